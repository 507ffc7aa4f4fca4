#pragma once

namespace tbhook
{

enum class HookPhase
{
    Before,
    After
};

/// Phases a hook declares it participates in. The declaration must match
/// the phases the hook implements with real logic; only the orchestrator
/// can detect a mismatch.
struct PermissionSet
{
    bool beforeExecute = false;
    bool afterExecute = false;

    constexpr bool allows(HookPhase phase) const
    {
        return phase == HookPhase::Before ? beforeExecute : afterExecute;
    }

    constexpr bool none() const { return !beforeExecute && !afterExecute; }

    constexpr bool operator==(const PermissionSet& other) const = default;
};

inline constexpr PermissionSet kBeforeOnlyPermissions{ true, false };
inline constexpr PermissionSet kAfterOnlyPermissions{ false, true };
inline constexpr PermissionSet kFullPermissions{ true, true };

inline const char* PhaseName(HookPhase phase)
{
    return phase == HookPhase::Before ? "before" : "after";
}

} // namespace tbhook
