#pragma once

#include "Address.hpp"
#include "PermissionSet.hpp"
#include "Types.hpp"

#include <string>

namespace tbhook
{

enum class HookErrorCode
{
    None,
    Unauthorized,         // invoker is not the bound orchestrator
    NotImplemented,       // phase invoked but not overridden
    TargetNotWhitelisted, // policy
    ExceedsDailyLimit,    // policy
    LimitNotConfigured,   // policy
    InvalidMagic,         // reported success without kHookMagic
    HookThrew             // exception escaped a hook phase or event listener
};

const char* ErrorCodeName(HookErrorCode code);

/**
 * @brief Outcome of one before/after invocation
 *
 * A successful invocation carries kHookMagic. Any failure means the
 * orchestrator must abort the whole surrounding operation; there is no
 * partial success. Policy failures carry the data a caller needs to retry
 * with adjusted parameters.
 */
struct HookResult
{
    bool succeeded = false;
    Selector magic{};
    HookErrorCode error = HookErrorCode::None;
    std::string message;

    Address target;       // TargetNotWhitelisted
    Amount requested = 0; // ExceedsDailyLimit
    Amount remaining = 0; // ExceedsDailyLimit

    /// Succeeded and returned the shared magic code.
    bool confirmed() const { return succeeded && magic == kHookMagic; }

    bool isPolicyViolation() const;

    static HookResult Success();
    static HookResult Unauthorized(const Address& invoker);
    static HookResult NotImplemented(HookPhase phase);
    static HookResult TargetNotWhitelisted(const Address& target);
    static HookResult ExceedsDailyLimit(Amount requested, Amount remaining);
    static HookResult LimitNotConfigured(TokenId token_id);
    static HookResult HookThrew(const std::string& what);
};

} // namespace tbhook
