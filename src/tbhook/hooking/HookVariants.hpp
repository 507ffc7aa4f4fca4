#pragma once

#include "BaseHook.hpp"

namespace tbhook
{

// The three canonical hook shapes. Each pins permissions() and routes the
// declared phase(s) to a pure virtual handler, so a concrete hook cannot
// compile without implementing what it declares. The undeclared phase
// always fails with NotImplemented.

class BeforeOnlyHook : public BaseHook
{
public:
    using BaseHook::BaseHook;

    PermissionSet permissions() const final { return kBeforeOnlyPermissions; }

protected:
    virtual HookResult onBeforeExecute(const HookParams& params) = 0;

    HookResult handleBeforeExecute(const HookParams& params) final;
    HookResult handleAfterExecute(const HookParams& params) final;
};

class AfterOnlyHook : public BaseHook
{
public:
    using BaseHook::BaseHook;

    PermissionSet permissions() const final { return kAfterOnlyPermissions; }

protected:
    virtual HookResult onAfterExecute(const HookParams& params) = 0;

    HookResult handleBeforeExecute(const HookParams& params) final;
    HookResult handleAfterExecute(const HookParams& params) final;
};

class FullHook : public BaseHook
{
public:
    using BaseHook::BaseHook;

    PermissionSet permissions() const final { return kFullPermissions; }

protected:
    virtual HookResult onBeforeExecute(const HookParams& params) = 0;
    virtual HookResult onAfterExecute(const HookParams& params) = 0;

    HookResult handleBeforeExecute(const HookParams& params) final;
    HookResult handleAfterExecute(const HookParams& params) final;
};

} // namespace tbhook
