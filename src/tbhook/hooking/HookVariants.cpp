#include "HookVariants.hpp"

namespace tbhook
{

HookResult BeforeOnlyHook::handleBeforeExecute(const HookParams& params)
{
    return onBeforeExecute(params);
}

HookResult BeforeOnlyHook::handleAfterExecute(const HookParams&)
{
    return HookResult::NotImplemented(HookPhase::After);
}

HookResult AfterOnlyHook::handleBeforeExecute(const HookParams&)
{
    return HookResult::NotImplemented(HookPhase::Before);
}

HookResult AfterOnlyHook::handleAfterExecute(const HookParams& params)
{
    return onAfterExecute(params);
}

HookResult FullHook::handleBeforeExecute(const HookParams& params)
{
    return onBeforeExecute(params);
}

HookResult FullHook::handleAfterExecute(const HookParams& params)
{
    return onAfterExecute(params);
}

} // namespace tbhook
