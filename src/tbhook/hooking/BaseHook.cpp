#include "BaseHook.hpp"

#include <chrono>

#include <plog/Log.h>

namespace tbhook
{

Timestamp SystemTime()
{
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

BaseHook::BaseHook(const HookCreateInfo& create_info)
    : authority_(create_info.authority)
    , time_source_(create_info.time_source ? create_info.time_source : TimeSource(SystemTime))
    , verbose_(create_info.verbose)
{
}

HookResult BaseHook::beforeExecute(const Address& invoker, const HookParams& params)
{
    if (!isAuthorized(invoker, HookPhase::Before))
        return HookResult::Unauthorized(invoker);

    if (verbose_)
        PLOG_DEBUG << "[" << hookName() << "] before token=" << params.tokenId << " to=" << params.to.toHex();

    return handleBeforeExecute(params);
}

HookResult BaseHook::afterExecute(const Address& invoker, const HookParams& params)
{
    if (!isAuthorized(invoker, HookPhase::After))
        return HookResult::Unauthorized(invoker);

    if (verbose_)
        PLOG_DEBUG << "[" << hookName() << "] after token=" << params.tokenId << " success=" << params.success;

    return handleAfterExecute(params);
}

HookResult BaseHook::handleBeforeExecute(const HookParams&)
{
    return HookResult::NotImplemented(HookPhase::Before);
}

HookResult BaseHook::handleAfterExecute(const HookParams&)
{
    return HookResult::NotImplemented(HookPhase::After);
}

bool BaseHook::isAuthorized(const Address& invoker, HookPhase phase) const
{
    if (invoker == authority_)
        return true;

    PLOG_WARNING << "[" << hookName() << "] rejected " << PhaseName(phase) << " call from " << invoker.toHex()
                 << " (authority " << authority_.toHex() << ")";
    return false;
}

} // namespace tbhook
