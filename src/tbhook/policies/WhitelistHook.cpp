#include "WhitelistHook.hpp"

#include <plog/Log.h>

namespace tbhook
{

WhitelistHook::WhitelistHook(const HookCreateInfo& create_info)
    : BeforeOnlyHook(create_info)
{
}

void WhitelistHook::setWhitelist(TokenId token_id, const Address& target, bool allowed)
{
    state_.get().allowed[token_id][target] = allowed;

    HookEvent event;
    event.type = HookEventType::WhitelistUpdated;
    event.tokenId = token_id;
    event.data = { { "target", target.toHex() }, { "allowed", allowed } };
    emit(event);
}

void WhitelistHook::batchWhitelist(TokenId token_id, const std::vector<Address>& targets)
{
    for (const auto& target : targets)
    {
        setWhitelist(token_id, target, true);
    }
}

bool WhitelistHook::isWhitelisted(TokenId token_id, const Address& target) const
{
    const auto& allowed = state_.get().allowed;
    auto token_it = allowed.find(token_id);
    if (token_it == allowed.end())
        return false;

    auto target_it = token_it->second.find(target);
    return target_it != token_it->second.end() && target_it->second;
}

HookResult WhitelistHook::onBeforeExecute(const HookParams& params)
{
    if (!isWhitelisted(params.tokenId, params.to))
    {
        PLOG_INFO << "[whitelist] token " << params.tokenId << " blocked call to " << params.to.toHex();
        return HookResult::TargetNotWhitelisted(params.to);
    }

    return HookResult::Success();
}

} // namespace tbhook
