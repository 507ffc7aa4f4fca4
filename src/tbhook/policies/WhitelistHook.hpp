#pragma once

#include "../core/Checkpoint.hpp"
#include "../hooking/HookVariants.hpp"

#include <unordered_map>
#include <vector>

namespace tbhook
{

/// Before-phase gate: a call passes only if its target is whitelisted for
/// the token. The admin mutators carry no caller restriction.
class WhitelistHook final : public BeforeOnlyHook, public ITransactional
{
public:
    explicit WhitelistHook(const HookCreateInfo& create_info);

    const char* hookName() const override { return "whitelist"; }

    void setWhitelist(TokenId token_id, const Address& target, bool allowed);
    void batchWhitelist(TokenId token_id, const std::vector<Address>& targets);
    bool isWhitelisted(TokenId token_id, const Address& target) const;

    ITransactional* transactional() override { return this; }
    void beginCheckpoint() override { state_.begin(); }
    void commitCheckpoint() override { state_.commit(); }
    void rollbackCheckpoint() override { state_.rollback(); }

protected:
    HookResult onBeforeExecute(const HookParams& params) override;

private:
    struct State
    {
        std::unordered_map<TokenId, std::unordered_map<Address, bool>> allowed;
    };

    CheckpointedState<State> state_;
};

} // namespace tbhook
