#pragma once

#include "../core/Address.hpp"
#include "../core/Checkpoint.hpp"
#include "../core/Types.hpp"

#include <unordered_map>

namespace tbhook
{

/// Token the reward hook pays out from. Transfers come out of the
/// payer's own balance.
class IRewardToken
{
public:
    virtual ~IRewardToken() = default;

    virtual Address address() const = 0;

    /// @return false when the transfer did not happen
    virtual bool transfer(const Address& to, Amount amount) = 0;
};

/// In-memory balance table. The treasury is the account transfers are
/// debited from.
class LedgerRewardToken final : public IRewardToken, public ITransactional
{
public:
    LedgerRewardToken(const Address& token_address, const Address& treasury);

    Address address() const override { return address_; }
    const Address& treasury() const { return treasury_; }

    bool transfer(const Address& to, Amount amount) override;

    void mint(const Address& holder, Amount amount);
    Amount balanceOf(const Address& holder) const;

    void beginCheckpoint() override { balances_.begin(); }
    void commitCheckpoint() override { balances_.commit(); }
    void rollbackCheckpoint() override { balances_.rollback(); }

private:
    Address address_;
    Address treasury_;
    CheckpointedState<std::unordered_map<Address, Amount>> balances_;
};

} // namespace tbhook
