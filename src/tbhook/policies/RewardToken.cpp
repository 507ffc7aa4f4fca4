#include "RewardToken.hpp"

#include <limits>

#include <plog/Log.h>

namespace tbhook
{

LedgerRewardToken::LedgerRewardToken(const Address& token_address, const Address& treasury)
    : address_(token_address)
    , treasury_(treasury)
{
}

bool LedgerRewardToken::transfer(const Address& to, Amount amount)
{
    auto& balances = balances_.get();
    Amount& from_balance = balances[treasury_];
    if (from_balance < amount)
    {
        PLOG_DEBUG << "[token " << address_.toHex() << "] treasury balance " << from_balance << " < " << amount;
        return false;
    }

    Amount& to_balance = balances[to];
    if (to != treasury_ && to_balance > std::numeric_limits<Amount>::max() - amount)
        return false;

    from_balance -= amount;
    to_balance += amount;
    return true;
}

void LedgerRewardToken::mint(const Address& holder, Amount amount)
{
    balances_.get()[holder] += amount;
}

Amount LedgerRewardToken::balanceOf(const Address& holder) const
{
    const auto& balances = balances_.get();
    auto it = balances.find(holder);
    return it == balances.end() ? 0 : it->second;
}

} // namespace tbhook
