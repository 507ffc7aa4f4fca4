#pragma once

#include "../core/Checkpoint.hpp"
#include "../hooking/HookVariants.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace tbhook
{

struct ExecutionLog
{
    Timestamp timestamp = 0;
    Address caller;
    Address to;
    Amount value = 0;
    Selector selector{};
    bool success = false;
};

void to_json(nlohmann::json& j, const ExecutionLog& log);

/**
 * @brief Append-only audit trail of executions per token
 *
 * The before phase is reserved and does nothing. Logs are never pruned,
 * so memory grows with the number of executions per token.
 */
class ExecutionLoggerHook final : public FullHook, public ITransactional
{
public:
    explicit ExecutionLoggerHook(const HookCreateInfo& create_info);

    const char* hookName() const override { return "execution_logger"; }

    /// Records [offset, min(offset + limit, total)) in insertion order;
    /// empty when offset >= total.
    std::vector<ExecutionLog> getHistory(TokenId token_id, std::size_t offset, std::size_t limit) const;

    std::size_t executionCount(TokenId token_id) const;

    // Journals appended tokens instead of snapshotting the history, so a
    // checkpoint costs O(entries appended since begin).
    ITransactional* transactional() override { return this; }
    void beginCheckpoint() override;
    void commitCheckpoint() override;
    void rollbackCheckpoint() override;

protected:
    HookResult onBeforeExecute(const HookParams& params) override;
    HookResult onAfterExecute(const HookParams& params) override;

private:
    std::unordered_map<TokenId, std::vector<ExecutionLog>> logs_;
    std::unordered_map<TokenId, std::size_t> counts_;

    bool journaling_ = false;
    std::vector<TokenId> appended_; // in append order
};

} // namespace tbhook
