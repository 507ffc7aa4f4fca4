#pragma once

#include "../core/Checkpoint.hpp"
#include "../core/IHook.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tbhook
{

struct TargetOutcome
{
    bool success = false;
    Bytes returnData;
};

/// Performs the account's target call. Exceptions count as a failed call.
using TargetCall = std::function<TargetOutcome(const HookParams& params)>;

enum class ExecutionStage
{
    Before,
    Target,
    After,
    Completed
};

const char* StageName(ExecutionStage stage);

struct ExecutionOutcome
{
    bool committed = false;
    ExecutionStage stage = ExecutionStage::Before; // Completed, or where the abort happened
    std::string hook_name;                         // hook that aborted, if any
    HookResult hook_result;
    bool target_success = false;
    Bytes return_data;
};

/**
 * @brief Reference orchestrator for registered hooks
 * 
 * Runs before phases in registration order, the target call, then after
 * phases, invoking only the phases each hook declares. Every hook failure
 * or missing magic code aborts the operation and rolls back all
 * transactional participants, including state written by before phases
 * and by the target call's own participants.
 */
class HookManager
{
public:
    explicit HookManager(const Address& orchestrator);
    ~HookManager() = default;

    // Non-copyable, non-movable (owns unique hook instances)
    HookManager(const HookManager&) = delete;
    HookManager& operator=(const HookManager&) = delete;

    /**
     * @brief Register a hook under a unique name
     * @return false if the name is taken or the hook is null
     */
    bool registerHook(const std::string& name, std::unique_ptr<IHook> hook);

    /**
     * @brief Access a hook by name
     * @return Pointer to hook instance, or nullptr if not registered
     */
    IHook* getHook(const std::string& name) const;

    template<typename T>
    T* getHookAs(const std::string& name) const
    {
        return dynamic_cast<T*>(getHook(name));
    }

    std::size_t hookCount() const { return hooks_.size(); }
    const Address& orchestrator() const { return orchestrator_; }

    /// Extra state (e.g. a token ledger) rolled back together with the hooks.
    void addParticipant(ITransactional* participant);

    ExecutionOutcome execute(const HookParams& params, const TargetCall& target);

    /// Same as execute() but presents `invoker` to the hooks instead of the
    /// orchestrator address.
    ExecutionOutcome executeAs(const Address& invoker, const HookParams& params, const TargetCall& target);

private:
    bool runPhase(HookPhase phase, const Address& invoker, const HookParams& params, ExecutionOutcome& outcome);
    std::vector<ITransactional*> collectParticipants() const;
    void reportAbort(const ExecutionOutcome& outcome, const HookParams& params) const;

    Address orchestrator_;
    std::vector<std::pair<std::string, std::unique_ptr<IHook>>> hooks_;
    std::vector<ITransactional*> participants_;
};

} // namespace tbhook
