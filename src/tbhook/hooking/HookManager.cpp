#include "HookManager.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <exception>

#include <plog/Log.h>

namespace tbhook
{

namespace
{

utils::ErrorCategory CategoryFor(const HookResult& result)
{
    if (result.error == HookErrorCode::Unauthorized)
        return utils::ErrorCategory::Authorization;
    if (result.isPolicyViolation())
        return utils::ErrorCategory::Policy;
    return utils::ErrorCategory::Dispatch;
}

} // namespace

const char* StageName(ExecutionStage stage)
{
    switch (stage)
    {
    case ExecutionStage::Before:
        return "before";
    case ExecutionStage::Target:
        return "target";
    case ExecutionStage::After:
        return "after";
    case ExecutionStage::Completed:
        return "completed";
    default:
        return "unknown";
    }
}

HookManager::HookManager(const Address& orchestrator)
    : orchestrator_(orchestrator)
{
}

bool HookManager::registerHook(const std::string& name, std::unique_ptr<IHook> hook)
{
    if (!hook)
    {
        PLOG_ERROR << "Refusing to register null hook '" << name << "'";
        return false;
    }

    if (getHook(name) != nullptr)
    {
        PLOG_ERROR << "Hook '" << name << "' already registered";
        return false;
    }

    const auto perms = hook->permissions();
    if (perms.none())
    {
        PLOG_WARNING << "Hook '" << name << "' declares no phases and will never be invoked";
    }

    PLOG_INFO << "Registered hook '" << name << "' (before=" << perms.beforeExecute
              << ", after=" << perms.afterExecute << ")";
    hooks_.emplace_back(name, std::move(hook));
    return true;
}

IHook* HookManager::getHook(const std::string& name) const
{
    for (const auto& [hook_name, hook] : hooks_)
    {
        if (hook_name == name)
            return hook.get();
    }
    return nullptr;
}

void HookManager::addParticipant(ITransactional* participant)
{
    if (participant)
        participants_.push_back(participant);
}

ExecutionOutcome HookManager::execute(const HookParams& params, const TargetCall& target)
{
    return executeAs(orchestrator_, params, target);
}

ExecutionOutcome HookManager::executeAs(const Address& invoker, const HookParams& params, const TargetCall& target)
{
    ExecutionOutcome outcome;
    const auto participants = collectParticipants();
    for (auto* participant : participants)
    {
        participant->beginCheckpoint();
    }

    auto abort = [&]() -> ExecutionOutcome
    {
        for (auto* participant : participants)
        {
            participant->rollbackCheckpoint();
        }
        outcome.committed = false;
        reportAbort(outcome, params);
        return outcome;
    };

    // Before phase sees success/returnData cleared
    HookParams call = params;
    call.success = false;
    call.returnData.clear();

    outcome.stage = ExecutionStage::Before;
    if (!runPhase(HookPhase::Before, invoker, call, outcome))
        return abort();

    outcome.stage = ExecutionStage::Target;
    TargetOutcome target_outcome;
    if (target)
    {
        try
        {
            target_outcome = target(call);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Target call for token " << params.tokenId << " threw: " << ex.what();
            target_outcome = TargetOutcome{};
        }
    }
    outcome.target_success = target_outcome.success;
    outcome.return_data = target_outcome.returnData;

    call.success = target_outcome.success;
    call.returnData = std::move(target_outcome.returnData);

    outcome.stage = ExecutionStage::After;
    if (!runPhase(HookPhase::After, invoker, call, outcome))
        return abort();

    for (auto* participant : participants)
    {
        participant->commitCheckpoint();
    }

    outcome.stage = ExecutionStage::Completed;
    outcome.committed = true;
    outcome.hook_result = HookResult::Success();
    return outcome;
}

bool HookManager::runPhase(HookPhase phase, const Address& invoker, const HookParams& params,
                           ExecutionOutcome& outcome)
{
    for (const auto& [name, hook] : hooks_)
    {
        if (!hook->permissions().allows(phase))
            continue;

        HookResult result;
        try
        {
            result = phase == HookPhase::Before ? hook->beforeExecute(invoker, params)
                                                : hook->afterExecute(invoker, params);
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Hook '" << name << "' threw in " << PhaseName(phase) << " phase: " << ex.what();
            result = HookResult::HookThrew(ex.what());
        }

        if (result.succeeded && result.magic != kHookMagic)
        {
            PLOG_ERROR << "Hook '" << name << "' returned success without the magic code";
            result.succeeded = false;
            result.error = HookErrorCode::InvalidMagic;
            result.message = "hook returned an invalid magic value";
        }

        if (!result.succeeded)
        {
            outcome.hook_name = name;
            outcome.hook_result = std::move(result);
            return false;
        }
    }
    return true;
}

std::vector<ITransactional*> HookManager::collectParticipants() const
{
    std::vector<ITransactional*> participants;
    for (const auto& [name, hook] : hooks_)
    {
        if (auto* tx = hook->transactional())
            participants.push_back(tx);
    }
    participants.insert(participants.end(), participants_.begin(), participants_.end());
    return participants;
}

void HookManager::reportAbort(const ExecutionOutcome& outcome, const HookParams& params) const
{
    const auto& result = outcome.hook_result;
    const std::string details = outcome.hook_name + " (" + StageName(outcome.stage) + "): " +
                                ErrorCodeName(result.error) + " - " + result.message + " [token " +
                                std::to_string(params.tokenId) + "]";

    if (result.isPolicyViolation())
    {
        utils::ErrorReporter::ReportInfo(CategoryFor(result), "Execution rejected by policy", details);
    }
    else
    {
        utils::ErrorReporter::ReportError(CategoryFor(result), "Execution aborted", details);
    }
}

} // namespace tbhook
