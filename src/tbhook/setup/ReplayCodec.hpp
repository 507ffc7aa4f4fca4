#pragma once

#include "../core/HookParams.hpp"
#include "../hooking/HookManager.hpp"

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace tbhook
{

/// One line of a replay file: the execution to run and the canned
/// result of its target call.
struct ReplayRequest
{
    Address invoker;
    HookParams params;
    TargetOutcome target;
};

/**
 * @brief Parse one JSONL replay line
 *
 * Fields: token_id, account, caller, to, value, selector, data,
 * target_success (default true), return_data, invoker (defaults to
 * `default_invoker`). Addresses and byte strings are hex.
 */
bool ParseReplayRequest(const std::string& line, const Address& default_invoker, ReplayRequest& out,
                        std::string& error);

nlohmann::json OutcomeToJson(const ExecutionOutcome& outcome, const HookParams& params);

} // namespace tbhook
