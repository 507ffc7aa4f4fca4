#include "ReplayCodec.hpp"
#include "../core/Hex.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tbhook
{

namespace
{

bool ReadAddressField(const json& j, const char* key, Address& out, std::string& error)
{
    if (!j.contains(key) || j[key].is_null())
        return true;

    if (!j[key].is_string())
    {
        error = std::string(key) + " must be a hex string";
        return false;
    }

    auto parsed = Address::FromHex(j[key].get<std::string>());
    if (!parsed)
    {
        error = std::string(key) + " is not a valid address";
        return false;
    }
    out = *parsed;
    return true;
}

bool ReadBytesField(const json& j, const char* key, Bytes& out, std::string& error)
{
    if (!j.contains(key) || j[key].is_null())
        return true;

    auto decoded = j[key].is_string() ? hex::Decode(j[key].get<std::string>()) : std::nullopt;
    if (!decoded)
    {
        error = std::string(key) + " must be a hex string";
        return false;
    }
    out = std::move(*decoded);
    return true;
}

bool ReadUnsignedField(const json& j, const char* key, std::uint64_t& out, std::string& error)
{
    if (!j.contains(key) || j[key].is_null())
        return true;

    if (!j[key].is_number_unsigned())
    {
        error = std::string(key) + " must be a non-negative integer";
        return false;
    }
    out = j[key].get<std::uint64_t>();
    return true;
}

} // namespace

bool ParseReplayRequest(const std::string& line, const Address& default_invoker, ReplayRequest& out,
                        std::string& error)
{
    json j;
    try
    {
        j = json::parse(line);
    }
    catch (const json::parse_error& ex)
    {
        error = std::string("invalid JSON: ") + ex.what();
        return false;
    }

    if (!j.is_object())
    {
        error = "request must be a JSON object";
        return false;
    }

    ReplayRequest request;
    request.invoker = default_invoker;
    request.target.success = true;

    auto& params = request.params;
    if (!ReadUnsignedField(j, "token_id", params.tokenId, error) ||
        !ReadAddressField(j, "invoker", request.invoker, error) ||
        !ReadAddressField(j, "account", params.account, error) ||
        !ReadAddressField(j, "caller", params.caller, error) ||
        !ReadAddressField(j, "to", params.to, error) ||
        !ReadUnsignedField(j, "value", params.value, error) ||
        !ReadBytesField(j, "data", params.hookData, error) ||
        !ReadBytesField(j, "return_data", request.target.returnData, error))
        return false;

    if (j.contains("selector"))
    {
        auto selector = j["selector"].is_string() ? hex::DecodeSelector(j["selector"].get<std::string>()) : std::nullopt;
        if (!selector)
        {
            error = "selector must be 4 hex bytes";
            return false;
        }
        params.selector = *selector;
    }
    else if (params.hookData.size() >= 4)
    {
        std::copy(params.hookData.begin(), params.hookData.begin() + 4, params.selector.begin());
    }

    if (j.contains("target_success"))
    {
        if (!j["target_success"].is_boolean())
        {
            error = "target_success must be a boolean";
            return false;
        }
        request.target.success = j["target_success"].get<bool>();
    }

    out = std::move(request);
    return true;
}

json OutcomeToJson(const ExecutionOutcome& outcome, const HookParams& params)
{
    json j = { { "token_id", params.tokenId },
               { "committed", outcome.committed },
               { "stage", StageName(outcome.stage) },
               { "target_success", outcome.target_success },
               { "return_data", hex::Encode(outcome.return_data) } };

    if (!outcome.committed)
    {
        const auto& result = outcome.hook_result;
        j["hook"] = outcome.hook_name;
        j["error"] = ErrorCodeName(result.error);
        j["message"] = result.message;
        if (result.error == HookErrorCode::TargetNotWhitelisted)
            j["target"] = result.target.toHex();
        if (result.error == HookErrorCode::ExceedsDailyLimit)
        {
            j["requested"] = result.requested;
            j["remaining"] = result.remaining;
        }
    }
    else
    {
        j["magic"] = hex::Encode(outcome.hook_result.magic);
    }

    return j;
}

} // namespace tbhook
