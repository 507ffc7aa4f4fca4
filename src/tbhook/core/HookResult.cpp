#include "HookResult.hpp"

namespace tbhook
{

namespace
{

HookResult Failure(HookErrorCode code, std::string message)
{
    HookResult result;
    result.succeeded = false;
    result.error = code;
    result.message = std::move(message);
    return result;
}

} // namespace

const char* ErrorCodeName(HookErrorCode code)
{
    switch (code)
    {
    case HookErrorCode::None:
        return "None";
    case HookErrorCode::Unauthorized:
        return "Unauthorized";
    case HookErrorCode::NotImplemented:
        return "NotImplemented";
    case HookErrorCode::TargetNotWhitelisted:
        return "TargetNotWhitelisted";
    case HookErrorCode::ExceedsDailyLimit:
        return "ExceedsDailyLimit";
    case HookErrorCode::LimitNotConfigured:
        return "LimitNotConfigured";
    case HookErrorCode::InvalidMagic:
        return "InvalidMagic";
    case HookErrorCode::HookThrew:
        return "HookThrew";
    default:
        return "Unknown";
    }
}

bool HookResult::isPolicyViolation() const
{
    return error == HookErrorCode::TargetNotWhitelisted || error == HookErrorCode::ExceedsDailyLimit ||
           error == HookErrorCode::LimitNotConfigured;
}

HookResult HookResult::Success()
{
    HookResult result;
    result.succeeded = true;
    result.magic = kHookMagic;
    return result;
}

HookResult HookResult::Unauthorized(const Address& invoker)
{
    return Failure(HookErrorCode::Unauthorized, "unauthorized invoker: " + invoker.toHex());
}

HookResult HookResult::NotImplemented(HookPhase phase)
{
    return Failure(HookErrorCode::NotImplemented, std::string(PhaseName(phase)) + " phase not implemented");
}

HookResult HookResult::TargetNotWhitelisted(const Address& target)
{
    auto result = Failure(HookErrorCode::TargetNotWhitelisted, "target not whitelisted: " + target.toHex());
    result.target = target;
    return result;
}

HookResult HookResult::ExceedsDailyLimit(Amount requested, Amount remaining)
{
    auto result = Failure(HookErrorCode::ExceedsDailyLimit, "exceeds daily limit: requested " +
                                                                std::to_string(requested) + ", remaining " +
                                                                std::to_string(remaining));
    result.requested = requested;
    result.remaining = remaining;
    return result;
}

HookResult HookResult::LimitNotConfigured(TokenId token_id)
{
    return Failure(HookErrorCode::LimitNotConfigured,
                   "daily limit not configured for token " + std::to_string(token_id));
}

HookResult HookResult::HookThrew(const std::string& what)
{
    return Failure(HookErrorCode::HookThrew, "hook threw: " + what);
}

} // namespace tbhook
