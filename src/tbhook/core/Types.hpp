#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace tbhook
{

// Identity of the token that owns an account.
using TokenId = std::uint64_t;

// Native-currency and reward-token amounts.
using Amount = std::uint64_t;

// Unix time in seconds.
using Timestamp = std::uint64_t;

using Bytes = std::vector<std::uint8_t>;

// First four bytes of a call payload, identifying the target function.
using Selector = std::array<std::uint8_t, 4>;

/// Sentinel every successful hook invocation returns ("HOOK" in ASCII).
/// Shared by all hooks; callers compare against it in addition to the
/// success flag of the result.
inline constexpr Selector kHookMagic = { 0x48, 0x4F, 0x4F, 0x4B };

inline constexpr Timestamp kSecondsPerDay = 86400;

} // namespace tbhook
