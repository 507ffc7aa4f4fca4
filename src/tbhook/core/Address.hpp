#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tbhook
{

/// 20-byte account address.
struct Address
{
    static constexpr std::size_t kSize = 20;

    std::array<std::uint8_t, kSize> bytes{};

    /// Parse "0x"-prefixed (or bare) hex. Short input is left-padded with
    /// zeros, so "0xDEAD" names the same address as its 40-digit form.
    static std::optional<Address> FromHex(std::string_view text);

    /// Address whose low eight bytes hold `value` (big-endian).
    static Address FromUint(std::uint64_t value);

    std::string toHex() const;
    bool isZero() const;

    auto operator<=>(const Address& other) const = default;
};

} // namespace tbhook

namespace std
{

template<>
struct hash<tbhook::Address>
{
    std::size_t operator()(const tbhook::Address& address) const noexcept
    {
        std::size_t seed = 0;
        for (auto b : address.bytes)
        {
            seed ^= std::hash<std::uint8_t>{}(b) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

} // namespace std
