#include "Address.hpp"
#include "Hex.hpp"

#include <algorithm>

namespace tbhook
{

std::optional<Address> Address::FromHex(std::string_view text)
{
    auto decoded = hex::Decode(text);
    if (!decoded || decoded->empty() || decoded->size() > kSize)
        return std::nullopt;

    Address address;
    std::copy(decoded->begin(), decoded->end(), address.bytes.end() - static_cast<std::ptrdiff_t>(decoded->size()));
    return address;
}

Address Address::FromUint(std::uint64_t value)
{
    Address address;
    for (std::size_t i = 0; i < sizeof(value); ++i)
    {
        address.bytes[kSize - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    return address;
}

std::string Address::toHex() const
{
    return hex::Encode(bytes.data(), bytes.size());
}

bool Address::isZero() const
{
    return std::all_of(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b == 0; });
}

} // namespace tbhook
