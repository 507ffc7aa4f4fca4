#include "Hex.hpp"

#include <algorithm>

namespace tbhook::hex
{

namespace
{

int NibbleValue(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view StripPrefix(std::string_view text)
{
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
        text.remove_prefix(2);
    return text;
}

} // namespace

std::optional<Bytes> Decode(std::string_view text)
{
    text = StripPrefix(text);

    Bytes out;
    out.reserve(text.size() / 2 + 1);

    std::size_t pos = 0;
    if (text.size() % 2 != 0)
    {
        const int low = NibbleValue(text[0]);
        if (low < 0)
            return std::nullopt;
        out.push_back(static_cast<std::uint8_t>(low));
        pos = 1;
    }

    for (; pos < text.size(); pos += 2)
    {
        const int high = NibbleValue(text[pos]);
        const int low = NibbleValue(text[pos + 1]);
        if (high < 0 || low < 0)
            return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return out;
}

std::string Encode(const std::uint8_t* data, std::size_t size)
{
    static constexpr char kDigits[] = "0123456789abcdef";

    std::string out;
    out.reserve(2 + size * 2);
    out += "0x";
    for (std::size_t i = 0; i < size; ++i)
    {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

std::optional<Selector> DecodeSelector(std::string_view text)
{
    auto bytes = Decode(text);
    if (!bytes || bytes->size() != 4)
        return std::nullopt;

    Selector selector{};
    std::copy(bytes->begin(), bytes->end(), selector.begin());
    return selector;
}

} // namespace tbhook::hex
