#pragma once

#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tbhook::hex
{

/// Decode a hex string with optional "0x" prefix. An odd digit count is
/// treated as having an implicit leading zero. Returns nullopt on any
/// non-hex character.
std::optional<Bytes> Decode(std::string_view text);

/// Encode bytes as lowercase hex with a "0x" prefix.
std::string Encode(const std::uint8_t* data, std::size_t size);

inline std::string Encode(const Bytes& bytes) { return Encode(bytes.data(), bytes.size()); }

std::optional<Selector> DecodeSelector(std::string_view text);

inline std::string Encode(const Selector& selector) { return Encode(selector.data(), selector.size()); }

} // namespace tbhook::hex
