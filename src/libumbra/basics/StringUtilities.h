#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace umbra {

using Blob = std::vector<std::uint8_t>;

/** Lowercase hex of a byte range, no prefix. */
std::string strHex(std::uint8_t const* data, std::size_t size);

template <class Container>
std::string
strHex(Container const& c)
{
    return strHex(
        reinterpret_cast<std::uint8_t const*>(c.data()), c.size());
}

/** Hex with a leading "0x", the form used on the wire. */
template <class Container>
std::string
strPrefixedHex(Container const& c)
{
    return "0x" + strHex(c);
}

/** Decodes hex, with or without a "0x" prefix. Empty on odd length or bad digits. */
std::optional<Blob> strUnHex(std::string const& hex);

/** Strips a leading "0x" or "0X" if present. */
std::string stripHexPrefix(std::string const& hex);

}  // namespace umbra
