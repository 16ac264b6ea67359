#include <libumbra/basics/StringUtilities.h>

namespace umbra {

namespace {

int
charUnHex(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string
strHex(std::uint8_t const* data, std::size_t size)
{
    static char const digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string
stripHexPrefix(std::string const& hex)
{
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        return hex.substr(2);
    return hex;
}

std::optional<Blob>
strUnHex(std::string const& hex)
{
    std::string const digits = stripHexPrefix(hex);
    if (digits.size() % 2 != 0)
        return std::nullopt;

    Blob out;
    out.reserve(digits.size() / 2);
    for (std::size_t i = 0; i < digits.size(); i += 2)
    {
        int const hi = charUnHex(digits[i]);
        int const lo = charUnHex(digits[i + 1]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace umbra
