#pragma once

#include <libumbra/basics/RandomSource.h>
#include <libumbra/basics/StringUtilities.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace umbra {
namespace stealth {

/** Compressed SEC1 encoding of a secp256k1 point. */
class PublicKey
{
public:
    static constexpr std::size_t size = 33;

    PublicKey() = default;

    /** @throws InputValidationError unless data is a valid point on the curve */
    PublicKey(std::uint8_t const* data, std::size_t length);

    /** @return nothing if hex is not a valid compressed point */
    static std::optional<PublicKey> fromHex(std::string const& hex);

    std::uint8_t const* data() const
    {
        return bytes_.data();
    }

    std::array<std::uint8_t, size> const& bytes() const
    {
        return bytes_;
    }

    bool empty() const
    {
        return bytes_[0] == 0;
    }

    std::string toHex() const
    {
        return strHex(bytes_);
    }

    bool operator==(PublicKey const& other) const
    {
        return bytes_ == other.bytes_;
    }

    bool operator!=(PublicKey const& other) const
    {
        return bytes_ != other.bytes_;
    }

private:
    std::array<std::uint8_t, size> bytes_{};
};

/**
 * A secp256k1 private scalar in [1, n-1], 32 bytes big-endian.
 *
 * The bytes are wiped when the key is destroyed or overwritten.
 */
class SecretKey
{
public:
    static constexpr std::size_t size = 32;

    SecretKey() = default;

    /** @throws InputValidationError if the scalar is zero or not below n */
    SecretKey(std::uint8_t const* data, std::size_t length);

    SecretKey(SecretKey const& other) = default;
    SecretKey& operator=(SecretKey const& other);
    ~SecretKey();

    /** Uniform scalar drawn from rng by rejection sampling. */
    static SecretKey random(RandomSource& rng);

    std::uint8_t const* data() const
    {
        return bytes_.data();
    }

    bool empty() const;

    std::string toHex() const
    {
        return strHex(bytes_);
    }

    bool operator==(SecretKey const& other) const;

private:
    std::array<std::uint8_t, size> bytes_{};
};

using Digest = std::array<std::uint8_t, 32>;

/** s * G */
PublicKey derivePublicKey(SecretKey const& s);

/** Compressed encoding of s * P. */
PublicKey multiply(PublicKey const& p, SecretKey const& s);

/**
 * P + (tweak mod n) * G.
 *
 * @throws InputValidationError if the result is the point at infinity
 */
PublicKey addTweak(PublicKey const& p, Digest const& tweak);

/**
 * (s + tweak) mod n.
 *
 * @throws InputValidationError if the sum is zero
 */
SecretKey addTweak(SecretKey const& s, Digest const& tweak);

bool isValidScalar(std::uint8_t const* data, std::size_t length);

}  // namespace stealth
}  // namespace umbra
