#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace umbra {

/**
 * Source of cryptographically secure bytes.
 *
 * Implementations must be safe to call from several threads at once.
 * A failure to produce entropy throws RngFailureError; it never yields
 * weaker or partial output.
 */
class RandomSource
{
public:
    virtual ~RandomSource() = default;

    virtual void fill(std::uint8_t* out, std::size_t size) = 0;

    template <std::size_t N>
    std::array<std::uint8_t, N>
    bytes()
    {
        std::array<std::uint8_t, N> out;
        fill(out.data(), out.size());
        return out;
    }
};

/**
 * OpenSSL DRBG backed source.
 *
 * After every reseedInterval bytes the DRBG is reseeded from the
 * operating system with RAND_poll.
 */
class CryptoRandom : public RandomSource
{
public:
    static constexpr std::size_t defaultReseedInterval = 1 << 20;

    explicit CryptoRandom(std::size_t reseedInterval = defaultReseedInterval);

    void fill(std::uint8_t* out, std::size_t size) override;

    /** Reseeds now. Throws RngFailureError if the OS source is unavailable. */
    void reseed();

private:
    std::size_t const reseedInterval_;
    std::atomic<std::size_t> sinceReseed_{0};
};

/** Process-wide CryptoRandom. */
RandomSource& cryptoRandom();

}  // namespace umbra
