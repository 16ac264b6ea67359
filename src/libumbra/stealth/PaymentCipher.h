#pragma once

#include <libumbra/basics/RandomSource.h>
#include <libumbra/basics/StringUtilities.h>
#include <libumbra/stealth/Secp256k1.h>

#include <gmpxx.h>

#include <initializer_list>
#include <optional>
#include <utility>

namespace umbra {
namespace stealth {

/**
 * Authenticated encryption of payment amounts with ChaCha20-Poly1305.
 *
 * Sealed form: nonce(12) || ciphertext(32) || tag(16). The plaintext is
 * the amount as 32 bytes big-endian; the additional data binds the
 * ciphertext to the ephemeral public key it was sent with.
 */
namespace cipher {

constexpr std::size_t nonceSize = 12;
constexpr std::size_t tagSize = 16;
constexpr std::size_t amountSize = 32;
constexpr std::size_t sealedSize = nonceSize + amountSize + tagSize;

/** SHA256("umbra.amount" || sharedSecret) */
Digest amountKey(Digest const& sharedSecret);

/** @throws InputValidationError if amount is negative or wider than 256 bits */
Blob sealAmount(
    Digest const& key,
    mpz_class const& amount,
    PublicKey const& ephemeralPublicKey,
    RandomSource& rng);

/** @return nothing if sealed is malformed or fails authentication */
std::optional<mpz_class> openAmount(
    Digest const& key,
    Blob const& sealed,
    PublicKey const& ephemeralPublicKey);

}  // namespace cipher

/** SHA256 over the concatenation of the given parts. */
Digest sha256(std::initializer_list<std::pair<void const*, std::size_t>> parts);

}  // namespace stealth
}  // namespace umbra
