#pragma once

#include <libumbra/basics/Journal.h>
#include <libumbra/basics/RandomSource.h>
#include <libumbra/stealth/PrivacyManifest.h>
#include <libumbra/stealth/Secp256k1.h>

#include <gmpxx.h>
#include <json/value.h>

#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace umbra {
namespace stealth {

/** One-shot key pair for a single payment. Never persisted. */
struct StealthKeyPair
{
    SecretKey privateKey;
    PublicKey publicKey;
};

/** What the sender learns from one key agreement. */
struct StealthDerivation
{
    PublicKey stealthPublicKey;
    std::string stealthAddress;
    Digest sharedSecret;
};

/** Public, broadcastable record that lets the recipient find a payment. */
struct PaymentMetadata
{
    PublicKey ephemeralPublicKey;
    Blob encryptedAmount;
    Digest stealthTag{};

    /** {ephemeralPublicKey, encryptedAmount, stealthTag}, hex strings. */
    Json::Value toJson() const;

    /** @throws InputValidationError for missing or undecodable fields */
    static PaymentMetadata fromJson(Json::Value const& v);
};

/** A payment the recipient recognized while scanning. */
struct PaymentMatch
{
    std::size_t index = 0;
    std::string stealthAddress;
    PublicKey stealthPublicKey;
    mpz_class amount;
    SecretKey stealthPrivateKey;
};

/** Everything a sender needs to pay a manifest's owner. */
struct PreparedPayment
{
    StealthDerivation derivation;
    PaymentMetadata metadata;
};

class StealthAddressEngine;

/**
 * Lazy scan of candidate metadata for payments to one key.
 *
 * Each begin() restarts the scan from the first candidate; nothing is
 * cached between passes, so every pass yields the same matches. Entries
 * that do not parse, carry another tag or fail authentication are
 * skipped. The scan owns its candidate list; copies of a scan share it.
 */
class PaymentScan
{
public:
    class iterator
    {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = PaymentMatch;
        using difference_type = std::ptrdiff_t;
        using pointer = PaymentMatch const*;
        using reference = PaymentMatch const&;

        iterator() = default;

        reference operator*() const
        {
            return *current_;
        }

        pointer operator->() const
        {
            return &*current_;
        }

        iterator& operator++();

        bool operator==(iterator const& other) const;

        bool operator!=(iterator const& other) const
        {
            return !(*this == other);
        }

    private:
        friend class PaymentScan;

        iterator(PaymentScan const* scan, std::size_t from);

        void seek(std::size_t from);

        PaymentScan const* scan_ = nullptr;
        std::size_t next_ = 0;
        std::optional<PaymentMatch> current_;
    };

    iterator begin() const
    {
        return iterator(this, 0);
    }

    iterator end() const
    {
        return iterator();
    }

    std::size_t candidates() const
    {
        return candidates_->size();
    }

private:
    friend class StealthAddressEngine;

    PaymentScan(
        StealthAddressEngine const& engine,
        SecretKey const& scanningKey,
        std::vector<Json::Value> candidates);

    std::optional<PaymentMatch> tryMatch(std::size_t index) const;

    StealthAddressEngine const* engine_;
    SecretKey scanningKey_;
    PublicKey basePoint_;
    std::shared_ptr<std::vector<Json::Value> const> candidates_;
};

/**
 * Sender and recipient sides of single-key ECDH stealth payments on
 * secp256k1.
 *
 * For recipient key p with P = p*G and ephemeral key e with E = e*G:
 *
 *     S       = SHA256(compress(e*P)) = SHA256(compress(p*E))
 *     h       = SHA256("umbra.stealth" || S || P) mod n
 *     address = compress(P + h*G), spendable with p + h
 *     tag     = SHA256(S || "tag")
 *
 * The engine holds no state besides its entropy source and is safe to use
 * from several threads when that source is.
 */
class StealthAddressEngine
{
public:
    StealthAddressEngine(RandomSource& rng, Journal j);

    /** @throws RngFailureError if the entropy source fails */
    StealthKeyPair generateEphemeralKeyPair();

    /** Sender side. */
    StealthDerivation deriveStealthAddress(
        PublicKey const& recipientBasePoint,
        SecretKey const& ephemeralPrivateKey) const;

    /** Recipient side of the same agreement, from the published E. */
    StealthDerivation recoverStealthAddress(
        SecretKey const& recipientKey,
        PublicKey const& ephemeralPublicKey) const;

    /** p + h mod n: the key that spends from the stealth address. */
    SecretKey recoverStealthKey(
        SecretKey const& recipientKey, Digest const& sharedSecret) const;

    /**
     * @throws InputValidationError if amount does not fit in 256 bits
     * @throws RngFailureError if no nonce can be drawn
     */
    PaymentMetadata buildPaymentMetadata(
        Digest const& sharedSecret,
        PublicKey const& ephemeralPublicKey,
        mpz_class const& amount);

    /** Decrypted amount, or nothing if the tag or ciphertext does not check out. */
    std::optional<mpz_class> openPaymentMetadata(
        Digest const& sharedSecret, PaymentMetadata const& metadata) const;

    /**
     * Lazy scan of candidates (wire JSON) for payments to recipientKey.
     * Pass an rvalue to hand the list over without a copy.
     */
    PaymentScan scanForPayments(
        SecretKey const& recipientKey,
        std::vector<Json::Value> candidates) const;

    /**
     * Validates manifest at now, then generates a key pair, derives the
     * stealth address and seals the amount.
     *
     * @throws ManifestExpiredError if the manifest has expired
     */
    PreparedPayment preparePayment(
        PrivacyManifest const& manifest,
        mpz_class const& amount,
        Clock::time_point now);

    static Digest stealthTag(Digest const& sharedSecret);

private:
    StealthDerivation derive(PublicKey const& basePoint, Digest const& sharedSecret) const;

    RandomSource& rng_;
    Journal j_;
};

}  // namespace stealth
}  // namespace umbra
