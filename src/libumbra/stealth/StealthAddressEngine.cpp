#include <libumbra/stealth/StealthAddressEngine.h>
#include <libumbra/basics/Errors.h>
#include <libumbra/stealth/PaymentCipher.h>

#include <openssl/crypto.h>

#include <algorithm>
#include <memory>
#include <tuple>
#include <utility>

namespace umbra {
namespace stealth {

namespace {

char const stealthLabel[] = "umbra.stealth";
char const tagLabel[] = "tag";

Digest
sharedSecretOf(PublicKey const& point, SecretKey const& scalar)
{
    auto const dh = multiply(point, scalar);
    return sha256({{dh.data(), PublicKey::size}});
}

template <class Array>
std::optional<Array>
fixedFromHex(Json::Value const& v)
{
    if (!v.isString())
        return std::nullopt;
    auto const raw = strUnHex(v.asString());
    if (!raw || raw->size() != std::tuple_size<Array>::value)
        return std::nullopt;
    Array out;
    std::copy(raw->begin(), raw->end(), out.begin());
    return out;
}

}  // namespace

Json::Value
PaymentMetadata::toJson() const
{
    Json::Value v(Json::objectValue);
    v["ephemeralPublicKey"] = strPrefixedHex(ephemeralPublicKey.bytes());
    v["encryptedAmount"] = strPrefixedHex(encryptedAmount);
    v["stealthTag"] = strPrefixedHex(stealthTag);
    return v;
}

PaymentMetadata
PaymentMetadata::fromJson(Json::Value const& v)
{
    if (!v.isObject())
        throw InputValidationError("payment metadata must be a JSON object");
    for (char const* field : {"ephemeralPublicKey", "encryptedAmount", "stealthTag"})
        if (!v.isMember(field))
            throw MissingFieldError(field);

    PaymentMetadata m;

    auto const& epk = v["ephemeralPublicKey"];
    auto const key = epk.isString() ? PublicKey::fromHex(epk.asString()) : std::nullopt;
    if (!key)
        throw InputValidationError("ephemeralPublicKey is not a compressed secp256k1 point");
    m.ephemeralPublicKey = *key;

    auto const sealed = v["encryptedAmount"].isString()
        ? strUnHex(v["encryptedAmount"].asString())
        : std::nullopt;
    if (!sealed)
        throw InputValidationError("encryptedAmount is not hex");
    m.encryptedAmount = *sealed;

    auto const tag = fixedFromHex<Digest>(v["stealthTag"]);
    if (!tag)
        throw InputValidationError("stealthTag must be 32 bytes of hex");
    m.stealthTag = *tag;

    return m;
}

//------------------------------------------------------------------------------

PaymentScan::PaymentScan(
    StealthAddressEngine const& engine,
    SecretKey const& scanningKey,
    std::vector<Json::Value> candidates)
    : engine_(&engine)
    , scanningKey_(scanningKey)
    , basePoint_(derivePublicKey(scanningKey))
    , candidates_(std::make_shared<std::vector<Json::Value> const>(std::move(candidates)))
{
}

std::optional<PaymentMatch>
PaymentScan::tryMatch(std::size_t index) const
{
    PaymentMetadata metadata;
    try
    {
        metadata = PaymentMetadata::fromJson((*candidates_)[index]);
    }
    catch (InputValidationError const&)
    {
        return std::nullopt;
    }

    auto const secret = sharedSecretOf(metadata.ephemeralPublicKey, scanningKey_);
    auto const expected = StealthAddressEngine::stealthTag(secret);
    if (CRYPTO_memcmp(expected.data(), metadata.stealthTag.data(), expected.size()) != 0)
        return std::nullopt;

    auto amount = engine_->openPaymentMetadata(secret, metadata);
    if (!amount)
        return std::nullopt;

    auto const derivation = engine_->recoverStealthAddress(scanningKey_, metadata.ephemeralPublicKey);

    PaymentMatch match;
    match.index = index;
    match.stealthAddress = derivation.stealthAddress;
    match.stealthPublicKey = derivation.stealthPublicKey;
    match.amount = std::move(*amount);
    match.stealthPrivateKey = engine_->recoverStealthKey(scanningKey_, secret);
    return match;
}

PaymentScan::iterator::iterator(PaymentScan const* scan, std::size_t from) : scan_(scan)
{
    seek(from);
}

void
PaymentScan::iterator::seek(std::size_t from)
{
    current_.reset();
    for (next_ = from; next_ < scan_->candidates(); ++next_)
    {
        current_ = scan_->tryMatch(next_);
        if (current_)
        {
            ++next_;
            return;
        }
    }
}

PaymentScan::iterator&
PaymentScan::iterator::operator++()
{
    if (current_)
        seek(next_);
    return *this;
}

bool
PaymentScan::iterator::operator==(iterator const& other) const
{
    if (!current_ || !other.current_)
        return !current_ && !other.current_;
    return scan_ == other.scan_ && next_ == other.next_;
}

//------------------------------------------------------------------------------

StealthAddressEngine::StealthAddressEngine(RandomSource& rng, Journal j)
    : rng_(rng), j_(j)
{
}

StealthKeyPair
StealthAddressEngine::generateEphemeralKeyPair()
{
    StealthKeyPair pair;
    pair.privateKey = SecretKey::random(rng_);
    pair.publicKey = derivePublicKey(pair.privateKey);
    return pair;
}

Digest
StealthAddressEngine::stealthTag(Digest const& sharedSecret)
{
    return sha256(
        {{sharedSecret.data(), sharedSecret.size()},
         {tagLabel, sizeof(tagLabel) - 1}});
}

StealthDerivation
StealthAddressEngine::derive(PublicKey const& basePoint, Digest const& sharedSecret) const
{
    auto const h = sha256(
        {{stealthLabel, sizeof(stealthLabel) - 1},
         {sharedSecret.data(), sharedSecret.size()},
         {basePoint.data(), PublicKey::size}});

    StealthDerivation d;
    d.stealthPublicKey = addTweak(basePoint, h);
    d.stealthAddress = d.stealthPublicKey.toHex();
    d.sharedSecret = sharedSecret;
    return d;
}

StealthDerivation
StealthAddressEngine::deriveStealthAddress(
    PublicKey const& recipientBasePoint, SecretKey const& ephemeralPrivateKey) const
{
    return derive(recipientBasePoint, sharedSecretOf(recipientBasePoint, ephemeralPrivateKey));
}

StealthDerivation
StealthAddressEngine::recoverStealthAddress(
    SecretKey const& recipientKey, PublicKey const& ephemeralPublicKey) const
{
    return derive(
        derivePublicKey(recipientKey), sharedSecretOf(ephemeralPublicKey, recipientKey));
}

SecretKey
StealthAddressEngine::recoverStealthKey(
    SecretKey const& recipientKey, Digest const& sharedSecret) const
{
    auto const basePoint = derivePublicKey(recipientKey);
    auto const h = sha256(
        {{stealthLabel, sizeof(stealthLabel) - 1},
         {sharedSecret.data(), sharedSecret.size()},
         {basePoint.data(), PublicKey::size}});
    return addTweak(recipientKey, h);
}

PaymentMetadata
StealthAddressEngine::buildPaymentMetadata(
    Digest const& sharedSecret,
    PublicKey const& ephemeralPublicKey,
    mpz_class const& amount)
{
    PaymentMetadata m;
    m.ephemeralPublicKey = ephemeralPublicKey;
    m.encryptedAmount =
        cipher::sealAmount(cipher::amountKey(sharedSecret), amount, ephemeralPublicKey, rng_);
    m.stealthTag = stealthTag(sharedSecret);
    return m;
}

std::optional<mpz_class>
StealthAddressEngine::openPaymentMetadata(
    Digest const& sharedSecret, PaymentMetadata const& metadata) const
{
    auto const expected = stealthTag(sharedSecret);
    if (CRYPTO_memcmp(expected.data(), metadata.stealthTag.data(), expected.size()) != 0)
        return std::nullopt;

    auto amount = cipher::openAmount(
        cipher::amountKey(sharedSecret), metadata.encryptedAmount, metadata.ephemeralPublicKey);
    if (!amount)
        JLOG(j_.debug()) << "payment metadata tag matched but ciphertext did not authenticate";
    return amount;
}

PaymentScan
StealthAddressEngine::scanForPayments(
    SecretKey const& recipientKey, std::vector<Json::Value> candidates) const
{
    return PaymentScan(*this, recipientKey, std::move(candidates));
}

PreparedPayment
StealthAddressEngine::preparePayment(
    PrivacyManifest const& manifest, mpz_class const& amount, Clock::time_point now)
{
    manifest.requireFresh(now);

    auto const ephemeral = generateEphemeralKeyPair();

    PreparedPayment payment;
    payment.derivation = deriveStealthAddress(manifest.basePoint, ephemeral.privateKey);
    payment.metadata = buildPaymentMetadata(
        payment.derivation.sharedSecret, ephemeral.publicKey, amount);

    JLOG(j_.debug()) << "prepared stealth payment to " << payment.derivation.stealthAddress;
    return payment;
}

}  // namespace stealth
}  // namespace umbra
