#include <libumbra/stealth/PaymentCipher.h>
#include <libumbra/basics/Errors.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cstring>
#include <memory>

namespace umbra {
namespace stealth {

namespace {

struct CipherContextDeleter
{
    void operator()(EVP_CIPHER_CTX* ctx) const
    {
        EVP_CIPHER_CTX_free(ctx);
    }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

CipherContext
newCipherContext()
{
    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        throw CryptoArtifactError("EVP_CIPHER_CTX_new failed");
    return ctx;
}

void
check(int result, char const* what)
{
    if (result != 1)
        throw CryptoArtifactError(std::string("chacha20-poly1305: ") + what + " failed");
}

char const amountLabel[] = "umbra.amount";

}  // namespace

Digest
sha256(std::initializer_list<std::pair<void const*, std::size_t>> parts)
{
    SHA256_CTX ctx;
    SHA256_Init(&ctx);
    for (auto const& [data, size] : parts)
        SHA256_Update(&ctx, data, size);
    Digest out;
    SHA256_Final(out.data(), &ctx);
    OPENSSL_cleanse(&ctx, sizeof(ctx));
    return out;
}

namespace cipher {

Digest
amountKey(Digest const& sharedSecret)
{
    return sha256(
        {{amountLabel, sizeof(amountLabel) - 1},
         {sharedSecret.data(), sharedSecret.size()}});
}

Blob
sealAmount(
    Digest const& key,
    mpz_class const& amount,
    PublicKey const& ephemeralPublicKey,
    RandomSource& rng)
{
    if (sgn(amount) < 0 || mpz_sizeinbase(amount.get_mpz_t(), 2) > amountSize * 8)
        throw InputValidationError("amount must fit in 256 bits");

    std::array<std::uint8_t, amountSize> plain{};
    std::size_t count = 0;
    std::array<std::uint8_t, amountSize> raw{};
    mpz_export(raw.data(), &count, 1, 1, 1, 0, amount.get_mpz_t());
    std::copy(raw.begin(), raw.begin() + count, plain.end() - count);

    Blob sealed(sealedSize);
    rng.fill(sealed.data(), nonceSize);

    auto ctx = newCipherContext();
    int len = 0;
    check(EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr),
          "init");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, nonceSize, nullptr),
          "set nonce length");
    check(EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.data()),
          "set key");
    check(EVP_EncryptUpdate(
              ctx.get(), nullptr, &len, ephemeralPublicKey.data(), PublicKey::size),
          "aad");
    check(EVP_EncryptUpdate(
              ctx.get(), sealed.data() + nonceSize, &len, plain.data(), plain.size()),
          "encrypt");
    check(EVP_EncryptFinal_ex(ctx.get(), sealed.data() + nonceSize + len, &len),
          "finalize");
    check(EVP_CIPHER_CTX_ctrl(
              ctx.get(),
              EVP_CTRL_AEAD_GET_TAG,
              tagSize,
              sealed.data() + nonceSize + amountSize),
          "get tag");

    OPENSSL_cleanse(plain.data(), plain.size());
    OPENSSL_cleanse(raw.data(), raw.size());
    return sealed;
}

std::optional<mpz_class>
openAmount(Digest const& key, Blob const& sealed, PublicKey const& ephemeralPublicKey)
{
    if (sealed.size() != sealedSize)
        return std::nullopt;

    auto ctx = newCipherContext();
    int len = 0;
    std::array<std::uint8_t, amountSize> plain{};
    std::array<std::uint8_t, tagSize> tag;
    std::memcpy(tag.data(), sealed.data() + nonceSize + amountSize, tagSize);

    check(EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr),
          "init");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, nonceSize, nullptr),
          "set nonce length");
    check(EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.data()),
          "set key");
    check(EVP_DecryptUpdate(
              ctx.get(), nullptr, &len, ephemeralPublicKey.data(), PublicKey::size),
          "aad");
    check(EVP_DecryptUpdate(
              ctx.get(), plain.data(), &len, sealed.data() + nonceSize, amountSize),
          "decrypt");
    check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, tagSize, tag.data()),
          "set tag");

    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + len, &len) != 1)
    {
        OPENSSL_cleanse(plain.data(), plain.size());
        return std::nullopt;
    }

    mpz_class amount;
    mpz_import(amount.get_mpz_t(), plain.size(), 1, 1, 1, 0, plain.data());
    OPENSSL_cleanse(plain.data(), plain.size());
    return amount;
}

}  // namespace cipher

}  // namespace stealth
}  // namespace umbra
