#include <libumbra/basics/RandomSource.h>
#include <libumbra/basics/Errors.h>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>

namespace umbra {

namespace {

std::string
lastOpenSslError()
{
    unsigned long const code = ERR_get_error();
    if (code == 0)
        return "no error detail";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

}  // namespace

CryptoRandom::CryptoRandom(std::size_t reseedInterval)
    : reseedInterval_(reseedInterval)
{
}

void
CryptoRandom::reseed()
{
    if (RAND_poll() != 1)
        throw RngFailureError("RAND_poll failed: " + lastOpenSslError());
    sinceReseed_ = 0;
}

void
CryptoRandom::fill(std::uint8_t* out, std::size_t size)
{
    if (reseedInterval_ != 0 && sinceReseed_.fetch_add(size) >= reseedInterval_)
        reseed();

    while (size > 0)
    {
        int const chunk = size > INT_MAX ? INT_MAX : static_cast<int>(size);
        if (RAND_bytes(out, chunk) != 1)
            throw RngFailureError("RAND_bytes failed: " + lastOpenSslError());
        out += chunk;
        size -= chunk;
    }
}

RandomSource&
cryptoRandom()
{
    static CryptoRandom source;
    return source;
}

}  // namespace umbra
