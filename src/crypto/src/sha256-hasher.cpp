#include "rangepart/crypto/sha256-hasher.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace rangepart::crypto {

Sha256Hasher::Sha256Hasher() : ctx_(nullptr)
{
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_)
    {
        throw std::runtime_error("Sha256Hasher: EVP_MD_CTX_new() failed");
    }
    if (EVP_DigestInit_ex(
            static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1)
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestInit_ex() failed");
    }
}

Sha256Hasher::~Sha256Hasher()
{
    if (ctx_)
    {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

void
Sha256Hasher::check_context() const
{
    if (!ctx_)
    {
        throw std::runtime_error("Sha256Hasher: context is not valid");
    }
}

void
Sha256Hasher::cleanup_and_throw(const char* msg)
{
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    ctx_ = nullptr;
    throw std::runtime_error(msg);
}

void
Sha256Hasher::update(const void* data, size_t len)
{
    check_context();
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1)
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestUpdate failed");
    }
}

Sha256Digest
Sha256Hasher::finalize()
{
    check_context();
    Sha256Digest digest{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(
            static_cast<EVP_MD_CTX*>(ctx_), digest.data(), &out_len) != 1 ||
        out_len != digest.size())
    {
        cleanup_and_throw("Sha256Hasher: EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    ctx_ = nullptr;
    return digest;
}

Sha256Digest
sha256(std::string_view data)
{
    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finalize();
}

Sha256Digest
hmac_sha256(std::string_view key, std::string_view data)
{
    Sha256Digest digest{};
    unsigned int out_len = 0;
    if (HMAC(EVP_sha256(),
             key.data(),
             static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()),
             data.size(),
             digest.data(),
             &out_len) == nullptr ||
        out_len != digest.size())
    {
        throw std::runtime_error("hmac_sha256: HMAC() failed");
    }
    return digest;
}

std::string
to_hex(const std::uint8_t* data, size_t len)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i)
    {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

}  // namespace rangepart::crypto
