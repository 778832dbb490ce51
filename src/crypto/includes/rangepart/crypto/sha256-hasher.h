#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rangepart::crypto {

using Sha256Digest = std::array<std::uint8_t, 32>;

// RAII wrapper for OpenSSL SHA-256 EVP API
class Sha256Hasher
{
public:
    Sha256Hasher();
    ~Sha256Hasher();

    // Not copyable or movable
    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher&
    operator=(const Sha256Hasher&) = delete;

    /**
     * Update the hash with more data.
     * @param data Pointer to data to hash
     * @param len Length of data in bytes
     * @throws std::runtime_error if the update fails
     */
    void
    update(const void* data, size_t len);

    /**
     * Finalize the hash. The hasher cannot be updated afterwards.
     * @throws std::runtime_error if finalization fails
     */
    Sha256Digest
    finalize();

private:
    void
    check_context() const;

    void
    cleanup_and_throw(const char* msg);

    void* ctx_;  // opaque pointer to avoid including openssl headers here
};

// One-shot SHA-256 of a byte string
Sha256Digest
sha256(std::string_view data);

// HMAC-SHA256 of data under key
Sha256Digest
hmac_sha256(std::string_view key, std::string_view data);

// Lowercase hex encoding
std::string
to_hex(const std::uint8_t* data, size_t len);

inline std::string
to_hex(const Sha256Digest& digest)
{
    return to_hex(digest.data(), digest.size());
}

}  // namespace rangepart::crypto
