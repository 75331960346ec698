#pragma once

// ============================================================
// hash.hpp -- Content and key hashing for tardelta
//
// SHA-1 (OpenSSL EVP) fingerprints entry payloads; xxHash3
// hashes path keys for the in-memory index and lookup sets.
// ============================================================

#include "platform.hpp"
#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include <xxhash.h>

namespace hash {

// 20-byte (160-bit) SHA-1 digest
using Sha1Digest = std::array<u8, 20>;

// Streaming SHA-1 hasher
class Sha1Hasher {
public:
    Sha1Hasher() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha1) failed");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    // Finishes the digest; the hasher must be reset() before reuse.
    Sha1Digest digest() {
        Sha1Digest out{};
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 ||
            out_len != out.size()) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
};

// One-shot SHA-1 of a memory buffer
inline Sha1Digest sha1(const void* data, size_t len) {
    Sha1Hasher h;
    h.update(data, len);
    return h.digest();
}

// Hash functor for path-keyed unordered containers
struct PathHash {
    size_t operator()(std::string_view s) const noexcept {
        return (size_t)XXH3_64bits(s.data(), s.size());
    }
};

// Lowercase hex rendering of a digest (logging only)
template<size_t N>
inline std::string to_hex(const std::array<u8, N>& d) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(N * 2);
    for (u8 b : d) {
        s.push_back(digits[b >> 4]);
        s.push_back(digits[b & 0x0F]);
    }
    return s;
}

} // namespace hash
