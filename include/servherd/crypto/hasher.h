#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace servherd::crypto {

// Incremental SHA-256 backed by OpenSSL EVP; digests are lowercase hex
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void update(std::string_view data);
    /// Returns the digest and resets the hasher for the next input
    std::string finalize();

    static std::string hash(std::string_view text);

private:
    void reset();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace servherd::crypto
