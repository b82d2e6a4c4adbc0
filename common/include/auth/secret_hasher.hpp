#pragma once

#include <string>
#include <string_view>
#include <cstddef>

namespace mailcore {

namespace crypto {

// Throws std::runtime_error when the OpenSSL RNG cannot deliver.
std::string random_bytes(size_t count);
std::string sha256(std::string_view data);
std::string hmac_sha256(std::string_view key, std::string_view data);
bool constant_time_equals(std::string_view a, std::string_view b);

}  // namespace crypto

// PBKDF2-SHA256 hashing of credential secrets.
// Format: $pbkdf2-sha256$<iterations>$<salt hex>$<hash hex>
class SecretHasher {
public:
    static constexpr int DEFAULT_ITERATIONS = 100000;
    static constexpr size_t KEY_PREFIX_LENGTH = 12;

    explicit SecretHasher(int iterations = DEFAULT_ITERATIONS);

    std::string hash(std::string_view secret) const;
    bool verify(std::string_view secret, std::string_view encoded) const;

    // New random API key, 48 hex characters.
    static std::string generate_key();

    // Indexed lookup prefix of a raw key.
    static std::string key_prefix(std::string_view key);

private:
    int iterations_;
};

}  // namespace mailcore
