#include "auth/secret_hasher.hpp"
#include "encoding.hpp"

#include <charconv>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace mailcore {

namespace crypto {

std::string random_bytes(size_t count) {
    std::string bytes(count, '\0');
    if (count > 0 &&
        RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes;
}

std::string sha256(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return std::string(reinterpret_cast<const char*>(digest), sizeof(digest));
}

std::string hmac_sha256(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest, &length);
    return std::string(reinterpret_cast<const char*>(digest), length);
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace crypto

namespace {

constexpr std::string_view HASH_SCHEME = "$pbkdf2-sha256$";
constexpr int DERIVED_KEY_LENGTH = 32;
constexpr size_t SALT_LENGTH = 16;

std::string derive(std::string_view secret, std::string_view salt, int iterations) {
    unsigned char derived[DERIVED_KEY_LENGTH];
    PKCS5_PBKDF2_HMAC(
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        DERIVED_KEY_LENGTH, derived
    );
    return std::string(reinterpret_cast<const char*>(derived), DERIVED_KEY_LENGTH);
}

}  // namespace

SecretHasher::SecretHasher(int iterations)
    : iterations_(iterations > 0 ? iterations : DEFAULT_ITERATIONS) {
}

std::string SecretHasher::hash(std::string_view secret) const {
    std::string salt = crypto::random_bytes(SALT_LENGTH);
    std::string derived = derive(secret, salt, iterations_);

    std::string encoded(HASH_SCHEME);
    encoded += std::to_string(iterations_);
    encoded += '$';
    encoded += hex_encode(salt);
    encoded += '$';
    encoded += hex_encode(derived);
    return encoded;
}

bool SecretHasher::verify(std::string_view secret, std::string_view encoded) const {
    if (encoded.substr(0, HASH_SCHEME.size()) != HASH_SCHEME) {
        return false;
    }
    encoded.remove_prefix(HASH_SCHEME.size());

    size_t iter_end = encoded.find('$');
    if (iter_end == std::string_view::npos) return false;
    size_t salt_end = encoded.find('$', iter_end + 1);
    if (salt_end == std::string_view::npos) return false;

    int iterations = 0;
    auto iter_text = encoded.substr(0, iter_end);
    auto [ptr, ec] = std::from_chars(iter_text.data(), iter_text.data() + iter_text.size(), iterations);
    if (ec != std::errc() || ptr != iter_text.data() + iter_text.size() || iterations <= 0) {
        return false;
    }

    auto salt = hex_decode(encoded.substr(iter_end + 1, salt_end - iter_end - 1));
    auto expected = hex_decode(encoded.substr(salt_end + 1));
    if (!salt || !expected) return false;

    return crypto::constant_time_equals(derive(secret, *salt, iterations), *expected);
}

std::string SecretHasher::generate_key() {
    return hex_encode(crypto::random_bytes(24));
}

std::string SecretHasher::key_prefix(std::string_view key) {
    return std::string(key.substr(0, KEY_PREFIX_LENGTH));
}

}  // namespace mailcore
