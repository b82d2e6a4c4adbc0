#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <cstdint>

#include "auth/rate_limiter.hpp"
#include "auth/secret_hasher.hpp"
#include "auth/scope.hpp"
#include "background_task_queue.hpp"
#include "config.hpp"
#include "storage/stores.hpp"

namespace mailcore {

namespace auth_result {

struct Success {
    User user;
    int64_t credential_id = 0;
};

struct NotFound {};
struct ScopeDenied {};

struct RateLimited {
    std::chrono::milliseconds retry_after{0};
};

}  // namespace auth_result

using AuthResult = std::variant<auth_result::Success,
                                auth_result::NotFound,
                                auth_result::ScopeDenied,
                                auth_result::RateLimited>;

inline bool is_success(const AuthResult& result) {
    return std::holds_alternative<auth_result::Success>(result);
}

const char* describe(const AuthResult& result);

// Verifies identifier + API key pairs for the protocol listeners.
// Every attempt is registered with the rate limiter; successful results are
// memoized under an HMAC of the credentials for a short time.
class Authenticator {
public:
    Authenticator(UserStore& users, RateLimiter& rate_limiter,
                  BackgroundTaskQueue& tasks, const SecurityConfig& config);

    Authenticator(const Authenticator&) = delete;
    Authenticator& operator=(const Authenticator&) = delete;

    AuthResult authenticate(std::string_view identifier, std::string_view secret,
                            Protocol protocol, const std::string& client_address);

    size_t cache_size();
    void clear_cache();

private:
    using Clock = std::chrono::steady_clock;

    struct CacheEntry {
        User user;
        int64_t credential_id = 0;
        ScopeSet scopes;
        Clock::time_point expires_at;
    };

    AuthResult verify(const std::string& address, std::string_view secret, Scope scope,
                      const std::string& cache_key, Protocol protocol,
                      const std::string& client_address);
    AuthResult finish_success(const User& user, int64_t credential_id,
                              Protocol protocol, const std::string& client_address);
    AuthResult finish_failure(AuthResult result, const std::string& address,
                              Protocol protocol, const std::string& client_address);

    void queue_last_used(int64_t credential_id);
    void remember(const std::string& key, CacheEntry entry);

    UserStore& users_;
    RateLimiter& rate_limiter_;
    BackgroundTaskQueue& tasks_;
    SecretHasher hasher_;
    std::chrono::seconds cache_ttl_;
    size_t cache_max_entries_;

    std::unordered_map<std::string, CacheEntry> cache_;
    std::mutex cache_mutex_;
};

}  // namespace mailcore
