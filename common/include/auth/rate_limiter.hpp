#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <functional>

#include "auth/scope.hpp"
#include "config.hpp"

namespace mailcore {

struct RateLimitResult {
    bool blocked = false;
    int failed_attempts = 0;
    std::optional<std::chrono::milliseconds> retry_after;
};

// Failed-authentication tracking per (client address, protocol).
// Reaching max_failed_attempts locks the key out until lockout_window has
// passed since the first failure. Below that each failure imposes an
// exponential delay before the next attempt is allowed.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    explicit RateLimiter(const SecurityConfig& config, TimeSource now = &Clock::now);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    RateLimitResult check(const std::string& client_address, Protocol protocol);
    void record_failure(const std::string& client_address, Protocol protocol);
    void record_success(const std::string& client_address, Protocol protocol);

    // base64(HMAC-SHA256(key, lower(identifier) ":" secret)). The key derives
    // from the configured salt, or is random per process when none is set.
    std::string cache_key(std::string_view identifier, std::string_view secret) const;

    size_t tracked_entries();

private:
    struct Entry {
        int failures = 0;
        Clock::time_point first_failure;
        Clock::time_point last_failure;
        Clock::time_point expires_at;
    };

    static std::string entry_key(const std::string& client_address, Protocol protocol);
    std::chrono::milliseconds backoff_delay(int failures) const;
    void purge_expired(Clock::time_point now);

    int max_failed_attempts_;
    std::chrono::milliseconds lockout_window_;
    std::chrono::milliseconds base_backoff_;
    std::chrono::milliseconds max_backoff_;
    TimeSource now_;
    std::string hmac_key_;

    std::unordered_map<std::string, Entry> entries_;
    Clock::time_point next_purge_;
    std::mutex mutex_;
};

}  // namespace mailcore
