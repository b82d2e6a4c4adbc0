#include "auth/rate_limiter.hpp"
#include "auth/secret_hasher.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <algorithm>

namespace mailcore {

namespace {

constexpr std::chrono::seconds PURGE_INTERVAL{60};

}  // namespace

RateLimiter::RateLimiter(const SecurityConfig& config, TimeSource now)
    : max_failed_attempts_(std::max(config.max_failed_attempts, 1))
    , lockout_window_(std::chrono::duration_cast<std::chrono::milliseconds>(config.lockout_window))
    , base_backoff_(config.base_backoff_delay)
    , max_backoff_(config.max_backoff_delay)
    , now_(std::move(now)) {
    if (config.authentication_salt.empty()) {
        LOG_WARNING("No authentication salt configured; credential cache keys use a random "
                    "per-process key");
        hmac_key_ = crypto::random_bytes(32);
    } else {
        hmac_key_ = crypto::sha256(config.authentication_salt);
    }
    next_purge_ = now_() + PURGE_INTERVAL;
}

std::string RateLimiter::entry_key(const std::string& client_address, Protocol protocol) {
    return std::string("ratelimit:") + protocol_name(protocol) + ":" + client_address;
}

std::chrono::milliseconds RateLimiter::backoff_delay(int failures) const {
    if (failures <= 0) return std::chrono::milliseconds(0);
    int shift = std::min(failures - 1, 30);
    auto delay = base_backoff_ * (int64_t{1} << shift);
    return std::min(delay, max_backoff_);
}

RateLimitResult RateLimiter::check(const std::string& client_address, Protocol protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();
    purge_expired(now);

    RateLimitResult result;
    auto it = entries_.find(entry_key(client_address, protocol));
    if (it == entries_.end()) {
        return result;
    }

    const Entry& entry = it->second;
    result.failed_attempts = entry.failures;

    if (entry.failures >= max_failed_attempts_) {
        auto lockout_end = entry.first_failure + lockout_window_;
        if (now < lockout_end) {
            result.blocked = true;
            result.retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(lockout_end - now);
            return result;
        }
        entries_.erase(it);
        result.failed_attempts = 0;
        return result;
    }

    auto next_allowed = entry.last_failure + backoff_delay(entry.failures);
    if (now < next_allowed) {
        result.blocked = true;
        result.retry_after = std::chrono::duration_cast<std::chrono::milliseconds>(next_allowed - now);
    }
    return result;
}

void RateLimiter::record_failure(const std::string& client_address, Protocol protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();

    auto key = entry_key(client_address, protocol);
    auto [it, inserted] = entries_.try_emplace(key);
    Entry& entry = it->second;
    if (inserted || now >= entry.expires_at) {
        entry.failures = 0;
        entry.first_failure = now;
    }

    ++entry.failures;
    entry.last_failure = now;
    entry.expires_at = now + lockout_window_;

    if (entry.failures == max_failed_attempts_) {
        LOG_WARNING_FMT("{} locked out after {} failed attempts", key, entry.failures);
    }
}

void RateLimiter::record_success(const std::string& client_address, Protocol protocol) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(entry_key(client_address, protocol));
}

std::string RateLimiter::cache_key(std::string_view identifier, std::string_view secret) const {
    std::string material = to_lower(identifier);
    material += ':';
    material.append(secret);
    return base64_encode(crypto::hmac_sha256(hmac_key_, material));
}

size_t RateLimiter::tracked_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void RateLimiter::purge_expired(Clock::time_point now) {
    if (now < next_purge_) return;
    next_purge_ = now + PURGE_INTERVAL;

    std::erase_if(entries_, [now](const auto& item) {
        return now >= item.second.expires_at;
    });
}

}  // namespace mailcore
