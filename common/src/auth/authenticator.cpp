#include "auth/authenticator.hpp"
#include "encoding.hpp"
#include "logger.hpp"

#include <algorithm>

namespace mailcore {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

const char* describe(const AuthResult& result) {
    return std::visit(overloaded{
        [](const auth_result::Success&) { return "success"; },
        [](const auth_result::NotFound&) { return "credential not found"; },
        [](const auth_result::ScopeDenied&) { return "scope denied"; },
        [](const auth_result::RateLimited&) { return "rate limited"; },
    }, result);
}

Authenticator::Authenticator(UserStore& users, RateLimiter& rate_limiter,
                             BackgroundTaskQueue& tasks, const SecurityConfig& config)
    : users_(users)
    , rate_limiter_(rate_limiter)
    , tasks_(tasks)
    , hasher_(config.hash_iterations)
    , cache_ttl_(config.auth_cache_ttl)
    , cache_max_entries_(config.auth_cache_max_entries) {
}

AuthResult Authenticator::authenticate(std::string_view identifier, std::string_view secret,
                                       Protocol protocol, const std::string& client_address) {
    auto limit = rate_limiter_.check(client_address, protocol);
    if (limit.blocked) {
        auto retry_after = limit.retry_after.value_or(std::chrono::milliseconds(0));
        LOG_WARNING_FMT("{} authentication from {} rate limited ({} failures, retry in {} ms)",
                        protocol_name(protocol), client_address, limit.failed_attempts,
                        retry_after.count());
        return auth_result::RateLimited{retry_after};
    }

    std::string address = to_lower(trim(identifier));
    if (address.empty() || secret.empty()) {
        return finish_failure(auth_result::NotFound{}, address, protocol, client_address);
    }

    Scope scope = required_scope(protocol);
    std::string key = rate_limiter_.cache_key(address, secret);

    std::optional<CacheEntry> cached;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            if (Clock::now() < it->second.expires_at) {
                cached = it->second;
            } else {
                cache_.erase(it);
            }
        }
    }

    if (cached) {
        if (!cached->scopes.contains(scope)) {
            return finish_failure(auth_result::ScopeDenied{}, address, protocol, client_address);
        }
        LOG_DEBUG_FMT("{} authentication for {} served from cache", protocol_name(protocol), address);
        return finish_success(cached->user, cached->credential_id, protocol, client_address);
    }

    return verify(address, secret, scope, key, protocol, client_address);
}

AuthResult Authenticator::verify(const std::string& address, std::string_view secret, Scope scope,
                                 const std::string& cache_key, Protocol protocol,
                                 const std::string& client_address) {
    auto account = users_.find_user_with_credentials(address);
    if (!account || !account->user.active) {
        return finish_failure(auth_result::NotFound{}, address, protocol, client_address);
    }

    // Keys carrying the presented prefix first, then keys stored without one.
    std::vector<Credential> candidates;
    for (auto& credential : users_.find_credentials_by_prefix(SecretHasher::key_prefix(secret))) {
        if (credential.user_id == account->user.id && credential.is_active()) {
            candidates.push_back(std::move(credential));
        }
    }
    for (const auto& credential : account->credentials) {
        if (credential.key_prefix.empty()) {
            candidates.push_back(credential);
        }
    }

    for (const auto& credential : candidates) {
        if (!hasher_.verify(secret, credential.key_hash)) {
            continue;
        }
        if (!credential.scopes.contains(scope)) {
            LOG_WARNING_FMT("Key {} of {} lacks the {} scope", credential.id, address, scope_name(scope));
            return finish_failure(auth_result::ScopeDenied{}, address, protocol, client_address);
        }

        remember(cache_key, CacheEntry{account->user, credential.id, credential.scopes,
                                       Clock::now() + cache_ttl_});
        return finish_success(account->user, credential.id, protocol, client_address);
    }

    return finish_failure(auth_result::NotFound{}, address, protocol, client_address);
}

AuthResult Authenticator::finish_success(const User& user, int64_t credential_id,
                                         Protocol protocol, const std::string& client_address) {
    rate_limiter_.record_success(client_address, protocol);
    queue_last_used(credential_id);
    LOG_INFO_FMT("{} login for {} from {}", protocol_name(protocol), user.address, client_address);
    return auth_result::Success{user, credential_id};
}

AuthResult Authenticator::finish_failure(AuthResult result, const std::string& address,
                                         Protocol protocol, const std::string& client_address) {
    rate_limiter_.record_failure(client_address, protocol);
    LOG_WARNING_FMT("{} authentication failed for '{}' from {}: {}",
                    protocol_name(protocol), address, client_address, describe(result));
    return result;
}

void Authenticator::queue_last_used(int64_t credential_id) {
    if (credential_id <= 0) return;

    auto now = std::chrono::system_clock::now();
    UserStore& users = users_;
    bool queued = tasks_.enqueue("credential-last-used", [&users, credential_id, now]() {
        if (!users.mark_credential_used(credential_id, now)) {
            LOG_WARNING_FMT("Could not record last use of key {}", credential_id);
        }
    });
    if (!queued) {
        LOG_DEBUG_FMT("Background queue closed, skipping last-used update for key {}", credential_id);
    }
}

void Authenticator::remember(const std::string& key, CacheEntry entry) {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    if (cache_.size() >= cache_max_entries_) {
        auto now = Clock::now();
        std::erase_if(cache_, [now](const auto& item) { return now >= item.second.expires_at; });
    }
    if (!cache_.empty() && cache_.size() >= cache_max_entries_) {
        auto oldest = std::min_element(cache_.begin(), cache_.end(), [](const auto& a, const auto& b) {
            return a.second.expires_at < b.second.expires_at;
        });
        cache_.erase(oldest);
    }

    cache_[key] = std::move(entry);
}

size_t Authenticator::cache_size() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void Authenticator::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

}  // namespace mailcore
