#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

#include "config.hpp"
#include "storage/stores.hpp"
#include "mx_resolver.hpp"
#include "smtp_client.hpp"
#include "message_builder.hpp"

namespace mailcore::smtp {

// Outcome of one recipient in one delivery attempt.
struct RecipientOutcome {
    size_t index = 0;  // into OutboundEmail::recipients
    bool success = false;
    std::string error;
};

// Polls the outbound queue and delivers due emails, either through the
// configured smarthost or directly to each recipient domain's MX hosts.
class DeliveryEngine {
public:
    DeliveryEngine(const OutboundConfig& config, OutboundStore& store, MxResolver& resolver,
                   SmtpTransport& transport, DeliveryObserver* observer = nullptr);
    ~DeliveryEngine();

    DeliveryEngine(const DeliveryEngine&) = delete;
    DeliveryEngine& operator=(const DeliveryEngine&) = delete;

    // Returns emails interrupted mid-delivery to the queue, then polls
    // every poll_interval until stop().
    void start();
    void stop();
    bool is_running() const { return running_; }

    // Fetches up to max_concurrency due emails and delivers them in parallel.
    size_t process_queue(TimePoint now = std::chrono::system_clock::now());

    // One attempt for one email; the outcome is persisted and reported.
    void deliver(OutboundEmail& email, TimePoint now = std::chrono::system_clock::now());

    // Counts the failed attempt. Failed once max_retries is reached,
    // otherwise Queued again after an exponential backoff.
    void apply_failure(OutboundEmail& email, TimePoint now) const;
    std::chrono::seconds retry_delay(int retry_count) const;

private:
    void run();

    std::vector<RecipientOutcome> deliver_via_relay(OutboundEmail& email, const std::string& content,
                                                    const std::vector<size_t>& pending);
    std::vector<RecipientOutcome> deliver_to_domain(OutboundEmail& email, const std::string& content,
                                                    const std::string& domain,
                                                    const std::vector<size_t>& recipients);

    // One transport call; appends a delivery log row per recipient.
    TransferResult attempt(OutboundEmail& email, const std::string& content, TransferRequest request,
                           const std::vector<size_t>& recipients);

    void record_outcome(OutboundEmail& email, const std::vector<RecipientOutcome>& outcomes, TimePoint now);
    void save(const OutboundEmail& email);
    void notify(const OutboundEmail& email);

    OutboundConfig config_;
    OutboundStore& store_;
    MxResolver& resolver_;
    SmtpTransport& transport_;
    DeliveryObserver* observer_;
    MessageBuilder builder_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    bool stopping_ = false;
};

}  // namespace mailcore::smtp
