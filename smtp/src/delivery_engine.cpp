#include "delivery_engine.hpp"
#include "mime/message_parser.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace mailcore::smtp {

namespace asio = boost::asio;

namespace {

constexpr uint16_t MX_PORT = 25;

bool rejected_at_rcpt(const TransferResult& result, size_t n) {
    return n < result.recipients.size() && result.recipients[n].reply.code != 0 &&
           !result.recipients[n].accepted;
}

std::string recipient_error(const TransferResult& result, size_t n) {
    if (result.recipient_delivered(n)) return "";
    if (rejected_at_rcpt(result, n)) {
        return "Recipient rejected: " + result.recipients[n].reply.summary();
    }
    return result.error.empty() ? "Delivery failed" : result.error;
}

}  // namespace

DeliveryEngine::DeliveryEngine(const OutboundConfig& config, OutboundStore& store, MxResolver& resolver,
                               SmtpTransport& transport, DeliveryObserver* observer)
    : config_(config)
    , store_(store)
    , resolver_(resolver)
    , transport_(transport)
    , observer_(observer)
    , builder_(config.sender_domain) {
}

DeliveryEngine::~DeliveryEngine() {
    stop();
}

void DeliveryEngine::start() {
    if (running_) return;
    if (!config_.enabled) {
        LOG_INFO("Outbound mail delivery is disabled");
        return;
    }

    try {
        size_t requeued = store_.requeue_interrupted();
        if (requeued > 0) {
            LOG_WARNING_FMT("Returned {} interrupted deliveries to the queue", requeued);
        }
    } catch (const StoreError& e) {
        LOG_ERROR_FMT("Cannot requeue interrupted deliveries: {}", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
    }
    running_ = true;
    worker_ = std::thread(&DeliveryEngine::run, this);

    LOG_INFO_FMT("Outbound mail delivery started with max concurrency {}{}", config_.max_concurrency,
                 config_.uses_relay() ? " via relay " + config_.relay_host : "");
}

void DeliveryEngine::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    if (running_) {
        running_ = false;
        LOG_INFO("Outbound mail delivery stopped");
    }
}

void DeliveryEngine::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        lock.unlock();
        try {
            process_queue();
        } catch (const std::exception& e) {
            LOG_ERROR_FMT("Error processing delivery queue: {}", e.what());
        }
        lock.lock();
        cv_.wait_for(lock, config_.poll_interval, [this] { return stopping_; });
    }
}

size_t DeliveryEngine::process_queue(TimePoint now) {
    auto emails = store_.fetch_due(std::max<size_t>(config_.max_concurrency, 1), now);
    if (emails.empty()) {
        return 0;
    }

    LOG_INFO_FMT("Processing {} queued emails for delivery", emails.size());

    if (emails.size() == 1) {
        deliver(emails.front(), now);
        return 1;
    }

    asio::thread_pool pool(emails.size());
    for (auto& email : emails) {
        asio::post(pool, [this, &email, now]() { deliver(email, now); });
    }
    pool.join();
    return emails.size();
}

void DeliveryEngine::deliver(OutboundEmail& email, TimePoint now) {
    try {
        email.status = OutboundStatus::Sending;
        save(email);
        notify(email);

        std::vector<size_t> pending;
        for (size_t i = 0; i < email.recipients.size(); ++i) {
            auto status = email.recipients[i].status;
            if (status == RecipientStatus::Pending || status == RecipientStatus::Deferred) {
                pending.push_back(i);
            }
        }

        if (pending.empty()) {
            LOG_WARNING_FMT("Email {} has no recipients left to deliver to", email.id);
            email.status = OutboundStatus::Failed;
            email.last_error = "No recipients";
            email.next_retry_at.reset();
        } else {
            std::string content = builder_.build(email);
            std::vector<RecipientOutcome> outcomes;

            if (config_.uses_relay()) {
                outcomes = deliver_via_relay(email, content, pending);
            } else {
                std::vector<std::pair<std::string, std::vector<size_t>>> domains;
                for (size_t index : pending) {
                    std::string domain = mime::address_domain(email.recipients[index].address);
                    auto it = std::find_if(domains.begin(), domains.end(),
                                           [&](const auto& entry) { return entry.first == domain; });
                    if (it == domains.end()) {
                        domains.emplace_back(domain, std::vector<size_t>{index});
                    } else {
                        it->second.push_back(index);
                    }
                }
                for (const auto& [domain, members] : domains) {
                    auto part = deliver_to_domain(email, content, domain, members);
                    outcomes.insert(outcomes.end(), part.begin(), part.end());
                }
            }

            record_outcome(email, outcomes, now);
        }

        save(email);
        notify(email);
    } catch (const std::exception& e) {
        LOG_ERROR_FMT("Unexpected error delivering email {}: {}", email.id, e.what());
        email.last_error = e.what();
        apply_failure(email, now);
        try {
            save(email);
            notify(email);
        } catch (const std::exception& inner) {
            LOG_ERROR_FMT("Cannot record failed delivery of email {}: {}", email.id, inner.what());
        }
    }
}

std::vector<RecipientOutcome> DeliveryEngine::deliver_via_relay(OutboundEmail& email, const std::string& content,
                                                                const std::vector<size_t>& pending) {
    TransferRequest request;
    request.host = config_.relay_host;
    request.port = config_.relay_port;
    request.tls = config_.relay_use_tls ? TlsPolicy::Required : TlsPolicy::Opportunistic;
    request.username = config_.relay_username;
    request.password = config_.relay_password;

    auto result = attempt(email, content, std::move(request), pending);
    if (!result.delivered) {
        LOG_ERROR_FMT("Failed to deliver email {} via relay {}: {}", email.id, config_.relay_host, result.error);
    }

    std::vector<RecipientOutcome> outcomes;
    for (size_t n = 0; n < pending.size(); ++n) {
        outcomes.push_back(RecipientOutcome{pending[n], result.recipient_delivered(n), recipient_error(result, n)});
    }
    return outcomes;
}

std::vector<RecipientOutcome> DeliveryEngine::deliver_to_domain(OutboundEmail& email, const std::string& content,
                                                                const std::string& domain,
                                                                const std::vector<size_t>& recipients) {
    std::vector<RecipientOutcome> outcomes;
    if (domain.empty()) {
        for (size_t index : recipients) {
            outcomes.push_back(RecipientOutcome{index, false, "Invalid recipient address"});
        }
        return outcomes;
    }

    auto hosts = resolver_.resolve(domain);

    std::vector<RecipientOutcome> by_position(recipients.size());
    for (size_t n = 0; n < recipients.size(); ++n) {
        by_position[n] = RecipientOutcome{recipients[n], false, "No mail hosts for " + domain};
    }

    // Positions into `recipients` still to be tried on the next host.
    std::vector<size_t> remaining(recipients.size());
    for (size_t n = 0; n < remaining.size(); ++n) remaining[n] = n;

    std::string last_error;
    for (const auto& host : hosts) {
        if (remaining.empty()) break;

        std::vector<size_t> indexes;
        for (size_t position : remaining) indexes.push_back(recipients[position]);

        TransferRequest request;
        request.host = host;
        request.port = MX_PORT;
        request.tls = TlsPolicy::Opportunistic;

        auto result = attempt(email, content, std::move(request), indexes);
        if (!result.delivered) {
            last_error = result.error;
            LOG_WARNING_FMT("Failed to deliver email {} to MX host {} for {}: {}",
                            email.id, host, domain, result.error);
        }

        std::vector<size_t> next;
        for (size_t n = 0; n < remaining.size(); ++n) {
            auto& outcome = by_position[remaining[n]];
            outcome.success = result.recipient_delivered(n);
            outcome.error = recipient_error(result, n);
            // A permanent RCPT rejection is final; other failures move on to the next host.
            bool permanent = rejected_at_rcpt(result, n) && result.recipients[n].reply.code >= 500;
            if (!outcome.success && !permanent) {
                next.push_back(remaining[n]);
            }
        }
        remaining = std::move(next);
    }

    if (!hosts.empty()) {
        for (size_t position : remaining) {
            by_position[position].error = std::format("All MX hosts for {} failed: {}", domain, last_error);
        }
    }

    outcomes = std::move(by_position);
    return outcomes;
}

TransferResult DeliveryEngine::attempt(OutboundEmail& email, const std::string& content, TransferRequest request,
                                       const std::vector<size_t>& recipients) {
    request.helo_name = config_.sender_domain;
    request.mail_from = email.from_address;
    request.content = content;
    request.recipients.clear();
    for (size_t index : recipients) {
        request.recipients.push_back(email.recipients[index].address);
    }

    auto started = std::chrono::steady_clock::now();
    TransferResult result = transport_.send(request);
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    auto attempted_at = std::chrono::system_clock::now();

    for (size_t n = 0; n < recipients.size(); ++n) {
        const auto& recipient = email.recipients[recipients[n]];

        DeliveryLog log;
        log.outbound_email_id = email.id;
        log.recipient_id = recipient.id;
        log.recipient_address = recipient.address;
        log.mx_host = request.host;
        log.success = result.recipient_delivered(n);
        log.error_message = recipient_error(result, n);
        if (rejected_at_rcpt(result, n)) {
            log.smtp_status_code = result.recipients[n].reply.code;
            log.smtp_response = result.recipients[n].reply.text();
        } else if (result.reply.code != 0) {
            log.smtp_status_code = result.reply.code;
            log.smtp_response = result.reply.text();
        }
        log.attempt_number = email.retry_count + 1;
        log.attempted_at = attempted_at;
        log.duration = duration;

        if (!store_.append_delivery_log(log)) {
            LOG_WARNING_FMT("Delivery log for email {} recipient {} not written", email.id, recipient.address);
        }
    }

    return result;
}

void DeliveryEngine::record_outcome(OutboundEmail& email, const std::vector<RecipientOutcome>& outcomes,
                                    TimePoint now) {
    size_t succeeded = 0;
    std::string errors;
    for (const auto& outcome : outcomes) {
        auto& recipient = email.recipients[outcome.index];
        if (outcome.success) {
            recipient.status = RecipientStatus::Sent;
            recipient.status_message.clear();
            recipient.delivered_at = now;
            ++succeeded;
        } else {
            recipient.status = RecipientStatus::Failed;
            recipient.status_message = outcome.error;
            if (!errors.empty()) errors += "; ";
            errors += recipient.address + ": " + outcome.error;
        }
    }

    if (succeeded == outcomes.size()) {
        email.status = OutboundStatus::Sent;
        email.sent_at = now;
        email.last_error.clear();
        email.next_retry_at.reset();
        LOG_INFO_FMT("Email {} delivered to all {} recipients", email.id, succeeded);
    } else if (succeeded == 0) {
        email.last_error = errors;
        apply_failure(email, now);
    } else {
        email.status = OutboundStatus::PartialFailure;
        email.sent_at = now;
        email.last_error = errors;
        email.next_retry_at.reset();
        LOG_WARNING_FMT("Email {} partially delivered. Failed recipients: {}", email.id, errors);
    }
}

void DeliveryEngine::apply_failure(OutboundEmail& email, TimePoint now) const {
    ++email.retry_count;

    if (email.retry_count >= config_.max_retries) {
        email.status = OutboundStatus::Failed;
        email.next_retry_at.reset();
        for (auto& recipient : email.recipients) {
            if (recipient.status != RecipientStatus::Sent) {
                recipient.status = RecipientStatus::Failed;
            }
        }
        LOG_ERROR_FMT("Email {} permanently failed after {} attempts", email.id, email.retry_count);
        return;
    }

    auto delay = retry_delay(email.retry_count);
    email.status = OutboundStatus::Queued;
    email.next_retry_at = now + delay;
    for (auto& recipient : email.recipients) {
        if (recipient.status != RecipientStatus::Sent) {
            recipient.status = RecipientStatus::Deferred;
        }
    }
    LOG_WARNING_FMT("Email {} deferred, attempt {}/{}, next retry in {}s",
                    email.id, email.retry_count, config_.max_retries, delay.count());
}

std::chrono::seconds DeliveryEngine::retry_delay(int retry_count) const {
    auto delay = config_.retry_base_delay;
    for (int i = 1; i < retry_count && delay < config_.retry_max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.retry_max_delay);
}

void DeliveryEngine::save(const OutboundEmail& email) {
    if (!store_.update(email)) {
        LOG_WARNING_FMT("Outbound email {} no longer exists", email.id);
    }
}

void DeliveryEngine::notify(const OutboundEmail& email) {
    if (!observer_) return;
    try {
        observer_->on_status_changed(email.user_id, email.id, email.status);
    } catch (const std::exception& e) {
        LOG_WARNING_FMT("Delivery status notification for email {} failed: {}", email.id, e.what());
    }
}

}  // namespace mailcore::smtp
