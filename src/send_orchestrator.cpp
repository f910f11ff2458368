#include "send_orchestrator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <vector>

namespace bhumi {

SendOrchestrator::SendOrchestrator(net::io_context& ioc,
                                   ConnectionRegistry& registry,
                                   CapabilityStore& capabilities,
                                   ResponseCache& cache,
                                   std::chrono::milliseconds send_timeout,
                                   std::chrono::seconds cache_ttl)
    : ioc_(ioc)
    , registry_(registry)
    , capabilities_(capabilities)
    , cache_(cache)
    , send_timeout_(send_timeout)
    , cache_ttl_(cache_ttl) {
    registry_.add_unbind_listener([this](ConnectionHandle handle, const std::optional<Id52>&) {
        fail_pending_for(handle);
    });
}

void SendOrchestrator::complete(const Completion& completion, SendOutcome outcome) {
    MetricsRegistry::instance().increment_counter(
        std::string("send_result_") + status_to_string(outcome.status) + "_total");
    if (completion) {
        completion(std::move(outcome));
    }
}

void SendOrchestrator::send(const SendRequest& request, Completion completion) {
    auto& metrics = MetricsRegistry::instance();
    metrics.increment_counter("send_total");

    // 1. A cached response answers the retry without touching the recipient.
    if (auto cached = cache_.take(request.preimage)) {
        metrics.increment_counter("cache_hit_total");
        complete(completion, SendOutcome::success(std::move(*cached)));
        return;
    }

    // 2. Offline recipients consume nothing.
    auto recipient = registry_.lookup(request.to_id52);
    if (!recipient) {
        complete(completion, SendOutcome::failure(SendStatus::RECIPIENT_OFFLINE));
        return;
    }

    // 3. Admission. A consumed commit is never refunded past this point.
    if (!capabilities_.try_consume(request.to_id52, request.preimage)) {
        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::ADMISSION_DENIED,
                           "internal", "Invalid or consumed capability for " + short_id(request.to_id52));
        complete(completion, SendOutcome::failure(SendStatus::INVALID_CAPABILITY));
        return;
    }

    // 4. Register before forwarding so an immediate ACK always finds the entry.
    const ConnectionHandle recipient_handle = recipient->handle();
    PendingSend entry;
    entry.recipient = recipient_handle;
    entry.preimage = request.preimage;
    entry.completion = std::move(completion);
    const CorrelationId id = insert_pending(std::move(entry));

    // An unbind that ran before the insert could not see this entry.
    if (!registry_.is_live(recipient_handle)) {
        fail_pending_for(recipient_handle);
        return;
    }

    Deliver deliver{id, request.payload};
    if (!recipient->send_frame(make_frame(MessageType::DELIVER, deliver.encode()))) {
        fail_pending_for(recipient_handle);
    }
}

CorrelationId SendOrchestrator::insert_pending(PendingSend entry) {
    auto timer = std::make_shared<net::steady_timer>(net::make_strand(ioc_));
    entry.timer = timer;

    for (;;) {
        CorrelationId id = next_id_.fetch_add(1);
        if (id == 0) continue;

        auto& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        if (shard.pending.count(id)) continue;

        shard.pending.emplace(id, std::move(entry));
        MetricsRegistry::instance().increment_gauge("pending_sends");

        // Armed on the timer's strand while the entry is locked in, so a
        // resolver's cancel is always queued behind it.
        net::post(timer->get_executor(), [this, id, timer, timeout = send_timeout_]() {
            timer->expires_after(timeout);
            timer->async_wait([this, id, timer](const boost::system::error_code& ec) {
                if (ec == net::error::operation_aborted) return;
                on_timeout(id);
            });
        });
        return id;
    }
}

// Caller has already taken the entry out of its shard.
void SendOrchestrator::finish(PendingSend& entry, SendOutcome outcome) {
    MetricsRegistry::instance().decrement_gauge("pending_sends");

    auto timer = entry.timer;
    if (timer) {
        net::post(timer->get_executor(), [timer]() {
            timer->cancel();
        });
    }
    complete(entry.completion, std::move(outcome));
}

void SendOrchestrator::on_timeout(CorrelationId id) {
    PendingSend entry;
    {
        auto& shard = shard_for(id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.pending.find(id);
        if (it == shard.pending.end()) return;
        entry = std::move(it->second);
        shard.pending.erase(it);
    }

    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::DELIVERY,
                       "internal", "Delivery " + std::to_string(id) + " timed out");
    finish(entry, SendOutcome::failure(SendStatus::RECIPIENT_TIMEOUT));
}

bool SendOrchestrator::on_ack(ConnectionHandle from, const Ack& ack) {
    PendingSend entry;
    {
        auto& shard = shard_for(ack.correlation_id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.pending.find(ack.correlation_id);
        if (it == shard.pending.end() || it->second.recipient != from) {
            MetricsRegistry::instance().increment_counter("ack_ignored_total");
            return false;
        }
        entry = std::move(it->second);
        shard.pending.erase(it);
    }

    cache_.store(entry.preimage, ack.payload, cache_ttl_);
    finish(entry, SendOutcome::success(ack.payload));
    return true;
}

size_t SendOrchestrator::fail_pending_for(ConnectionHandle recipient) {
    std::vector<PendingSend> failed;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.pending.begin(); it != shard.pending.end(); ) {
            if (it->second.recipient == recipient) {
                failed.push_back(std::move(it->second));
                it = shard.pending.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : failed) {
        finish(entry, SendOutcome::failure(SendStatus::RECIPIENT_DISCONNECTED));
    }
    return failed.size();
}

size_t SendOrchestrator::pending_count() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.pending.size();
    }
    return total;
}

}
