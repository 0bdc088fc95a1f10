#include "printlink/core/StatusStream.hpp"
#include "printlink/log/Log.hpp"

#include <vector>

namespace printlink::core {

namespace asio = printlink::net::asio;

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::None:       return "none";
        case ConnectionStatus::Connecting: return "connecting";
        case ConnectionStatus::Connected:  return "connected";
    }
    return "unknown";
}

StatusStream::StatusStream(std::shared_ptr<asio::io_context> io)
: io_(std::move(io))
, strand_(asio::make_strand(*io_))
, shared_(std::make_shared<Shared>())
{}

StatusStream::SubscriptionId StatusStream::subscribe(Listener listener) {
    std::lock_guard lock(shared_->mutex);
    const auto id = shared_->nextId++;
    shared_->listeners.emplace(id, std::make_shared<Listener>(std::move(listener)));
    return id;
}

void StatusStream::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(shared_->mutex);
    shared_->listeners.erase(id);
}

std::size_t StatusStream::subscriberCount() const {
    std::lock_guard lock(shared_->mutex);
    return shared_->listeners.size();
}

void StatusStream::publish(ConnectionStatus status) {
    logDebug("[StatusStream] publish ", toString(status), "\n");
    asio::post(strand_, [shared = shared_, status] {
        std::vector<std::shared_ptr<Listener>> snapshot;
        {
            std::lock_guard lock(shared->mutex);
            snapshot.reserve(shared->listeners.size());
            for (const auto& entry : shared->listeners) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& listener : snapshot) {
            if (*listener) {
                (*listener)(status);
            }
        }
    });
}

} // namespace printlink::core
