#ifndef CONNECTION_REGISTRY_HPP
#define CONNECTION_REGISTRY_HPP

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "../messaging/event_publisher.hpp"
#include "../metrics/metrics_aggregator.hpp"

namespace sealgate {

// One open push channel to a client device.
class LiveConnection {
public:
    virtual ~LiveConnection() = default;
    // Queues a text frame; must not block.
    virtual void send(const std::string& payload) = 0;
};

/**
 * Tracks the open WebSocket sessions of each user. A user may hold several
 * sessions (one per device). Entries are weak so a dropped socket never keeps
 * its session alive; expired entries are pruned on the next publish or count.
 */
class ConnectionRegistry : public EventPublisher, public ConnectionCounter {
public:
    void add(const std::string& user_id, const std::shared_ptr<LiveConnection>& connection);
    void remove(const std::string& user_id, const LiveConnection* connection);

    // channel must be "user:<id>"; other channels are ignored.
    void publish(const std::string& channel, const std::string& event_json) override;
    ConnectionStats connectionStats() const override;

private:
    std::vector<std::shared_ptr<LiveConnection>> liveConnections(const std::string& user_id);

    mutable std::mutex mutex_;
    mutable std::map<std::string, std::vector<std::weak_ptr<LiveConnection>>> connections_;
};

} // namespace sealgate

#endif // CONNECTION_REGISTRY_HPP
