#include "../../include/server/connection_registry.hpp"
#include "../../include/utils/logger.hpp"
#include <algorithm>

namespace sealgate {

namespace {

const std::string kUserChannelPrefix = "user:";

} // namespace

void ConnectionRegistry::add(const std::string& user_id, const std::shared_ptr<LiveConnection>& connection) {
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& list = connections_[user_id];
        list.push_back(connection);
        count = list.size();
    }
    Logger::getInstance().info("WebSocket registered for user " + user_id + " (" + std::to_string(count) +
                               " open)");
}

void ConnectionRegistry::remove(const std::string& user_id, const LiveConnection* connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    if (it == connections_.end()) {
        return;
    }
    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [connection](const std::weak_ptr<LiveConnection>& entry) {
                                  auto live = entry.lock();
                                  return !live || live.get() == connection;
                              }),
               list.end());
    if (list.empty()) {
        connections_.erase(it);
    }
}

std::vector<std::shared_ptr<LiveConnection>> ConnectionRegistry::liveConnections(const std::string& user_id) {
    std::vector<std::shared_ptr<LiveConnection>> live;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    if (it == connections_.end()) {
        return live;
    }
    auto& list = it->second;
    for (auto entry = list.begin(); entry != list.end();) {
        if (auto connection = entry->lock()) {
            live.push_back(std::move(connection));
            ++entry;
        } else {
            entry = list.erase(entry);
        }
    }
    if (list.empty()) {
        connections_.erase(it);
    }
    return live;
}

void ConnectionRegistry::publish(const std::string& channel, const std::string& event_json) {
    if (channel.compare(0, kUserChannelPrefix.size(), kUserChannelPrefix) != 0) {
        Logger::getInstance().warning("Ignoring publish on unknown channel " + channel);
        return;
    }
    const std::string user_id = channel.substr(kUserChannelPrefix.size());

    // Sends happen outside the lock; a session may call remove() from its own callbacks.
    auto targets = liveConnections(user_id);
    if (targets.empty()) {
        Logger::getInstance().debug("No live connection for user " + user_id);
        return;
    }
    for (const auto& connection : targets) {
        connection->send(event_json);
    }
}

ConnectionStats ConnectionRegistry::connectionStats() const {
    ConnectionStats stats;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = connections_.begin(); it != connections_.end();) {
        int64_t live = 0;
        for (const auto& entry : it->second) {
            if (!entry.expired()) {
                ++live;
            }
        }
        if (live == 0) {
            it = connections_.erase(it);
            continue;
        }
        stats.per_user[it->first] = live;
        stats.total += live;
        ++it;
    }
    return stats;
}

} // namespace sealgate
