#ifndef EVENT_PUBLISHER_HPP
#define EVENT_PUBLISHER_HPP

#include <string>
#include <exception>
#include "../utils/logger.hpp"

namespace sealgate {

// Best-effort fan-out of live events. Channels are "user:<id>".
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    // May throw; callers go through publishQuietly().
    virtual void publish(const std::string& channel, const std::string& event_json) = 0;

    static std::string userChannel(const std::string& user_id) { return "user:" + user_id; }
};

// Delivery happens after commit, so a failure here is logged and dropped.
// Clients recover missed events through message paging and the stored epoch.
inline void publishQuietly(EventPublisher* publisher, const std::string& user_id, const std::string& event_json) {
    if (!publisher) {
        return;
    }
    try {
        publisher->publish(EventPublisher::userChannel(user_id), event_json);
    } catch (const std::exception& e) {
        Logger::getInstance().warning("Publish to user " + user_id + " failed: " + e.what());
    }
}

} // namespace sealgate

#endif // EVENT_PUBLISHER_HPP
