#ifndef RELATIONSHIP_SERVICE_HPP
#define RELATIONSHIP_SERVICE_HPP

#include <string>
#include <vector>
#include <set>
#include <mutex>
#include "../storage/storage.hpp"
#include "../utils/clock.hpp"
#include "../utils/service_error.hpp"

namespace sealgate {

// User directory and block list; answers "does X exist", "is X blocked" and
// "do X and Y already know each other" for the other components.
class RelationshipService {
public:
    RelationshipService(Storage& storage, const Clock& clock);

    // Records a caller seen at the gateway. Cached per process after the first write.
    bool registerUser(const std::string& user_id, const std::string& username, ServiceError& error);

    bool block(const std::string& caller, const std::string& target_user_id, bool& already_blocked,
               ServiceError& error);
    bool unblock(const std::string& caller, const std::string& target_user_id, ServiceError& error);
    bool listBlocks(const std::string& caller, std::vector<BlockEntry>& blocks, ServiceError& error);

    // Transaction-scoped checks shared by the key, conversation and relay paths.
    static bool blockedEitherWay(Store& store, const std::string& user_a, const std::string& user_b);
    static bool related(Store& store, const std::string& user_a, const std::string& user_b);

private:
    Storage& storage_;
    const Clock& clock_;
    std::mutex known_mutex_;
    std::set<std::string> known_users_;
};

} // namespace sealgate

#endif // RELATIONSHIP_SERVICE_HPP
