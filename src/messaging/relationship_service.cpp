#include "../../include/messaging/relationship_service.hpp"
#include "../../include/storage/transaction.hpp"
#include "../../include/utils/logger.hpp"

namespace sealgate {

RelationshipService::RelationshipService(Storage& storage, const Clock& clock)
    : storage_(storage), clock_(clock) {}

bool RelationshipService::registerUser(const std::string& user_id, const std::string& username,
                                       ServiceError& error) {
    {
        std::lock_guard<std::mutex> lock(known_mutex_);
        if (known_users_.count(user_id) && username.empty()) {
            return true;
        }
    }
    User user;
    user.id = user_id;
    user.username = username;
    user.created_at = clock_.nowMillis();
    bool ok = runTransaction(storage_, "registerUser", error, [&](Store& store) {
        store.upsertUser(user);
        return true;
    });
    if (ok) {
        std::lock_guard<std::mutex> lock(known_mutex_);
        known_users_.insert(user_id);
    }
    return ok;
}

bool RelationshipService::block(const std::string& caller, const std::string& target_user_id,
                                bool& already_blocked, ServiceError& error) {
    if (target_user_id.empty()) {
        error.set(400, "", "user_id is required");
        return false;
    }
    if (target_user_id == caller) {
        error.set(400, "", "Cannot block yourself");
        return false;
    }
    already_blocked = false;
    return runTransaction(storage_, "block", error, [&](Store& store) {
        User target;
        if (!store.findUser(target_user_id, target)) {
            error.set(404, "", "User not found");
            return false;
        }
        BlockEntry entry;
        entry.blocker_id = caller;
        entry.blocked_id = target_user_id;
        entry.created_at = clock_.nowMillis();
        already_blocked = !store.insertBlock(entry);
        if (!already_blocked) {
            Logger::getInstance().info("User " + caller + " blocked " + target_user_id);
        }
        return true;
    });
}

bool RelationshipService::unblock(const std::string& caller, const std::string& target_user_id,
                                  ServiceError& error) {
    return runTransaction(storage_, "unblock", error, [&](Store& store) {
        if (!store.deleteBlock(caller, target_user_id)) {
            error.set(404, "", "User is not blocked");
            return false;
        }
        Logger::getInstance().info("User " + caller + " unblocked " + target_user_id);
        return true;
    });
}

bool RelationshipService::listBlocks(const std::string& caller, std::vector<BlockEntry>& blocks,
                                     ServiceError& error) {
    return runTransaction(storage_, "listBlocks", error, [&](Store& store) {
        blocks = store.listBlocks(caller);
        return true;
    });
}

bool RelationshipService::blockedEitherWay(Store& store, const std::string& user_a, const std::string& user_b) {
    return store.isBlocked(user_a, user_b) || store.isBlocked(user_b, user_a);
}

bool RelationshipService::related(Store& store, const std::string& user_a, const std::string& user_b) {
    return store.shareConversation(user_a, user_b) || store.shareActiveGroup(user_a, user_b);
}

} // namespace sealgate
