#include "../../include/database/connection_pool.hpp"
#include "../../include/utils/logger.hpp"
#include "../../include/utils/service_error.hpp"

namespace sealgate {

ConnectionPool::Lease::~Lease() {
    if (conn_) {
        pool_->release(conn_);
    }
}

ConnectionPool::ConnectionPool(const std::string& host, const std::string& port, const std::string& dbname,
                               const std::string& user, const std::string& password, int size,
                               std::chrono::milliseconds acquire_timeout)
    : acquire_timeout_(acquire_timeout) {
    if (size < 1) {
        size = 1;
    }
    for (int i = 0; i < size; ++i) {
        connections_.push_back(std::make_unique<DatabaseConnection>(host, port, dbname, user, password));
    }
}

bool ConnectionPool::open(const ConnectHook& on_connect) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_connect_ = on_connect;
    idle_.clear();
    for (auto& conn : connections_) {
        if (!conn->connect()) {
            Logger::getInstance().error("Failed to open pooled database connection");
            return false;
        }
        if (on_connect_ && !on_connect_(*conn)) {
            Logger::getInstance().error("Failed to prepare pooled database connection");
            return false;
        }
        idle_.push_back(conn.get());
    }
    Logger::getInstance().info("Database pool ready with " + std::to_string(connections_.size()) + " connections");
    return true;
}

ConnectionPool::Lease ConnectionPool::acquire() {
    DatabaseConnection* conn = nullptr;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!available_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty(); })) {
            Logger::getInstance().error("Timed out waiting for a pooled database connection");
            throw StorageError("no database connection available");
        }
        conn = idle_.back();
        idle_.pop_back();
    }
    Lease lease(*this, conn);

    if (!conn->isConnected()) {
        Logger::getInstance().warning("Pooled database connection lost, reconnecting");
        if (!conn->connect() || (on_connect_ && !on_connect_(*conn))) {
            throw StorageError("database connection unavailable");
        }
    }
    return lease;
}

void ConnectionPool::release(DatabaseConnection* conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(conn);
    }
    available_.notify_one();
}

} // namespace sealgate
