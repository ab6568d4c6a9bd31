#ifndef CONNECTION_POOL_HPP
#define CONNECTION_POOL_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <condition_variable>
#include <functional>
#include "db_connection.hpp"

namespace sealgate {

/**
 * Fixed-size pool of PostgreSQL connections.
 *
 * A connection is handed out as a Lease and returned when the lease goes out of
 * scope. Dropped connections are re-established on the next acquire and passed
 * to the on-connect hook again so prepared statements exist on every session.
 */
class ConnectionPool {
public:
    using ConnectHook = std::function<bool(DatabaseConnection&)>;

    class Lease {
    public:
        Lease(ConnectionPool& pool, DatabaseConnection* conn) : pool_(&pool), conn_(conn) {}
        ~Lease();
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(other.conn_) { other.conn_ = nullptr; }

        DatabaseConnection& connection() { return *conn_; }

    private:
        ConnectionPool* pool_;
        DatabaseConnection* conn_;
    };

    static constexpr std::chrono::milliseconds kDefaultAcquireTimeout{5000};

    ConnectionPool(const std::string& host, const std::string& port, const std::string& dbname,
                   const std::string& user, const std::string& password, int size,
                   std::chrono::milliseconds acquire_timeout = kDefaultAcquireTimeout);

    // Opens every connection and runs the hook on each. Returns false if any fails.
    bool open(const ConnectHook& on_connect);

    // Waits up to the acquire timeout for a free connection. Throws StorageError
    // on timeout or if the connection cannot be (re)connected.
    Lease acquire();

private:
    void release(DatabaseConnection* conn);

    std::vector<std::unique_ptr<DatabaseConnection>> connections_;
    std::vector<DatabaseConnection*> idle_;
    ConnectHook on_connect_;
    std::chrono::milliseconds acquire_timeout_;
    std::mutex mutex_;
    std::condition_variable available_;
};

} // namespace sealgate

#endif // CONNECTION_POOL_HPP
