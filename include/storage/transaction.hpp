#ifndef TRANSACTION_HPP
#define TRANSACTION_HPP

#include <string>
#include <functional>
#include "storage.hpp"
#include "../utils/service_error.hpp"
#include "../utils/logger.hpp"

namespace sealgate {

// Runs `work` in one transaction. A StorageError is logged and reported as 500;
// the transaction has already been rolled back by then.
inline bool runTransaction(Storage& storage, const std::string& operation, ServiceError& error,
                           const std::function<bool(Store&)>& work) {
    try {
        return storage.transact(work);
    } catch (const StorageError& e) {
        Logger::getInstance().error(operation + " failed: " + e.what());
        error.set(500, "", "storage unavailable");
        return false;
    }
}

} // namespace sealgate

#endif // TRANSACTION_HPP
