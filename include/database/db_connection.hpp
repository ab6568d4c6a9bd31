#ifndef DB_CONNECTION_HPP
#define DB_CONNECTION_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <libpq-fe.h>

namespace sealgate {

// Owns a PGresult and clears it on destruction.
class PgResult {
public:
    PgResult() = default;
    explicit PgResult(PGresult* res) : res_(res) {}
    ~PgResult();

    PgResult(const PgResult&) = delete;
    PgResult& operator=(const PgResult&) = delete;
    PgResult(PgResult&& other) noexcept;
    PgResult& operator=(PgResult&& other) noexcept;

    bool ok() const { return res_ != nullptr; }
    int rows() const;
    int affected() const;
    bool isNull(int row, int col) const;
    // Empty string for NULL.
    std::string text(int row, int col) const;
    // 0 for NULL.
    int64_t int64(int row, int col) const;
    double number(int row, int col) const;
    bool boolean(int row, int col) const;

private:
    PGresult* res_ = nullptr;
};

// Positional text parameters for PQexecPrepared. Values stay owned here.
class PgParams {
public:
    PgParams& add(const std::string& value);
    PgParams& add(int64_t value);
    PgParams& addBool(bool value);
    // NULL when empty.
    PgParams& addOptional(const std::string& value);
    // Epoch milliseconds; NULL when 0.
    PgParams& addMillis(int64_t millis);
    // Postgres array literal, e.g. {"a","b"}.
    PgParams& addArray(const std::vector<std::string>& values);

    int size() const { return static_cast<int>(values_.size()); }
    std::vector<const char*> pointers() const;

private:
    std::vector<std::string> values_;
    std::vector<bool> nulls_;
};

class DatabaseConnection {
public:
    DatabaseConnection(const std::string& host,
                      const std::string& port,
                      const std::string& dbname,
                      const std::string& user,
                      const std::string& password);
    ~DatabaseConnection();

    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    PGresult* executeQuery(const std::string& query);
    PGresult* executePrepared(const std::string& stmt_name,
                              int n_params,
                              const char* const* param_values);

    bool prepareStatement(const std::string& stmt_name,
                          const std::string& query);

    std::string getLastError() const;

private:
    std::string host_;
    std::string port_;
    std::string dbname_;
    std::string user_;
    std::string password_;
    PGconn* conn_;

    void logError();
};

} // namespace sealgate

#endif // DB_CONNECTION_HPP
