#include "../../include/database/db_connection.hpp"
#include "../../include/utils/logger.hpp"
#include <cstring>
#include <cstdlib>
#include <cctype>

namespace sealgate {

// ========== PgResult ==========

PgResult::~PgResult() {
    if (res_) {
        PQclear(res_);
    }
}

PgResult::PgResult(PgResult&& other) noexcept : res_(other.res_) {
    other.res_ = nullptr;
}

PgResult& PgResult::operator=(PgResult&& other) noexcept {
    if (this != &other) {
        if (res_) {
            PQclear(res_);
        }
        res_ = other.res_;
        other.res_ = nullptr;
    }
    return *this;
}

int PgResult::rows() const {
    return res_ ? PQntuples(res_) : 0;
}

int PgResult::affected() const {
    if (!res_) {
        return 0;
    }
    const char* tuples = PQcmdTuples(res_);
    return (tuples && *tuples) ? std::atoi(tuples) : 0;
}

bool PgResult::isNull(int row, int col) const {
    return !res_ || PQgetisnull(res_, row, col);
}

std::string PgResult::text(int row, int col) const {
    if (isNull(row, col)) {
        return "";
    }
    return std::string(PQgetvalue(res_, row, col));
}

int64_t PgResult::int64(int row, int col) const {
    if (isNull(row, col)) {
        return 0;
    }
    return std::strtoll(PQgetvalue(res_, row, col), nullptr, 10);
}

double PgResult::number(int row, int col) const {
    if (isNull(row, col)) {
        return 0.0;
    }
    return std::strtod(PQgetvalue(res_, row, col), nullptr);
}

bool PgResult::boolean(int row, int col) const {
    if (isNull(row, col)) {
        return false;
    }
    return PQgetvalue(res_, row, col)[0] == 't';
}

// ========== PgParams ==========

PgParams& PgParams::add(const std::string& value) {
    values_.push_back(value);
    nulls_.push_back(false);
    return *this;
}

PgParams& PgParams::add(int64_t value) {
    return add(std::to_string(value));
}

PgParams& PgParams::addBool(bool value) {
    return add(std::string(value ? "true" : "false"));
}

PgParams& PgParams::addOptional(const std::string& value) {
    values_.push_back(value);
    nulls_.push_back(value.empty());
    return *this;
}

PgParams& PgParams::addMillis(int64_t millis) {
    values_.push_back(std::to_string(millis));
    nulls_.push_back(millis == 0);
    return *this;
}

PgParams& PgParams::addArray(const std::vector<std::string>& values) {
    std::string literal = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            literal += ",";
        }
        literal += "\"";
        for (char c : values[i]) {
            if (c == '"' || c == '\\') {
                literal += '\\';
            }
            literal += c;
        }
        literal += "\"";
    }
    literal += "}";
    return add(literal);
}

std::vector<const char*> PgParams::pointers() const {
    std::vector<const char*> result;
    result.reserve(values_.size());
    for (size_t i = 0; i < values_.size(); ++i) {
        result.push_back(nulls_[i] ? nullptr : values_[i].c_str());
    }
    return result;
}

// ========== DatabaseConnection ==========

DatabaseConnection::DatabaseConnection(const std::string& host,
                                     const std::string& port,
                                     const std::string& dbname,
                                     const std::string& user,
                                     const std::string& password)
    : host_(host), port_(port), dbname_(dbname), user_(user), password_(password), conn_(nullptr) {
}

DatabaseConnection::~DatabaseConnection() {
    disconnect();
}

bool DatabaseConnection::connect() {
    disconnect();
    std::string conninfo = "host=" + host_ +
                          " port=" + port_ +
                          " dbname=" + dbname_ +
                          " user=" + user_ +
                          " password=" + password_;

    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        logError();
        return false;
    }

    Logger::getInstance().debug("Connected to PostgreSQL database " + dbname_ + " at " + host_ + ":" + port_);
    return true;
}

void DatabaseConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool DatabaseConnection::isConnected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* DatabaseConnection::executeQuery(const std::string& query) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return nullptr;
    }

    PGresult* res = PQexec(conn_, query.c_str());

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        logError();
        PQclear(res);
        return nullptr;
    }

    return res;
}

PGresult* DatabaseConnection::executePrepared(const std::string& stmt_name,
                                             int n_params,
                                             const char* const* param_values) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return nullptr;
    }

    // -1 length marks a NULL parameter; every parameter is sent in text format
    std::vector<int> param_lengths(n_params > 0 ? n_params : 0);
    std::vector<int> param_formats(n_params > 0 ? n_params : 0, 0);
    for (int i = 0; i < n_params; i++) {
        param_lengths[i] = param_values[i] == nullptr ? -1 : static_cast<int>(strlen(param_values[i]));
    }

    PGresult* res = PQexecPrepared(conn_, stmt_name.c_str(), n_params, param_values,
                                   param_lengths.data(), param_formats.data(), 0);

    if (PQresultStatus(res) != PGRES_COMMAND_OK && PQresultStatus(res) != PGRES_TUPLES_OK) {
        std::string error_msg = PQresultErrorMessage(res) ? PQresultErrorMessage(res) : "Unknown error";
        Logger::getInstance().error("PostgreSQL prepared statement error (" + stmt_name + "): " + error_msg);
        PQclear(res);
        return nullptr;
    }

    return res;
}

bool DatabaseConnection::prepareStatement(const std::string& stmt_name, const std::string& query) {
    if (!isConnected()) {
        Logger::getInstance().error("Database not connected");
        return false;
    }

    // Highest $N placeholder gives the parameter count
    int param_count = 0;
    size_t pos = 0;
    while ((pos = query.find('$', pos)) != std::string::npos) {
        pos++;
        if (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
            int num = 0;
            while (pos < query.length() && std::isdigit(static_cast<unsigned char>(query[pos]))) {
                num = num * 10 + (query[pos] - '0');
                pos++;
            }
            if (num > param_count) param_count = num;
        }
    }

    PGresult* res = PQprepare(conn_, stmt_name.c_str(), query.c_str(), param_count, nullptr);
    bool ok = PQresultStatus(res) == PGRES_COMMAND_OK;
    if (!ok) {
        Logger::getInstance().error("Failed to prepare statement '" + stmt_name + "' with " +
                                    std::to_string(param_count) + " params: " + PQerrorMessage(conn_));
    } else {
        Logger::getInstance().debug("Prepared statement '" + stmt_name + "' with " +
                                    std::to_string(param_count) + " parameters");
    }
    PQclear(res);
    return ok;
}

std::string DatabaseConnection::getLastError() const {
    if (conn_) {
        return PQerrorMessage(conn_);
    }
    return "No connection";
}

void DatabaseConnection::logError() {
    if (conn_) {
        Logger::getInstance().error("PostgreSQL error: " + std::string(PQerrorMessage(conn_)));
    }
}

} // namespace sealgate
