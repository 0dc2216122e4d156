#pragma once

#include <string>
#include <vector>

#include <sqlite3.h>

#include "datatypes.hpp"
#include "portfolio.hpp" // PortfolioState

namespace data {

// SQLite store for market data and the audit trail of a run.
// Timestamps are stored as UTC ISO 8601 text so lexicographic order is time order.
class DatabaseManager {
public:
    // ":memory:" opens a private in-memory database
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Bulk insert inside one transaction; bars already stored for the same
    // (instrument, interval, timestamp) are ignored
    bool saveBars(const core::TimeSeries<core::Bar>& bars,
                  const std::string& instrument_key,
                  const std::string& interval);

    // Bars in [start_time, end_time] ordered by timestamp. Throws core::DataException.
    core::TimeSeries<core::Bar> queryBars(const std::string& instrument_key,
                                          const std::string& interval,
                                          core::Timestamp start_time,
                                          core::Timestamp end_time);

    // --- Audit trail (throw core::StorageException on failure) ---
    void appendFill(const std::string& instrument_key, const core::Fill& fill);
    void appendPortfolioSnapshot(const std::string& instrument_key, const portfolio::PortfolioState& state);
    void appendSignal(const std::string& instrument_key, const core::Signal& signal);
    void appendRiskEvent(const std::string& instrument_key,
                         core::Timestamp timestamp,
                         const std::string& event,
                         const std::string& detail);

    // Fills of an instrument in insertion order. Throws core::DataException.
    std::vector<core::Fill> queryFills(const std::string& instrument_key);

    long long countRows(const std::string& table, const std::string& instrument_key);

private:
    sqlite3_stmt* prepare(const char* sql);
    void stepAndFinalize(sqlite3_stmt* stmt, const char* what);

    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
