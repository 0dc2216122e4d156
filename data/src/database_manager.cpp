#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <set>
#include <stdexcept>

namespace data
{

    namespace
    {
        std::string toDbTime(core::Timestamp ts)
        {
            return core::utils::timestampToString(ts, 0);
        }

        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            return text ? std::string(reinterpret_cast<const char *>(text)) : std::string();
        }
    } // namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        auto logger = core::logging::getLogger();
        if (connected_)
        {
            logger->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        logger->info("Connecting to SQLite database: {}", database_path_);
        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Cannot open SQLite database '{}': {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Handle is allocated even when open fails
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        sqlite3_busy_timeout(db_, 5000);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : "unknown");
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS historical_bars (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- UTC ISO 8601
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume INTEGER NOT NULL,
            PRIMARY KEY (instrument_key, interval, timestamp)
        );
    )";

        const std::string create_fills_sql = R"(
        CREATE TABLE IF NOT EXISTS fills (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument_key TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            side TEXT NOT NULL,
            quantity INTEGER NOT NULL,
            price REAL NOT NULL,
            commission REAL NOT NULL,
            order_id TEXT,
            exit_reason TEXT,
            strategy_tag TEXT,
            reason TEXT
        );
    )";

        const std::string create_snapshots_sql = R"(
        CREATE TABLE IF NOT EXISTS portfolio_snapshots (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument_key TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            cash REAL NOT NULL,
            position INTEGER NOT NULL,
            average_cost REAL NOT NULL,
            market_price REAL NOT NULL,
            total_equity REAL NOT NULL,
            peak_equity REAL NOT NULL,
            drawdown REAL NOT NULL
        );
    )";

        const std::string create_signals_sql = R"(
        CREATE TABLE IF NOT EXISTS signals (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument_key TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            direction TEXT NOT NULL,
            strength REAL NOT NULL,
            strategy_tag TEXT,
            reason TEXT
        );
    )";

        const std::string create_risk_events_sql = R"(
        CREATE TABLE IF NOT EXISTS risk_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            instrument_key TEXT NOT NULL,
            timestamp TEXT NOT NULL,
            event TEXT NOT NULL,
            detail TEXT
        );
    )";

        bool success = true;
        success &= executeSQL(create_bars_sql);
        success &= executeSQL(create_fills_sql);
        success &= executeSQL(create_snapshots_sql);
        success &= executeSQL(create_signals_sql);
        success &= executeSQL(create_risk_events_sql);

        if (!success)
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed for one or more statements.");
        }
        return success;
    }

    sqlite3_stmt *DatabaseManager::prepare(const char *sql)
    {
        if (!isConnected())
        {
            throw core::StorageException("Not connected to database.");
        }
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::StorageException(fmt::format("Failed to prepare statement [{}]: {}", rc, message));
        }
        return stmt;
    }

    void DatabaseManager::stepAndFinalize(sqlite3_stmt *stmt, const char *what)
    {
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            throw core::StorageException(fmt::format("Failed to insert {} [{}]: {}", what, rc, sqlite3_errmsg(db_)));
        }
    }

    core::TimeSeries<core::Bar> DatabaseManager::queryBars(
        const std::string &instrument_key,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            throw core::DataException("Cannot query bars: Not connected to database.");
        }

        const std::string start_str = toDbTime(start_time);
        const std::string end_str = toDbTime(end_time);
        logger->debug("Querying bars for {} ({}) between '{}' and '{}'", instrument_key, interval, start_str, end_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM historical_bars
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataException(fmt::format("Failed to prepare bar query [{}]: {}", rc, message));
        }

        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, start_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, end_str.c_str(), -1, SQLITE_TRANSIENT);

        core::TimeSeries<core::Bar> bars;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::Bar bar;
            const std::string ts_text = columnText(stmt, 0);
            try
            {
                bar.timestamp = core::utils::stringToTimestamp(ts_text);
            }
            catch (const core::DataException &)
            {
                sqlite3_finalize(stmt);
                throw;
            }
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            bar.volume = sqlite3_column_int64(stmt, 5);
            bars.push_back(bar);
        }

        if (rc != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataException(fmt::format("Error stepping through bar query [{}]: {}", rc, message));
        }
        sqlite3_finalize(stmt);

        logger->debug("Loaded {} bars for {} ({}).", bars.size(), instrument_key, interval);
        return bars;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::Bar> &bars,
                                   const std::string &instrument_key,
                                   const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save for {} ({}).", instrument_key, interval);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO historical_bars
(instrument_key, interval, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            const std::string timestamp_str = toDbTime(bar.timestamp);
            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 3, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 4, bar.open);
            sqlite3_bind_double(stmt, 5, bar.high);
            sqlite3_bind_double(stmt, 6, bar.low);
            sqlite3_bind_double(stmt, 7, bar.close);
            sqlite3_bind_int64(stmt, 8, bar.volume);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        const std::string final_sql = success ? "COMMIT;" : "ROLLBACK;";
        if (!executeSQL(final_sql))
        {
            logger->error("Failed to {} transaction for saving bars.", success ? "COMMIT" : "ROLLBACK");
            if (success)
            {
                executeSQL("ROLLBACK;");
            }
            return false;
        }

        if (success)
        {
            logger->info("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during bar save for {} ({}).", instrument_key, interval);
        }
        return success;
    }

    void DatabaseManager::appendFill(const std::string &instrument_key, const core::Fill &fill)
    {
        sqlite3_stmt *stmt = prepare(R"(
INSERT INTO fills (instrument_key, timestamp, side, quantity, price, commission, order_id, exit_reason, strategy_tag, reason)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
)");
        const std::string timestamp_str = toDbTime(fill.timestamp);
        const std::string side = core::toString(fill.intent.side);
        const std::string exit_reason = core::toString(fill.intent.exit_reason);
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, side.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 4, fill.quantity);
        sqlite3_bind_double(stmt, 5, fill.price);
        sqlite3_bind_double(stmt, 6, fill.commission);
        sqlite3_bind_text(stmt, 7, fill.order_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 8, exit_reason.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 9, fill.intent.signal.strategy_tag.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 10, fill.intent.signal.reason.c_str(), -1, SQLITE_TRANSIENT);
        stepAndFinalize(stmt, "fill");
    }

    void DatabaseManager::appendPortfolioSnapshot(const std::string &instrument_key, const portfolio::PortfolioState &state)
    {
        sqlite3_stmt *stmt = prepare(R"(
INSERT INTO portfolio_snapshots (instrument_key, timestamp, cash, position, average_cost, market_price, total_equity, peak_equity, drawdown)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
)");
        const std::string timestamp_str = toDbTime(state.timestamp);
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 3, state.cash);
        sqlite3_bind_int64(stmt, 4, state.position);
        sqlite3_bind_double(stmt, 5, state.average_cost);
        sqlite3_bind_double(stmt, 6, state.market_price);
        sqlite3_bind_double(stmt, 7, state.total_equity);
        sqlite3_bind_double(stmt, 8, state.peak_equity);
        sqlite3_bind_double(stmt, 9, state.drawdown);
        stepAndFinalize(stmt, "portfolio snapshot");
    }

    void DatabaseManager::appendSignal(const std::string &instrument_key, const core::Signal &signal)
    {
        sqlite3_stmt *stmt = prepare(R"(
INSERT INTO signals (instrument_key, timestamp, direction, strength, strategy_tag, reason)
VALUES (?, ?, ?, ?, ?, ?);
)");
        const std::string timestamp_str = toDbTime(signal.timestamp);
        const std::string direction = core::toString(signal.direction);
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, direction.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(stmt, 4, signal.strength);
        sqlite3_bind_text(stmt, 5, signal.strategy_tag.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 6, signal.reason.c_str(), -1, SQLITE_TRANSIENT);
        stepAndFinalize(stmt, "signal");
    }

    void DatabaseManager::appendRiskEvent(const std::string &instrument_key,
                                          core::Timestamp timestamp,
                                          const std::string &event,
                                          const std::string &detail)
    {
        sqlite3_stmt *stmt = prepare(R"(
INSERT INTO risk_events (instrument_key, timestamp, event, detail)
VALUES (?, ?, ?, ?);
)");
        const std::string timestamp_str = toDbTime(timestamp);
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, event.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, detail.c_str(), -1, SQLITE_TRANSIENT);
        stepAndFinalize(stmt, "risk event");
    }

    std::vector<core::Fill> DatabaseManager::queryFills(const std::string &instrument_key)
    {
        if (!isConnected())
        {
            throw core::DataException("Cannot query fills: Not connected to database.");
        }
        const char *sql = R"(
            SELECT timestamp, side, quantity, price, commission, order_id, strategy_tag, reason
            FROM fills
            WHERE instrument_key = ?
            ORDER BY id ASC;
        )";
        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataException(fmt::format("Failed to prepare fill query [{}]: {}", rc, message));
        }
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);

        std::vector<core::Fill> fills;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            core::Fill fill;
            try
            {
                fill.timestamp = core::utils::stringToTimestamp(columnText(stmt, 0));
            }
            catch (const core::DataException &)
            {
                sqlite3_finalize(stmt);
                throw;
            }
            fill.intent.side = columnText(stmt, 1) == core::toString(core::OrderSide::Sell)
                ? core::OrderSide::Sell : core::OrderSide::Buy;
            fill.quantity = sqlite3_column_int64(stmt, 2);
            fill.intent.quantity = fill.quantity;
            fill.price = sqlite3_column_double(stmt, 3);
            fill.commission = sqlite3_column_double(stmt, 4);
            fill.order_id = columnText(stmt, 5);
            fill.intent.signal.timestamp = fill.timestamp;
            fill.intent.signal.strategy_tag = columnText(stmt, 6);
            fill.intent.signal.reason = columnText(stmt, 7);
            fills.push_back(fill);
        }
        if (rc != SQLITE_DONE)
        {
            std::string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt);
            throw core::DataException(fmt::format("Error stepping through fill query [{}]: {}", rc, message));
        }
        sqlite3_finalize(stmt);
        return fills;
    }

    long long DatabaseManager::countRows(const std::string &table, const std::string &instrument_key)
    {
        static const std::set<std::string> kAuditTables = {
            "historical_bars", "fills", "portfolio_snapshots", "signals", "risk_events"};
        if (kAuditTables.count(table) == 0)
        {
            throw std::invalid_argument(fmt::format("Unknown table '{}'", table));
        }

        const std::string sql = fmt::format("SELECT COUNT(*) FROM {} WHERE instrument_key = ?;", table);
        sqlite3_stmt *stmt = prepare(sql.c_str());
        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        long long count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }

} // namespace data
