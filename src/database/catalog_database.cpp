/**
 * Catalog Database Implementation
 *
 * SQLite-based storage of events and Omori-Utsu analysis results.
 */

#include "omorifit/database/catalog_database.hpp"
#include <sqlite3.h>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>

namespace omorifit {

namespace {

void bindDouble(sqlite3_stmt* stmt, int index, double value) {
    if (std::isfinite(value)) {
        sqlite3_bind_double(stmt, index, value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

double columnDouble(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return schema::NULL_DOUBLE;
    return sqlite3_column_double(stmt, col);
}

std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::string configText(const AnalysisConfig& config) {
    std::ostringstream oss;
    Config cfg = config.toConfig();
    for (const auto& [key, value] : cfg.all()) {
        oss << key << " = " << value << "\n";
    }
    return oss.str();
}

} // namespace

CatalogDatabase::CatalogDatabase()
    : db_(nullptr)
    , author_("omorifit")
    , next_evid_(1)
    , next_runid_(1)
    , next_fitid_(1)
    , stmt_insert_event_(nullptr)
    , stmt_find_event_(nullptr)
    , stmt_insert_run_(nullptr)
    , stmt_insert_fit_(nullptr)
    , stmt_insert_bin_(nullptr)
{
}

CatalogDatabase::~CatalogDatabase() {
    close();
}

bool CatalogDatabase::open(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        finalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
    }

    int rc = sqlite3_open(filename.c_str(), &db_);
    if (rc != SQLITE_OK) {
        setError("Failed to open database");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    executeSQL("PRAGMA foreign_keys = ON;");
    executeSQL("PRAGMA synchronous = NORMAL;");

    // Tables must exist before statements can be prepared
    if (!executeSQL(schema::EventRow::CREATE_SQL) ||
        !executeSQL(schema::AnalysisRunRow::CREATE_SQL) ||
        !executeSQL(schema::SequenceFitRow::CREATE_SQL) ||
        !executeSQL(schema::RateBinRow::CREATE_SQL)) {
        setError("Failed to create tables");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!initializeSequences() || !prepareStatements()) {
        setError("Failed to prepare statements");
        finalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    return true;
}

void CatalogDatabase::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        finalizeStatements();
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool CatalogDatabase::createSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    if (!executeSQL(schema::EventRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::AnalysisRunRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::SequenceFitRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::RateBinRow::CREATE_SQL)) return false;
    if (!executeSQL(schema::CREATE_INDICES_SQL)) return false;

    if (!executeSQL(R"(
        CREATE TABLE IF NOT EXISTS omorifit_meta (
            key TEXT PRIMARY KEY,
            value TEXT
        )
    )")) return false;

    std::string version = std::string("INSERT OR REPLACE INTO omorifit_meta VALUES "
                                      "('schema_version', '") + schema::SCHEMA_VERSION + "')";
    if (!executeSQL(version.c_str())) return false;
    executeSQL("INSERT OR IGNORE INTO omorifit_meta VALUES ('created', datetime('now'))");

    // Statements may have been invalidated by a previous dropSchema
    finalizeStatements();
    return initializeSequences() && prepareStatements();
}

bool CatalogDatabase::dropSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return false;

    finalizeStatements();

    const char* tables[] = {
        "rate_bin", "sequence_fit", "analysis_run", "event", "omorifit_meta"
    };

    bool ok = true;
    for (const auto& table : tables) {
        std::string sql = "DROP TABLE IF EXISTS " + std::string(table);
        ok = executeSQL(sql.c_str()) && ok;
    }

    next_evid_ = next_runid_ = next_fitid_ = 1;
    return ok;
}

std::string CatalogDatabase::schemaVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return "";

    sqlite3_stmt* stmt;
    std::string version;

    if (sqlite3_prepare_v2(db_,
            "SELECT value FROM omorifit_meta WHERE key = 'schema_version'",
            -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = columnText(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    return version;
}

int64_t CatalogDatabase::storeEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insertEvent(event);
}

bool CatalogDatabase::storeEvents(const std::vector<EventPtr>& events) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_ || !executeSQL("BEGIN TRANSACTION")) return false;

    for (const auto& ev : events) {
        if (ev && insertEvent(*ev) < 0) {
            executeSQL("ROLLBACK");
            initializeSequences();
            return false;
        }
    }

    if (!executeSQL("COMMIT")) {
        setError("Failed to commit events");
        executeSQL("ROLLBACK");
        initializeSequences();
        return false;
    }
    return true;
}

int64_t CatalogDatabase::loadEvents(EventStore& store, double min_magnitude) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_) return -1;

    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT event_id, time, lat, lon, depth, magnitude, magtype, place "
        "FROM event WHERE magnitude >= ? ORDER BY time, event_id";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query events");
        return -1;
    }
    sqlite3_bind_double(stmt, 1, min_magnitude);

    int64_t added = 0;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        double depth = columnDouble(stmt, 4);
        Event event(columnText(stmt, 0),
                    fromEpochSeconds(sqlite3_column_double(stmt, 1)),
                    GeoPoint(sqlite3_column_double(stmt, 2),
                             sqlite3_column_double(stmt, 3),
                             std::isfinite(depth) ? depth : 0.0),
                    sqlite3_column_double(stmt, 5),
                    stringToMagnitudeType(columnText(stmt, 6)),
                    columnText(stmt, 7));
        if (store.add(event)) added++;
    }

    if (rc != SQLITE_DONE) {
        setError("Failed to read events");
        sqlite3_finalize(stmt);
        return -1;
    }

    sqlite3_finalize(stmt);
    return added;
}

int64_t CatalogDatabase::storeAnalysis(const AnalysisConfig& config,
                                       const AnalysisOutput& output) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!db_ || !stmt_insert_run_) return -1;
    if (!executeSQL("BEGIN TRANSACTION")) {
        setError("Failed to begin transaction");
        return -1;
    }

    auto fail = [this](const std::string& context) -> int64_t {
        setError(context);
        executeSQL("ROLLBACK");
        initializeSequences();
        return -1;
    };

    const SequenceSummary& s = output.summary;
    int64_t runid = next_runid_++;

    sqlite3_reset(stmt_insert_run_);
    sqlite3_clear_bindings(stmt_insert_run_);
    sqlite3_bind_int64(stmt_insert_run_, 1, runid);
    bindText(stmt_insert_run_, 2, author_);
    bindText(stmt_insert_run_, 3, configText(config));
    sqlite3_bind_int64(stmt_insert_run_, 4, static_cast<int64_t>(s.total_candidates));
    sqlite3_bind_int64(stmt_insert_run_, 5, static_cast<int64_t>(s.insufficient_count));
    sqlite3_bind_int64(stmt_insert_run_, 6, static_cast<int64_t>(s.fitted_count));
    sqlite3_bind_int64(stmt_insert_run_, 7, static_cast<int64_t>(s.success_count));
    bindDouble(stmt_insert_run_, 8, s.p_mean);
    bindDouble(stmt_insert_run_, 9, s.p_std);
    bindDouble(stmt_insert_run_, 10, s.r2_mean);
    bindDouble(stmt_insert_run_, 11, s.r2_fixed_mean);
    sqlite3_bind_double(stmt_insert_run_, 12, currentLddate());

    if (sqlite3_step(stmt_insert_run_) != SQLITE_DONE) {
        return fail("Failed to insert analysis run");
    }

    for (const auto& result : output.results) {
        if (!result.mainshock) continue;

        if (result.insufficient) {
            if (insertFit(runid, result, nullptr, "modified") < 0) {
                return fail("Failed to insert sequence fit");
            }
            continue;
        }

        int64_t fitid = insertFit(runid, result, &result.modified, "modified");
        if (fitid < 0 || !insertBins(fitid, result.series)) {
            return fail("Failed to insert sequence fit");
        }
        if (result.fixed && insertFit(runid, result, &*result.fixed, "fixed") < 0) {
            return fail("Failed to insert sequence fit");
        }
    }

    if (!executeSQL("COMMIT")) {
        return fail("Failed to commit analysis");
    }
    return runid;
}

schema::AnalysisRunRow CatalogDatabase::queryRun(int64_t runid) {
    std::lock_guard<std::mutex> lock(mutex_);

    schema::AnalysisRunRow run;
    if (!db_) return run;

    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT runid, auth, config, n_candidates, n_insufficient, n_fitted, "
        "n_success, p_mean, p_std, r2_mean, r2_fixed_mean, lddate "
        "FROM analysis_run WHERE runid = ?";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query analysis run");
        return run;
    }
    sqlite3_bind_int64(stmt, 1, runid);

    if (sqlite3_step(stmt) == SQLITE_ROW) {
        run.runid = sqlite3_column_int64(stmt, 0);
        run.auth = columnText(stmt, 1);
        run.config = columnText(stmt, 2);
        run.n_candidates = sqlite3_column_int64(stmt, 3);
        run.n_insufficient = sqlite3_column_int64(stmt, 4);
        run.n_fitted = sqlite3_column_int64(stmt, 5);
        run.n_success = sqlite3_column_int64(stmt, 6);
        run.p_mean = columnDouble(stmt, 7);
        run.p_std = columnDouble(stmt, 8);
        run.r2_mean = columnDouble(stmt, 9);
        run.r2_fixed_mean = columnDouble(stmt, 10);
        run.lddate = columnDouble(stmt, 11);
    }

    sqlite3_finalize(stmt);
    return run;
}

std::vector<schema::SequenceFitRow> CatalogDatabase::queryFits(int64_t runid) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<schema::SequenceFitRow> fits;
    if (!db_) return fits;

    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT fitid, runid, mainshock_id, mainshock_time, magnitude, model, "
        "aftershocks, duration_hours, status, K, c, p, p_stderr, r_squared, rmse, "
        "success, iterations, npoints FROM sequence_fit WHERE runid = ? ORDER BY fitid";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query fits");
        return fits;
    }
    sqlite3_bind_int64(stmt, 1, runid);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema::SequenceFitRow row;
        row.fitid = sqlite3_column_int64(stmt, 0);
        row.runid = sqlite3_column_int64(stmt, 1);
        row.mainshock_id = columnText(stmt, 2);
        row.mainshock_time = columnDouble(stmt, 3);
        row.magnitude = columnDouble(stmt, 4);
        row.model = columnText(stmt, 5);
        row.aftershocks = sqlite3_column_int64(stmt, 6);
        row.duration_hours = columnDouble(stmt, 7);
        row.status = columnText(stmt, 8);
        row.K = columnDouble(stmt, 9);
        row.c = columnDouble(stmt, 10);
        row.p = columnDouble(stmt, 11);
        row.p_stderr = columnDouble(stmt, 12);
        row.r_squared = columnDouble(stmt, 13);
        row.rmse = columnDouble(stmt, 14);
        row.success = sqlite3_column_int(stmt, 15) != 0;
        row.iterations = sqlite3_column_int64(stmt, 16);
        row.npoints = sqlite3_column_int64(stmt, 17);
        fits.push_back(row);
    }

    sqlite3_finalize(stmt);
    return fits;
}

std::vector<schema::RateBinRow> CatalogDatabase::queryRateBins(int64_t fitid) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<schema::RateBinRow> bins;
    if (!db_) return bins;

    sqlite3_stmt* stmt;
    const char* sql =
        "SELECT fitid, bin_index, t_start, t_end, t_center, count, rate "
        "FROM rate_bin WHERE fitid = ? ORDER BY bin_index";

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        setError("Failed to query rate bins");
        return bins;
    }
    sqlite3_bind_int64(stmt, 1, fitid);

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        schema::RateBinRow row;
        row.fitid = sqlite3_column_int64(stmt, 0);
        row.bin_index = sqlite3_column_int64(stmt, 1);
        row.t_start = columnDouble(stmt, 2);
        row.t_end = columnDouble(stmt, 3);
        row.t_center = columnDouble(stmt, 4);
        row.count = sqlite3_column_int64(stmt, 5);
        row.rate = columnDouble(stmt, 6);
        bins.push_back(row);
    }

    sqlite3_finalize(stmt);
    return bins;
}

int64_t CatalogDatabase::countEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count("event");
}

int64_t CatalogDatabase::countRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count("analysis_run");
}

int64_t CatalogDatabase::countFits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count("sequence_fit");
}

bool CatalogDatabase::beginTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ && executeSQL("BEGIN TRANSACTION");
}

bool CatalogDatabase::commitTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ && executeSQL("COMMIT");
}

bool CatalogDatabase::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) return false;
    bool ok = executeSQL("ROLLBACK");
    initializeSequences();
    return ok;
}

int64_t CatalogDatabase::insertEvent(const Event& event) {
    if (!db_ || !stmt_insert_event_ || !stmt_find_event_) return -1;

    // Existing catalog id keeps its row
    sqlite3_reset(stmt_find_event_);
    bindText(stmt_find_event_, 1, event.id());
    if (sqlite3_step(stmt_find_event_) == SQLITE_ROW) {
        int64_t existing = sqlite3_column_int64(stmt_find_event_, 0);
        sqlite3_reset(stmt_find_event_);
        return existing;
    }
    sqlite3_reset(stmt_find_event_);

    int64_t evid = next_evid_++;

    sqlite3_reset(stmt_insert_event_);
    sqlite3_bind_int64(stmt_insert_event_, 1, evid);
    bindText(stmt_insert_event_, 2, event.id());
    sqlite3_bind_double(stmt_insert_event_, 3, toEpochSeconds(event.time()));
    sqlite3_bind_double(stmt_insert_event_, 4, event.latitude());
    sqlite3_bind_double(stmt_insert_event_, 5, event.longitude());
    bindDouble(stmt_insert_event_, 6, event.depth());
    sqlite3_bind_double(stmt_insert_event_, 7, event.magnitude());
    bindText(stmt_insert_event_, 8, magnitudeTypeToString(event.magnitudeType()));
    bindText(stmt_insert_event_, 9, event.place());
    sqlite3_bind_double(stmt_insert_event_, 10, currentLddate());

    if (sqlite3_step(stmt_insert_event_) != SQLITE_DONE) {
        setError("Failed to insert event");
        sqlite3_reset(stmt_insert_event_);
        return -1;
    }

    sqlite3_reset(stmt_insert_event_);
    return evid;
}

int64_t CatalogDatabase::insertFit(int64_t runid, const SequenceResult& result,
                                   const OmoriFit* fit, const char* model) {
    if (!stmt_insert_fit_) return -1;

    int64_t fitid = next_fitid_++;
    const Event& ms = *result.mainshock;
    OmoriFit unfit;
    const OmoriFit& f = fit ? *fit : unfit;

    sqlite3_reset(stmt_insert_fit_);
    sqlite3_clear_bindings(stmt_insert_fit_);
    sqlite3_bind_int64(stmt_insert_fit_, 1, fitid);
    sqlite3_bind_int64(stmt_insert_fit_, 2, runid);
    bindText(stmt_insert_fit_, 3, ms.id());
    sqlite3_bind_double(stmt_insert_fit_, 4, toEpochSeconds(ms.time()));
    sqlite3_bind_double(stmt_insert_fit_, 5, ms.magnitude());
    sqlite3_bind_text(stmt_insert_fit_, 6, model, -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt_insert_fit_, 7, static_cast<int64_t>(result.aftershock_count));
    bindDouble(stmt_insert_fit_, 8, result.insufficient ? schema::NULL_DOUBLE
                                                       : result.duration_hours);
    bindText(stmt_insert_fit_, 9, fit ? fitStatusToString(f.status) : result.status());
    bindDouble(stmt_insert_fit_, 10, f.K);
    bindDouble(stmt_insert_fit_, 11, f.c);
    bindDouble(stmt_insert_fit_, 12, f.p);
    bindDouble(stmt_insert_fit_, 13, f.p_stderr);
    bindDouble(stmt_insert_fit_, 14, f.r_squared);
    bindDouble(stmt_insert_fit_, 15, f.rmse);
    sqlite3_bind_int(stmt_insert_fit_, 16, f.success ? 1 : 0);
    sqlite3_bind_int64(stmt_insert_fit_, 17, f.iterations);
    sqlite3_bind_int64(stmt_insert_fit_, 18, f.point_count);
    sqlite3_bind_double(stmt_insert_fit_, 19, currentLddate());

    if (sqlite3_step(stmt_insert_fit_) != SQLITE_DONE) {
        return -1;
    }
    return fitid;
}

bool CatalogDatabase::insertBins(int64_t fitid, const RateSeries& series) {
    if (!stmt_insert_bin_) return false;

    for (size_t i = 0; i < series.bins.size(); i++) {
        const RateBin& b = series.bins[i];

        sqlite3_reset(stmt_insert_bin_);
        sqlite3_bind_int64(stmt_insert_bin_, 1, fitid);
        sqlite3_bind_int64(stmt_insert_bin_, 2, static_cast<int64_t>(i));
        sqlite3_bind_double(stmt_insert_bin_, 3, b.start);
        sqlite3_bind_double(stmt_insert_bin_, 4, b.end);
        sqlite3_bind_double(stmt_insert_bin_, 5, b.center);
        sqlite3_bind_int64(stmt_insert_bin_, 6, b.count);
        sqlite3_bind_double(stmt_insert_bin_, 7, b.rate);

        if (sqlite3_step(stmt_insert_bin_) != SQLITE_DONE) {
            return false;
        }
    }
    return true;
}

bool CatalogDatabase::initializeSequences() {
    sqlite3_stmt* stmt;

    auto getMax = [this, &stmt](const char* table, const char* column, int64_t& value) {
        value = 1;
        std::string sql = "SELECT MAX(" + std::string(column) + ") FROM " + table;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
            if (sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_type(stmt, 0) != SQLITE_NULL) {
                value = sqlite3_column_int64(stmt, 0) + 1;
            }
            sqlite3_finalize(stmt);
        }
    };

    getMax("event", "evid", next_evid_);
    getMax("analysis_run", "runid", next_runid_);
    getMax("sequence_fit", "fitid", next_fitid_);

    return true;
}

bool CatalogDatabase::prepareStatements() {
    int rc;

    // Event insert
    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO event (evid, event_id, time, lat, lon, depth, magnitude, magtype, "
        "place, lddate) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_event_, nullptr);
    if (rc != SQLITE_OK) return false;

    // Event lookup by catalog id
    rc = sqlite3_prepare_v2(db_,
        "SELECT evid FROM event WHERE event_id = ?",
        -1, &stmt_find_event_, nullptr);
    if (rc != SQLITE_OK) return false;

    // Run insert
    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO analysis_run (runid, auth, config, n_candidates, n_insufficient, "
        "n_fitted, n_success, p_mean, p_std, r2_mean, r2_fixed_mean, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_run_, nullptr);
    if (rc != SQLITE_OK) return false;

    // Fit insert
    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO sequence_fit (fitid, runid, mainshock_id, mainshock_time, magnitude, "
        "model, aftershocks, duration_hours, status, K, c, p, p_stderr, r_squared, rmse, "
        "success, iterations, npoints, lddate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_fit_, nullptr);
    if (rc != SQLITE_OK) return false;

    // Rate bin insert
    rc = sqlite3_prepare_v2(db_,
        "INSERT INTO rate_bin (fitid, bin_index, t_start, t_end, t_center, count, rate) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)",
        -1, &stmt_insert_bin_, nullptr);
    if (rc != SQLITE_OK) return false;

    return true;
}

void CatalogDatabase::finalizeStatements() {
    if (stmt_insert_event_) sqlite3_finalize(stmt_insert_event_);
    if (stmt_find_event_) sqlite3_finalize(stmt_find_event_);
    if (stmt_insert_run_) sqlite3_finalize(stmt_insert_run_);
    if (stmt_insert_fit_) sqlite3_finalize(stmt_insert_fit_);
    if (stmt_insert_bin_) sqlite3_finalize(stmt_insert_bin_);

    stmt_insert_event_ = nullptr;
    stmt_find_event_ = nullptr;
    stmt_insert_run_ = nullptr;
    stmt_insert_fit_ = nullptr;
    stmt_insert_bin_ = nullptr;
}

int64_t CatalogDatabase::count(const char* table) const {
    if (!db_) return 0;

    sqlite3_stmt* stmt;
    int64_t n = 0;
    std::string sql = "SELECT COUNT(*) FROM " + std::string(table);

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            n = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
    }

    return n;
}

double CatalogDatabase::currentLddate() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

bool CatalogDatabase::executeSQL(const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        if (errmsg) {
            last_error_ = errmsg;
            sqlite3_free(errmsg);
        }
        return false;
    }
    return true;
}

void CatalogDatabase::setError(const std::string& context) {
    last_error_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "no database");
    std::cerr << "CatalogDatabase error: " << last_error_ << std::endl;
}

} // namespace omorifit
