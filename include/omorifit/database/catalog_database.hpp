#pragma once

/**
 * Catalog Database Interface
 *
 * SQLite storage for the earthquake catalog and for aftershock analysis
 * runs: per-sequence Omori-Utsu fits and the rate series behind them.
 */

#include "catalog_schema.hpp"
#include "omorifit/analysis/sequence_analyzer.hpp"
#include "omorifit/core/event_store.hpp"
#include <memory>
#include <mutex>
#include <vector>

// Forward declare sqlite3 types
struct sqlite3;
struct sqlite3_stmt;

namespace omorifit {

/**
 * CatalogDatabase - SQLite catalog and analysis result store
 */
class CatalogDatabase {
public:
    CatalogDatabase();
    ~CatalogDatabase();

    // Prevent copying
    CatalogDatabase(const CatalogDatabase&) = delete;
    CatalogDatabase& operator=(const CatalogDatabase&) = delete;

    // Connection management
    bool open(const std::string& filename);
    bool isOpen() const { return db_ != nullptr; }
    void close();

    // Schema management
    bool createSchema();
    bool dropSchema();
    std::string schemaVersion() const;

    void setAuthor(const std::string& auth) { author_ = auth; }
    const std::string& author() const { return author_; }

    // Catalog. Storing an event whose id already exists returns the
    // existing evid and leaves the row untouched.
    int64_t storeEvent(const Event& event);
    bool storeEvents(const std::vector<EventPtr>& events);
    bool storeEvents(const EventStore& store) { return storeEvents(store.events()); }

    // Adds every stored event with magnitude >= min_magnitude to the
    // store; returns the number added or -1 on error
    int64_t loadEvents(EventStore& store, double min_magnitude = -10.0);

    // Run, fits and rate bins in one transaction; returns the run id
    int64_t storeAnalysis(const AnalysisConfig& config, const AnalysisOutput& output);

    // Query methods
    schema::AnalysisRunRow queryRun(int64_t runid);
    std::vector<schema::SequenceFitRow> queryFits(int64_t runid);
    std::vector<schema::RateBinRow> queryRateBins(int64_t fitid);

    // Statistics
    int64_t countEvents() const;
    int64_t countRuns() const;
    int64_t countFits() const;

    // Transaction support
    bool beginTransaction();
    bool commitTransaction();
    bool rollbackTransaction();

    // Last error message
    std::string lastError() const { return last_error_; }

private:
    sqlite3* db_;
    std::string author_;
    std::string last_error_;
    mutable std::mutex mutex_;

    // ID generators
    int64_t next_evid_;
    int64_t next_runid_;
    int64_t next_fitid_;

    // Prepared statements
    sqlite3_stmt* stmt_insert_event_;
    sqlite3_stmt* stmt_find_event_;
    sqlite3_stmt* stmt_insert_run_;
    sqlite3_stmt* stmt_insert_fit_;
    sqlite3_stmt* stmt_insert_bin_;

    // Internal helpers, called with mutex_ held
    int64_t insertEvent(const Event& event);
    int64_t insertFit(int64_t runid, const SequenceResult& result,
                      const OmoriFit* fit, const char* model);
    bool insertBins(int64_t fitid, const RateSeries& series);

    bool initializeSequences();
    bool prepareStatements();
    void finalizeStatements();
    int64_t count(const char* table) const;
    double currentLddate() const;
    bool executeSQL(const char* sql);
    void setError(const std::string& context);
};

} // namespace omorifit
