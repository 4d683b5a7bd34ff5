#pragma once

/**
 * OmoriFit Catalog Database Schema
 *
 * Table definitions for the event catalog and the results of aftershock
 * sequence analyses. Times are epoch seconds (UTC); missing numeric
 * values are stored as NULL.
 */

#include <cstdint>
#include <limits>
#include <string>

namespace omorifit {
namespace schema {

constexpr const char* SCHEMA_VERSION = "1.0";

constexpr int64_t NULL_INT = -1;
constexpr double NULL_DOUBLE = std::numeric_limits<double>::quiet_NaN();

/**
 * EVENT table - Catalog earthquakes
 */
struct EventRow {
    int64_t evid = NULL_INT;        // Internal identifier
    std::string event_id;           // Catalog identifier (unique)
    double time = NULL_DOUBLE;      // Origin time (epoch)
    double lat = NULL_DOUBLE;
    double lon = NULL_DOUBLE;
    double depth = NULL_DOUBLE;     // km
    double magnitude = NULL_DOUBLE;
    std::string magtype;
    std::string place;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS event (
            evid        INTEGER PRIMARY KEY,
            event_id    TEXT NOT NULL UNIQUE,
            time        REAL NOT NULL,
            lat         REAL NOT NULL,
            lon         REAL NOT NULL,
            depth       REAL,
            magnitude   REAL NOT NULL,
            magtype     TEXT DEFAULT '-',
            place       TEXT,
            lddate      REAL
        )
    )";
};

/**
 * ANALYSIS_RUN table - One row per pipeline run
 */
struct AnalysisRunRow {
    int64_t runid = NULL_INT;
    std::string auth;
    std::string config;             // INI text of the configuration used
    int64_t n_candidates = 0;
    int64_t n_insufficient = 0;
    int64_t n_fitted = 0;
    int64_t n_success = 0;
    double p_mean = NULL_DOUBLE;
    double p_std = NULL_DOUBLE;
    double r2_mean = NULL_DOUBLE;
    double r2_fixed_mean = NULL_DOUBLE;
    double lddate = NULL_DOUBLE;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS analysis_run (
            runid           INTEGER PRIMARY KEY,
            auth            TEXT DEFAULT '-',
            config          TEXT,
            n_candidates    INTEGER,
            n_insufficient  INTEGER,
            n_fitted        INTEGER,
            n_success       INTEGER,
            p_mean          REAL,
            p_std           REAL,
            r2_mean         REAL,
            r2_fixed_mean   REAL,
            lddate          REAL
        )
    )";
};

/**
 * SEQUENCE_FIT table - One row per candidate mainshock and model
 *
 * model is "modified" (free p) or "fixed"; candidates without enough
 * aftershocks only get a "modified" row with status insufficient_data.
 */
struct SequenceFitRow {
    int64_t fitid = NULL_INT;
    int64_t runid = NULL_INT;
    std::string mainshock_id;
    double mainshock_time = NULL_DOUBLE;
    double magnitude = NULL_DOUBLE;
    std::string model;
    int64_t aftershocks = 0;
    double duration_hours = NULL_DOUBLE;
    std::string status;
    double K = NULL_DOUBLE;
    double c = NULL_DOUBLE;
    double p = NULL_DOUBLE;
    double p_stderr = NULL_DOUBLE;
    double r_squared = NULL_DOUBLE;
    double rmse = NULL_DOUBLE;
    bool success = false;
    int64_t iterations = 0;
    int64_t npoints = 0;

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS sequence_fit (
            fitid           INTEGER PRIMARY KEY,
            runid           INTEGER NOT NULL REFERENCES analysis_run(runid) ON DELETE CASCADE,
            mainshock_id    TEXT NOT NULL,
            mainshock_time  REAL,
            magnitude       REAL,
            model           TEXT NOT NULL,
            aftershocks     INTEGER,
            duration_hours  REAL,
            status          TEXT,
            K               REAL,
            c               REAL,
            p               REAL,
            p_stderr        REAL,
            r_squared       REAL,
            rmse            REAL,
            success         INTEGER,
            iterations      INTEGER,
            npoints         INTEGER,
            lddate          REAL
        )
    )";
};

/**
 * RATE_BIN table - Binned rate series a modified fit was computed from
 */
struct RateBinRow {
    int64_t fitid = NULL_INT;
    int64_t bin_index = 0;
    double t_start = NULL_DOUBLE;   // hours after the mainshock
    double t_end = NULL_DOUBLE;
    double t_center = NULL_DOUBLE;
    int64_t count = 0;
    double rate = NULL_DOUBLE;      // events per hour

    static constexpr const char* CREATE_SQL = R"(
        CREATE TABLE IF NOT EXISTS rate_bin (
            fitid       INTEGER NOT NULL REFERENCES sequence_fit(fitid) ON DELETE CASCADE,
            bin_index   INTEGER NOT NULL,
            t_start     REAL,
            t_end       REAL,
            t_center    REAL,
            count       INTEGER,
            rate        REAL,
            PRIMARY KEY (fitid, bin_index)
        )
    )";
};

constexpr const char* CREATE_INDICES_SQL = R"(
    CREATE INDEX IF NOT EXISTS idx_event_time ON event(time);
    CREATE INDEX IF NOT EXISTS idx_event_magnitude ON event(magnitude);
    CREATE INDEX IF NOT EXISTS idx_fit_runid ON sequence_fit(runid);
    CREATE INDEX IF NOT EXISTS idx_fit_mainshock ON sequence_fit(mainshock_id);
)";

} // namespace schema
} // namespace omorifit
