/**
 * Unit tests for the catalog database
 */

#include "test_framework.hpp"
#include "omorifit/database/catalog_database.hpp"
#include "omorifit/core/synthetic.hpp"
#include <cmath>
#include <cstdio>
#include <unistd.h>

using namespace omorifit;
using namespace omorifit::test;

namespace {
    // Counter for unique database names
    static int db_counter = 0;

    std::string testDbPath() {
        return "/tmp/omorifit_test_" + std::to_string(getpid()) + "_" +
               std::to_string(++db_counter) + ".db";
    }

    void removeTestDb(const std::string& path) {
        std::remove(path.c_str());
    }

    TimePoint catalogStart() {
        return fromEpochSeconds(1577836800.0);
    }

    Event makeEvent(const std::string& id, double hours, double mag) {
        return Event(id, addHours(catalogStart(), hours), GeoPoint(35.5, -117.6, 8.0),
                     mag, MagnitudeType::ML, "Ridgecrest, CA");
    }

    // One fittable sequence plus one with too few aftershocks
    EventStore analysisCatalog() {
        EventStore store;
        SyntheticSequenceGenerator generator;

        SyntheticSequence full;
        full.id_prefix = "full";
        full.origin_time = catalogStart();
        full.epicenter = GeoPoint(35.7, -117.5, 8.0);
        full.count = 120;
        for (const auto& ev : generator.generate(full)) store.add(ev);

        SyntheticSequence quiet;
        quiet.id_prefix = "quiet";
        quiet.origin_time = addHours(catalogStart(), 24.0 * 90.0);
        quiet.epicenter = GeoPoint(40.0, -125.0, 15.0);
        quiet.magnitude = 6.3;
        quiet.count = 4;
        for (const auto& ev : generator.generate(quiet)) store.add(ev);

        return store;
    }
}

// ============================================================================
// Connection and schema
// ============================================================================

TEST(CatalogDatabase, CreateAndOpen) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_FALSE(db.isOpen());

    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.isOpen());

    db.close();
    ASSERT_FALSE(db.isOpen());

    removeTestDb(db_path);
}

TEST(CatalogDatabase, OpenFailsOnBadPath) {
    CatalogDatabase db;
    ASSERT_FALSE(db.open("/nonexistent/directory/omorifit.db"));
    ASSERT_FALSE(db.isOpen());
    ASSERT_FALSE(db.lastError().empty());
}

TEST(CatalogDatabase, CreateSchema) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());

    ASSERT_EQ(db.countEvents(), 0);
    ASSERT_EQ(db.countRuns(), 0);
    ASSERT_EQ(db.countFits(), 0);
    ASSERT_EQ(db.schemaVersion(), std::string(schema::SCHEMA_VERSION));

    // Idempotent
    ASSERT_TRUE(db.createSchema());

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, SetAuthor) {
    CatalogDatabase db;
    ASSERT_EQ(db.author(), std::string("omorifit"));
    db.setAuthor("analyst");
    ASSERT_EQ(db.author(), std::string("analyst"));
}

TEST(CatalogDatabase, NotOpen) {
    CatalogDatabase db;
    ASSERT_FALSE(db.createSchema());
    ASSERT_EQ(db.storeEvent(makeEvent("a", 0.0, 3.0)), -1);
    EventStore store;
    ASSERT_EQ(db.loadEvents(store), -1);
    ASSERT_EQ(db.countEvents(), 0);
    ASSERT_TRUE(db.schemaVersion().empty());
}

// ============================================================================
// Events
// ============================================================================

TEST(CatalogDatabase, StoreEvent) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());

    int64_t evid = db.storeEvent(makeEvent("ci38457511", 0.0, 7.1));
    ASSERT_GT(evid, 0);
    ASSERT_EQ(db.countEvents(), 1);

    // Same catalog id keeps the first row
    ASSERT_EQ(db.storeEvent(makeEvent("ci38457511", 5.0, 2.0)), evid);
    ASSERT_EQ(db.countEvents(), 1);

    int64_t second = db.storeEvent(makeEvent("ci38457512", 1.0, 3.0));
    ASSERT_EQ(second, evid + 1);

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, StoreAndLoadEvents) {
    std::string db_path = testDbPath();

    EventStore original;
    original.add(makeEvent("ms", 0.0, 7.1));
    for (int i = 0; i < 20; i++) {
        original.add(makeEvent("as" + std::to_string(i), 0.5 + i, 2.0 + 0.1 * i));
    }

    {
        CatalogDatabase db;
        ASSERT_TRUE(db.open(db_path));
        ASSERT_TRUE(db.createSchema());
        ASSERT_TRUE(db.storeEvents(original));
        ASSERT_EQ(db.countEvents(), 21);
    }

    // Reopen and read back
    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));

    EventStore loaded;
    ASSERT_EQ(db.loadEvents(loaded), 21);
    ASSERT_EQ(loaded.size(), 21u);

    auto ms = loaded.find("ms");
    ASSERT_TRUE(ms != nullptr);
    ASSERT_NEAR(ms->magnitude(), 7.1, 1e-12);
    ASSERT_NEAR(ms->latitude(), 35.5, 1e-12);
    ASSERT_NEAR(ms->depth(), 8.0, 1e-12);
    ASSERT_TRUE(ms->magnitudeType() == MagnitudeType::ML);
    ASSERT_EQ(ms->place(), std::string("Ridgecrest, CA"));
    ASSERT_NEAR(hoursBetween(ms->time(), loaded.find("as3")->time()), 3.5, 1e-6);

    // New ids continue after the stored ones
    ASSERT_EQ(db.storeEvent(makeEvent("late", 100.0, 2.5)), 22);

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, LoadEventsMagnitudeFilter) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());
    db.storeEvent(makeEvent("a", 0.0, 2.0));
    db.storeEvent(makeEvent("b", 1.0, 4.0));
    db.storeEvent(makeEvent("c", 2.0, 6.0));

    EventStore store;
    ASSERT_EQ(db.loadEvents(store, 4.0), 2);
    ASSERT_TRUE(store.find("a") == nullptr);

    // Events already in the store are not added twice
    ASSERT_EQ(db.loadEvents(store), 1);
    ASSERT_EQ(store.size(), 3u);

    db.close();
    removeTestDb(db_path);
}

// ============================================================================
// Analysis results
// ============================================================================

TEST(CatalogDatabase, StoreAnalysis) {
    std::string db_path = testDbPath();

    EventStore store = analysisCatalog();
    AnalysisConfig config;
    AnalysisOutput output = SequenceAnalyzer(config).analyze(store);
    ASSERT_EQ(output.results.size(), 2u);
    ASSERT_TRUE(output.results[0].success());
    ASSERT_TRUE(output.results[1].insufficient);

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());
    db.setAuthor("unit-test");

    int64_t runid = db.storeAnalysis(config, output);
    ASSERT_GT(runid, 0);
    ASSERT_EQ(db.countRuns(), 1);

    // modified + fixed for the fitted sequence, one row for the other
    ASSERT_EQ(db.countFits(), 3);

    schema::AnalysisRunRow run = db.queryRun(runid);
    ASSERT_EQ(run.runid, runid);
    ASSERT_EQ(run.auth, std::string("unit-test"));
    ASSERT_EQ(run.n_candidates, 2);
    ASSERT_EQ(run.n_insufficient, 1);
    ASSERT_EQ(run.n_fitted, 1);
    ASSERT_EQ(run.n_success, 1);
    ASSERT_NEAR(run.p_mean, output.summary.p_mean, 1e-12);
    ASSERT_TRUE(run.config.find("binning.n_bins = 20") != std::string::npos);

    auto fits = db.queryFits(runid);
    ASSERT_EQ(fits.size(), 3u);

    const schema::SequenceFitRow& modified = fits[0];
    ASSERT_EQ(modified.mainshock_id, std::string("full"));
    ASSERT_EQ(modified.model, std::string("modified"));
    ASSERT_EQ(modified.status, std::string("success"));
    ASSERT_TRUE(modified.success);
    ASSERT_NEAR(modified.p, output.results[0].modified.p, 1e-12);
    ASSERT_NEAR(modified.r_squared, output.results[0].modified.r_squared, 1e-12);
    ASSERT_EQ(modified.aftershocks, 120);
    ASSERT_EQ(modified.npoints, static_cast<int64_t>(output.results[0].series.size()));

    const schema::SequenceFitRow& fixed = fits[1];
    ASSERT_EQ(fixed.model, std::string("fixed"));
    ASSERT_NEAR(fixed.p, 1.0, 1e-12);
    ASSERT_TRUE(std::isnan(fixed.p_stderr));

    const schema::SequenceFitRow& quiet = fits[2];
    ASSERT_EQ(quiet.mainshock_id, std::string("quiet"));
    ASSERT_EQ(quiet.status, std::string("insufficient_data"));
    ASSERT_EQ(quiet.aftershocks, 4);
    ASSERT_FALSE(quiet.success);
    ASSERT_TRUE(std::isnan(quiet.p));
    ASSERT_TRUE(std::isnan(quiet.duration_hours));

    auto bins = db.queryRateBins(modified.fitid);
    const RateSeries& series = output.results[0].series;
    ASSERT_EQ(bins.size(), series.size());
    int total = 0;
    for (size_t i = 0; i < bins.size(); i++) {
        ASSERT_EQ(bins[i].bin_index, static_cast<int64_t>(i));
        ASSERT_NEAR(bins[i].rate, series.bins[i].rate, 1e-9);
        total += static_cast<int>(bins[i].count);
    }
    ASSERT_EQ(total, 120);

    // Fixed fits keep no bins of their own
    ASSERT_TRUE(db.queryRateBins(fixed.fitid).empty());

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, RunRecordsEverySetting) {
    std::string db_path = testDbPath();

    AnalysisConfig config;
    config.n_bins = 14;
    config.spatial_radius_km = 75.0;
    config.threads = 3;

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());

    int64_t runid = db.storeAnalysis(config, AnalysisOutput());
    ASSERT_GT(runid, 0);
    ASSERT_EQ(db.countFits(), 0);

    schema::AnalysisRunRow run = db.queryRun(runid);
    Config expected = config.toConfig();
    for (const auto& [key, value] : expected.all()) {
        ASSERT_TRUE(run.config.find(key + " = " + value + "\n") != std::string::npos);
    }
    ASSERT_TRUE(run.config.find("binning.n_bins = 14") != std::string::npos);
    ASSERT_EQ(run.n_candidates, 0);

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, SeveralRuns) {
    std::string db_path = testDbPath();

    EventStore store = analysisCatalog();
    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());

    AnalysisConfig first;
    AnalysisConfig second;
    second.n_bins = 12;

    int64_t run1 = db.storeAnalysis(first, SequenceAnalyzer(first).analyze(store));
    int64_t run2 = db.storeAnalysis(second, SequenceAnalyzer(second).analyze(store));
    ASSERT_EQ(run2, run1 + 1);
    ASSERT_EQ(db.countRuns(), 2);
    ASSERT_EQ(db.queryFits(run1).size(), 3u);
    ASSERT_EQ(db.queryFits(run2).size(), 3u);
    ASSERT_LE(db.queryRateBins(db.queryFits(run2)[0].fitid).size(), 12u);

    ASSERT_TRUE(db.queryFits(999).empty());
    ASSERT_EQ(db.queryRun(999).runid, schema::NULL_INT);

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, TransactionRollback) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());

    ASSERT_TRUE(db.beginTransaction());
    db.storeEvent(makeEvent("temp", 0.0, 3.0));
    ASSERT_EQ(db.countEvents(), 1);
    ASSERT_TRUE(db.rollbackTransaction());
    ASSERT_EQ(db.countEvents(), 0);

    // Ids restart after the rollback
    ASSERT_EQ(db.storeEvent(makeEvent("kept", 0.0, 3.0)), 1);

    ASSERT_TRUE(db.beginTransaction());
    db.storeEvent(makeEvent("committed", 1.0, 3.0));
    ASSERT_TRUE(db.commitTransaction());
    ASSERT_EQ(db.countEvents(), 2);

    db.close();
    removeTestDb(db_path);
}

TEST(CatalogDatabase, DropSchema) {
    std::string db_path = testDbPath();

    CatalogDatabase db;
    ASSERT_TRUE(db.open(db_path));
    ASSERT_TRUE(db.createSchema());
    db.storeEvent(makeEvent("a", 0.0, 3.0));

    ASSERT_TRUE(db.dropSchema());
    ASSERT_EQ(db.countEvents(), 0);
    ASSERT_TRUE(db.schemaVersion().empty());

    ASSERT_TRUE(db.createSchema());
    ASSERT_EQ(db.storeEvent(makeEvent("b", 0.0, 3.0)), 1);
    ASSERT_EQ(db.countEvents(), 1);

    db.close();
    removeTestDb(db_path);
}
