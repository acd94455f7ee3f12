/// @file tests/store/test_model_version_store.cpp
/// @brief Unit Tests — ModelVersionStore
///
/// Tests cover:
///   - First promotion becomes the only active version
///   - Promotion supersedes the previous active version
///   - At most one active version per strategy, across strategies
///   - Rollback restores the exact previous parameters, newest predecessor
///     first; a first version rolls back to no active version
///   - Manual rollback to an arbitrary version
///   - Persistence across reopen, id collisions, repair of a bad document

#include "wfv/model_version.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

using namespace wfv;
using wfv::testing::TempDir;
using wfv::testing::timestamp;

// ─── Helpers ──────────────────────────────────────────────────────────────────

namespace {

BacktestMatrixResults evidence(double sharpe) {
    BacktestMatrixResults r;
    r.strategy_id     = "alpha";
    r.mean_oos_sharpe = sharpe;
    r.passed          = true;
    return r;
}

std::size_t active_count(const ModelVersionStore& store, const std::string& strategy) {
    const auto h = store.history(strategy);
    return static_cast<std::size_t>(std::count_if(
        h.begin(), h.end(), [](const ModelVersion& v) { return v.is_active; }));
}

} // anonymous namespace

// ─── Promotion ────────────────────────────────────────────────────────────────

TEST(ModelVersionStore_Promote, FirstPromotion_Active) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));

    const auto v = store.promote("alpha", {{"x", 10}}, evidence(1.0),
                                 timestamp("2025-01-02T10:00:00"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->version_id, "v20250102T100000");
    EXPECT_EQ(v->created_at, "2025-01-02T10:00:00");
    EXPECT_TRUE(v->is_active);
    EXPECT_FALSE(v->superseded_by.has_value());

    const auto active = store.active("alpha");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->parameters.at("x"), 10.0);
}

TEST(ModelVersionStore_Promote, SecondPromotion_SupersedesPrevious) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));

    const auto a = store.promote("alpha", {{"x", 10}}, evidence(1.0), timestamp("2025-01-02T10:00:00"));
    const auto b = store.promote("alpha", {{"x", 12}}, evidence(1.3), timestamp("2025-02-02T10:00:00"));
    ASSERT_TRUE(a && b);

    const auto old = store.find(a->version_id);
    ASSERT_TRUE(old.has_value());
    EXPECT_FALSE(old->is_active);
    EXPECT_EQ(old->superseded_by, b->version_id);
    EXPECT_EQ(store.active("alpha")->version_id, b->version_id);
    EXPECT_EQ(active_count(store, "alpha"), 1u);
}

TEST(ModelVersionStore_Promote, Strategies_Independent) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));

    ASSERT_TRUE(store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-01T00:00:00")));
    ASSERT_TRUE(store.promote("beta", {{"y", 2}}, evidence(1.0), timestamp("2025-01-01T00:00:01")));
    ASSERT_TRUE(store.promote("alpha", {{"x", 1.2}}, evidence(1.1), timestamp("2025-01-01T00:00:02")));

    EXPECT_EQ(active_count(store, "alpha"), 1u);
    EXPECT_EQ(active_count(store, "beta"), 1u);
    EXPECT_EQ(store.active("beta")->parameters.at("y"), 2.0);
}

TEST(ModelVersionStore_Promote, SameSecond_DistinctIds) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));
    const auto now = timestamp("2025-03-01T09:30:00");

    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), now);
    const auto b = store.promote("alpha", {{"x", 1.1}}, evidence(1.1), now);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(a->version_id, "v20250301T093000");
    EXPECT_EQ(b->version_id, "v20250301T093000-2");
    EXPECT_EQ(store.history("alpha").size(), 2u);
}

// ─── Rollback ─────────────────────────────────────────────────────────────────

TEST(ModelVersionStore_Rollback, Rollback_RestoresExactParameters) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));

    const ParameterSet original{{"lookback", 20}, {"threshold", 0.35}};
    const auto a = store.promote("alpha", original, evidence(1.0), timestamp("2025-01-02T10:00:00"));
    const auto b = store.promote("alpha", {{"lookback", 25}, {"threshold", 0.4}}, evidence(1.2),
                                 timestamp("2025-02-02T10:00:00"));
    ASSERT_TRUE(a && b);

    ASSERT_TRUE(store.rollback(b->version_id, "Live Sharpe divergence: 0.90",
                               timestamp("2025-03-05T10:00:00")));

    const auto active = store.active("alpha");
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->version_id, a->version_id);
    EXPECT_EQ(active->parameters, original);
    EXPECT_FALSE(active->superseded_by.has_value());

    const auto rolled = store.find(b->version_id);
    EXPECT_FALSE(rolled->is_active);
    EXPECT_NE(rolled->notes.find("Rolled back on 2025-03-05T10:00:00: Live Sharpe divergence: 0.90"),
              std::string::npos);
    EXPECT_EQ(active_count(store, "alpha"), 1u);
}

TEST(ModelVersionStore_Rollback, FirstVersion_LeavesNoActive) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));
    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-02T10:00:00"));
    ASSERT_TRUE(a);

    ASSERT_TRUE(store.rollback(a->version_id, "Live Sharpe divergence: 2.50",
                               timestamp("2025-02-03T10:00:00")));
    EXPECT_FALSE(store.active("alpha").has_value());
    EXPECT_NE(store.find(a->version_id)->notes.find("Rolled back on 2025-02-03T10:00:00"),
              std::string::npos);
    EXPECT_FALSE(store.rollback(a->version_id, "again", timestamp("2025-02-04T10:00:00")));
    EXPECT_FALSE(store.rollback("v19990101T000000", "unknown", timestamp("2025-01-03T10:00:00")));

    ModelVersionStore reopened(dir.file("versions.json"));
    EXPECT_FALSE(reopened.active("alpha").has_value());
}

TEST(ModelVersionStore_Rollback, SupersededVersion_Refused) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));
    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-01T00:00:00"));
    const auto b = store.promote("alpha", {{"x", 1.2}}, evidence(1.1), timestamp("2025-02-01T00:00:00"));
    const auto c = store.promote("alpha", {{"x", 1.4}}, evidence(1.2), timestamp("2025-03-01T00:00:00"));
    ASSERT_TRUE(a && b && c);

    // b is no longer active, so reinstating a would leave c active beside it
    EXPECT_FALSE(store.rollback(b->version_id, "late", timestamp("2025-03-10T00:00:00")));
    EXPECT_EQ(store.active("alpha")->version_id, c->version_id);
    EXPECT_EQ(active_count(store, "alpha"), 1u);
}

TEST(ModelVersionStore_Rollback, AfterManualRollback_ReinstatesNewest) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));
    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-01T00:00:00"));
    const auto b = store.promote("alpha", {{"x", 1.2}}, evidence(1.1), timestamp("2025-02-01T00:00:00"));
    const auto c = store.promote("alpha", {{"x", 1.4}}, evidence(1.2), timestamp("2025-03-01T00:00:00"));
    ASSERT_TRUE(a && b && c);

    // a and c both record b as their successor now
    ASSERT_TRUE(store.rollback_to(b->version_id, "operator", timestamp("2025-03-10T00:00:00")));
    ASSERT_TRUE(store.rollback(b->version_id, "undo", timestamp("2025-03-11T00:00:00")));

    EXPECT_EQ(store.active("alpha")->version_id, c->version_id);
    EXPECT_FALSE(store.find(a->version_id)->is_active);
    EXPECT_EQ(active_count(store, "alpha"), 1u);
}

TEST(ModelVersionStore_RollbackTo, AnyVersion_Reactivated) {
    TempDir dir;
    ModelVersionStore store(dir.file("versions.json"));
    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-01T00:00:00"));
    const auto b = store.promote("alpha", {{"x", 1.2}}, evidence(1.1), timestamp("2025-02-01T00:00:00"));
    const auto c = store.promote("alpha", {{"x", 1.4}}, evidence(1.2), timestamp("2025-03-01T00:00:00"));
    ASSERT_TRUE(a && b && c);

    ASSERT_TRUE(store.rollback_to(a->version_id, "operator request", timestamp("2025-03-10T00:00:00")));
    EXPECT_EQ(store.active("alpha")->version_id, a->version_id);
    EXPECT_FALSE(store.find(c->version_id)->is_active);
    EXPECT_EQ(store.find(c->version_id)->superseded_by, a->version_id);
    EXPECT_EQ(active_count(store, "alpha"), 1u);

    EXPECT_FALSE(store.rollback_to("missing", "x", timestamp("2025-03-10T00:00:00")));
}

// ─── Persistence ──────────────────────────────────────────────────────────────

TEST(ModelVersionStore_Persistence, Reopen_StateSurvives) {
    TempDir dir;
    std::string id;
    {
        ModelVersionStore store(dir.file("versions.json"));
        const auto v = store.promote("alpha", {{"x", 7}}, evidence(1.4), timestamp("2025-01-02T10:00:00"));
        ASSERT_TRUE(v);
        id = v->version_id;
        ASSERT_TRUE(store.append_note(id, "Confirmed on 2025-02-01T00:00:00"));
    }

    ModelVersionStore reopened(dir.file("versions.json"));
    const auto v = reopened.find(id);
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->is_active);
    EXPECT_DOUBLE_EQ(v->validation.mean_oos_sharpe, 1.4);
    EXPECT_EQ(v->notes, "Created by automated re-optimization\nConfirmed on 2025-02-01T00:00:00");
}

TEST(ModelVersionStore_Persistence, TwoActives_KeepsNewest) {
    TempDir dir;
    std::ofstream(dir.file("versions.json")) << R"({
        "v20250101T000000": {"strategy_id": "alpha", "is_active": true,
                             "parameters": {"x": 1}, "superseded_by": null, "notes": ""},
        "v20250201T000000": {"strategy_id": "alpha", "is_active": true,
                             "parameters": {"x": 2}, "superseded_by": null, "notes": ""}
    })";

    ModelVersionStore store(dir.file("versions.json"));
    EXPECT_EQ(active_count(store, "alpha"), 1u);
    EXPECT_EQ(store.active("alpha")->version_id, "v20250201T000000");
}

TEST(ModelVersionStore_Persistence, FailedWrite_StateUnchanged) {
    TempDir dir;
    const std::string path = dir.file("versions.json");
    ModelVersionStore store(path);
    const auto a = store.promote("alpha", {{"x", 1}}, evidence(1.0), timestamp("2025-01-01T00:00:00"));
    ASSERT_TRUE(a);

    std::filesystem::create_directories(path + ".tmp");
    EXPECT_FALSE(store.promote("alpha", {{"x", 2}}, evidence(2.0), timestamp("2025-02-01T00:00:00")));

    EXPECT_EQ(store.active("alpha")->version_id, a->version_id);
    EXPECT_EQ(store.history("alpha").size(), 1u);
}
