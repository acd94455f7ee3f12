/// @file tests/store/test_json_store.cpp
/// @brief Unit Tests — JsonDocumentStore
///
/// Tests cover:
///   - Missing and corrupt files load as an empty object
///   - Save creates parent directories and leaves no temporary file
///   - A failed save keeps the previous document

#include "wfv/json_store.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace wfv;

TEST(JsonDocumentStore_Load, MissingFile_EmptyObject) {
    wfv::testing::TempDir dir;
    const JsonDocumentStore store(dir.file("none.json"));
    const Json::Value doc = store.load();
    EXPECT_TRUE(doc.isObject());
    EXPECT_TRUE(doc.empty());
}

TEST(JsonDocumentStore_Load, CorruptFile_EmptyObject) {
    wfv::testing::TempDir dir;
    std::ofstream(dir.file("state.json")) << "{\"a\": [1, 2";
    EXPECT_TRUE(JsonDocumentStore(dir.file("state.json")).load().empty());

    std::ofstream(dir.file("array.json")) << "[1, 2, 3]";
    EXPECT_TRUE(JsonDocumentStore(dir.file("array.json")).load().isObject());
}

TEST(JsonDocumentStore_Save, SaveThenLoad_SameDocument) {
    wfv::testing::TempDir dir;
    const JsonDocumentStore store(dir.file("nested/deeper/state.json"));

    Json::Value doc(Json::objectValue);
    doc["strategy"]["count"] = 3;
    ASSERT_TRUE(store.save(doc));

    EXPECT_EQ(store.load()["strategy"]["count"].asInt(), 3);
    EXPECT_FALSE(std::filesystem::exists(dir.file("nested/deeper/state.json.tmp")));
}

TEST(JsonDocumentStore_Save, FailedSave_KeepsPrevious) {
    wfv::testing::TempDir dir;
    const std::string path = dir.file("state.json");
    const JsonDocumentStore store(path);

    Json::Value first(Json::objectValue);
    first["version"] = 1;
    ASSERT_TRUE(store.save(first));

    // A directory squatting on the temporary path makes the write fail.
    std::filesystem::create_directories(path + ".tmp");

    Json::Value second(Json::objectValue);
    second["version"] = 2;
    EXPECT_FALSE(store.save(second));
    EXPECT_EQ(store.load()["version"].asInt(), 1);
}
