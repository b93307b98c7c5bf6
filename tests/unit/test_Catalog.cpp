#include <gtest/gtest.h>
#include "catalog/Catalog.hpp"
#include "storage/MemoryStorageEngine.hpp"
#include "repo/Layout.hpp"
#include "error/Error.hpp"
#include "TestUtil.hpp"

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace sp::catalog;
using namespace sp::catalog::model;
using namespace sp::storage;
using namespace sp::error;
using namespace std::chrono;

class CatalogTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStorageEngine> engine;
    std::unique_ptr<Catalog> catalog;
    sp::util::Timestamp t0 = sp::util::Timestamp(seconds(1700000000));

    void SetUp() override {
        engine = std::make_shared<MemoryStorageEngine>();
        Catalog::create(*engine);
        catalog = std::make_unique<Catalog>(engine);
    }

    SaveRecord record(const std::string& id, const sp::util::Timestamp ts,
                      std::optional<std::string> base = std::nullopt) const {
        SaveRecord r;
        r.id = id;
        r.label = "label " + id;
        r.created_at = ts;
        r.files = {"b.txt", "a.txt"};
        r.base_id = std::move(base);
        return r;
    }
};

TEST_F(CatalogTest, StartsEmpty) {
    EXPECT_TRUE(catalog->empty());
    EXPECT_FALSE(catalog->latest().has_value());
    EXPECT_EQ(catalog->tryFind("x"), nullptr);
    EXPECT_THROW((void)catalog->find("x"), NotFound);
}

TEST_F(CatalogTest, MissingDocumentLoadsEmpty) {
    const auto bare = std::make_shared<MemoryStorageEngine>();
    const Catalog c(bare);
    EXPECT_TRUE(c.empty());
}

TEST_F(CatalogTest, NextIdIsTwelveHexCharacters) {
    const auto id = Catalog::nextId("first", t0, {"a.txt"});
    EXPECT_EQ(id.size(), Catalog::ID_LENGTH);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(CatalogTest, NextIdDependsOnEveryInput) {
    const auto id = Catalog::nextId("first", t0, {"a.txt"});
    EXPECT_EQ(Catalog::nextId("first", t0, {"a.txt"}), id);
    EXPECT_NE(Catalog::nextId("second", t0, {"a.txt"}), id);
    EXPECT_NE(Catalog::nextId("first", t0 + microseconds(1), {"a.txt"}), id);
    EXPECT_NE(Catalog::nextId("first", t0, {"a.txt", "b.txt"}), id);
}

TEST_F(CatalogTest, AppendKeepsOrderAndSortsFiles) {
    catalog->append(record("s1", t0));
    catalog->append(record("s2", t0 + seconds(1), "s1"));

    ASSERT_EQ(catalog->size(), 2u);
    EXPECT_EQ(catalog->all()[0].id, "s1");
    EXPECT_EQ(catalog->latest()->id, "s2");
    EXPECT_EQ(catalog->find("s1").files, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_TRUE(catalog->find("s1").tracks("b.txt"));
    EXPECT_FALSE(catalog->find("s1").tracks("c.txt"));
}

TEST_F(CatalogTest, AppendRejectsBadLinks) {
    EXPECT_THROW(catalog->append(record("s1", t0, "ghost")), std::invalid_argument);
    catalog->append(record("s1", t0));
    EXPECT_THROW(catalog->append(record("s2", t0 + seconds(1))), std::invalid_argument);
    EXPECT_THROW(catalog->append(record("s2", t0 + seconds(1), "other")), std::invalid_argument);
    EXPECT_EQ(catalog->size(), 1u);
}

TEST_F(CatalogTest, AppendRejectsDuplicatesAndTimeTravel) {
    catalog->append(record("s1", t0));
    EXPECT_THROW(catalog->append(record("s1", t0 + seconds(1), "s1")), std::invalid_argument);
    EXPECT_THROW(catalog->append(record("s2", t0 - seconds(1), "s1")), std::invalid_argument);
    catalog->append(record("s2", t0, "s1"));
    EXPECT_EQ(catalog->size(), 2u);
}

TEST_F(CatalogTest, PersistsAcrossInstances) {
    catalog->append(record("s1", t0 + microseconds(7)));
    catalog->append(record("s2", t0 + seconds(5), "s1"));

    const Catalog reopened(engine);
    ASSERT_EQ(reopened.size(), 2u);
    EXPECT_EQ(reopened.all()[0].created_at, t0 + microseconds(7));
    EXPECT_FALSE(reopened.all()[0].base_id.has_value());
    EXPECT_EQ(reopened.all()[1].base_id, "s1");
}

TEST_F(CatalogTest, DocumentShape) {
    catalog->append(record("s1", t0));
    const auto doc = nlohmann::json::parse(sp::test::get(*engine, std::string(sp::repo::CATALOG_FILE)));
    EXPECT_EQ(doc["version"], 1);
    ASSERT_EQ(doc["saves"].size(), 1u);
    EXPECT_EQ(doc["saves"][0]["id"], "s1");
    EXPECT_EQ(doc["saves"][0]["created_at"], "2023-11-14T22:13:20.000000Z");
    EXPECT_FALSE(doc["saves"][0].contains("base_id"));
}

TEST_F(CatalogTest, ReloadSeesExternalWrites) {
    const Catalog other(engine);
    catalog->append(record("s1", t0));
    EXPECT_TRUE(other.empty());

    Catalog reader(engine);
    catalog->append(record("s2", t0 + seconds(1), "s1"));
    reader.reload();
    EXPECT_EQ(reader.size(), 2u);
}

TEST_F(CatalogTest, CorruptDocumentIsIntegrityError) {
    sp::test::put(*engine, std::string(sp::repo::CATALOG_FILE), "{\"saves\": [ {\"id\": 3} ]}");
    EXPECT_THROW(catalog->reload(), IntegrityError);

    sp::test::put(*engine, std::string(sp::repo::CATALOG_FILE),
                  R"({"version":1,"saves":[{"id":"a","label":"l","created_at":"not a time","files":[]}]})");
    EXPECT_THROW(catalog->reload(), IntegrityError);
}

TEST_F(CatalogTest, ClampTimestampNeverGoesBackwards) {
    EXPECT_EQ(catalog->clampTimestamp(t0), t0);
    catalog->append(record("s1", t0));
    EXPECT_EQ(catalog->clampTimestamp(t0 - seconds(10)), t0);
    EXPECT_EQ(catalog->clampTimestamp(t0 + seconds(10)), t0 + seconds(10));
}
