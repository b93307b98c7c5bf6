#include <gtest/gtest.h>
#include "store/ObjectStore.hpp"
#include "storage/MemoryStorageEngine.hpp"
#include "delta/Patch.hpp"
#include "error/Error.hpp"
#include "util/bytes.hpp"
#include "TestUtil.hpp"

#include <memory>
#include <nlohmann/json.hpp>

using namespace sp::store;
using namespace sp::storage;
using namespace sp::delta::model;
using namespace sp::error;
using sp::util::toBytes;
using sp::util::toString;

class ObjectStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<MemoryStorageEngine> engine;
    std::unique_ptr<ObjectStore> store;

    void SetUp() override {
        engine = std::make_shared<MemoryStorageEngine>();
        store = std::make_unique<ObjectStore>(engine, 6);
    }

    std::vector<uint8_t> rawBlob(const std::string& saveId, const std::string& path) const {
        return *engine->readFile(ObjectStore::blobPath(saveId, path));
    }
};

TEST_F(ObjectStoreTest, BlobLayoutUnderObjectsDir) {
    EXPECT_EQ(ObjectStore::blobPath("abc", "src/main.cpp").generic_string(), ".savepoint/objects/abc_src/main.cpp");
    EXPECT_EQ(ObjectStore::deltaSetPath("abc").generic_string(), ".savepoint/objects/delta_abc.json");
}

TEST_F(ObjectStoreTest, CompressedBlobReadsBack) {
    const auto content = toBytes("hello hello hello hello\n");
    store->putBlob("s1", "a.txt", content, Compression::On);
    EXPECT_TRUE(store->hasBlob("s1", "a.txt"));
    EXPECT_EQ(store->getBlob("s1", "a.txt"), content);
}

TEST_F(ObjectStoreTest, UncompressedBlobReadsBack) {
    const auto content = toBytes("plain bytes");
    store->putBlob("s1", "a.txt", content, Compression::Off);
    EXPECT_EQ(store->getBlob("s1", "a.txt"), content);
}

TEST_F(ObjectStoreTest, EmptyBlobReadsBack) {
    store->putBlob("s1", "empty", {}, Compression::Off);
    EXPECT_TRUE(store->getBlob("s1", "empty").empty());
}

TEST_F(ObjectStoreTest, FrameCarriesMetadata) {
    const auto content = toBytes("abc");
    store->putBlob("s1", "a.txt", content, Compression::Off);
    const auto raw = rawBlob("s1", "a.txt");

    const uint32_t len = (uint32_t(raw[0]) << 24) | (uint32_t(raw[1]) << 16) | (uint32_t(raw[2]) << 8) | raw[3];
    const auto meta = nlohmann::json::parse(raw.begin() + 4, raw.begin() + 4 + len);
    EXPECT_EQ(meta["compressed"], false);
    EXPECT_EQ(meta["content_hash"], "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(toString(std::span(raw).subspan(4 + len)), "abc");
}

TEST_F(ObjectStoreTest, MissingBlobIsNotFound) {
    EXPECT_FALSE(store->hasBlob("s1", "nope"));
    EXPECT_THROW((void)store->getBlob("s1", "nope"), NotFound);
}

TEST_F(ObjectStoreTest, TamperedPayloadFailsIntegrity) {
    store->putBlob("s1", "a.txt", toBytes("original content"), Compression::Off);
    auto raw = rawBlob("s1", "a.txt");
    raw.back() ^= 0x01;
    engine->writeFile(ObjectStore::blobPath("s1", "a.txt"), raw);
    EXPECT_THROW((void)store->getBlob("s1", "a.txt"), IntegrityError);
}

TEST_F(ObjectStoreTest, CorruptedGzipFailsIntegrity) {
    store->putBlob("s1", "a.txt", toBytes("original content"), Compression::On);
    auto raw = rawBlob("s1", "a.txt");
    raw.resize(raw.size() - 6);
    engine->writeFile(ObjectStore::blobPath("s1", "a.txt"), raw);
    EXPECT_THROW((void)store->getBlob("s1", "a.txt"), IntegrityError);
}

TEST_F(ObjectStoreTest, UnframedBlobIsReturnedRaw) {
    const auto legacy = toBytes("written before blobs had a frame");
    engine->writeFile(ObjectStore::blobPath("old", "a.txt"), legacy);
    EXPECT_EQ(store->getBlob("old", "a.txt"), legacy);
}

TEST_F(ObjectStoreTest, DeltaSetStoresCompressedPatches) {
    DeltaRecord d;
    d.path = "a.txt";
    d.base_id = "s0";
    d.patch = sp::delta::makePatch("a\nb\n", "a\nc\n");
    d.content_hash = "h";

    store->putDeltaSet("s1", {d}, Compression::On);

    const auto raw = nlohmann::json::parse(toString(*engine->readFile(ObjectStore::deltaSetPath("s1"))));
    EXPECT_EQ(raw["deltas"][0]["compressed"], true);
    EXPECT_EQ(sp::delta::decodePatch(raw["deltas"][0]["patch"].get<std::string>()), *d.patch);

    const auto set = store->getDeltaSet("s1");
    ASSERT_EQ(set.deltas.size(), 1u);
    EXPECT_FALSE(set.deltas[0].compressed);
    EXPECT_EQ(set.deltas[0].patch, d.patch);
    EXPECT_EQ(set.save_id, "s1");
}

TEST_F(ObjectStoreTest, DeltaSetKeepsUncompressedBinaryPatches) {
    DeltaRecord d;
    d.path = "bin";
    d.base_id = "s0";
    d.patch = std::string("\x00\xff\n", 3);
    d.content_hash = "h";

    store->putDeltaSet("s1", {d}, Compression::Off);
    const auto set = store->getDeltaSet("s1");
    ASSERT_EQ(set.deltas.size(), 1u);
    EXPECT_EQ(set.deltas[0].patch, d.patch);
}

TEST_F(ObjectStoreTest, DeltaSetRecordsWithoutPatch) {
    DeltaRecord added;
    added.path = "new.txt";
    added.is_new = true;
    added.content_hash = "h1";

    DeltaRecord removed;
    removed.path = "old.txt";
    removed.is_deleted = true;
    removed.base_id = "s0";
    removed.content_hash = "h2";

    store->putDeltaSet("s1", {added, removed});
    const auto set = store->getDeltaSet("s1");
    ASSERT_EQ(set.deltas.size(), 2u);
    ASSERT_NE(set.find("new.txt"), nullptr);
    EXPECT_TRUE(set.find("new.txt")->is_new);
    EXPECT_FALSE(set.find("new.txt")->patch.has_value());
    EXPECT_TRUE(set.find("old.txt")->is_deleted);
    EXPECT_EQ(set.find("missing"), nullptr);
}

TEST_F(ObjectStoreTest, MissingDeltaSetIsNotFound) {
    EXPECT_FALSE(store->hasDeltaSet("s9"));
    EXPECT_THROW((void)store->getDeltaSet("s9"), NotFound);
}

TEST_F(ObjectStoreTest, UnreadableDeltaSetFailsIntegrity) {
    sp::test::put(*engine, ObjectStore::deltaSetPath("s1").generic_string(), "{ not json");
    EXPECT_THROW((void)store->getDeltaSet("s1"), IntegrityError);

    sp::test::put(*engine, ObjectStore::deltaSetPath("s2").generic_string(),
                  R"({"save_id":"s2","deltas":[{"path":"a","content_hash":"h","compressed":false,"patch":"zz"}]})");
    EXPECT_THROW((void)store->getDeltaSet("s2"), IntegrityError);

    sp::test::put(*engine, ObjectStore::deltaSetPath("s3").generic_string(),
                  R"({"save_id":"s3","deltas":[{"path":"a","content_hash":"h","compressed":true,"patch":"abcd"}]})");
    EXPECT_THROW((void)store->getDeltaSet("s3"), IntegrityError);
}
