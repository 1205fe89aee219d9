#include <gtest/gtest.h>
#include "emb/EmbeddingCache.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using hierarchy::EmbeddingTable;
using hierarchy::InputError;
using hierarchy::NodeRecord;

namespace {

// Deterministic 3-d embedding from text length and first byte; counts calls.
class CountingEmbedder : public TextEmbedder {
public:
    mutable int calls = 0;
    bool loaded = true;

    std::vector<float> embed(const std::string& text) const override {
        ++calls;
        return {(float)text.size(), (float)(unsigned char)text[0], 1.0f};
    }

    bool ready() const override { return loaded; }
};

class RaggedEmbedder : public TextEmbedder {
public:
    std::vector<float> embed(const std::string& text) const override {
        return std::vector<float>(text.size() % 2 == 0 ? 2 : 3, 1.0f);
    }
};

NodeRecord make_record(const std::string& key, const std::string& desc, const std::string& summary) {
    NodeRecord r;
    r.root_key = key;
    r.root_description = desc;
    r.parent_name = summary.empty() ? "" : "P";
    r.parent_short_summary = summary;
    return r;
}

}  // namespace

class EmbeddingCacheTest : public ::testing::Test {
protected:
    fs::path dir;
    std::vector<NodeRecord> records;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("hierarchy_emb_cache_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir);
        records = {
            make_record("a", "alpha", "parent of alpha"),
            make_record("b", "bravo", ""),
            make_record("c", "  ", "charlie's parent"),
        };
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string cache_path() const { return (dir / "nested" / "embeddings.bin").string(); }
};

TEST_F(EmbeddingCacheTest, EmbedRecordsAlignsWithRecords) {
    CountingEmbedder emb;
    const EmbeddingTable t = embed_records(records, emb);

    ASSERT_EQ(t.root.size(), 3u);
    ASSERT_EQ(t.parent.size(), 3u);
    EXPECT_EQ(t.root[0], (std::vector<float>{5.0f, (float)'a', 1.0f}));
    EXPECT_EQ(t.parent[2], (std::vector<float>{16.0f, (float)'c', 1.0f}));

    // blank text is never sent to the model
    EXPECT_TRUE(t.parent[1].empty());
    EXPECT_TRUE(t.root[2].empty());
    EXPECT_EQ(emb.calls, 4);
}

TEST_F(EmbeddingCacheTest, InconsistentDimensionIsInputError) {
    RaggedEmbedder emb;
    EXPECT_THROW(embed_records(records, emb), InputError);
}

TEST_F(EmbeddingCacheTest, SaveThenLoadPreservesAbsentVectors) {
    CountingEmbedder emb;
    const EmbeddingTable t = embed_records(records, emb);

    const EmbeddingCache cache(cache_path());
    ASSERT_TRUE(cache.save(t));

    EmbeddingTable loaded;
    ASSERT_TRUE(cache.load(loaded));
    EXPECT_EQ(loaded.root, t.root);
    EXPECT_EQ(loaded.parent, t.parent);
}

TEST_F(EmbeddingCacheTest, LoadFailsForMissingOrForeignFile) {
    EmbeddingTable t;
    EXPECT_FALSE(EmbeddingCache((dir / "missing.bin").string()).load(t));

    fs::create_directories(dir);
    const fs::path junk = dir / "junk.bin";
    {
        std::ofstream out(junk, std::ios::binary);
        out << "definitely not an embedding cache";
    }
    EXPECT_FALSE(EmbeddingCache(junk.string()).load(t));
}

TEST_F(EmbeddingCacheTest, LoadFailsForTruncatedFile) {
    CountingEmbedder emb;
    const EmbeddingCache cache(cache_path());
    ASSERT_TRUE(cache.save(embed_records(records, emb)));

    const auto size = fs::file_size(cache_path());
    fs::resize_file(cache_path(), size - 5);

    EmbeddingTable t;
    EXPECT_FALSE(cache.load(t));
}

TEST_F(EmbeddingCacheTest, LoadRejectsRecordCountLargerThanFile) {
    fs::create_directories(dir);
    const fs::path p = dir / "huge.bin";
    {
        const uint32_t header[4] = {0x31564548, 1, 0xFFFFFFF0u, 384};
        std::ofstream out(p, std::ios::binary);
        out.write((const char*)header, sizeof(header));
    }

    EmbeddingTable t;
    bool ok = true;
    EXPECT_NO_THROW(ok = EmbeddingCache(p.string()).load(t));
    EXPECT_FALSE(ok);
}

TEST_F(EmbeddingCacheTest, LoadRejectsVectorLengthLargerThanFile) {
    fs::create_directories(dir);
    const fs::path p = dir / "wide.bin";
    {
        // one record whose dim claims ~16 GB of floats
        const uint32_t words[6] = {0x31564548, 1, 1, 0xFFFFFFF0u, 0xFFFFFFF0u, 0};
        std::ofstream out(p, std::ios::binary);
        out.write((const char*)words, sizeof(words));
    }

    EmbeddingTable t;
    bool ok = true;
    EXPECT_NO_THROW(ok = EmbeddingCache(p.string()).load(t));
    EXPECT_FALSE(ok);
}

TEST_F(EmbeddingCacheTest, GetOrCreateEmbedsOnceThenUsesCache) {
    CountingEmbedder emb;
    const EmbeddingCache cache(cache_path());

    const EmbeddingTable first = get_or_create_embeddings(records, emb, cache);
    EXPECT_EQ(emb.calls, 4);
    EXPECT_TRUE(fs::exists(cache_path()));

    const EmbeddingTable second = get_or_create_embeddings(records, emb, cache);
    EXPECT_EQ(emb.calls, 4);
    EXPECT_EQ(second.root, first.root);
    EXPECT_EQ(second.parent, first.parent);
}

TEST_F(EmbeddingCacheTest, RebuildIgnoresCache) {
    CountingEmbedder emb;
    const EmbeddingCache cache(cache_path());

    (void)get_or_create_embeddings(records, emb, cache);
    (void)get_or_create_embeddings(records, emb, cache, true);
    EXPECT_EQ(emb.calls, 8);
}

TEST_F(EmbeddingCacheTest, StaleCacheIsInputError) {
    CountingEmbedder emb;
    const EmbeddingCache cache(cache_path());
    (void)get_or_create_embeddings(records, emb, cache);

    records.push_back(make_record("d", "delta", "delta parent"));
    try {
        (void)get_or_create_embeddings(records, emb, cache);
        FAIL() << "expected InputError";
    } catch (const InputError& e) {
        EXPECT_NE(std::string(e.what()).find(cache_path()), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("--rebuild"), std::string::npos);
    }

    // rebuild recovers
    const EmbeddingTable t = get_or_create_embeddings(records, emb, cache, true);
    EXPECT_EQ(t.size(), 4u);
}

TEST_F(EmbeddingCacheTest, MissingCacheWithoutModelIsInputError) {
    CountingEmbedder emb;
    emb.loaded = false;
    EXPECT_THROW(get_or_create_embeddings(records, emb, EmbeddingCache(cache_path())), InputError);
    EXPECT_EQ(emb.calls, 0);
}

TEST_F(EmbeddingCacheTest, UnreadableCacheLoadsModelAndRebuilds) {
    fs::create_directories(dir / "nested");
    {
        std::ofstream out(cache_path(), std::ios::binary);
        out << "left over from something else";
    }

    CountingEmbedder emb;
    emb.loaded = false;
    int loads = 0;
    const EmbeddingTable t = get_or_create_embeddings(records, emb, EmbeddingCache(cache_path()), false,
                                                      [&]() { ++loads; emb.loaded = true; return true; });
    EXPECT_EQ(loads, 1);
    EXPECT_EQ(t.size(), 3u);
    EXPECT_EQ(emb.calls, 4);

    // the rewritten cache is valid again
    EmbeddingTable reloaded;
    EXPECT_TRUE(EmbeddingCache(cache_path()).load(reloaded));
    EXPECT_EQ(reloaded.root, t.root);
}

TEST_F(EmbeddingCacheTest, ValidCacheSkipsModelLoad) {
    CountingEmbedder emb;
    const EmbeddingCache cache(cache_path());
    (void)get_or_create_embeddings(records, emb, cache);

    CountingEmbedder cold;
    cold.loaded = false;
    int loads = 0;
    const EmbeddingTable t = get_or_create_embeddings(records, cold, cache, false,
                                                      [&]() { ++loads; return true; });
    EXPECT_EQ(loads, 0);
    EXPECT_EQ(cold.calls, 0);
    EXPECT_EQ(t.size(), 3u);
}

TEST_F(EmbeddingCacheTest, FailedModelLoadIsInputError) {
    CountingEmbedder emb;
    emb.loaded = false;
    EXPECT_THROW(get_or_create_embeddings(records, emb, EmbeddingCache(cache_path()), false,
                                          []() { return false; }),
                 InputError);
    EXPECT_EQ(emb.calls, 0);
}
