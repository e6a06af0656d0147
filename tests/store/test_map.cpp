// VEIL - Storage Map Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/store/map.h"
#include "veil/db/leveldb.h"
#include "veil/crypto/field.h"

#include <algorithm>

using namespace veil;
using namespace veil::store;

namespace {

template<typename MapT>
class MapTest : public ::testing::Test {
protected:
    MapT map_;
};

using MemoryFieldMap = MemoryMap<Field, uint64_t>;

struct DatabaseFieldMap : DatabaseMap<Field, uint64_t> {
    DatabaseFieldMap() : DatabaseMap<Field, uint64_t>(std::make_shared<db::MemoryDatabase>(), 'm') {}
};

} // namespace

// ============================================================================
// Shared Behaviour
// ============================================================================

using MapTypes = ::testing::Types<MemoryFieldMap, DatabaseFieldMap>;
TYPED_TEST_SUITE(MapTest, MapTypes);

TYPED_TEST(MapTest, InsertGetRemove) {
    auto& map = this->map_;
    EXPECT_FALSE(map.Get(Field(1)).has_value());

    map.Insert(Field(1), 10);
    ASSERT_TRUE(map.Get(Field(1)).has_value());
    EXPECT_EQ(*map.Get(Field(1)), 10u);
    EXPECT_TRUE(map.ContainsKey(Field(1)));

    map.Insert(Field(1), 11);
    EXPECT_EQ(*map.Get(Field(1)), 11u);

    map.Remove(Field(1));
    EXPECT_FALSE(map.ContainsKey(Field(1)));
}

TYPED_TEST(MapTest, RemoveMissingKeyIsNoOp) {
    auto& map = this->map_;
    map.Remove(Field(42));
    EXPECT_TRUE(map.Entries().empty());
}

TYPED_TEST(MapTest, EntriesKeysValues) {
    auto& map = this->map_;
    map.Insert(Field(1), 100);
    map.Insert(Field(2), 200);
    map.Insert(Field(3), 300);
    map.Remove(Field(2));

    auto keys = map.Keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_NE(std::find(keys.begin(), keys.end(), Field(1)), keys.end());
    EXPECT_NE(std::find(keys.begin(), keys.end(), Field(3)), keys.end());

    auto values = map.Values();
    std::sort(values.begin(), values.end());
    EXPECT_EQ(values, (std::vector<uint64_t>{100, 300}));
}

TYPED_TEST(MapTest, BatchIsVisibleBeforeFinish) {
    auto& map = this->map_;
    map.Insert(Field(1), 1);

    map.StartAtomic();
    EXPECT_TRUE(map.IsAtomicInProgress());
    map.Insert(Field(2), 2);
    map.Remove(Field(1));

    EXPECT_EQ(*map.Get(Field(2)), 2u);
    EXPECT_FALSE(map.ContainsKey(Field(1)));
    EXPECT_EQ(map.Entries().size(), 1u);

    map.FinishAtomic();
    EXPECT_FALSE(map.IsAtomicInProgress());
    EXPECT_EQ(*map.Get(Field(2)), 2u);
    EXPECT_FALSE(map.ContainsKey(Field(1)));
}

TYPED_TEST(MapTest, AbortDropsBatch) {
    auto& map = this->map_;
    map.Insert(Field(1), 1);

    map.StartAtomic();
    map.Insert(Field(2), 2);
    map.Remove(Field(1));
    map.AbortAtomic();

    EXPECT_FALSE(map.IsAtomicInProgress());
    EXPECT_EQ(*map.Get(Field(1)), 1u);
    EXPECT_FALSE(map.ContainsKey(Field(2)));
}

TYPED_TEST(MapTest, NestedBatchCommitsAtOutermostFinish) {
    auto& map = this->map_;
    map.StartAtomic();
    map.Insert(Field(1), 1);

    map.StartAtomic();
    map.Insert(Field(2), 2);
    map.FinishAtomic();

    // Still inside the outer batch
    EXPECT_TRUE(map.IsAtomicInProgress());
    map.AbortAtomic();

    EXPECT_FALSE(map.ContainsKey(Field(1)));
    EXPECT_FALSE(map.ContainsKey(Field(2)));

    map.StartAtomic();
    map.StartAtomic();
    map.Insert(Field(3), 3);
    map.FinishAtomic();
    map.FinishAtomic();
    EXPECT_TRUE(map.ContainsKey(Field(3)));
}

TYPED_TEST(MapTest, FinishWithoutStartThrows) {
    EXPECT_THROW(this->map_.FinishAtomic(), StorageError);
}

// ============================================================================
// Codec Tests
// ============================================================================

TEST(MapCodecTest, OptionalAndVectorValues) {
    MemoryMap<Field, std::optional<std::vector<Field>>> map;
    map.Insert(Field(1), std::nullopt);
    map.Insert(Field(2), std::vector<Field>{Field(5), Field(6)});

    auto none = map.Get(Field(1));
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none->has_value());

    auto some = map.Get(Field(2));
    ASSERT_TRUE(some.has_value() && some->has_value());
    EXPECT_EQ(**some, (std::vector<Field>{Field(5), Field(6)}));
}

TEST(MapCodecTest, DecodeRejectsTrailingBytes) {
    std::string encoded = store::detail::Encode(uint32_t(7)) + "x";
    EXPECT_THROW(store::detail::Decode<uint32_t>(encoded.data(), encoded.size()), StorageError);
}

TEST(MapCodecTest, DecodeRejectsShortInput) {
    std::string encoded = "ab";
    EXPECT_THROW(store::detail::Decode<uint32_t>(encoded.data(), encoded.size()), StorageError);
}

// ============================================================================
// Database Map Tests
// ============================================================================

TEST(DatabaseMapTest, PrefixesKeepMapsApart) {
    auto database = std::make_shared<db::MemoryDatabase>();
    DatabaseMap<Field, uint64_t> a(database, 'a');
    DatabaseMap<Field, uint64_t> b(database, 'b');

    a.Insert(Field(1), 1);
    b.Insert(Field(1), 2);
    b.Insert(Field(2), 3);

    EXPECT_EQ(*a.Get(Field(1)), 1u);
    EXPECT_EQ(*b.Get(Field(1)), 2u);
    EXPECT_EQ(a.Entries().size(), 1u);
    EXPECT_EQ(b.Entries().size(), 2u);
    EXPECT_EQ(database->Size(), 3u);
}

TEST(DatabaseMapTest, BatchWritesNothingUntilFinish) {
    auto database = std::make_shared<db::MemoryDatabase>();
    DatabaseMap<Field, uint64_t> map(database, 'a');

    map.StartAtomic();
    map.Insert(Field(1), 1);
    map.Insert(Field(2), 2);
    EXPECT_EQ(database->Size(), 0u);

    map.FinishAtomic();
    EXPECT_EQ(database->Size(), 2u);
}

TEST(DatabaseMapTest, CorruptValueRaisesStorageError) {
    auto database = std::make_shared<db::MemoryDatabase>();
    DatabaseMap<Field, uint64_t> map(database, 'a');
    map.Insert(Field(1), 1);

    std::string key = db::MakeKey('a') + store::detail::Encode(Field(1));
    ASSERT_TRUE(database->Put(db::Slice(key), db::Slice("short")).ok());
    EXPECT_THROW(map.Get(Field(1)), StorageError);
}

TEST(DatabaseMapTest, RequiresDatabase) {
    EXPECT_THROW((DatabaseMap<Field, uint64_t>(std::shared_ptr<db::Database>(nullptr), 'a')), StorageError);
}
