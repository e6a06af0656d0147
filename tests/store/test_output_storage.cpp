// VEIL - Output Storage Tests
// Copyright (c) 2024 VEIL Developers
// MIT License

#include <gtest/gtest.h>
#include "veil/store/output_storage.h"
#include "veil/db/leveldb.h"
#include "veil/network/network.h"

#include <algorithm>

using namespace veil;
using namespace veil::store;

namespace {

RecordCiphertext MakeRecordCiphertext(uint64_t seed) {
    Address owner = Address::FromPrivateKey(PrivateKey::FromSeed(Field(seed)));
    Scalar randomizer = Scalar::FromUint64(seed + 1000);
    Record record(owner, Visibility::Private, 50 + seed, Visibility::Public, {},
                  network::GScalarMultiply(randomizer));
    return record.Encrypt(randomizer);
}

Output MakeRecordOutput(uint64_t seed) {
    RecordCiphertext ciphertext = MakeRecordCiphertext(seed);
    Field checksum = network::HashBHP1024(ciphertext.ToBitsLE());
    return Output(output::Record{Field::FromDomain("commitment" + std::to_string(seed)), checksum, ciphertext});
}

std::vector<Output> MakeOutputs(uint64_t base) {
    Plaintext plaintext(Literal::FromU64(base));
    return {
        Output(output::Constant{Field(base + 1), plaintext}),
        Output(output::Public{Field(base + 2), std::nullopt}),
        Output(output::Private{Field(base + 3), Ciphertext({Field(7), Field(8)})}),
        MakeRecordOutput(base),
        Output(output::ExternalRecord{Field(base + 5)}),
    };
}

/// Record map whose writes always fail
class FailingRecordMap : public MemoryMap<Field, std::pair<Field, std::optional<RecordCiphertext>>> {
public:
    void Insert(const Field&, const std::pair<Field, std::optional<RecordCiphertext>>&) override {
        throw StorageError("record map is read-only");
    }
};

std::unique_ptr<OutputStorage> MemoryStorageWithFailingRecords() {
    OutputStorage::Maps maps;
    maps.ids = std::make_unique<MemoryMap<Field, std::vector<Field>>>();
    maps.reverseIds = std::make_unique<MemoryMap<Field, Field>>();
    maps.constant = std::make_unique<MemoryMap<Field, std::optional<Plaintext>>>();
    maps.publicOutputs = std::make_unique<MemoryMap<Field, std::optional<Plaintext>>>();
    maps.privateOutputs = std::make_unique<MemoryMap<Field, std::optional<Ciphertext>>>();
    maps.record = std::make_unique<FailingRecordMap>();
    maps.recordNonce = std::make_unique<MemoryMap<Point, Field>>();
    maps.externalRecord = std::make_unique<MemoryMap<Field, std::monostate>>();
    return std::make_unique<OutputStorage>(std::move(maps));
}

/// Rejects any write batch that touches the record prefix
class RecordRejectingDatabase : public db::MemoryDatabase {
public:
    using MemoryDatabase::Write;

    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        bool touchesRecords = false;
        batch->Iterate([&touchesRecords](const std::string& key, const std::optional<std::string>&) {
            if (!key.empty() && key[0] == db::prefix::OUTPUT_RECORD) {
                touchesRecords = true;
            }
        });
        ++writes;
        if (touchesRecords) {
            return db::Status::IOError("record writes rejected");
        }
        return MemoryDatabase::Write(options, batch);
    }

    int writes{0};
};

} // namespace

// ============================================================================
// Output Store Tests
// ============================================================================

class OutputStoreTest : public ::testing::TestWithParam<bool> {
protected:
    void SetUp() override {
        if (GetParam()) {
            storage_ = OutputStorage::Persistent(std::make_shared<db::MemoryDatabase>(), 1);
        } else {
            storage_ = OutputStorage::Memory(1);
        }
        store_ = std::make_unique<OutputStore>(storage_);
    }

    std::shared_ptr<OutputStorage> storage_;
    std::unique_ptr<OutputStore> store_;
};

INSTANTIATE_TEST_SUITE_P(Backends, OutputStoreTest, ::testing::Values(false, true));

TEST_P(OutputStoreTest, InsertGetRoundTrip) {
    Field tid = Field::FromDomain("transition-a");
    auto outputs = MakeOutputs(100);
    store_->Insert(tid, outputs);

    EXPECT_EQ(store_->GetOutputs(tid), outputs);
    ASSERT_EQ(store_->GetOutputIDs(tid).size(), outputs.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        EXPECT_EQ(store_->GetOutputIDs(tid)[i], outputs[i].ID());
        EXPECT_EQ(store_->FindTransitionID(outputs[i].ID()), tid);
        EXPECT_TRUE(store_->ContainsOutputID(outputs[i].ID()));
    }
    EXPECT_EQ(store_->Dev(), std::optional<uint16_t>(1));
}

TEST_P(OutputStoreTest, IndexesRecordFields) {
    Field tid = Field::FromDomain("transition-b");
    auto outputs = MakeOutputs(200);
    store_->Insert(tid, outputs);

    const auto& record = std::get<output::Record>(outputs[3].Get());
    EXPECT_TRUE(store_->ContainsCommitment(record.commitment));
    EXPECT_TRUE(store_->ContainsChecksum(record.checksum));
    EXPECT_TRUE(store_->ContainsNonce(record.record->Nonce()));
    EXPECT_EQ(store_->GetRecord(record.commitment), record.record);

    EXPECT_EQ(store_->Commitments(), std::vector<Field>{record.commitment});
    EXPECT_EQ(store_->Checksums(), std::vector<Field>{record.checksum});
    EXPECT_EQ(store_->Nonces(), std::vector<Point>{record.record->Nonce()});
    ASSERT_EQ(store_->Records().size(), 1u);
    EXPECT_EQ(store_->Records()[0].second, *record.record);
}

TEST_P(OutputStoreTest, PayloadListings) {
    store_->Insert(Field::FromDomain("transition-c"), MakeOutputs(300));

    EXPECT_EQ(store_->ConstantOutputIDs(), std::vector<Field>{Field(301)});
    EXPECT_EQ(store_->PublicOutputIDs(), std::vector<Field>{Field(302)});
    EXPECT_EQ(store_->PrivateOutputIDs(), std::vector<Field>{Field(303)});
    EXPECT_EQ(store_->ExternalOutputIDs(), std::vector<Field>{Field(305)});
    EXPECT_EQ(store_->OutputIDs().size(), 5u);

    ASSERT_EQ(store_->ConstantOutputs().size(), 1u);
    EXPECT_EQ(store_->ConstantOutputs()[0], Plaintext(Literal::FromU64(300)));
    // The public output carries no plaintext
    EXPECT_TRUE(store_->PublicOutputs().empty());
    ASSERT_EQ(store_->PrivateOutputs().size(), 1u);
    EXPECT_EQ(store_->PrivateOutputs()[0].Size(), 2u);
}

TEST_P(OutputStoreTest, RemoveErasesEveryMap) {
    Field tid = Field::FromDomain("transition-d");
    auto outputs = MakeOutputs(400);
    store_->Insert(tid, outputs);
    store_->Remove(tid);

    EXPECT_TRUE(store_->GetOutputIDs(tid).empty());
    EXPECT_TRUE(store_->GetOutputs(tid).empty());
    EXPECT_TRUE(store_->OutputIDs().empty());
    EXPECT_TRUE(store_->Commitments().empty());
    EXPECT_TRUE(store_->Nonces().empty());
    EXPECT_TRUE(store_->ExternalOutputIDs().empty());
    EXPECT_FALSE(store_->FindTransitionID(outputs[0].ID()).has_value());
}

TEST_P(OutputStoreTest, RemoveUnknownTransitionIsNoOp) {
    store_->Insert(Field::FromDomain("kept"), MakeOutputs(500));
    store_->Remove(Field::FromDomain("unknown"));
    EXPECT_EQ(store_->OutputIDs().size(), 5u);
}

TEST_P(OutputStoreTest, UnknownRecordThrows) {
    EXPECT_THROW(store_->GetRecord(Field(999)), StorageError);
}

TEST_P(OutputStoreTest, CallerBatchSpansInserts) {
    Field t1 = Field::FromDomain("t1");
    Field t2 = Field::FromDomain("t2");

    store_->StartAtomic();
    store_->Insert(t1, MakeOutputs(600));
    store_->Insert(t2, MakeOutputs(700));
    EXPECT_TRUE(store_->IsAtomicInProgress());
    EXPECT_EQ(store_->OutputIDs().size(), 10u);
    store_->AbortAtomic();

    EXPECT_FALSE(store_->IsAtomicInProgress());
    EXPECT_TRUE(store_->OutputIDs().empty());
    EXPECT_TRUE(store_->GetOutputIDs(t1).empty());

    store_->StartAtomic();
    store_->Insert(t1, MakeOutputs(600));
    store_->FinishAtomic();
    EXPECT_EQ(store_->GetOutputs(t1), MakeOutputs(600));
}

TEST_P(OutputStoreTest, MissingOutputIsReported) {
    Field tid = Field::FromDomain("transition-e");
    auto outputs = MakeOutputs(800);
    store_->Insert(tid, outputs);

    storage_->GetConstantMap().Remove(outputs[0].ID());
    EXPECT_THROW(store_->GetOutputs(tid), StorageError);
}

TEST_P(OutputStoreTest, DuplicateOutputIsReported) {
    Field tid = Field::FromDomain("transition-f");
    auto outputs = MakeOutputs(900);
    store_->Insert(tid, outputs);

    storage_->GetPublicMap().Insert(outputs[0].ID(), std::nullopt);
    EXPECT_THROW(store_->GetOutputs(tid), StorageError);
}

// ============================================================================
// Atomicity Tests
// ============================================================================

TEST(OutputStorageAtomicTest, FailedInsertLeavesNoTrace) {
    auto storage = MemoryStorageWithFailingRecords();
    Field tid = Field::FromDomain("failing");

    EXPECT_THROW(storage->Insert(tid, MakeOutputs(1000)), StorageError);

    EXPECT_FALSE(storage->IsAtomicInProgress());
    EXPECT_TRUE(storage->GetIDs(tid).empty());
    EXPECT_TRUE(storage->ReverseIdMap().Entries().empty());
    EXPECT_TRUE(storage->GetConstantMap().Entries().empty());
    EXPECT_TRUE(storage->GetPrivateMap().Entries().empty());
    EXPECT_TRUE(storage->GetRecordNonceMap().Entries().empty());
}

TEST(OutputStorageAtomicTest, FailureInsideCallerBatchAbortsIt) {
    auto storage = MemoryStorageWithFailingRecords();

    storage->StartAtomic();
    std::vector<Output> plain = {Output(output::Public{Field(1), std::nullopt})};
    storage->Insert(Field(10), plain);
    EXPECT_THROW(storage->Insert(Field(11), MakeOutputs(1100)), StorageError);

    EXPECT_FALSE(storage->IsAtomicInProgress());
    EXPECT_TRUE(storage->GetIDs(Field(10)).empty());
}

TEST(OutputStorageAtomicTest, RejectedDatabaseWriteLeavesNoTrace) {
    auto database = std::make_shared<RecordRejectingDatabase>();
    auto storage = OutputStorage::Persistent(database);
    Field tid = Field::FromDomain("rejected");
    std::vector<Output> outputs = {
        Output(output::Public{Field(21), std::nullopt}),
        MakeRecordOutput(21),
    };

    EXPECT_THROW(storage->Insert(tid, outputs), StorageError);

    EXPECT_EQ(database->writes, 1);
    EXPECT_EQ(database->Size(), 0u);
    EXPECT_FALSE(storage->IsAtomicInProgress());
    EXPECT_FALSE(storage->IdMap().ContainsKey(tid));
    EXPECT_FALSE(storage->GetPublicMap().ContainsKey(Field(21)));
    EXPECT_TRUE(storage->ReverseIdMap().Entries().empty());

    std::vector<Output> plain = {Output(output::Public{Field(22), std::nullopt})};
    storage->Insert(Field(30), plain);
    EXPECT_EQ(database->writes, 2);
    EXPECT_EQ(storage->Get(Field(30)), plain);
}

TEST(OutputStorageAtomicTest, RequiresEveryMap) {
    OutputStorage::Maps maps;
    EXPECT_THROW(OutputStorage(std::move(maps)), StorageError);
}

TEST(OutputStorageAtomicTest, OpenUsesMemoryMaps) {
    OutputStore store = OutputStore::Open();
    EXPECT_FALSE(store.Dev().has_value());
    store.Insert(Field(1), MakeOutputs(1200));
    EXPECT_EQ(store.GetOutputs(Field(1)), MakeOutputs(1200));
}
