// VEIL - Transition Output Storage
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Eight maps holding the outputs of stored transitions:
//
//   ids             transition id -> output ids
//   reverse ids     output id     -> transition id
//   constant        hash          -> plaintext?
//   public          hash          -> plaintext?
//   private         hash          -> ciphertext?
//   record          commitment    -> (checksum, record ciphertext?)
//   record nonce    nonce         -> commitment
//   external record hash          -> ()
//
// Insert and Remove run in one atomic batch across all maps, joining the
// caller's batch when one is already open. Persistent maps commit that
// batch in a single database write.

#ifndef VEIL_STORE_OUTPUT_STORAGE_H
#define VEIL_STORE_OUTPUT_STORAGE_H

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>
#include "veil/crypto/field.h"
#include "veil/crypto/group.h"
#include "veil/db/database.h"
#include "veil/program/plaintext.h"
#include "veil/program/record.h"
#include "veil/store/map.h"
#include "veil/transition/output.h"

namespace veil {
namespace store {

/**
 * Transition outputs split across eight maps, written as one atomic batch.
 */
class OutputStorage {
public:
    using IDMap = Map<Field, std::vector<Field>>;
    using ReverseIDMap = Map<Field, Field>;
    using ConstantMap = Map<Field, std::optional<Plaintext>>;
    using PublicMap = Map<Field, std::optional<Plaintext>>;
    using PrivateMap = Map<Field, std::optional<Ciphertext>>;
    using RecordMap = Map<Field, std::pair<Field, std::optional<RecordCiphertext>>>;
    using RecordNonceMap = Map<Point, Field>;
    using ExternalRecordMap = Map<Field, std::monostate>;

    struct Maps {
        std::unique_ptr<IDMap> ids;
        std::unique_ptr<ReverseIDMap> reverseIds;
        std::unique_ptr<ConstantMap> constant;
        std::unique_ptr<PublicMap> publicOutputs;
        std::unique_ptr<PrivateMap> privateOutputs;
        std::unique_ptr<RecordMap> record;
        std::unique_ptr<RecordNonceMap> recordNonce;
        std::unique_ptr<ExternalRecordMap> externalRecord;

        /// Set when the maps stage their commits in one database write
        std::shared_ptr<SharedWriteBatch> shared;
    };

    /// Throws StorageError if any map is missing
    explicit OutputStorage(Maps maps, std::optional<uint16_t> dev = std::nullopt);

    OutputStorage(const OutputStorage&) = delete;
    OutputStorage& operator=(const OutputStorage&) = delete;

    /// In-memory maps
    static std::unique_ptr<OutputStorage> Memory(std::optional<uint16_t> dev = std::nullopt);

    /// Maps sharing `database`, one key prefix each
    static std::unique_ptr<OutputStorage> Persistent(std::shared_ptr<db::Database> database,
                                                     std::optional<uint16_t> dev = std::nullopt);

    IDMap& IdMap() const { return *maps_.ids; }
    ReverseIDMap& ReverseIdMap() const { return *maps_.reverseIds; }
    ConstantMap& GetConstantMap() const { return *maps_.constant; }
    PublicMap& GetPublicMap() const { return *maps_.publicOutputs; }
    PrivateMap& GetPrivateMap() const { return *maps_.privateOutputs; }
    RecordMap& GetRecordMap() const { return *maps_.record; }
    RecordNonceMap& GetRecordNonceMap() const { return *maps_.recordNonce; }
    ExternalRecordMap& GetExternalRecordMap() const { return *maps_.externalRecord; }

    std::optional<uint16_t> Dev() const { return dev_; }

    void StartAtomic();
    bool IsAtomicInProgress() const;
    void AbortAtomic();
    void FinishAtomic();

    /// Store the outputs of `transitionID`. On failure every map is rolled
    /// back and the error is rethrown.
    void Insert(const Field& transitionID, const std::vector<Output>& outputs);

    /// Inverse of Insert; a missing transition is a no-op
    void Remove(const Field& transitionID);

    std::optional<Field> FindTransitionID(const Field& outputID) const;

    /// Empty when the transition is unknown
    std::vector<Field> GetIDs(const Field& transitionID) const;

    /// Rebuild the outputs of `transitionID`. Throws StorageError when an
    /// output is missing from every kind map or present in several.
    std::vector<Output> Get(const Field& transitionID) const;

private:
    Maps maps_;
    std::optional<uint16_t> dev_;

    Output ConstructOutput(const Field& transitionID, const Field& outputID) const;

    template<typename Fn>
    void RunAtomic(const char* operation, Fn&& fn);
};

/**
 * Read helpers over an OutputStorage
 */
class OutputStore {
public:
    explicit OutputStore(std::shared_ptr<OutputStorage> storage);

    static OutputStore Open(std::optional<uint16_t> dev = std::nullopt);

    void Insert(const Field& transitionID, const std::vector<Output>& outputs) { storage_->Insert(transitionID, outputs); }
    void Remove(const Field& transitionID) { storage_->Remove(transitionID); }

    void StartAtomic() { storage_->StartAtomic(); }
    bool IsAtomicInProgress() const { return storage_->IsAtomicInProgress(); }
    void AbortAtomic() { storage_->AbortAtomic(); }
    void FinishAtomic() { storage_->FinishAtomic(); }

    std::optional<uint16_t> Dev() const { return storage_->Dev(); }

    std::vector<Field> GetOutputIDs(const Field& transitionID) const { return storage_->GetIDs(transitionID); }
    std::vector<Output> GetOutputs(const Field& transitionID) const { return storage_->Get(transitionID); }

    /// The stored record, or nullopt when it was purged. Throws
    /// StorageError for an unknown commitment.
    std::optional<RecordCiphertext> GetRecord(const Field& commitment) const;

    std::optional<Field> FindTransitionID(const Field& outputID) const {
        return storage_->FindTransitionID(outputID);
    }

    bool ContainsOutputID(const Field& outputID) const;
    bool ContainsCommitment(const Field& commitment) const;
    bool ContainsChecksum(const Field& checksum) const;
    bool ContainsNonce(const Point& nonce) const;

    std::vector<Field> OutputIDs() const { return storage_->ReverseIdMap().Keys(); }
    std::vector<Field> ConstantOutputIDs() const { return storage_->GetConstantMap().Keys(); }
    std::vector<Field> PublicOutputIDs() const { return storage_->GetPublicMap().Keys(); }
    std::vector<Field> PrivateOutputIDs() const { return storage_->GetPrivateMap().Keys(); }
    std::vector<Field> Commitments() const { return storage_->GetRecordMap().Keys(); }
    std::vector<Field> ExternalOutputIDs() const { return storage_->GetExternalRecordMap().Keys(); }

    /// Present payloads only
    std::vector<Plaintext> ConstantOutputs() const;
    std::vector<Plaintext> PublicOutputs() const;
    std::vector<Ciphertext> PrivateOutputs() const;

    std::vector<Field> Checksums() const;
    std::vector<Point> Nonces() const { return storage_->GetRecordNonceMap().Keys(); }

    /// (commitment, record) for every record still held
    std::vector<std::pair<Field, RecordCiphertext>> Records() const;

private:
    std::shared_ptr<OutputStorage> storage_;
};

} // namespace store
} // namespace veil

#endif // VEIL_STORE_OUTPUT_STORAGE_H
