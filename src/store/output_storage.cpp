// VEIL - Transition Output Storage
// Copyright (c) 2024 VEIL Developers
// MIT License

#include "veil/store/output_storage.h"
#include "veil/util/logging.h"
#include <type_traits>

namespace veil {
namespace store {

OutputStorage::OutputStorage(Maps maps, std::optional<uint16_t> dev)
    : maps_(std::move(maps)), dev_(dev) {
    if (!maps_.ids || !maps_.reverseIds || !maps_.constant || !maps_.publicOutputs ||
        !maps_.privateOutputs || !maps_.record || !maps_.recordNonce || !maps_.externalRecord) {
        throw StorageError("Output storage requires all eight maps");
    }
}

std::unique_ptr<OutputStorage> OutputStorage::Memory(std::optional<uint16_t> dev) {
    Maps maps;
    maps.ids = std::make_unique<MemoryMap<Field, std::vector<Field>>>();
    maps.reverseIds = std::make_unique<MemoryMap<Field, Field>>();
    maps.constant = std::make_unique<MemoryMap<Field, std::optional<Plaintext>>>();
    maps.publicOutputs = std::make_unique<MemoryMap<Field, std::optional<Plaintext>>>();
    maps.privateOutputs = std::make_unique<MemoryMap<Field, std::optional<Ciphertext>>>();
    maps.record = std::make_unique<MemoryMap<Field, std::pair<Field, std::optional<RecordCiphertext>>>>();
    maps.recordNonce = std::make_unique<MemoryMap<Point, Field>>();
    maps.externalRecord = std::make_unique<MemoryMap<Field, std::monostate>>();
    return std::make_unique<OutputStorage>(std::move(maps), dev);
}

std::unique_ptr<OutputStorage> OutputStorage::Persistent(std::shared_ptr<db::Database> database,
                                                         std::optional<uint16_t> dev) {
    namespace p = db::prefix;
    Maps maps;
    maps.shared = std::make_shared<SharedWriteBatch>(std::move(database));
    const auto& shared = maps.shared;
    maps.ids = std::make_unique<DatabaseMap<Field, std::vector<Field>>>(shared, p::OUTPUT_IDS);
    maps.reverseIds = std::make_unique<DatabaseMap<Field, Field>>(shared, p::OUTPUT_REVERSE_IDS);
    maps.constant = std::make_unique<DatabaseMap<Field, std::optional<Plaintext>>>(shared, p::OUTPUT_CONSTANT);
    maps.publicOutputs = std::make_unique<DatabaseMap<Field, std::optional<Plaintext>>>(shared, p::OUTPUT_PUBLIC);
    maps.privateOutputs =
        std::make_unique<DatabaseMap<Field, std::optional<Ciphertext>>>(shared, p::OUTPUT_PRIVATE);
    maps.record = std::make_unique<DatabaseMap<Field, std::pair<Field, std::optional<RecordCiphertext>>>>(
        shared, p::OUTPUT_RECORD);
    maps.recordNonce = std::make_unique<DatabaseMap<Point, Field>>(shared, p::OUTPUT_RECORD_NONCE);
    maps.externalRecord = std::make_unique<DatabaseMap<Field, std::monostate>>(shared, p::OUTPUT_EXTERNAL);
    return std::make_unique<OutputStorage>(std::move(maps), dev);
}

// ============================================================================
// Atomic Batches
// ============================================================================

void OutputStorage::StartAtomic() {
    maps_.ids->StartAtomic();
    maps_.reverseIds->StartAtomic();
    maps_.constant->StartAtomic();
    maps_.publicOutputs->StartAtomic();
    maps_.privateOutputs->StartAtomic();
    maps_.record->StartAtomic();
    maps_.recordNonce->StartAtomic();
    maps_.externalRecord->StartAtomic();
}

bool OutputStorage::IsAtomicInProgress() const {
    return maps_.ids->IsAtomicInProgress() || maps_.reverseIds->IsAtomicInProgress() ||
           maps_.constant->IsAtomicInProgress() || maps_.publicOutputs->IsAtomicInProgress() ||
           maps_.privateOutputs->IsAtomicInProgress() || maps_.record->IsAtomicInProgress() ||
           maps_.recordNonce->IsAtomicInProgress() || maps_.externalRecord->IsAtomicInProgress();
}

void OutputStorage::AbortAtomic() {
    if (maps_.shared) {
        maps_.shared->Discard();
    }
    maps_.ids->AbortAtomic();
    maps_.reverseIds->AbortAtomic();
    maps_.constant->AbortAtomic();
    maps_.publicOutputs->AbortAtomic();
    maps_.privateOutputs->AbortAtomic();
    maps_.record->AbortAtomic();
    maps_.recordNonce->AbortAtomic();
    maps_.externalRecord->AbortAtomic();
}

void OutputStorage::FinishAtomic() {
    if (maps_.shared) {
        maps_.shared->Collect();
    }
    try {
        maps_.ids->FinishAtomic();
        maps_.reverseIds->FinishAtomic();
        maps_.constant->FinishAtomic();
        maps_.publicOutputs->FinishAtomic();
        maps_.privateOutputs->FinishAtomic();
        maps_.record->FinishAtomic();
        maps_.recordNonce->FinishAtomic();
        maps_.externalRecord->FinishAtomic();
        if (maps_.shared) {
            maps_.shared->Flush();
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::STORAGE) << "Aborting atomic batch at commit: " << e.what();
        AbortAtomic();
        throw;
    }
}

template<typename Fn>
void OutputStorage::RunAtomic(const char* operation, Fn&& fn) {
    bool partOfBatch = IsAtomicInProgress();
    if (!partOfBatch) {
        StartAtomic();
    }
    try {
        fn();
        if (!partOfBatch) {
            FinishAtomic();
        }
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::STORAGE) << "Aborting atomic batch during " << operation << ": " << e.what();
        AbortAtomic();
        throw;
    }
}

// ============================================================================
// Writes
// ============================================================================

void OutputStorage::Insert(const Field& transitionID, const std::vector<Output>& outputs) {
    RunAtomic("output insert", [&]() {
        std::vector<Field> ids;
        ids.reserve(outputs.size());
        for (const auto& output : outputs) {
            ids.push_back(output.ID());
        }
        maps_.ids->Insert(transitionID, ids);

        for (const auto& output : outputs) {
            maps_.reverseIds->Insert(output.ID(), transitionID);
            std::visit([this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, output::Constant>) {
                    maps_.constant->Insert(v.hash, v.plaintext);
                } else if constexpr (std::is_same_v<T, output::Public>) {
                    maps_.publicOutputs->Insert(v.hash, v.plaintext);
                } else if constexpr (std::is_same_v<T, output::Private>) {
                    maps_.privateOutputs->Insert(v.hash, v.ciphertext);
                } else if constexpr (std::is_same_v<T, output::Record>) {
                    if (v.record) {
                        maps_.recordNonce->Insert(v.record->Nonce(), v.commitment);
                    }
                    maps_.record->Insert(v.commitment, std::make_pair(v.checksum, v.record));
                } else {
                    maps_.externalRecord->Insert(v.hash, std::monostate{});
                }
            }, output.Get());
        }
    });
    LOG_DEBUG(util::LogCategory::STORAGE) << "Stored " << outputs.size() << " outputs for transition "
                                          << transitionID.ToHex();
}

void OutputStorage::Remove(const Field& transitionID) {
    std::optional<std::vector<Field>> outputIDs = maps_.ids->Get(transitionID);
    if (!outputIDs) {
        return;
    }

    RunAtomic("output remove", [&]() {
        maps_.ids->Remove(transitionID);
        for (const auto& outputID : *outputIDs) {
            maps_.reverseIds->Remove(outputID);

            auto record = maps_.record->Get(outputID);
            if (record && record->second) {
                maps_.recordNonce->Remove(record->second->Nonce());
            }

            maps_.constant->Remove(outputID);
            maps_.publicOutputs->Remove(outputID);
            maps_.privateOutputs->Remove(outputID);
            maps_.record->Remove(outputID);
            maps_.externalRecord->Remove(outputID);
        }
    });
    LOG_DEBUG(util::LogCategory::STORAGE) << "Removed " << outputIDs->size() << " outputs of transition "
                                          << transitionID.ToHex();
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Field> OutputStorage::FindTransitionID(const Field& outputID) const {
    return maps_.reverseIds->Get(outputID);
}

std::vector<Field> OutputStorage::GetIDs(const Field& transitionID) const {
    auto ids = maps_.ids->Get(transitionID);
    return ids ? *ids : std::vector<Field>{};
}

Output OutputStorage::ConstructOutput(const Field& transitionID, const Field& outputID) const {
    auto constant = maps_.constant->Get(outputID);
    auto publicOutput = maps_.publicOutputs->Get(outputID);
    auto privateOutput = maps_.privateOutputs->Get(outputID);
    auto record = maps_.record->Get(outputID);
    bool external = maps_.externalRecord->ContainsKey(outputID);

    int found = int(constant.has_value()) + int(publicOutput.has_value()) + int(privateOutput.has_value()) +
                int(record.has_value()) + int(external);
    if (found == 0) {
        throw StorageError("Missing output '" + outputID.ToHex() + "' in transition '" +
                           transitionID.ToHex() + "'");
    }
    if (found > 1) {
        throw StorageError("Found multiple outputs for the output ID '" + outputID.ToHex() +
                           "' in transition '" + transitionID.ToHex() + "'");
    }

    if (constant) {
        return Output(output::Constant{outputID, std::move(*constant)});
    }
    if (publicOutput) {
        return Output(output::Public{outputID, std::move(*publicOutput)});
    }
    if (privateOutput) {
        return Output(output::Private{outputID, std::move(*privateOutput)});
    }
    if (record) {
        return Output(output::Record{outputID, record->first, std::move(record->second)});
    }
    return Output(output::ExternalRecord{outputID});
}

std::vector<Output> OutputStorage::Get(const Field& transitionID) const {
    std::vector<Output> outputs;
    for (const auto& outputID : GetIDs(transitionID)) {
        outputs.push_back(ConstructOutput(transitionID, outputID));
    }
    return outputs;
}

// ============================================================================
// OutputStore
// ============================================================================

OutputStore::OutputStore(std::shared_ptr<OutputStorage> storage) : storage_(std::move(storage)) {
    if (!storage_) {
        throw StorageError("Output store requires a storage");
    }
}

OutputStore OutputStore::Open(std::optional<uint16_t> dev) {
    return OutputStore(std::shared_ptr<OutputStorage>(OutputStorage::Memory(dev)));
}

std::optional<RecordCiphertext> OutputStore::GetRecord(const Field& commitment) const {
    auto entry = storage_->GetRecordMap().Get(commitment);
    if (!entry) {
        throw StorageError("Record '" + commitment.ToHex() + "' does not exist");
    }
    return entry->second;
}

bool OutputStore::ContainsOutputID(const Field& outputID) const {
    return storage_->ReverseIdMap().ContainsKey(outputID);
}

bool OutputStore::ContainsCommitment(const Field& commitment) const {
    return storage_->GetRecordMap().ContainsKey(commitment);
}

bool OutputStore::ContainsChecksum(const Field& checksum) const {
    for (const auto& [commitment, entry] : storage_->GetRecordMap().Entries()) {
        if (entry.first == checksum) {
            return true;
        }
    }
    return false;
}

bool OutputStore::ContainsNonce(const Point& nonce) const {
    return storage_->GetRecordNonceMap().ContainsKey(nonce);
}

std::vector<Plaintext> OutputStore::ConstantOutputs() const {
    std::vector<Plaintext> out;
    for (auto& value : storage_->GetConstantMap().Values()) {
        if (value) {
            out.push_back(std::move(*value));
        }
    }
    return out;
}

std::vector<Plaintext> OutputStore::PublicOutputs() const {
    std::vector<Plaintext> out;
    for (auto& value : storage_->GetPublicMap().Values()) {
        if (value) {
            out.push_back(std::move(*value));
        }
    }
    return out;
}

std::vector<Ciphertext> OutputStore::PrivateOutputs() const {
    std::vector<Ciphertext> out;
    for (auto& value : storage_->GetPrivateMap().Values()) {
        if (value) {
            out.push_back(std::move(*value));
        }
    }
    return out;
}

std::vector<Field> OutputStore::Checksums() const {
    std::vector<Field> out;
    for (const auto& entry : storage_->GetRecordMap().Values()) {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<std::pair<Field, RecordCiphertext>> OutputStore::Records() const {
    std::vector<std::pair<Field, RecordCiphertext>> out;
    for (auto& [commitment, entry] : storage_->GetRecordMap().Entries()) {
        if (entry.second) {
            out.emplace_back(commitment, std::move(*entry.second));
        }
    }
    return out;
}

} // namespace store
} // namespace veil
