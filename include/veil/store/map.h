// VEIL - Storage Maps
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Typed key-value maps with nestable atomic batches. While a batch is
// open, writes are queued and visible to reads through the same map;
// the outermost FinishAtomic applies them, AbortAtomic drops them.

#ifndef VEIL_STORE_MAP_H
#define VEIL_STORE_MAP_H

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "veil/core/errors.h"
#include "veil/core/serialize.h"
#include "veil/db/database.h"

namespace veil {
namespace store {

// ============================================================================
// Value Codec
// ============================================================================

namespace detail {

template<typename T>
struct Codec {
    static void Write(DataStream& s, const T& v) { ::veil::Serialize(s, v); }
    static void Read(DataStream& s, T& v) { ::veil::Unserialize(s, v); }
};

template<typename T>
struct Codec<std::optional<T>> {
    static void Write(DataStream& s, const std::optional<T>& v) {
        ::veil::Serialize(s, v.has_value());
        if (v) {
            Codec<T>::Write(s, *v);
        }
    }
    static void Read(DataStream& s, std::optional<T>& v) {
        bool present = false;
        ::veil::Unserialize(s, present);
        v.reset();
        if (present) {
            T inner;
            Codec<T>::Read(s, inner);
            v = std::move(inner);
        }
    }
};

template<typename T>
struct Codec<std::vector<T>> {
    static void Write(DataStream& s, const std::vector<T>& v) {
        ser_writedata32(s, static_cast<uint32_t>(v.size()));
        for (const auto& e : v) {
            Codec<T>::Write(s, e);
        }
    }
    static void Read(DataStream& s, std::vector<T>& v) {
        uint32_t n = ser_readdata32(s);
        v.clear();
        for (uint32_t i = 0; i < n; ++i) {
            T e;
            Codec<T>::Read(s, e);
            v.push_back(std::move(e));
        }
    }
};

template<typename A, typename B>
struct Codec<std::pair<A, B>> {
    static void Write(DataStream& s, const std::pair<A, B>& v) {
        Codec<A>::Write(s, v.first);
        Codec<B>::Write(s, v.second);
    }
    static void Read(DataStream& s, std::pair<A, B>& v) {
        Codec<A>::Read(s, v.first);
        Codec<B>::Read(s, v.second);
    }
};

template<>
struct Codec<std::monostate> {
    static void Write(DataStream&, const std::monostate&) {}
    static void Read(DataStream&, std::monostate&) {}
};

template<typename T>
std::string Encode(const T& value) {
    DataStream ss;
    Codec<T>::Write(ss, value);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// Throws StorageError when the bytes are not exactly one T
template<typename T>
T Decode(const char* data, size_t len) {
    DataStream ss(reinterpret_cast<const Byte*>(data), len);
    T value;
    try {
        Codec<T>::Read(ss, value);
    } catch (const std::ios_base::failure& e) {
        throw StorageError(std::string("Corrupted storage entry: ") + e.what());
    } catch (const DecodeError& e) {
        throw StorageError(std::string("Corrupted storage entry: ") + e.what());
    }
    if (!ss.empty()) {
        throw StorageError("Corrupted storage entry: trailing bytes");
    }
    return value;
}

} // namespace detail

// ============================================================================
// Map
// ============================================================================

template<typename K, typename V>
class Map {
public:
    virtual ~Map() = default;

    virtual void Insert(const K& key, const V& value) = 0;
    virtual void Remove(const K& key) = 0;
    virtual std::optional<V> Get(const K& key) const = 0;

    virtual bool ContainsKey(const K& key) const { return Get(key).has_value(); }

    /// All entries, pending batch included; order is unspecified
    virtual std::vector<std::pair<K, V>> Entries() const = 0;

    std::vector<K> Keys() const {
        std::vector<K> out;
        for (auto& [k, v] : Entries()) {
            out.push_back(std::move(k));
        }
        return out;
    }

    std::vector<V> Values() const {
        std::vector<V> out;
        for (auto& [k, v] : Entries()) {
            out.push_back(std::move(v));
        }
        return out;
    }

    /// Opens a batch, or nests inside the open one
    virtual void StartAtomic() = 0;
    virtual bool IsAtomicInProgress() const = 0;

    /// Drops every queued write and closes all nesting levels
    virtual void AbortAtomic() = 0;

    /// Closes one nesting level; the outermost applies the batch
    virtual void FinishAtomic() = 0;
};

// ============================================================================
// BatchedMap
// ============================================================================

/**
 * Batch bookkeeping shared by the backends. Keys are compared by their
 * encoding, so K needs no ordering of its own.
 */
template<typename K, typename V>
class BatchedMap : public Map<K, V> {
public:
    struct Operation {
        std::string encodedKey;
        K key;
        std::optional<V> value; // nullopt removes
    };

    void Insert(const K& key, const V& value) override { Queue({detail::Encode(key), key, value}); }
    void Remove(const K& key) override { Queue({detail::Encode(key), key, std::nullopt}); }

    std::optional<V> Get(const K& key) const override {
        std::string encoded = detail::Encode(key);
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = batch_.rbegin(); it != batch_.rend(); ++it) {
            if (it->encodedKey == encoded) {
                return it->value;
            }
        }
        return ReadConfirmed(encoded);
    }

    std::vector<std::pair<K, V>> Entries() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, std::pair<K, V>> merged;
        for (auto& entry : ReadAllConfirmed()) {
            std::string encoded = detail::Encode(entry.first);
            merged.emplace(std::move(encoded), std::move(entry));
        }
        for (const auto& op : batch_) {
            if (op.value) {
                merged.insert_or_assign(op.encodedKey, std::make_pair(op.key, *op.value));
            } else {
                merged.erase(op.encodedKey);
            }
        }
        std::vector<std::pair<K, V>> out;
        out.reserve(merged.size());
        for (auto& [encoded, entry] : merged) {
            out.push_back(std::move(entry));
        }
        return out;
    }

    void StartAtomic() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++depth_;
    }

    bool IsAtomicInProgress() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return depth_ > 0;
    }

    void AbortAtomic() override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch_.clear();
        depth_ = 0;
    }

    void FinishAtomic() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (depth_ == 0) {
            throw StorageError("No atomic batch in progress");
        }
        if (--depth_ > 0) {
            return;
        }
        std::vector<Operation> batch;
        batch.swap(batch_);
        Commit(batch);
    }

protected:
    /// Called with the lock held
    virtual std::optional<V> ReadConfirmed(const std::string& encodedKey) const = 0;
    virtual std::vector<std::pair<K, V>> ReadAllConfirmed() const = 0;
    virtual void Commit(const std::vector<Operation>& operations) = 0;

private:
    mutable std::mutex mutex_;
    std::vector<Operation> batch_;
    size_t depth_{0};

    void Queue(Operation op) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (depth_ > 0) {
            batch_.push_back(std::move(op));
            return;
        }
        std::vector<Operation> single;
        single.push_back(std::move(op));
        Commit(single);
    }
};

// ============================================================================
// MemoryMap
// ============================================================================

template<typename K, typename V>
class MemoryMap : public BatchedMap<K, V> {
public:
    using Operation = typename BatchedMap<K, V>::Operation;

protected:
    std::optional<V> ReadConfirmed(const std::string& encodedKey) const override {
        auto it = data_.find(encodedKey);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second.second;
    }

    std::vector<std::pair<K, V>> ReadAllConfirmed() const override {
        std::vector<std::pair<K, V>> out;
        out.reserve(data_.size());
        for (const auto& [encoded, entry] : data_) {
            out.push_back(entry);
        }
        return out;
    }

    void Commit(const std::vector<Operation>& operations) override {
        for (const auto& op : operations) {
            if (op.value) {
                data_.insert_or_assign(op.encodedKey, std::make_pair(op.key, *op.value));
            } else {
                data_.erase(op.encodedKey);
            }
        }
    }

private:
    std::map<std::string, std::pair<K, V>> data_;
};

// ============================================================================
// SharedWriteBatch
// ============================================================================

/**
 * One pending db::WriteBatch for several DatabaseMaps on the same
 * database. Between Collect() and Flush() the maps stage their commits
 * here instead of writing them, so the group lands in a single Write.
 */
class SharedWriteBatch {
public:
    explicit SharedWriteBatch(std::shared_ptr<db::Database> database) : db_(std::move(database)) {
        if (!db_) {
            throw StorageError("Shared write batch requires an open database");
        }
    }

    const std::shared_ptr<db::Database>& GetDatabase() const { return db_; }

    void Collect() {
        std::lock_guard<std::mutex> lock(mutex_);
        collecting_ = true;
    }

    /// Appends `batch` and returns true while collecting; false otherwise
    bool Stage(const db::WriteBatch& batch) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!collecting_) {
            return false;
        }
        batch.Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                pending_.Put(db::Slice(key), db::Slice(*value));
            } else {
                pending_.Delete(db::Slice(key));
            }
        });
        return true;
    }

    /// Write everything staged since Collect(). Throws StorageError when
    /// the database rejects the batch; nothing staged is kept either way.
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        collecting_ = false;
        if (pending_.Empty()) {
            return;
        }
        db::Status s = db_->Write(&pending_);
        pending_.Clear();
        if (!s.ok()) {
            throw StorageError("Failed to write to the database: " + s.ToString());
        }
    }

    void Discard() {
        std::lock_guard<std::mutex> lock(mutex_);
        collecting_ = false;
        pending_.Clear();
    }

private:
    std::shared_ptr<db::Database> db_;
    std::mutex mutex_;
    db::WriteBatch pending_;
    bool collecting_{false};
};

// ============================================================================
// DatabaseMap
// ============================================================================

/**
 * Entries live in a shared db::Database under a one-byte prefix. Maps
 * built on a SharedWriteBatch stage their outermost commit there while
 * the owner collects.
 */
template<typename K, typename V>
class DatabaseMap : public BatchedMap<K, V> {
public:
    using Operation = typename BatchedMap<K, V>::Operation;

    DatabaseMap(std::shared_ptr<db::Database> database, char prefix)
        : db_(std::move(database)), prefix_(prefix) {
        if (!db_) {
            throw StorageError("Database map requires an open database");
        }
    }

    DatabaseMap(std::shared_ptr<SharedWriteBatch> shared, char prefix)
        : db_(shared ? shared->GetDatabase() : nullptr), shared_(std::move(shared)), prefix_(prefix) {
        if (!db_) {
            throw StorageError("Database map requires an open database");
        }
    }

protected:
    std::optional<V> ReadConfirmed(const std::string& encodedKey) const override {
        std::string value;
        db::Status s = db_->Get(db::Slice(Prefixed(encodedKey)), &value);
        if (s.IsNotFound()) {
            return std::nullopt;
        }
        if (!s.ok()) {
            throw StorageError("Failed to read from the database: " + s.ToString());
        }
        return detail::Decode<V>(value.data(), value.size());
    }

    std::vector<std::pair<K, V>> ReadAllConfirmed() const override {
        std::vector<std::pair<K, V>> out;
        std::string start = db::MakeKey(prefix_);
        db::Slice startSlice(start);
        auto it = db_->NewIterator();
        for (it->Seek(startSlice); it->Valid() && it->key().StartsWith(startSlice); it->Next()) {
            db::Slice key = it->key();
            db::Slice value = it->value();
            out.emplace_back(detail::Decode<K>(key.data() + 1, key.size() - 1),
                             detail::Decode<V>(value.data(), value.size()));
        }
        db::Status s = it->status();
        if (!s.ok()) {
            throw StorageError("Failed to iterate the database: " + s.ToString());
        }
        return out;
    }

    void Commit(const std::vector<Operation>& operations) override {
        db::WriteBatch batch;
        for (const auto& op : operations) {
            std::string key = Prefixed(op.encodedKey);
            if (op.value) {
                batch.Put(db::Slice(key), db::Slice(detail::Encode(*op.value)));
            } else {
                batch.Delete(db::Slice(key));
            }
        }
        if (shared_ && shared_->Stage(batch)) {
            return;
        }
        db::Status s = db_->Write(&batch);
        if (!s.ok()) {
            throw StorageError("Failed to write to the database: " + s.ToString());
        }
    }

private:
    std::shared_ptr<db::Database> db_;
    std::shared_ptr<SharedWriteBatch> shared_;
    char prefix_;

    std::string Prefixed(const std::string& encodedKey) const {
        std::string key = db::MakeKey(prefix_);
        key.append(encodedKey);
        return key;
    }
};

} // namespace store
} // namespace veil

#endif // VEIL_STORE_MAP_H
