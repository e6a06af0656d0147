// VEIL - Database Backends
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// LevelDB implementation of db::Database, and the in-memory database
// used for tests and when LevelDB is not built in.

#ifndef VEIL_DB_LEVELDB_H
#define VEIL_DB_LEVELDB_H

#include "veil/db/database.h"
#include <map>
#include <mutex>

#ifdef VEIL_USE_LEVELDB
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>
#endif

namespace veil {
namespace db {

#ifdef VEIL_USE_LEVELDB

inline Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

// ============================================================================
// LevelDB
// ============================================================================

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return ConvertStatus(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache, const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filterPolicy_(filter) {}

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    ~LevelDBDatabase() override {
        // The database must close before its cache and filter
        db_.reset();
        cache_.reset();
        filterPolicy_.reset();
    }

    Status Get(const Slice& key, std::string* value) override {
        return ConvertStatus(db_->Get(leveldb::ReadOptions(), leveldb::Slice(key.data(), key.size()), value));
    }

    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override {
        return ConvertStatus(db_->Put(MakeWriteOptions(options), leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
    }

    Status Delete(const WriteOptions& options, const Slice& key) override {
        return ConvertStatus(db_->Delete(MakeWriteOptions(options), leveldb::Slice(key.data(), key.size())));
    }

    Status Write(const WriteOptions& options, WriteBatch* batch) override {
        leveldb::WriteBatch lb;
        batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                lb.Put(key, *value);
            } else {
                lb.Delete(key);
            }
        });
        return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
    }

    std::unique_ptr<Iterator> NewIterator() override {
        return std::make_unique<LevelDBIterator>(db_->NewIterator(leveldb::ReadOptions()));
    }

    void Compact() override { db_->CompactRange(nullptr, nullptr); }

private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }
};

#endif // VEIL_USE_LEVELDB

// ============================================================================
// In-Memory Database
// ============================================================================

class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    using Database::Put;
    using Database::Delete;
    using Database::Write;

    Status Get(const Slice& key, std::string* value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key.ToString());
        if (it == data_.end()) {
            return Status::NotFound();
        }
        *value = it->second;
        return Status::Ok();
    }

    Status Put(const WriteOptions&, const Slice& key, const Slice& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[key.ToString()] = value.ToString();
        return Status::Ok();
    }

    Status Delete(const WriteOptions&, const Slice& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.erase(key.ToString());
        return Status::Ok();
    }

    Status Write(const WriteOptions&, WriteBatch* batch) override {
        std::lock_guard<std::mutex> lock(mutex_);
        batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
            if (value) {
                data_[key] = *value;
            } else {
                data_.erase(key);
            }
        });
        return Status::Ok();
    }

    /// The iterator reads the live map; do not write while iterating
    std::unique_ptr<Iterator> NewIterator() override;

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(const std::map<std::string, std::string>& data)
        : data_(data), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    const std::map<std::string, std::string>& data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

inline std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    return std::make_unique<MemoryIterator>(data_);
}

} // namespace db
} // namespace veil

#endif // VEIL_DB_LEVELDB_H
