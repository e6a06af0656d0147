// VEIL - Database Abstraction Layer
// Copyright (c) 2024 VEIL Developers
// MIT License
//
// Abstract key-value interface beneath the persistent storage maps.
// LevelDB backs it when available; MemoryDatabase otherwise.

#ifndef VEIL_DB_DATABASE_H
#define VEIL_DB_DATABASE_H

#include "veil/core/types.h"
#include "veil/core/serialize.h"
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace veil {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Result of a database operation.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result;
        switch (code_) {
            case NOT_FOUND: result = "NotFound: "; break;
            case CORRUPTION: result = "Corruption: "; break;
            case NOT_SUPPORTED: result = "NotSupported: "; break;
            case INVALID_ARGUMENT: result = "InvalidArgument: "; break;
            case IO_ERROR: result = "IOError: "; break;
            default: result = "Unknown: "; break;
        }
        return result + message_;
    }

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/**
 * Non-owning view of a byte range. The buffer must outlive the Slice.
 */
class Slice {
public:
    Slice() : data_(nullptr), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const std::vector<Byte>& v)
        : data_(reinterpret_cast<const char*>(v.data())), size_(v.size()) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }
    std::vector<Byte> ToVector() const {
        return std::vector<Byte>(data_, data_ + size_);
    }

    /// True when this slice begins with `prefix`
    bool StartsWith(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Fail if the database already exists
    bool error_if_exists = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// LRU cache size for blocks (default 8MB, 0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 to disable)
    int bloom_filter_bits = 10;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/**
 * Writes applied atomically by Database::Write. A nullopt value deletes.
 */
class WriteBatch {
public:
    WriteBatch() = default;

    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

/**
 * Abstract key-value store. Backends: LevelDB, and an in-memory map for
 * tests.
 */
class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const Slice& key, std::string* value) = 0;

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator() = 0;

    virtual bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }

    virtual void Compact() {}
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open a database at `path`. Without LevelDB support the result is an
 * empty MemoryDatabase and `path` is only created.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete all data at `path`
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Key Prefixes
// ============================================================================

/// One prefix per storage map sharing a database
namespace prefix {
    constexpr char OUTPUT_IDS = 'i';         // transition id -> output ids
    constexpr char OUTPUT_REVERSE_IDS = 'I'; // output id -> transition id
    constexpr char OUTPUT_CONSTANT = 'c';    // plaintext hash -> plaintext?
    constexpr char OUTPUT_PUBLIC = 'p';      // plaintext hash -> plaintext?
    constexpr char OUTPUT_PRIVATE = 'v';     // ciphertext hash -> ciphertext?
    constexpr char OUTPUT_RECORD = 'r';      // commitment -> (checksum, record?)
    constexpr char OUTPUT_RECORD_NONCE = 'n';// nonce -> commitment
    constexpr char OUTPUT_EXTERNAL = 'x';    // external hash -> ()
    constexpr char COINBASE_SOLUTION = 's';  // epoch number -> coinbase solution
}

/// `prefix` followed by the serialized key
template<typename T>
std::string MakeKey(char prefix, const T& obj) {
    std::string result;
    result.push_back(prefix);
    DataStream ss;
    ss << obj;
    result.append(reinterpret_cast<const char*>(ss.data()), ss.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

} // namespace db
} // namespace veil

#endif // VEIL_DB_DATABASE_H
