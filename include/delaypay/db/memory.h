// DELAYPAY - In-Memory Database
// Copyright (c) 2024 DELAYPAY Developers
// MIT License

#ifndef DELAYPAY_DB_MEMORY_H
#define DELAYPAY_DB_MEMORY_H

#include "delaypay/db/database.h"
#include <map>
#include <mutex>

namespace delaypay {
namespace db {

/**
 * Ordered in-memory key-value store. Nothing survives the object; used by
 * tests and by ledgers configured with the "memory" backend.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// Iterates over a snapshot taken at creation
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace delaypay

#endif // DELAYPAY_DB_MEMORY_H
