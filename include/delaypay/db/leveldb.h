// DELAYPAY - LevelDB Wrapper
// Copyright (c) 2024 DELAYPAY Developers
// MIT License
//
// LevelDB implementation of the database interface.

#ifndef DELAYPAY_DB_LEVELDB_H
#define DELAYPAY_DB_LEVELDB_H

#include "delaypay/db/database.h"

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>
#include <leveldb/write_batch.h>

namespace delaypay {
namespace db {

/// Map a LevelDB status onto ours
Status FromLevelDB(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
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

    Status status() const override { return FromLevelDB(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
public:
    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : db_(db), cache_(cache), filter_policy_(filter) {}

    ~LevelDBDatabase() override {
        // The DB must close before its cache and filter go away
        db_.reset();
        cache_.reset();
        filter_policy_.reset();
    }

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

private:
    static leveldb::ReadOptions MakeReadOptions(const ReadOptions& opts) {
        leveldb::ReadOptions lo;
        lo.verify_checksums = opts.verify_checksums;
        lo.fill_cache = opts.fill_cache;
        return lo;
    }

    static leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
        leveldb::WriteOptions lo;
        lo.sync = opts.sync;
        return lo;
    }

    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy_;
};

} // namespace db
} // namespace delaypay

#endif // DELAYPAY_DB_LEVELDB_H
