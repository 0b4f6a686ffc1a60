#include "Storage/RocksDbStore.hpp"
#include "Utils/Logger.hpp"
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <filesystem>
#include <system_error>

namespace {

rocksdb::Status notOpen() {
    return rocksdb::Status::InvalidArgument("database is not open");
}

} // namespace

RocksDbStore::~RocksDbStore() {
    Close();
}

std::expected<void, rocksdb::Status> RocksDbStore::Open(const std::string& path) noexcept {
    std::lock_guard lock(mutex_);
    if (db_) return {};

    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return std::unexpected(rocksdb::Status::IOError("cannot create " + path, ec.message()));
    }

    rocksdb::Options options;
    options.create_if_missing = true;

    rocksdb::DB* raw = nullptr;
    const auto status = rocksdb::DB::Open(options, path, &raw);
    if (!status.ok()) {
        BoostLogger::Error("RocksDB open failed for {}: {}", path, status.ToString());
        return std::unexpected(status);
    }
    db_.reset(raw);
    BoostLogger::Debug("RocksDB opened at {}", path);
    return {};
}

std::expected<void, rocksdb::Status> RocksDbStore::Put(std::string_view key, std::string_view value) noexcept {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(notOpen());

    rocksdb::WriteOptions options;
    options.sync = true;
    const auto status = db_->Put(options, rocksdb::Slice(key.data(), key.size()),
                                 rocksdb::Slice(value.data(), value.size()));
    if (!status.ok()) return std::unexpected(status);
    return {};
}

std::expected<std::string, rocksdb::Status> RocksDbStore::Get(std::string_view key) const noexcept {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(notOpen());

    std::string value;
    const auto status = db_->Get(rocksdb::ReadOptions(), rocksdb::Slice(key.data(), key.size()), &value);
    if (!status.ok()) return std::unexpected(status);
    return value;
}

std::expected<void, rocksdb::Status> RocksDbStore::Delete(std::string_view key) noexcept {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(notOpen());

    rocksdb::WriteOptions options;
    options.sync = true;
    const auto status = db_->Delete(options, rocksdb::Slice(key.data(), key.size()));
    if (!status.ok()) return std::unexpected(status);
    return {};
}

std::expected<std::vector<std::string>, rocksdb::Status> RocksDbStore::Keys(std::string_view prefix) const noexcept {
    std::lock_guard lock(mutex_);
    if (!db_) return std::unexpected(notOpen());

    std::vector<std::string> keys;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(rocksdb::Slice(prefix.data(), prefix.size())); it->Valid(); it->Next()) {
        const auto key = it->key().ToString();
        if (key.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(key);
    }
    if (!it->status().ok()) return std::unexpected(it->status());
    return keys;
}

void RocksDbStore::Close() noexcept {
    std::lock_guard lock(mutex_);
    if (!db_) return;
    const auto status = db_->Close();
    if (!status.ok()) {
        BoostLogger::Warn("RocksDB close: {}", status.ToString());
    }
    db_.reset();
}

bool RocksDbStore::isOpen() const noexcept {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}
