#pragma once

#include <memory>
#include <mutex>
#include "Core/interfaces/IDatabase.hpp"

class RocksDbStore final : public IRocksDB {
public:
    RocksDbStore() = default;
    ~RocksDbStore() override;

    RocksDbStore(const RocksDbStore&) = delete;
    RocksDbStore& operator=(const RocksDbStore&) = delete;

    [[nodiscard]] std::expected<void, rocksdb::Status> Open(const std::string& path) noexcept override;
    [[nodiscard]] std::expected<void, rocksdb::Status> Put(std::string_view key, std::string_view value) noexcept override;
    [[nodiscard]] std::expected<std::string, rocksdb::Status> Get(std::string_view key) const noexcept override;
    [[nodiscard]] std::expected<void, rocksdb::Status> Delete(std::string_view key) noexcept override;
    [[nodiscard]] std::expected<std::vector<std::string>, rocksdb::Status> Keys(std::string_view prefix) const noexcept override;
    void Close() noexcept override;

    [[nodiscard]] bool isOpen() const noexcept;

private:
    mutable std::mutex mutex_;
    std::unique_ptr<rocksdb::DB> db_;
};
