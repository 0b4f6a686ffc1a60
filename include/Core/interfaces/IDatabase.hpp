#pragma once

#include <rocksdb/db.h>
#include <rocksdb/status.h>
#include <expected> // C++23
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Key/value storage for persisted sessions.
 *
 * Get on a missing key yields rocksdb::Status::NotFound().
 */
class IRocksDB {
public:
    virtual ~IRocksDB() noexcept = default;

    [[nodiscard]] virtual std::expected<void, rocksdb::Status>
    Open(const std::string& path) noexcept = 0;

    [[nodiscard]] virtual std::expected<void, rocksdb::Status>
    Put(std::string_view key, std::string_view value) noexcept = 0;

    [[nodiscard]] virtual std::expected<std::string, rocksdb::Status>
    Get(std::string_view key) const noexcept = 0;

    [[nodiscard]] virtual std::expected<void, rocksdb::Status>
    Delete(std::string_view key) noexcept = 0;

    // المفاتيح التي تبدأ بالبادئة، مرتبة
    [[nodiscard]] virtual std::expected<std::vector<std::string>, rocksdb::Status>
    Keys(std::string_view prefix) const noexcept = 0;

    virtual void Close() noexcept = 0;
};
