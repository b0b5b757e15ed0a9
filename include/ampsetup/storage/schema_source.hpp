/**
 * @file schema_source.hpp
 * @brief Named schema dump resources
 */

#pragma once

#include <ampsetup/core/result.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace ampsetup::storage {

/**
 * @brief A schema dump that can be read once when a database is created
 */
class schema_source {
public:
    virtual ~schema_source() = default;

    /**
     * @brief Name used in log messages (usually the file path)
     */
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /**
     * @brief Read the complete SQL text of the dump
     */
    [[nodiscard]] virtual auto read() -> Result<std::string> = 0;
};

/**
 * @brief Dump stored on disk, plain or gzip-compressed
 *
 * zlib's gzread passes uncompressed files through unchanged, so the same
 * reader serves "ampweb.sql" and "ampweb.sql.gz".
 */
class file_schema_source final : public schema_source {
public:
    explicit file_schema_source(std::filesystem::path path);

    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto read() -> Result<std::string> override;

private:
    std::filesystem::path path_;
};

/**
 * @brief Dump held in memory
 */
class text_schema_source final : public schema_source {
public:
    text_schema_source(std::string name, std::string sql)
        : name_(std::move(name)), sql_(std::move(sql)) {}

    [[nodiscard]] auto name() const -> std::string override { return name_; }

    [[nodiscard]] auto read() -> Result<std::string> override { return sql_; }

private:
    std::string name_;
    std::string sql_;
};

/**
 * @brief Create a source for a configured dump path
 * @return nullptr when path is empty (the database is created empty)
 */
[[nodiscard]] auto make_schema_source(const std::filesystem::path& path)
    -> std::unique_ptr<schema_source>;

}  // namespace ampsetup::storage
