/**
 * @file schema_source.cpp
 * @brief Implementation of schema dump sources
 */

#include <ampsetup/storage/schema_source.hpp>

#include <ampsetup/compat/format.hpp>

#include <zlib.h>

#include <array>

namespace ampsetup::storage {

namespace {

/**
 * @brief RAII wrapper for gzFile
 */
struct gz_file_deleter {
    void operator()(gzFile_s* file) const {
        if (file) gzclose(file);
    }
};
using gz_file_ptr = std::unique_ptr<gzFile_s, gz_file_deleter>;

constexpr std::size_t kReadChunk = 64 * 1024;

}  // namespace

file_schema_source::file_schema_source(std::filesystem::path path)
    : path_(std::move(path)) {}

auto file_schema_source::name() const -> std::string {
    return path_.string();
}

auto file_schema_source::read() -> Result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec)) {
        return make_error<std::string>(
            error_codes::file_not_found,
            compat::format("Schema dump not found: {}", path_.string()),
            "storage");
    }

    gz_file_ptr file(gzopen(path_.c_str(), "rb"));
    if (!file) {
        return make_error<std::string>(
            error_codes::schema_read_failed,
            compat::format("Cannot open schema dump: {}", path_.string()),
            "storage");
    }

    std::string sql;
    std::array<char, kReadChunk> buffer{};
    for (;;) {
        int n = gzread(file.get(), buffer.data(), static_cast<unsigned>(buffer.size()));
        if (n < 0) {
            int errnum = 0;
            const char* message = gzerror(file.get(), &errnum);
            return make_error<std::string>(
                error_codes::schema_read_failed,
                compat::format("Error reading {}: {}", path_.string(),
                               message ? message : "unknown error"),
                "storage");
        }
        if (n == 0) {
            break;
        }
        sql.append(buffer.data(), static_cast<std::size_t>(n));
    }

    return sql;
}

auto make_schema_source(const std::filesystem::path& path)
    -> std::unique_ptr<schema_source> {
    if (path.empty()) {
        return nullptr;
    }
    return std::make_unique<file_schema_source>(path);
}

}  // namespace ampsetup::storage
