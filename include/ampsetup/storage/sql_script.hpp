/**
 * @file sql_script.hpp
 * @brief Splits a PostgreSQL dump into individually executable statements
 *
 * Schema dumps are plain pg_dump output. Statements end at a ';' that is not
 * inside a quoted string, a quoted identifier, a dollar-quoted body or a
 * comment. "COPY ... FROM stdin;" statements carry the data lines that
 * follow them, up to the "\." terminator. psql meta-commands (lines starting
 * with a backslash, such as "\connect") are dropped.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ampsetup::storage {

/**
 * @brief One statement of a dump
 */
struct sql_statement {
    /// Statement text including the terminating ';'
    std::string text;

    /// True for COPY ... FROM stdin statements
    bool is_copy{false};

    /// Inline COPY data, one row per line, without the "\." terminator
    std::string copy_data;

    /// 1-based line where the statement starts in the dump
    std::size_t line{0};
};

/**
 * @brief Split dump text into statements
 *
 * Text after the last ';' that is only whitespace or comments is ignored;
 * any other trailing text becomes a final statement.
 */
[[nodiscard]] auto split_sql_script(std::string_view script)
    -> std::vector<sql_statement>;

}  // namespace ampsetup::storage
