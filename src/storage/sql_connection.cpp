/**
 * @file sql_connection.cpp
 * @brief Quoting helpers shared by all connection implementations
 */

#include <ampsetup/storage/sql_connection.hpp>

namespace ampsetup::storage {

auto quote_identifier(std::string_view name) -> std::string {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted.push_back('"');
    for (char c : name) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

}  // namespace ampsetup::storage
