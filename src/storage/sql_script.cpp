/**
 * @file sql_script.cpp
 * @brief Implementation of the dump statement splitter
 */

#include <ampsetup/storage/sql_script.hpp>

#include <algorithm>
#include <cctype>

namespace ampsetup::storage {

namespace {

auto is_blank_or_comment(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
            auto eol = text.find('\n', i);
            i = (eol == std::string_view::npos) ? text.size() : eol + 1;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            auto end = text.find("*/", i + 2);
            i = (end == std::string_view::npos) ? text.size() : end + 2;
        } else {
            return false;
        }
    }
    return true;
}

/// Strip leading whitespace and comments so the statement starts at its keyword
auto leading_code(std::string_view text) -> std::string_view {
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
            auto eol = text.find('\n', i);
            i = (eol == std::string_view::npos) ? text.size() : eol + 1;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            auto end = text.find("*/", i + 2);
            i = (end == std::string_view::npos) ? text.size() : end + 2;
        } else {
            break;
        }
    }
    return text.substr(i);
}

auto to_upper(std::string_view text) -> std::string {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

auto is_copy_from_stdin(std::string_view statement) -> bool {
    auto upper = to_upper(leading_code(statement));
    if (upper.rfind("COPY", 0) != 0) {
        return false;
    }
    return upper.find("FROM STDIN") != std::string::npos;
}

/// Length of a dollar-quote tag ("$$" or "$tag$") starting at pos, or 0
auto dollar_tag_length(std::string_view text, std::size_t pos) -> std::size_t {
    if (text[pos] != '$') {
        return 0;
    }
    std::size_t i = pos + 1;
    while (i < text.size()) {
        char c = text[i];
        if (c == '$') {
            return i - pos + 1;
        }
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) {
            return 0;
        }
        if (i == pos + 1 && std::isdigit(static_cast<unsigned char>(c))) {
            return 0;  // $1 is a parameter, not a tag
        }
        ++i;
    }
    return 0;
}

auto count_lines(std::string_view text, std::size_t from, std::size_t to) -> std::size_t {
    return static_cast<std::size_t>(
        std::count(text.begin() + static_cast<std::ptrdiff_t>(from),
                   text.begin() + static_cast<std::ptrdiff_t>(to), '\n'));
}

}  // namespace

auto split_sql_script(std::string_view script) -> std::vector<sql_statement> {
    std::vector<sql_statement> statements;

    std::size_t pos = 0;
    std::size_t start = 0;
    std::size_t line = 1;
    std::size_t start_line = 1;
    bool at_line_start = true;

    auto emit = [&](std::size_t end) {
        auto raw = script.substr(start, end - start);
        if (!is_blank_or_comment(raw)) {
            auto code = leading_code(raw);
            sql_statement statement;
            statement.text = std::string(code);
            statement.line = start_line + count_lines(raw, 0, raw.size() - code.size());
            statement.is_copy = is_copy_from_stdin(code);
            statements.push_back(std::move(statement));
        }
    };

    while (pos < script.size()) {
        char c = script[pos];

        // psql meta-command: drop the whole line
        if (at_line_start && c == '\\' && is_blank_or_comment(script.substr(start, pos - start))) {
            auto eol = script.find('\n', pos);
            pos = (eol == std::string_view::npos) ? script.size() : eol + 1;
            if (eol != std::string_view::npos) {
                ++line;
            }
            start = pos;
            start_line = line;
            continue;
        }
        at_line_start = false;

        if (c == '\n') {
            ++line;
            at_line_start = true;
            ++pos;
        } else if (c == '-' && pos + 1 < script.size() && script[pos + 1] == '-') {
            auto eol = script.find('\n', pos);
            pos = (eol == std::string_view::npos) ? script.size() : eol;
        } else if (c == '/' && pos + 1 < script.size() && script[pos + 1] == '*') {
            auto end = script.find("*/", pos + 2);
            auto stop = (end == std::string_view::npos) ? script.size() : end + 2;
            line += count_lines(script, pos, stop);
            pos = stop;
        } else if (c == '\'' || c == '"') {
            std::size_t i = pos + 1;
            while (i < script.size()) {
                if (script[i] == c) {
                    if (i + 1 < script.size() && script[i + 1] == c) {
                        i += 2;  // doubled quote
                        continue;
                    }
                    break;
                }
                ++i;
            }
            auto stop = std::min(i + 1, script.size());
            line += count_lines(script, pos, stop);
            pos = stop;
        } else if (auto tag_len = dollar_tag_length(script, pos); tag_len > 0) {
            auto tag = script.substr(pos, tag_len);
            auto end = script.find(tag, pos + tag_len);
            auto stop = (end == std::string_view::npos) ? script.size() : end + tag_len;
            line += count_lines(script, pos, stop);
            pos = stop;
        } else if (c == ';') {
            auto emitted_before = statements.size();
            emit(pos + 1);
            ++pos;

            if (statements.size() > emitted_before && statements.back().is_copy) {
                // Data starts on the next line and ends at "\."
                auto eol = script.find('\n', pos);
                pos = (eol == std::string_view::npos) ? script.size() : eol + 1;
                if (eol != std::string_view::npos) {
                    ++line;
                }

                std::string data;
                while (pos < script.size()) {
                    auto next = script.find('\n', pos);
                    auto row_end = (next == std::string_view::npos) ? script.size() : next;
                    auto row = script.substr(pos, row_end - pos);
                    if (!row.empty() && row.back() == '\r') {
                        row.remove_suffix(1);
                    }
                    pos = (next == std::string_view::npos) ? script.size() : next + 1;
                    if (next != std::string_view::npos) {
                        ++line;
                    }
                    if (row == "\\.") {
                        break;
                    }
                    data.append(row);
                    data.push_back('\n');
                }
                statements.back().copy_data = std::move(data);
                at_line_start = true;
            }

            start = pos;
            start_line = line;
        } else {
            ++pos;
        }
    }

    if (start < script.size()) {
        emit(script.size());
    }

    return statements;
}

}  // namespace ampsetup::storage
