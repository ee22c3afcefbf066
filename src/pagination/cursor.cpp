/**
 * @file cursor.cpp
 * @brief Cursor codec and keyset predicate builder
 *
 * Cursor wire format: base64url (no padding) of {"v":[...],"id":"..."}.
 *
 * @see include/clinic/opd/pagination/cursor.h
 */

#include "clinic/opd/pagination/cursor.h"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <algorithm>
#include <charconv>

namespace clinic::opd::pagination {

namespace {

// =============================================================================
// Base64url
// =============================================================================

[[nodiscard]] std::string base64url_encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));

    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view text) {
    if (text.empty() || text.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string padded(text);
    for (char& c : padded) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (c == '+' || c == '/' || c == '=') {
            // Only the URL-safe alphabet is produced by encode()
            return std::nullopt;
        }
    }
    std::size_t padding = (4 - padded.size() % 4) % 4;
    padded.append(padding, '=');

    std::string out(3 * (padded.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding bytes as output
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

[[nodiscard]] const char* comparison_operator(sort_direction direction) {
    return direction == sort_direction::descending ? "<" : ">";
}

[[nodiscard]] std::expected<integration::database_value, pagination_error>
to_binding(const sort_column& column, const std::string& value) {
    if (column.type == column_type::text) {
        return value;
    }

    int64_t number = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return std::unexpected(pagination_error::invalid_cursor);
    }
    return number;
}

}  // namespace

// =============================================================================
// Cursor Codec
// =============================================================================

std::string encode(const cursor_position& position) {
    nlohmann::json payload = {{"v", position.sort_values}, {"id", position.id}};
    return base64url_encode(payload.dump());
}

std::string encode(std::string_view sort_value, std::string_view id) {
    return encode(cursor_position{{std::string(sort_value)}, std::string(id)});
}

std::expected<cursor_position, pagination_error> decode(std::string_view cursor) {
    auto raw = base64url_decode(cursor);
    if (!raw) {
        return std::unexpected(pagination_error::invalid_cursor);
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::parse_error&) {
        return std::unexpected(pagination_error::invalid_cursor);
    }

    if (!payload.is_object()) {
        return std::unexpected(pagination_error::invalid_cursor);
    }

    auto id = payload.find("id");
    auto values = payload.find("v");
    if (id == payload.end() || !id->is_string() ||
        values == payload.end() || !values->is_array()) {
        return std::unexpected(pagination_error::invalid_cursor);
    }

    cursor_position position;
    position.id = id->get<std::string>();
    if (position.id.empty()) {
        return std::unexpected(pagination_error::invalid_cursor);
    }

    for (const auto& value : *values) {
        if (!value.is_string()) {
            return std::unexpected(pagination_error::invalid_cursor);
        }
        position.sort_values.push_back(value.get<std::string>());
    }

    return position;
}

// =============================================================================
// Keyset Predicate
// =============================================================================

std::expected<keyset_predicate, pagination_error>
build_keyset_predicate(const std::vector<sort_column>& columns,
                       const cursor_position& position) {
    if (columns.empty()) {
        return std::unexpected(pagination_error::no_sort_columns);
    }
    if (position.sort_values.size() + 1 != columns.size()) {
        return std::unexpected(pagination_error::cursor_shape_mismatch);
    }

    // Cursor value for column i; the tie-break column takes the id
    std::vector<integration::database_value> values;
    values.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const auto& raw = i + 1 < columns.size() ? position.sort_values[i] : position.id;
        auto bound = to_binding(columns[i], raw);
        if (!bound) {
            return std::unexpected(bound.error());
        }
        values.push_back(std::move(*bound));
    }

    keyset_predicate predicate;
    predicate.sql = "(";
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            predicate.sql += " OR ";
        }
        predicate.sql += "(";
        for (std::size_t j = 0; j < i; ++j) {
            predicate.sql += columns[j].name + " = ? AND ";
            predicate.bindings.push_back(values[j]);
        }
        predicate.sql += columns[i].name + " " +
                         comparison_operator(columns[i].direction) + " ?";
        predicate.bindings.push_back(values[i]);
        predicate.sql += ")";
    }
    predicate.sql += ")";

    return predicate;
}

std::string order_by_clause(const std::vector<sort_column>& columns) {
    std::string clause;
    for (const auto& column : columns) {
        if (!clause.empty()) {
            clause += ", ";
        }
        clause += column.name;
        clause += column.direction == sort_direction::descending ? " DESC" : " ASC";
    }
    return clause;
}

}  // namespace clinic::opd::pagination
