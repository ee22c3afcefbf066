#ifndef CLINIC_OPD_PAGINATION_CURSOR_H
#define CLINIC_OPD_PAGINATION_CURSOR_H

/**
 * @file cursor.h
 * @brief Stateless keyset pagination
 *
 * A cursor is an opaque, URL-safe token carrying the sort key values and
 * record id of the last row of a page. The next page is selected with a
 * compound keyset predicate instead of OFFSET, so rows inserted between
 * fetches are neither skipped nor repeated.
 *
 * Listings fetch limit + 1 rows; the extra row only signals has_more and
 * is dropped before the next cursor is encoded.
 *
 * @example
 * @code
 * const std::vector<sort_column> order = {
 *     {"priority_rank", sort_direction::descending, column_type::integer},
 *     {"check_in_time", sort_direction::ascending, column_type::text},
 *     {"id", sort_direction::ascending, column_type::text}};
 *
 * auto position = decode(request.cursor);
 * auto predicate = build_keyset_predicate(order, *position);
 * // SELECT ... WHERE <filters> AND <predicate->sql>
 * //   ORDER BY <order_by_clause(order)> LIMIT <limit + 1>
 * @endcode
 */

#include "clinic/opd/integration/database_adapter.h"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::pagination {

// =============================================================================
// Error Codes (-700 to -709)
// =============================================================================

/**
 * @brief Pagination error codes
 *
 * Allocated range: -700 to -709
 */
enum class pagination_error : int {
    /** Cursor is not valid base64 or not a cursor payload */
    invalid_cursor = -700,

    /** Cursor carries a different number of sort values than the listing */
    cursor_shape_mismatch = -701,

    /** Listing declared no sort columns */
    no_sort_columns = -702
};

[[nodiscard]] constexpr int to_error_code(pagination_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(pagination_error error) noexcept {
    switch (error) {
        case pagination_error::invalid_cursor:
            return "Invalid pagination cursor";
        case pagination_error::cursor_shape_mismatch:
            return "Cursor does not match the listing sort order";
        case pagination_error::no_sort_columns:
            return "Listing has no sort columns";
        default:
            return "Unknown pagination error";
    }
}

// =============================================================================
// Limits
// =============================================================================

inline constexpr std::size_t default_page_limit = 20;
inline constexpr std::size_t max_page_limit = 100;

/**
 * @brief Clamp a requested page size
 *
 * Missing or zero requests get @p fallback; larger requests are capped at
 * @p maximum.
 */
[[nodiscard]] constexpr std::size_t sanitize_limit(
    std::optional<std::size_t> requested,
    std::size_t fallback = default_page_limit,
    std::size_t maximum = max_page_limit) noexcept {
    if (!requested || *requested == 0) {
        return fallback < maximum ? fallback : maximum;
    }
    return *requested < maximum ? *requested : maximum;
}

// =============================================================================
// Cursor Codec
// =============================================================================

/**
 * @brief Decoded cursor: sort key values of a row plus its id
 */
struct cursor_position {
    std::vector<std::string> sort_values;
    std::string id;

    bool operator==(const cursor_position&) const = default;
};

/**
 * @brief Encode a position as an opaque cursor string
 */
[[nodiscard]] std::string encode(const cursor_position& position);

/**
 * @brief Encode a single-key position
 */
[[nodiscard]] std::string encode(std::string_view sort_value, std::string_view id);

/**
 * @brief Decode a cursor produced by encode()
 * @return The exact position that was encoded, or invalid_cursor
 */
[[nodiscard]] std::expected<cursor_position, pagination_error> decode(
    std::string_view cursor);

// =============================================================================
// Keyset Predicate
// =============================================================================

enum class sort_direction { ascending, descending };

/** Determines how cursor values are bound */
enum class column_type { text, integer };

struct sort_column {
    std::string name;
    sort_direction direction = sort_direction::ascending;
    column_type type = column_type::text;
};

/**
 * @brief SQL fragment selecting rows strictly after a cursor position
 */
struct keyset_predicate {
    std::string sql;
    std::vector<integration::database_value> bindings;
};

/**
 * @brief Build the compound "after this row" predicate
 *
 * The last column is the unique tie-break and receives position.id; the
 * preceding columns receive position.sort_values in order. Each column
 * compares in its own direction, so mixed orders are supported:
 *
 *   (a < ?) OR (a = ? AND b > ?) OR (a = ? AND b = ? AND id > ?)
 *
 * for a DESC, b ASC, id ASC.
 */
[[nodiscard]] std::expected<keyset_predicate, pagination_error>
build_keyset_predicate(const std::vector<sort_column>& columns,
                       const cursor_position& position);

/**
 * @brief "a DESC, b ASC, id ASC"
 */
[[nodiscard]] std::string order_by_clause(const std::vector<sort_column>& columns);

// =============================================================================
// Page Assembly
// =============================================================================

/**
 * @brief One page of a cursor-paginated listing
 */
template <typename T>
struct page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
    bool has_more = false;
};

/**
 * @brief Turn a limit + 1 fetch into a page
 *
 * @param rows Rows fetched with LIMIT limit + 1
 * @param limit Page size requested from storage (before the + 1)
 * @param position_of Maps a row to its cursor position
 */
template <typename T, typename PositionFn>
[[nodiscard]] page<T> make_page(std::vector<T> rows, std::size_t limit,
                                PositionFn&& position_of) {
    page<T> result;
    result.has_more = rows.size() > limit;
    if (result.has_more) {
        rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(limit), rows.end());
    }
    if (result.has_more && !rows.empty()) {
        result.next_cursor = encode(position_of(rows.back()));
    }
    result.items = std::move(rows);
    return result;
}

}  // namespace clinic::opd::pagination

#endif  // CLINIC_OPD_PAGINATION_CURSOR_H
