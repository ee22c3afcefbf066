/**
 * @file cursor_test.cpp
 * @brief Unit tests for keyset pagination
 *
 * @see include/clinic/opd/pagination/cursor.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/pagination/cursor.h"
#include "utils/test_helpers.h"

namespace clinic::opd::pagination {
namespace {

using namespace ::testing;

// =============================================================================
// Codec
// =============================================================================

TEST(CursorCodecTest, DecodeReturnsEncodedPosition) {
    cursor_position position{{"4", "2025-01-06 09:05:00.000"}, "visit-17"};
    auto cursor = encode(position);

    auto decoded = decode(cursor);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, position);
}

TEST(CursorCodecTest, CursorIsUrlSafe) {
    // Runs of '?' and '>' encode to "Pz8/" and "Pj4+" in standard base64
    cursor_position position{{"??????"}, ">>>>>>"};
    auto cursor = encode(position);

    EXPECT_THAT(cursor, Not(HasSubstr("+")));
    EXPECT_THAT(cursor, Not(HasSubstr("/")));
    EXPECT_THAT(cursor, Not(HasSubstr("=")));
}

TEST(CursorCodecTest, SingleKeyOverload) {
    auto decoded = decode(encode("2025-01-06", "appt-1"));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_THAT(decoded->sort_values, ElementsAre("2025-01-06"));
    EXPECT_EQ(decoded->id, "appt-1");
}

TEST(CursorCodecTest, RejectsGarbage) {
    EXPECT_EQ(decode("").error(), pagination_error::invalid_cursor);
    EXPECT_EQ(decode("!!!!").error(), pagination_error::invalid_cursor);
    EXPECT_EQ(decode("a").error(), pagination_error::invalid_cursor);
    // base64url of "not json"
    EXPECT_EQ(decode("bm90IGpzb24").error(), pagination_error::invalid_cursor);
    // base64url of {"v":[]} without an id
    EXPECT_EQ(decode("eyJ2IjpbXX0").error(), pagination_error::invalid_cursor);
}

TEST(CursorCodecTest, RejectsStandardAlphabet) {
    auto cursor = encode(cursor_position{{"x"}, "y"});
    cursor.push_back('=');
    EXPECT_FALSE(decode(cursor).has_value());
}

// =============================================================================
// Limits
// =============================================================================

TEST(SanitizeLimitTest, AppliesDefaultAndCap) {
    EXPECT_EQ(sanitize_limit(std::nullopt), 20u);
    EXPECT_EQ(sanitize_limit(0), 20u);
    EXPECT_EQ(sanitize_limit(5), 5u);
    EXPECT_EQ(sanitize_limit(500), 100u);
    EXPECT_EQ(sanitize_limit(std::nullopt, 50, 10), 10u);
}

// =============================================================================
// Keyset Predicate
// =============================================================================

const std::vector<sort_column> queue_order = {
    {"priority_rank", sort_direction::descending, column_type::integer},
    {"check_in_time", sort_direction::ascending, column_type::text},
    {"visit_id", sort_direction::ascending, column_type::text}};

TEST(KeysetPredicateTest, MixedDirections) {
    auto predicate =
        build_keyset_predicate(queue_order, {{"3", "2025-01-06 09:00:00.000"}, "v-9"});
    ASSERT_TRUE(predicate.has_value());

    EXPECT_EQ(predicate->sql,
              "((priority_rank < ?) OR "
              "(priority_rank = ? AND check_in_time > ?) OR "
              "(priority_rank = ? AND check_in_time = ? AND visit_id > ?))");
    ASSERT_EQ(predicate->bindings.size(), 6u);
    EXPECT_EQ(std::get<int64_t>(predicate->bindings[0]), 3);
    EXPECT_EQ(std::get<std::string>(predicate->bindings[2]), "2025-01-06 09:00:00.000");
    EXPECT_EQ(std::get<std::string>(predicate->bindings[5]), "v-9");
}

TEST(KeysetPredicateTest, ShapeMismatch) {
    auto predicate = build_keyset_predicate(queue_order, {{"3"}, "v-9"});
    ASSERT_FALSE(predicate.has_value());
    EXPECT_EQ(predicate.error(), pagination_error::cursor_shape_mismatch);
}

TEST(KeysetPredicateTest, NonNumericIntegerValue) {
    auto predicate = build_keyset_predicate(queue_order, {{"high", "t"}, "v"});
    ASSERT_FALSE(predicate.has_value());
    EXPECT_EQ(predicate.error(), pagination_error::invalid_cursor);
}

TEST(KeysetPredicateTest, NoColumns) {
    EXPECT_EQ(build_keyset_predicate({}, {{}, "x"}).error(), pagination_error::no_sort_columns);
}

TEST(KeysetPredicateTest, OrderByClause) {
    EXPECT_EQ(order_by_clause(queue_order),
              "priority_rank DESC, check_in_time ASC, visit_id ASC");
}

// =============================================================================
// Page Assembly
// =============================================================================

TEST(MakePageTest, ExtraRowSignalsMore) {
    auto p = make_page(std::vector<int>{1, 2, 3}, 2,
                       [](int v) { return cursor_position{{}, std::to_string(v)}; });
    EXPECT_THAT(p.items, ElementsAre(1, 2));
    EXPECT_TRUE(p.has_more);
    ASSERT_TRUE(p.next_cursor.has_value());
    EXPECT_EQ(decode(*p.next_cursor)->id, "2");
}

TEST(MakePageTest, LastPageHasNoCursor) {
    auto p = make_page(std::vector<int>{1, 2}, 2,
                       [](int v) { return cursor_position{{}, std::to_string(v)}; });
    EXPECT_EQ(p.items.size(), 2u);
    EXPECT_FALSE(p.has_more);
    EXPECT_FALSE(p.next_cursor.has_value());
}

// =============================================================================
// Paging Against SQLite
// =============================================================================

class KeysetPagingTest : public test::store_test {
protected:
    void SetUp() override {
        store_test::SetUp();
        test::exec_sql(*adapter_,
                       "CREATE TABLE ranked (id TEXT PRIMARY KEY, rank INTEGER, at TEXT)");
    }

    void add(const std::string& id, int64_t rank, const std::string& at) {
        test::exec_sql(*adapter_, "INSERT INTO ranked (id, rank, at) VALUES (?, ?, ?)",
                       {id, rank, at});
    }

    struct row {
        std::string id;
        int64_t rank;
        std::string at;
    };

    page<row> fetch(std::optional<std::string> cursor, std::size_t limit) {
        const std::vector<sort_column> order = {
            {"rank", sort_direction::descending, column_type::integer},
            {"at", sort_direction::ascending, column_type::text},
            {"id", sort_direction::ascending, column_type::text}};

        std::string sql = "SELECT id, rank, at FROM ranked";
        std::vector<integration::database_value> params;
        if (cursor) {
            auto position = decode(*cursor);
            EXPECT_TRUE(position.has_value());
            auto predicate = build_keyset_predicate(order, *position);
            EXPECT_TRUE(predicate.has_value());
            sql += " WHERE " + predicate->sql;
            params = predicate->bindings;
        }
        sql += " ORDER BY " + order_by_clause(order) + " LIMIT ?";
        params.emplace_back(static_cast<int64_t>(limit + 1));

        auto scope = integration::connection_scope::acquire(*adapter_);
        EXPECT_TRUE(scope.has_value());
        auto result = scope->connection().query(sql, params);
        EXPECT_TRUE(result.has_value());

        std::vector<row> rows;
        while ((*result)->next()) {
            const auto& r = (*result)->current_row();
            rows.push_back({r.get_string(0), r.get_int64(1), r.get_string(2)});
        }
        return make_page(std::move(rows), limit, [](const row& r) {
            return cursor_position{{std::to_string(r.rank), r.at}, r.id};
        });
    }
};

TEST_F(KeysetPagingTest, WalksEveryRowOnce) {
    add("a", 2, "09:00");
    add("b", 4, "09:05");
    add("c", 2, "09:00");
    add("d", 2, "08:55");
    add("e", 3, "09:10");

    std::vector<std::string> seen;
    std::optional<std::string> cursor;
    do {
        auto p = fetch(cursor, 2);
        for (const auto& r : p.items) seen.push_back(r.id);
        cursor = p.next_cursor;
    } while (cursor);

    EXPECT_THAT(seen, ElementsAre("b", "e", "d", "a", "c"));
}

TEST_F(KeysetPagingTest, InsertBetweenFetchesIsNotSkippedOrRepeated) {
    add("a", 2, "09:00");
    add("b", 2, "09:01");
    add("c", 2, "09:02");
    add("d", 2, "09:03");

    auto first = fetch(std::nullopt, 2);
    ASSERT_TRUE(first.next_cursor.has_value());

    // Lands before the cursor: must not shift the next page
    add("early", 2, "08:00");
    // Lands after the cursor: must appear on a later page
    add("late", 2, "09:02");

    std::vector<std::string> rest;
    std::optional<std::string> cursor = first.next_cursor;
    while (cursor) {
        auto p = fetch(cursor, 2);
        for (const auto& r : p.items) rest.push_back(r.id);
        cursor = p.next_cursor;
    }

    EXPECT_THAT(rest, ElementsAre("c", "late", "d"));
}

}  // namespace
}  // namespace clinic::opd::pagination
