#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MutationBuilder.hpp"
#include "ErrorHandler.hpp"

using namespace dbbridge;
using ::testing::HasSubstr;

class MutationBuilderTest : public ::testing::Test {
protected:
    // Run fn, expecting a ValidationError, and return its message
    template<typename Func>
    static std::string validationMessage(Func&& fn) {
        try {
            fn();
        } catch (const ValidationError& e) {
            return e.what();
        }
        ADD_FAILURE() << "expected ValidationError";
        return "";
    }

    std::vector<std::string> pkColumns_ = {"id"};
    std::vector<Value> pkValues_ = {Value(7)};
};

// Identifier tests
TEST_F(MutationBuilderTest, EscapeIdentifierDoublesQuotes) {
    EXPECT_EQ(MutationBuilder::escapeIdentifier("a\"b"), "a\"\"b");
    EXPECT_EQ(MutationBuilder::escapeIdentifier("plain"), "plain");
    EXPECT_EQ(MutationBuilder::quoteIdentifier("a\"b"), "\"a\"\"b\"");
}

TEST_F(MutationBuilderTest, TableRefPerBackend) {
    EXPECT_EQ(MutationBuilder::tableRef(DatabaseType::Postgres, "public", "users"), "\"public\".\"users\"");
    EXPECT_EQ(MutationBuilder::tableRef(DatabaseType::ClickHouse, "default", "events"), "\"default\".\"events\"");
    EXPECT_EQ(MutationBuilder::tableRef(DatabaseType::SQLite, "main", "users"), "\"users\"");
}

// Literal tests
TEST_F(MutationBuilderTest, FormatLiteral) {
    EXPECT_EQ(MutationBuilder::formatLiteral(Value(nullptr)), "NULL");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value(true)), "TRUE");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value(false)), "FALSE");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value(42)), "42");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value(-1.5)), "-1.5");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value("O'Brien")), "'O''Brien'");
}

TEST_F(MutationBuilderTest, FormatLiteralJsonAsText) {
    Value obj = {{"k", "it's"}};
    EXPECT_EQ(MutationBuilder::formatLiteral(obj), "'{\"k\":\"it''s\"}'");
    EXPECT_EQ(MutationBuilder::formatLiteral(Value::array({1, 2})), "'[1,2]'");
}

// Raw SQL allow-list tests
TEST_F(MutationBuilderTest, WhitelistedFunctionsAccepted) {
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("now()"));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("gen_random_uuid()"));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("datetime('now', 'localtime')"));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("generateUUIDv4()"));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("'{}'::jsonb"));
}

TEST_F(MutationBuilderTest, WhitelistIgnoresCaseAndSurroundingSpace) {
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("NOW()"));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("  Current_Timestamp "));
    EXPECT_NO_THROW(MutationBuilder::validateRawSql("null"));
}

TEST_F(MutationBuilderTest, EveryAllowedFunctionValidates) {
    for (const auto& function : MutationBuilder::allowedRawSqlFunctions()) {
        EXPECT_NO_THROW(MutationBuilder::validateRawSql(function)) << function;
    }
}

TEST_F(MutationBuilderTest, EmptyRawSqlRejected) {
    auto message = validationMessage([] { MutationBuilder::validateRawSql("   "); });
    EXPECT_EQ(message, "Raw SQL value cannot be empty");
}

TEST_F(MutationBuilderTest, InjectionAfterFunctionRejected) {
    auto message = validationMessage([] { MutationBuilder::validateRawSql("now(); DROP TABLE x"); });
    EXPECT_THAT(message, HasSubstr("dangerous pattern: 'drop'"));
}

TEST_F(MutationBuilderTest, SubqueryRejected) {
    auto message = validationMessage([] { MutationBuilder::validateRawSql("SELECT 1"); });
    EXPECT_THAT(message, HasSubstr("dangerous pattern: 'select'"));
}

TEST_F(MutationBuilderTest, CommentRejected) {
    auto message = validationMessage([] { MutationBuilder::validateRawSql("now() -- trailing"); });
    EXPECT_THAT(message, HasSubstr("'--'"));
}

TEST_F(MutationBuilderTest, UnknownFunctionRejected) {
    auto message = validationMessage([] { MutationBuilder::validateRawSql("random()"); });
    EXPECT_THAT(message, HasSubstr("'random()' is not in the whitelist"));
}

// UPDATE tests
TEST_F(MutationBuilderTest, BuildUpdate) {
    std::vector<ColumnValue> updates = {
        {"name", Value("Ann"), false},
        {"updated_at", Value("now()"), true},
    };

    auto sql = MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "users",
                                            pkColumns_, pkValues_, updates);

    EXPECT_EQ(sql, "UPDATE \"public\".\"users\" SET \"name\" = 'Ann', \"updated_at\" = now() "
                   "WHERE \"id\" = 7");
}

TEST_F(MutationBuilderTest, BuildUpdateCompositeKey) {
    std::vector<ColumnValue> updates = {{"qty", Value(3), false}};

    auto sql = MutationBuilder::buildUpdate(DatabaseType::SQLite, "", "order_items",
                                            {"order_id", "line"}, {Value(10), Value("a")}, updates);

    EXPECT_EQ(sql, "UPDATE \"order_items\" SET \"qty\" = 3 WHERE \"order_id\" = 10 AND \"line\" = 'a'");
}

TEST_F(MutationBuilderTest, BuildUpdatePrimaryKeyMismatch) {
    std::vector<ColumnValue> updates = {{"name", Value("x"), false}};

    auto message = validationMessage([&] {
        MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "users",
                                     {"id", "tenant"}, {Value(1)}, updates);
    });
    EXPECT_EQ(message, "Primary key columns and values must match");
}

TEST_F(MutationBuilderTest, BuildUpdateWithoutPrimaryKey) {
    std::vector<ColumnValue> updates = {{"name", Value("x"), false}};

    EXPECT_THROW(MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "users", {}, {}, updates),
                 ValidationError);
}

TEST_F(MutationBuilderTest, BuildUpdateWithoutValues) {
    auto message = validationMessage([&] {
        MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "users", pkColumns_, pkValues_, {});
    });
    EXPECT_EQ(message, "No updates provided");
}

TEST_F(MutationBuilderTest, BuildUpdateRejectsBadRawSql) {
    std::vector<ColumnValue> updates = {{"name", Value("now(); DROP TABLE users"), true}};

    auto message = validationMessage([&] {
        MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "users", pkColumns_, pkValues_, updates);
    });
    EXPECT_THAT(message, HasSubstr("Invalid raw SQL value: "));
    EXPECT_THAT(message, HasSubstr("'drop'"));
}

TEST_F(MutationBuilderTest, RawSqlMustBeString) {
    std::vector<ColumnValue> updates = {{"flag", Value(1), true}};

    auto message = validationMessage([&] {
        MutationBuilder::buildUpdate(DatabaseType::Postgres, "public", "t", pkColumns_, pkValues_, updates);
    });
    EXPECT_EQ(message, "Raw SQL value must be a string");
}

// INSERT and DELETE tests
TEST_F(MutationBuilderTest, BuildInsert) {
    std::vector<ColumnValue> values = {
        {"id", Value(1), false},
        {"note", Value(nullptr), false},
        {"created", Value("today()"), true},
    };

    auto sql = MutationBuilder::buildInsert(DatabaseType::ClickHouse, "default", "events", values);

    EXPECT_EQ(sql, "INSERT INTO \"default\".\"events\" (\"id\", \"note\", \"created\") "
                   "VALUES (1, NULL, today())");
}

TEST_F(MutationBuilderTest, BuildInsertWithoutValues) {
    auto message = validationMessage([] {
        MutationBuilder::buildInsert(DatabaseType::Postgres, "public", "users", {});
    });
    EXPECT_EQ(message, "No values provided");
}

TEST_F(MutationBuilderTest, BuildDelete) {
    auto sql = MutationBuilder::buildDelete(DatabaseType::Postgres, "public", "users", pkColumns_, pkValues_);

    EXPECT_EQ(sql, "DELETE FROM \"public\".\"users\" WHERE \"id\" = 7");
}

TEST_F(MutationBuilderTest, BuildDeleteKeyMismatch) {
    EXPECT_THROW(MutationBuilder::buildDelete(DatabaseType::SQLite, "", "users", {"id"}, {}),
                 ValidationError);
}

// Request parsing tests
TEST_F(MutationBuilderTest, ParseEditArrayValues) {
    Value request = json::parse(R"json({
        "op": "update",
        "schema": "public",
        "table": "users",
        "primary_key_columns": ["id"],
        "primary_key_values": [5],
        "values": [
            {"column": "name", "value": "Zed"},
            {"column": "seen_at", "value": "now()", "is_raw_sql": true}
        ]
    })json");

    RowEdit edit = MutationBuilder::parseEdit(request);

    EXPECT_EQ(edit.kind, MutationKind::Update);
    EXPECT_EQ(edit.schema, "public");
    EXPECT_EQ(edit.table, "users");
    ASSERT_EQ(edit.values.size(), 2u);
    EXPECT_FALSE(edit.values[0].rawSql);
    EXPECT_TRUE(edit.values[1].rawSql);

    EXPECT_EQ(MutationBuilder::build(DatabaseType::Postgres, edit),
              "UPDATE \"public\".\"users\" SET \"name\" = 'Zed', \"seen_at\" = now() WHERE \"id\" = 5");
}

TEST_F(MutationBuilderTest, ParseEditObjectValues) {
    Value request = json::parse(R"({"op": "INSERT", "table": "t", "values": {"a": 1, "b": "x"}})");

    RowEdit edit = MutationBuilder::parseEdit(request);

    EXPECT_EQ(edit.kind, MutationKind::Insert);
    ASSERT_EQ(edit.values.size(), 2u);
    EXPECT_EQ(MutationBuilder::build(DatabaseType::SQLite, edit),
              "INSERT INTO \"t\" (\"a\", \"b\") VALUES (1, 'x')");
}

TEST_F(MutationBuilderTest, ParseEditDelete) {
    Value request = json::parse(R"({"op": "delete", "table": "t", "primary_key_columns": ["k"],
                                   "primary_key_values": ["v"]})");

    RowEdit edit = MutationBuilder::parseEdit(request);

    EXPECT_EQ(MutationBuilder::build(DatabaseType::SQLite, edit), "DELETE FROM \"t\" WHERE \"k\" = 'v'");
}

TEST_F(MutationBuilderTest, ParseEditMalformed) {
    EXPECT_THROW(MutationBuilder::parseEdit(Value::array()), ValidationError);
    EXPECT_THROW(MutationBuilder::parseEdit(json::parse(R"({"table": "t"})")), ValidationError);
    EXPECT_THROW(MutationBuilder::parseEdit(json::parse(R"({"op": "merge", "table": "t"})")), ValidationError);
    EXPECT_THROW(MutationBuilder::parseEdit(json::parse(R"({"op": "update"})")), ValidationError);
    EXPECT_THROW(MutationBuilder::parseEdit(json::parse(R"({"op": "insert", "table": "t", "values": 3})")),
                 ValidationError);
    EXPECT_THROW(MutationBuilder::parseEdit(json::parse(R"({"op": "insert", "table": "t",
                                                           "values": [{"column": "a"}]})")),
                 ValidationError);
}
