#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "JsonCodec.hpp"

using namespace schemaforge;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class JsonCodecTest : public ::testing::Test {
protected:
    static SchemaDiff sampleDiff() {
        SchemaDiff diff;

        TableInfo audit;
        audit.name = "audit_log";
        diff.addedTables.push_back(audit);

        TableDiff users;
        users.tableName = "users";
        users.schema = "app";

        ColumnDiff email;
        email.columnName = "email";
        email.typeChange = Change<std::string>{"text", "varchar"};
        email.nullableChange = Change<bool>{false, true};
        users.modifiedColumns.push_back(email);

        ForeignKeyDiff fk;
        fk.foreignKeyName = "fk_org";
        fk.onDeleteChange = Change<ForeignKeyAction>{ForeignKeyAction::Cascade, ForeignKeyAction::NoAction};
        users.modifiedForeignKeys.push_back(fk);
        diff.modifiedTables.push_back(users);
        return diff;
    }
};

// Object specifications
TEST_F(JsonCodecTest, PolicyFromJson) {
    auto doc = JsonCodec::parse(R"({
        "name": "tenant_isolation",
        "table": "orders",
        "schema": "app",
        "command": "select",
        "type": "restrictive",
        "roles": ["app_user"],
        "using": "tenant_id = current_setting('app.tenant')::int"
    })");

    auto spec = JsonCodec::policyFromJson(doc);

    EXPECT_EQ(spec.name, "tenant_isolation");
    EXPECT_EQ(spec.table, "orders");
    EXPECT_EQ(spec.schema, std::optional<std::string>("app"));
    EXPECT_EQ(spec.command, PolicyCommand::Select);
    EXPECT_EQ(spec.policyType, PolicyType::Restrictive);
    EXPECT_EQ(spec.roles, std::vector<std::string>{"app_user"});
    ASSERT_TRUE(spec.usingExpr.has_value());
    EXPECT_FALSE(spec.checkExpr.has_value());
}

TEST_F(JsonCodecTest, PolicyDefaults) {
    auto spec = JsonCodec::policyFromJson(json{{"name", "p"}, {"table", "t"}});

    EXPECT_EQ(spec.command, PolicyCommand::All);
    EXPECT_EQ(spec.policyType, PolicyType::Permissive);
    EXPECT_TRUE(spec.roles.empty());
}

TEST_F(JsonCodecTest, TriggerFromJson) {
    auto doc = JsonCodec::parse(R"({
        "name": "touch",
        "table": "notes",
        "timing": "before",
        "events": ["update", "UPDATE", "delete"],
        "level": "statement",
        "when": "NEW.body <> OLD.body",
        "function": "touch_fn",
        "update_columns": ["body"]
    })");

    auto spec = JsonCodec::triggerFromJson(doc);

    EXPECT_EQ(spec.timing, TriggerTiming::Before);
    ASSERT_EQ(spec.events.size(), 2u);
    EXPECT_EQ(spec.events[0], TriggerEvent::Update);
    EXPECT_EQ(spec.events[1], TriggerEvent::Delete);
    EXPECT_EQ(spec.level, TriggerLevel::Statement);
    EXPECT_EQ(spec.functionName, std::optional<std::string>("touch_fn"));
    EXPECT_EQ(spec.updateColumns, std::vector<std::string>{"body"});
    EXPECT_FALSE(spec.body.has_value());
}

TEST_F(JsonCodecTest, FunctionFromJson) {
    auto doc = JsonCodec::parse(R"({
        "name": "add_numbers",
        "return_type": "integer",
        "language": "plpgsql",
        "volatility": "immutable",
        "security": "definer",
        "parallel_safe": true,
        "cost": 5,
        "parameters": [
            {"name": "a", "type": "integer"},
            {"name": "b", "data_type": "integer", "mode": "inout", "default": "0"}
        ],
        "body": "BEGIN RETURN a + b; END;"
    })");

    auto spec = JsonCodec::functionFromJson(doc);

    EXPECT_EQ(spec.returnType, "integer");
    EXPECT_EQ(spec.language.kind, FunctionLanguage::Kind::PlPgSql);
    EXPECT_EQ(spec.volatility, FunctionVolatility::Immutable);
    EXPECT_EQ(spec.security, SecurityMode::Definer);
    EXPECT_TRUE(spec.parallelSafe);
    EXPECT_EQ(spec.cost, std::optional<uint32_t>(5));
    ASSERT_EQ(spec.parameters.size(), 2u);
    EXPECT_EQ(spec.parameters[0].dataType, "integer");
    EXPECT_EQ(spec.parameters[1].mode, ParameterMode::InOut);
    EXPECT_EQ(spec.parameters[1].defaultValue, std::optional<std::string>("0"));
}

TEST_F(JsonCodecTest, FunctionReturnsTable) {
    auto doc = JsonCodec::parse(R"({
        "name": "user_emails",
        "returns_table": [{"name": "id", "type": "integer"}, {"name": "email", "type": "text"}],
        "body": "SELECT id, email FROM users"
    })");

    auto spec = JsonCodec::functionFromJson(doc);

    ASSERT_EQ(spec.tableColumns.size(), 2u);
    EXPECT_EQ(spec.tableColumns[1].name, "email");
    EXPECT_TRUE(spec.returnType.empty());
}

TEST_F(JsonCodecTest, TableFromJson) {
    auto doc = JsonCodec::parse(R"({
        "name": "order_items",
        "columns": [
            {"name": "order_id", "type": "INTEGER", "primary_key": true},
            {"name": "product_id", "type": "INTEGER", "primary_key": true},
            {"name": "note", "type": "VARCHAR", "length": 200},
            {"name": "qty", "type": "INTEGER", "nullable": false, "default": "1"}
        ],
        "indexes": [{"name": "idx_product", "columns": ["product_id"]}],
        "foreign_keys": [{
            "name": "fk_order", "columns": ["order_id"],
            "referenced_table": "orders", "referenced_columns": ["id"],
            "on_delete": "cascade"
        }]
    })");

    auto design = JsonCodec::tableFromJson(doc, Dialect::SQLite);

    EXPECT_EQ(design.dialect, Dialect::SQLite);
    ASSERT_EQ(design.columns.size(), 4u);
    EXPECT_FALSE(design.columns[0].nullable);
    EXPECT_TRUE(design.columns[0].isPartOfCompositePk);
    EXPECT_TRUE(design.columns[1].isPartOfCompositePk);
    EXPECT_TRUE(design.columns[2].nullable);
    EXPECT_FALSE(design.columns[2].isPartOfCompositePk);
    EXPECT_EQ(design.columns[2].length, std::optional<uint32_t>(200));
    EXPECT_FALSE(design.columns[3].nullable);
    ASSERT_EQ(design.indexes.size(), 1u);
    ASSERT_EQ(design.foreignKeys.size(), 1u);
    EXPECT_EQ(design.foreignKeys[0].onDelete, ForeignKeyAction::Cascade);
    EXPECT_EQ(design.foreignKeys[0].onUpdate, ForeignKeyAction::NoAction);
}

TEST_F(JsonCodecTest, TableDialectKeyWinsOverFallback) {
    auto doc = JsonCodec::parse(R"({
        "name": "users",
        "dialect": "mysql",
        "columns": [{"name": "id", "type": "INT", "primary_key": true}],
        "options": {"engine": "InnoDB", "charset": "utf8mb4"}
    })");

    auto design = JsonCodec::tableFromJson(doc, Dialect::PostgreSQL);

    EXPECT_EQ(design.dialect, Dialect::MySQL);
    EXPECT_FALSE(design.columns[0].isPartOfCompositePk);
    EXPECT_EQ(design.options.engine, std::optional<std::string>("InnoDB"));
    EXPECT_EQ(design.options.charset, std::optional<std::string>("utf8mb4"));
}

TEST_F(JsonCodecTest, SnapshotFromJson) {
    auto doc = JsonCodec::parse(R"({
        "tables": [{
            "name": "users",
            "schema": "app",
            "columns": [{"name": "id", "data_type": "integer", "nullable": false}],
            "primary_key": {"name": "users_pkey", "columns": ["id"]},
            "foreign_keys": [{
                "name": "fk_org", "columns": ["org_id"], "referenced_table": "orgs",
                "on_delete": "SET NULL"
            }]
        }],
        "views": [{"name": "active_users", "definition": "SELECT 1"}],
        "sequences": [{"name": "users_id_seq"}]
    })");

    auto snapshot = JsonCodec::snapshotFromJson(doc);

    ASSERT_EQ(snapshot.tables.size(), 1u);
    const auto& users = snapshot.tables[0];
    EXPECT_EQ(users.info.name, "users");
    EXPECT_EQ(users.info.schema, std::optional<std::string>("app"));
    ASSERT_EQ(users.columns.size(), 1u);
    EXPECT_FALSE(users.columns[0].nullable);
    ASSERT_TRUE(users.primaryKey.has_value());
    EXPECT_EQ(users.primaryKey->columns, std::vector<std::string>{"id"});
    ASSERT_EQ(users.foreignKeys.size(), 1u);
    EXPECT_EQ(users.foreignKeys[0].onDelete, ForeignKeyAction::SetNull);
    ASSERT_EQ(snapshot.views.size(), 1u);
    ASSERT_EQ(snapshot.sequences.size(), 1u);
    EXPECT_TRUE(snapshot.functions.empty());
}

// Decoding failures
TEST_F(JsonCodecTest, MalformedJson) {
    try {
        JsonCodec::parse("{\"name\": ");
        FAIL() << "expected SpecFormatError";
    } catch (const SpecFormatError& e) {
        EXPECT_THAT(e.what(), StartsWith("JSON parse error: "));
    }
}

TEST_F(JsonCodecTest, MissingNameIsReported) {
    try {
        JsonCodec::triggerFromJson(json{{"table", "users"}});
        FAIL() << "expected SpecFormatError";
    } catch (const SpecFormatError& e) {
        EXPECT_THAT(e.what(), StartsWith("Invalid trigger: "));
        EXPECT_THAT(e.what(), HasSubstr("'name'"));
    }
}

TEST_F(JsonCodecTest, UnknownEnumValueIsReported) {
    auto doc = json{{"name", "p"}, {"table", "t"}, {"command", "merge"}};

    EXPECT_THROW(JsonCodec::policyFromJson(doc), SpecFormatError);
    EXPECT_THROW(JsonCodec::tableFromJson(json{{"name", "t"}, {"dialect", "oracle"}}, Dialect::MySQL),
                 SpecFormatError);
}

TEST_F(JsonCodecTest, WrongShapesAreReported) {
    EXPECT_THROW(JsonCodec::functionFromJson(json::array()), SpecFormatError);
    EXPECT_THROW(JsonCodec::snapshotFromJson(json{{"tables", "users"}}), SpecFormatError);
    EXPECT_THROW(JsonCodec::snapshotFromJson(json::parse(R"({"tables": [{"columns": []}]})")),
                 SpecFormatError);
}

TEST_F(JsonCodecTest, MissingFileIsReported) {
    EXPECT_THROW(JsonCodec::loadFile("/nonexistent/schemaforge/spec.json"), SpecFormatError);
}

// Diff output
TEST_F(JsonCodecTest, EmptyDiffSummary) {
    auto out = JsonCodec::diffToJson(SchemaDiff{});

    EXPECT_EQ(out["summary"]["change_count"], 0);
    EXPECT_EQ(out["summary"]["empty"], true);
    EXPECT_EQ(out["summary"]["breaking"], false);
    for (const char* kind : {"tables", "views", "functions", "procedures", "triggers", "sequences", "types"}) {
        ASSERT_TRUE(out.contains(kind)) << kind;
        EXPECT_TRUE(out[kind]["added"].empty());
        EXPECT_TRUE(out[kind]["removed"].empty());
        EXPECT_TRUE(out[kind]["modified"].empty());
    }
}

TEST_F(JsonCodecTest, DiffEncodesChangesAsDesiredAndCurrent) {
    auto diff = sampleDiff();

    auto out = JsonCodec::diffToJson(diff);

    EXPECT_EQ(out["summary"]["change_count"], diff.changeCount());
    EXPECT_EQ(out["summary"]["empty"], false);
    EXPECT_EQ(out["tables"]["added"][0]["name"], "audit_log");

    const auto& users = out["tables"]["modified"][0];
    EXPECT_EQ(users["table"], "app.users");
    EXPECT_EQ(users["safe"], diff.modifiedTables[0].isSafe());

    const auto& email = users["columns"]["modified"][0];
    EXPECT_EQ(email["column"], "email");
    EXPECT_EQ(email["type"]["desired"], "text");
    EXPECT_EQ(email["type"]["current"], "varchar");
    EXPECT_EQ(email["nullable"]["desired"], false);
    EXPECT_FALSE(email.contains("default"));

    const auto& fk = users["foreign_keys"]["modified"][0];
    EXPECT_EQ(fk["foreign_key"], "fk_org");
    EXPECT_EQ(fk["on_delete"]["desired"], "CASCADE");
    EXPECT_EQ(fk["on_delete"]["current"], "NO ACTION");
}

TEST_F(JsonCodecTest, DumpPrettyAndCompact) {
    auto diff = sampleDiff();

    auto pretty = JsonCodec::dumpDiff(diff);
    auto compact = JsonCodec::dumpDiff(diff, JsonOutputOptions{false, 2});

    EXPECT_THAT(pretty, HasSubstr("\n  \""));
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_EQ(json::parse(pretty), json::parse(compact));
}
