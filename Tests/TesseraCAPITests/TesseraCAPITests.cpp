#include "tessera.h"
#include "tessera_json.hpp"
#include <cassert>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* tasks_schema =
    "create table tasks (id text primary key, name text, done integer, _status text)";

// Takes ownership of a string returned by the C API
nlohmann::json take_json(char* text) {
    assert(text != nullptr);
    auto value = nlohmann::json::parse(text);
    tessera_string_free(text);
    return value;
}

int64_t count(tessera_driver_t* d, const char* sql, const char* args_json = nullptr) {
    int64_t result = -1;
    auto status = tessera_driver_count(d, sql, args_json, &result);
    assert(status == TESSERA_OK);
    return result;
}

tessera_driver_t* open_tasks() {
    auto* d = tessera_driver_create();
    assert(d != nullptr);
    auto status = tessera_driver_set_up_with_schema(d, ":memory:", tasks_schema, 1);
    assert(status == TESSERA_OK);
    return d;
}

} // namespace

// ============================================================================
// Test: JSON Codec
// ============================================================================

void test_json_codec() {
    std::cout << "Testing JSON codec..." << std::endl;

    using nlohmann::json;

    // Arguments
    auto named = std::get<tessera::named_args_t>(
        tessera::args_from_json(json::parse(R"({":id": "a", "@n": 2, "$f": 1.5, "plain": null, "b": true})")));
    assert(std::get<std::string>(named.at("id")) == "a");
    assert(std::get<int64_t>(named.at("n")) == 2);
    assert(std::get<double>(named.at("f")) == 1.5);
    assert(std::holds_alternative<std::nullptr_t>(named.at("plain")));
    assert(std::get<bool>(named.at("b")) == true);

    auto positional = std::get<tessera::positional_args_t>(tessera::args_from_json(json::parse("[1, \"x\"]")));
    assert(positional.size() == 2);
    assert(tessera::args_empty(tessera::args_from_json(json(nullptr))));

    bool threw = false;
    try {
        tessera::arg_from_json(json::parse("[1]"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        tessera::arg_from_json(json::parse("18446744073709551615"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Versions
    assert(tessera::version_from_json(json(3)) == 3);
    assert(tessera::version_from_json(json(3.0)) == 3);
    assert(tessera::version_from_json(json("12")) == 12);
    for (const auto& bad : {json(3.5), json("12a"), json(""), json(-1), json(true), json(4294967296LL),
                            json(1e30), json(-1e300), json(-0.5)}) {
        threw = false;
        try {
            tessera::version_from_json(bad);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    // Operations
    auto create = std::get<tessera::create_op>(
        tessera::operation_from_json(json::parse(R"json(["create", "tasks", 42, "insert into tasks (id) values (?)", ["42"]])json")));
    assert(create.table == "tasks");
    assert(create.id == "42");

    auto deleted = std::get<tessera::mark_deleted_op>(
        tessera::operation_from_json(json::parse(R"(["markAsDeleted", "tasks", "t1"])")));
    assert(deleted.id == "t1");
    assert(tessera::operation_tag(deleted) == std::string("markAsDeleted"));

    try {
        tessera::operation_from_json(json::parse(R"(["frobnicate", "tasks", "t1"])"));
        assert(false && "expected driver_error");
    } catch (const tessera::driver_error& e) {
        assert(e.kind() == tessera::driver_errc::unknown_batch_operation);
        assert(e.get_if<tessera::unknown_batch_operation>()->tag == "frobnicate");
    }

    threw = false;
    try {
        tessera::operation_from_json(json::parse(R"(["destroyPermanently", "tasks"])"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // Results
    tessera::row_t row{{"id", std::string("a")}, {"data", std::vector<uint8_t>{1, 2}}, {"n", nullptr}};
    auto encoded = tessera::to_json(row);
    assert(encoded["id"] == "a");
    assert(encoded["data"] == json::array({1, 2}));
    assert(encoded["n"].is_null());
    assert(tessera::to_json(tessera::cached_entry_t{std::string("a")}) == json("a"));

    std::cout << "  JSON codec test passed!" << std::endl;
}

// ============================================================================
// Test: Status Codes
// ============================================================================

void test_null_arguments() {
    std::cout << "Testing null arguments..." << std::endl;

    assert(tessera_driver_initialize(nullptr, "db", 1) == TESSERA_ERROR_NULL_POINTER);
    assert(tessera_last_error() != nullptr);

    auto* d = tessera_driver_create();
    assert(tessera_driver_batch(d, nullptr) == TESSERA_ERROR_NULL_POINTER);
    assert(tessera_driver_find(d, "tasks", "t1", nullptr) == TESSERA_ERROR_NULL_POINTER);

    // Not opened yet
    int64_t n = 0;
    assert(tessera_driver_count(d, "select 1", nullptr, &n) == TESSERA_ERROR_DATABASE);

    tessera_driver_free(d);
    tessera_driver_free(nullptr);
    tessera_string_free(nullptr);

    std::cout << "  Null argument test passed!" << std::endl;
}

void test_batch_and_queries() {
    std::cout << "Testing batches and queries..." << std::endl;

    auto* d = open_tasks();
    assert(tessera_last_error() == nullptr);

    auto status = tessera_driver_batch(d, R"json([
        ["create", "tasks", "t1", "insert into tasks (id, name, done) values (:id, :name, :done)",
         {":id": "t1", "name": "first", "$done": false}],
        ["execute", "insert into tasks (id, name, done) values (?, ?, ?)", ["t2", "second", true]]
    ])json");
    assert(status == TESSERA_OK);

    // Created in the batch: bare id
    char* out = nullptr;
    assert(tessera_driver_find(d, "tasks", "t1", &out) == TESSERA_OK);
    assert(take_json(out) == "t1");

    // Executed, not created: full row, then cached
    assert(tessera_driver_find(d, "tasks", "t2", &out) == TESSERA_OK);
    auto row = take_json(out);
    assert(row["name"] == "second");
    assert(row["done"] == 1);
    assert(tessera_driver_find(d, "tasks", "t2", &out) == TESSERA_OK);
    assert(take_json(out) == "t2");

    assert(tessera_driver_find(d, "tasks", "missing", &out) == TESSERA_OK);
    assert(take_json(out).is_null());

    assert(tessera_driver_cached_query(d, "tasks", "select * from tasks order by id", nullptr, &out) == TESSERA_OK);
    assert(take_json(out) == nlohmann::json::array({"t1", "t2"}));

    assert(tessera_driver_query_ids(d, "select id from tasks where done = ?", "[true]", &out) == TESSERA_OK);
    assert(take_json(out) == nlohmann::json::array({"t2"}));

    assert(count(d, "select count(*) as count from tasks") == 2);
    assert(count(d, "select count(*) as count from tasks where name = ?", "[\"first\"]") == 1);

    tessera_driver_free(d);

    std::cout << "  Batch and query test passed!" << std::endl;
}

void test_batch_failures() {
    std::cout << "Testing batch failures..." << std::endl;

    auto* d = open_tasks();

    // Unknown tag after a valid create: nothing is applied
    auto status = tessera_driver_batch(d, R"json([
        ["create", "tasks", "t1", "insert into tasks (id) values (?)", ["t1"]],
        ["archive", "tasks", "t1"]
    ])json");
    assert(status == TESSERA_ERROR_UNKNOWN_BATCH_OPERATION);
    assert(std::strstr(tessera_last_error(), "archive") != nullptr);
    assert(count(d, "select count(*) as count from tasks") == 0);

    // Malformed JSON
    assert(tessera_driver_batch(d, "[[\"create\"") == TESSERA_ERROR_INVALID_ARGUMENT);
    assert(tessera_driver_batch(d, "{}") == TESSERA_ERROR_INVALID_ARGUMENT);

    // SQL failure rolls back the earlier operations
    status = tessera_driver_batch(d, R"json([
        ["create", "tasks", "t1", "insert into tasks (id) values (?)", ["t1"]],
        ["execute", "insert into missing_table values (1)"]
    ])json");
    assert(status == TESSERA_ERROR_DATABASE);
    assert(tessera_last_error() != nullptr);
    assert(count(d, "select count(*) as count from tasks") == 0);

    char* out = nullptr;
    assert(tessera_driver_find(d, "tasks", "t1", &out) == TESSERA_OK);
    assert(take_json(out).is_null());

    // A successful call clears the previous error
    assert(count(d, "select count(*) as count from tasks") == 0);
    assert(tessera_last_error() == nullptr);

    tessera_driver_free(d);

    std::cout << "  Batch failure test passed!" << std::endl;
}

void test_destroy_deleted_records() {
    std::cout << "Testing destroy deleted records..." << std::endl;

    auto* d = open_tasks();
    auto status = tessera_driver_batch(d, R"json([
        ["create", "tasks", "t1", "insert into tasks (id) values (?)", ["t1"]],
        ["create", "tasks", "t2", "insert into tasks (id) values (?)", ["t2"]],
        ["markAsDeleted", "tasks", "t1"]
    ])json");
    assert(status == TESSERA_OK);

    size_t deleted = 0;
    assert(tessera_driver_destroy_deleted_records(d, "tasks", R"(["t1", "gone"])", &deleted) == TESSERA_OK);
    assert(deleted == 1);
    assert(count(d, "select count(*) as count from tasks") == 1);

    // Integer ids are stringified the same way batch operations do it
    status = tessera_driver_batch(d, R"json([
        ["create", "tasks", 7, "insert into tasks (id) values (?)", ["7"]],
        ["markAsDeleted", "tasks", 7]
    ])json");
    assert(status == TESSERA_OK);
    assert(tessera_driver_destroy_deleted_records(d, "tasks", "[7]", &deleted) == TESSERA_OK);
    assert(deleted == 1);
    assert(tessera_driver_destroy_deleted_records(d, "tasks", "[true]", nullptr) ==
           TESSERA_ERROR_INVALID_ARGUMENT);

    // Output count is optional
    assert(tessera_driver_destroy_deleted_records(d, "tasks", "[]", nullptr) == TESSERA_OK);
    assert(tessera_driver_destroy_deleted_records(d, "tasks", R"({"id": "t2"})", nullptr) ==
           TESSERA_ERROR_INVALID_ARGUMENT);

    tessera_driver_free(d);

    std::cout << "  Destroy deleted records test passed!" << std::endl;
}

void test_invalid_utf8_text() {
    std::cout << "Testing invalid UTF-8 text..." << std::endl;

    auto* d = open_tasks();
    auto status = tessera_driver_batch(d, R"json([
        ["execute", "insert into tasks (id, name) values ('bad', CAST(x'ff' AS TEXT))"],
        ["execute", "insert into tasks (id, name) values ('bad2', CAST(x'c328' AS TEXT))"]
    ])json");
    assert(status == TESSERA_OK);

    // First read delivers the row with the bad bytes replaced, then it is cached
    char* out = nullptr;
    assert(tessera_driver_find(d, "tasks", "bad", &out) == TESSERA_OK);
    auto row = take_json(out);
    assert(row["id"] == "bad");
    assert(row["name"] == "\xEF\xBF\xBD");
    assert(tessera_driver_find(d, "tasks", "bad", &out) == TESSERA_OK);
    assert(take_json(out) == "bad");

    assert(tessera_driver_cached_query(d, "tasks", "select * from tasks where id = ?", "[\"bad2\"]", &out) ==
           TESSERA_OK);
    auto rows = take_json(out);
    assert(rows.size() == 1);
    assert(rows[0].is_object());
    assert(rows[0]["id"] == "bad2");
    assert(tessera_driver_cached_query(d, "tasks", "select * from tasks where id = ?", "[\"bad2\"]", &out) ==
           TESSERA_OK);
    assert(take_json(out) == nlohmann::json::array({"bad2"}));

    tessera_driver_free(d);

    std::cout << "  Invalid UTF-8 text test passed!" << std::endl;
}

void test_local_storage() {
    std::cout << "Testing local storage..." << std::endl;

    auto* d = open_tasks();

    char sentinel = 0;
    char* value = &sentinel;
    assert(tessera_driver_get_local(d, "token", &value) == TESSERA_OK);
    assert(value == nullptr);

    auto status = tessera_driver_batch(d, R"json([
        ["execute", "insert or replace into local_storage (key, value) values (:key, :value)",
         {"key": "token", "value": "abc"}]
    ])json");
    assert(status == TESSERA_OK);

    assert(tessera_driver_get_local(d, "token", &value) == TESSERA_OK);
    assert(value != nullptr);
    assert(std::string(value) == "abc");
    tessera_string_free(value);

    tessera_driver_free(d);

    std::cout << "  Local storage test passed!" << std::endl;
}

// ============================================================================
// Test: Schema Gate
// ============================================================================

void test_schema_gate() {
    std::cout << "Testing schema gate..." << std::endl;

    auto dir = fs::temp_directory_path() / ("tessera_capi_tests_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto name = (dir / "gate").string();

    auto* setup = tessera_driver_create();
    assert(tessera_driver_set_up_with_schema(setup, name.c_str(), tasks_schema, 1) == TESSERA_OK);
    tessera_driver_free(setup);

    auto* d = tessera_driver_create();
    assert(tessera_driver_initialize(d, name.c_str(), 1) == TESSERA_OK);

    assert(tessera_driver_initialize(d, name.c_str(), 2) == TESSERA_ERROR_MIGRATION_NEEDED);
    assert(tessera_last_error_database_version() == 1);

    // Versions may arrive as numeric strings
    auto status = tessera_driver_set_up_with_migrations(
        d, name.c_str(), R"({"from": "1", "to": 2, "sql": "alter table tasks add column pinned integer"})");
    assert(status == TESSERA_OK);
    assert(tessera_driver_initialize(d, name.c_str(), 2) == TESSERA_OK);

    status = tessera_driver_set_up_with_migrations(
        d, name.c_str(), R"({"from": 1, "to": 2, "sql": "select 1"})");
    assert(status == TESSERA_ERROR_INCOMPATIBLE_MIGRATION);
    assert(tessera_last_error_database_version() == 2);

    status = tessera_driver_set_up_with_migrations(d, name.c_str(), R"({"from": 2, "to": 3})");
    assert(status == TESSERA_ERROR_INVALID_ARGUMENT);
    status = tessera_driver_set_up_with_migrations(d, name.c_str(), R"({"from": "two", "to": 3, "sql": ""})");
    assert(status == TESSERA_ERROR_INVALID_ARGUMENT);

    // Stored version newer than expected
    assert(tessera_driver_initialize(d, name.c_str(), 1) == TESSERA_ERROR_SCHEMA_NEEDED);
    assert(tessera_last_error_database_version() == 2);

    // Reset wipes the tables and installs the new schema
    assert(tessera_driver_unsafe_reset_database(d, "create table tags (id text primary key)", 5) == TESSERA_OK);
    assert(tessera_driver_initialize(d, name.c_str(), 5) == TESSERA_OK);
    int64_t n = 0;
    assert(tessera_driver_count(d, "select count(*) from tasks", nullptr, &n) == TESSERA_ERROR_DATABASE);
    assert(count(d, "select count(*) from tags") == 0);

    tessera_driver_free(d);

    // Brand-new database
    auto* fresh = tessera_driver_create();
    assert(tessera_driver_initialize(fresh, ":memory:", 1) == TESSERA_ERROR_SCHEMA_NEEDED);
    assert(tessera_last_error_database_version() == 0);
    tessera_driver_free(fresh);

    fs::remove_all(dir);

    std::cout << "  Schema gate test passed!" << std::endl;
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== TesseraCAPI Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        tessera_set_log_level(99);  // clamped to debug
        tessera_set_log_level(0);

        test_json_codec();
        test_null_arguments();
        test_batch_and_queries();
        test_batch_failures();
        test_destroy_deleted_records();
        test_invalid_utf8_text();
        test_local_storage();
        test_schema_gate();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
