// update_field_test.cpp — End-to-end update scenarios over a small set of
// shared documents, written as MongoDB update documents in JSON.

#include <docupdate-cpp/docupdate.hpp>
#include <docupdate-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace du = docupdate_cpp;
using json = nlohmann::ordered_json;

namespace {

// Documents keyed by _id, in the shape a collection would return them.
auto shared_data() -> std::map<std::string, json> {
    return {
        {"int32", json::parse(R"({"_id": "int32", "v": 42})")},
        {"int64", json::parse(R"({"_id": "int64", "v": {"$numberLong": "42"}})")},
        {"string", json::parse(R"({"_id": "string", "v": "foo"})")},
        {"double", json::parse(R"({"_id": "double", "v": 42.13})")},
        {"document", json::parse(R"({"_id": "document", "v": {"foo": 42}})")},
        {"document-composite", json::parse(R"({
            "_id": "document-composite",
            "v": {"foo": 42, "42": "foo", "array": [42, "foo", null]}
        })")},
        {"array", json::parse(R"({"_id": "array", "v": [42]})")},
        {"array-empty", json::parse(R"({"_id": "array-empty", "v": []})")},
    };
}

struct UpdateOutcome {
    du::UpdateResult result;
    du::Value document;
};

// Apply `update` to the shared document with the given _id.
auto update_one(const std::string& id, const json& update) -> UpdateOutcome {
    auto document = shared_data().at(id).get<du::Value>();
    auto result = du::apply_update(du::UpdateApplier{}, document, update);
    return {result, std::move(document)};
}

auto update_one_error(const std::string& id, const json& update) -> du::Error {
    try {
        update_one(id, update);
    } catch (const du::Error& e) {
        return e;
    }
    ADD_FAILURE() << "expected update of '" << id << "' to fail";
    return du::Error{du::ErrorKind::bad_value, ""};
}

auto doc(const char* text) -> du::Value {
    return json::parse(text).get<du::Value>();
}

}  // anonymous namespace

// =============================================================================
// $set
// =============================================================================

TEST(UpdateFieldSet, array_nil) {
    auto [result, document] = update_one("string", json::parse(R"({"$set": {"v": [null]}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 1}));
    EXPECT_EQ(document, doc(R"({"_id": "string", "v": [null]})"));
}

TEST(UpdateFieldSet, set_same_value_int) {
    auto [result, document] = update_one("int32", json::parse(R"({"$set": {"v": 42}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 0}));
    EXPECT_EQ(document, doc(R"({"_id": "int32", "v": 42})"));
}

TEST(UpdateFieldSet, set_same_value_long_from_int_is_a_change) {
    auto [result, document] = update_one("int64", json::parse(R"({"$set": {"v": 42}})"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({"_id": "int64", "v": 42})"));
}

TEST(UpdateFieldSet, dot_notation_document_field_exist) {
    auto [result, document] = update_one("document-composite",
        json::parse(R"({"$set": {"v.foo": 1}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 1}));
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 1, "42": "foo", "array": [42, "foo", null]}
    })"));
}

TEST(UpdateFieldSet, dot_notation_array_field_exist) {
    auto [result, document] = update_one("document-composite",
        json::parse(R"({"$set": {"v.array.0": 1}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 1}));
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "foo", "array": [1, "foo", null]}
    })"));
}

TEST(UpdateFieldSet, document_dot_notation_array_field_not_exist) {
    auto [result, document] = update_one("document",
        json::parse(R"({"$set": {"v.0.foo": 1}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 1}));
    EXPECT_EQ(document, doc(R"({"_id": "document", "v": {"foo": 42, "0": {"foo": 1}}})"));
}

TEST(UpdateFieldSet, dot_notation_numeral_key_on_document) {
    auto [result, document] = update_one("document-composite",
        json::parse(R"({"$set": {"v.42": "bar"}})"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "bar", "array": [42, "foo", null]}
    })"));
}

TEST(UpdateFieldSet, absent_field_in_empty_document) {
    auto document = du::Value{du::Document{}};
    auto result = du::apply_update(du::UpdateApplier{}, document,
        json::parse(R"({"$set": {"v.0.foo": 1}})"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({"v": {"0": {"foo": 1}}})"));
}

TEST(UpdateFieldSet, array_index_past_end_pads_with_nulls) {
    auto [result, document] = update_one("array", json::parse(R"({"$set": {"v.3": "x"}})"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({"_id": "array", "v": [42, null, null, "x"]})"));
}

TEST(UpdateFieldSet, dot_notation_through_scalar_fails) {
    auto e = update_one_error("int32", json::parse(R"({"$set": {"v.foo": 1}})"));
    EXPECT_EQ(e.code(), 28);
    EXPECT_EQ(e.message, "Cannot create field 'foo' in element {v: 42}");
}

TEST(UpdateFieldSet, second_application_is_a_no_op) {
    const auto applier = du::UpdateApplier{};
    const auto update = json::parse(R"({"$set": {"v.array.0": 1, "v.bar": [1, {"x": 2}]}})");
    auto document = shared_data().at("document-composite").get<du::Value>();

    EXPECT_EQ(du::apply_update(applier, document, update).modified_count, 1u);
    const auto once = document;
    EXPECT_EQ(du::apply_update(applier, document, update).modified_count, 0u);
    EXPECT_EQ(document, once);
}

// =============================================================================
// $pop
// =============================================================================

TEST(UpdateFieldPop, pop_dot_notation) {
    auto [result, document] = update_one("document-composite",
        json::parse(R"({"$pop": {"v.array": 1}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 1}));
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "foo", "array": [42, "foo"]}
    })"));
}

TEST(UpdateFieldPop, pop_first) {
    auto [result, document] = update_one("document-composite",
        json::parse(R"({"$pop": {"v.array": -1}})"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 42, "42": "foo", "array": ["foo", null]}
    })"));
}

TEST(UpdateFieldPop, pop_empty_array) {
    auto [result, document] = update_one("array-empty", json::parse(R"({"$pop": {"v": 1}})"));
    EXPECT_EQ(result, (du::UpdateResult{true, 0}));
    EXPECT_EQ(document, doc(R"({"_id": "array-empty", "v": []})"));
}

TEST(UpdateFieldPop, pop_missing_field) {
    auto [result, document] = update_one("document", json::parse(R"({"$pop": {"v.nope": 1}})"));
    EXPECT_EQ(result.modified_count, 0u);
    EXPECT_EQ(document, doc(R"({"_id": "document", "v": {"foo": 42}})"));
}

TEST(UpdateFieldPop, pop_dot_notation_non_array) {
    auto e = update_one_error("document-composite", json::parse(R"({"$pop": {"v.foo": 1}})"));
    EXPECT_EQ(e.code(), 14);
    EXPECT_EQ(e.message, "Path 'v.foo' contains an element of non-array type 'int'");
}

TEST(UpdateFieldPop, pop_non_array_reports_runtime_type) {
    auto e = update_one_error("string", json::parse(R"({"$pop": {"v": -1}})"));
    EXPECT_EQ(e.message, "Path 'v' contains an element of non-array type 'string'");
    e = update_one_error("double", json::parse(R"({"$pop": {"v": -1}})"));
    EXPECT_EQ(e.message, "Path 'v' contains an element of non-array type 'double'");
    e = update_one_error("int64", json::parse(R"({"$pop": {"v": -1}})"));
    EXPECT_EQ(e.message, "Path 'v' contains an element of non-array type 'long'");
}

// =============================================================================
// Mixed operators
// =============================================================================

TEST(UpdateFieldMixed, several_operators_in_one_update) {
    auto [result, document] = update_one("document-composite", json::parse(R"({
        "$inc": {"v.foo": 1},
        "$push": {"v.array": "bar"},
        "$unset": {"v.42": ""}
    })"));
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(document, doc(R"({
        "_id": "document-composite",
        "v": {"foo": 43, "array": [42, "foo", null, "bar"]}
    })"));
}

TEST(UpdateFieldMixed, unknown_operator) {
    auto e = update_one_error("int32", json::parse(R"({"$set": {"v": 1}, "$foo": {"v": 1}})"));
    EXPECT_EQ(e.code(), 9);
}
