#include <docupdate-cpp/docupdate.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

using namespace docupdate_cpp;

namespace {

auto composite() -> Value {
    return Document{
        {"_id", "document-composite"},
        {"v", Document{
            {"foo", 42},
            {"42", "foo"},
            {"array", Array{42, "foo", Null{}}},
        }},
    };
}

auto apply_error(const UpdateApplier& applier, Value& doc, const UpdateSpec& spec) -> Error {
    try {
        applier.apply(doc, spec);
    } catch (const Error& e) {
        return e;
    }
    ADD_FAILURE() << "expected the update to fail";
    return Error{ErrorKind::bad_value, ""};
}

// Sets the field to the string "touched", for registry extension tests.
class TouchOperator final : public UpdateOperator {
public:
    auto name() const -> std::string_view override { return "$touch"; }
    auto mode() const -> ResolveMode override { return ResolveMode::create; }
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override {
        target.assign("touched", ctx.options);
        return true;
    }
};

}  // anonymous namespace

// -- Modified count -----------------------------------------------------------

TEST(UpdateApplier, reports_modification) {
    auto doc = composite();
    const auto result = UpdateApplier{}.apply(doc, {{"$set", "v.foo", 1}});
    EXPECT_TRUE(result.matched);
    EXPECT_EQ(result.modified_count, 1u);
}

TEST(UpdateApplier, set_twice_is_idempotent) {
    auto doc = composite();
    const auto applier = UpdateApplier{};
    const auto spec = UpdateSpec{{"$set", "v.array.0", 1}, {"$set", "w", "x"}};

    EXPECT_EQ(applier.apply(doc, spec).modified_count, 1u);
    const auto after_first = doc;
    EXPECT_EQ(applier.apply(doc, spec).modified_count, 0u);
    EXPECT_EQ(doc, after_first);
}

TEST(UpdateApplier, no_op_spec_leaves_document_unchanged) {
    auto doc = composite();
    const auto result = UpdateApplier{}.apply(doc, {
        {"$set", "v.foo", 42},
        {"$set", "v.array", Array{42, "foo", Null{}}},
        {"$unset", "missing", ""},
        {"$pop", "nope", 1},
        {"$max", "v.42", "a"},
    });
    EXPECT_EQ(result, (UpdateResult{true, 0}));
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, any_change_counts_once) {
    auto doc = composite();
    const auto result = UpdateApplier{}.apply(doc, {
        {"$set", "v.foo", 1},
        {"$pop", "v.array", 1},
        {"$set", "w", 2},
    });
    EXPECT_EQ(result.modified_count, 1u);
}

TEST(UpdateApplier, modifications_apply_in_order) {
    auto doc = Value{Document{}};
    UpdateApplier{}.apply(doc, {{"$set", "b", 1}, {"$set", "a", 2}});
    EXPECT_EQ(doc.get_if<Document>()->keys(), (std::vector<std::string>{"b", "a"}));
}

TEST(UpdateApplier, empty_spec_changes_nothing) {
    auto doc = composite();
    EXPECT_EQ(UpdateApplier{}.apply(doc, {}).modified_count, 0u);
}

// -- Validation pass ----------------------------------------------------------

TEST(UpdateApplier, unknown_operator_is_rejected_before_mutation) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$set", "v.foo", 1}, {"$foo", "v", 1}});
    EXPECT_EQ(e.code(), 9);
    EXPECT_EQ(e.message,
              "Unknown modifier: $foo. Expected a valid update modifier or "
              "pipeline-style update specified as an array");
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, invalid_path_is_rejected_before_mutation) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$set", "v.foo", 1}, {"$set", "v..bar", 1}});
    EXPECT_EQ(e.code(), 56);
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, invalid_operand_is_rejected_before_mutation) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$set", "v.foo", 1}, {"$pop", "v.array", 0}});
    EXPECT_EQ(e.message, "$pop expects 1 or -1, found: 0");
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, conflicting_paths_are_rejected) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$set", "v", 1}, {"$set", "v.foo", 1}});
    EXPECT_EQ(e.code(), 40);
    EXPECT_EQ(e.message, "Updating the path 'v.foo' would create a conflict at 'v'");

    e = apply_error(UpdateApplier{}, doc, {{"$set", "v.foo", 1}, {"$inc", "v", 1}});
    EXPECT_EQ(e.message, "Updating the path 'v' would create a conflict at 'v'");

    e = apply_error(UpdateApplier{}, doc, {{"$set", "v.foo", 1}, {"$unset", "v.foo", ""}});
    EXPECT_EQ(e.message, "Updating the path 'v.foo' would create a conflict at 'v.foo'");
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, sibling_paths_do_not_conflict) {
    auto doc = composite();
    EXPECT_NO_THROW(UpdateApplier{}.apply(doc, {{"$set", "v.foo", 1}, {"$set", "v.food", 2}}));
}

TEST(UpdateApplier, validate_alone_does_not_need_a_document) {
    const auto applier = UpdateApplier{};
    EXPECT_NO_THROW(applier.validate({{"$set", "a", 1}, {"$pop", "b", -1}}));
    EXPECT_THROW(applier.validate({{"$bogus", "a", 1}}), Error);
}

// -- Application errors -------------------------------------------------------

TEST(UpdateApplier, pop_on_non_array_reports_code_14) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$pop", "v.foo", 1}});
    EXPECT_EQ(e.code(), 14);
    EXPECT_EQ(e.message, "Path 'v.foo' contains an element of non-array type 'int'");
    EXPECT_EQ(doc, composite());
}

TEST(UpdateApplier, target_must_be_a_document) {
    auto value = Value{42};
    EXPECT_THROW(UpdateApplier{}.apply(value, {{"$set", "a", 1}}), Error);
}

// -- _id ----------------------------------------------------------------------

TEST(UpdateApplier, changing_id_is_rejected) {
    auto doc = composite();
    auto e = apply_error(UpdateApplier{}, doc, {{"$set", "_id", "other"}});
    EXPECT_EQ(e.code(), 66);
    EXPECT_EQ(e.message,
              "Performing an update on the path '_id' would modify the immutable field '_id'");

    doc = composite();
    e = apply_error(UpdateApplier{}, doc, {{"$unset", "_id", ""}});
    EXPECT_EQ(e.code(), 66);
}

TEST(UpdateApplier, setting_id_to_same_value_is_allowed) {
    auto doc = composite();
    const auto result = UpdateApplier{}.apply(doc, {{"$set", "_id", "document-composite"}});
    EXPECT_EQ(result.modified_count, 0u);
}

TEST(UpdateApplier, id_protection_can_be_disabled) {
    auto doc = composite();
    auto options = UpdateOptions{};
    options.protect_id = false;
    const auto result = UpdateApplier{options}.apply(doc, {{"$set", "_id", "other"}});
    EXPECT_EQ(result.modified_count, 1u);
    EXPECT_EQ(*doc.get_if<Document>()->find("_id"), Value{"other"});
}

TEST(UpdateApplier, documents_without_id_may_gain_one) {
    auto doc = Value{Document{{"v", 1}}};
    EXPECT_EQ(UpdateApplier{}.apply(doc, {{"$set", "_id", 7}}).modified_count, 1u);
}

// -- Options and registry -----------------------------------------------------

TEST(UpdateApplier, padding_limit_comes_from_options) {
    auto options = UpdateOptions{};
    options.max_array_padding = 3;
    const auto applier = UpdateApplier{options};

    auto doc = Value{Document{{"v", Array{}}}};
    auto e = apply_error(applier, doc, {{"$set", "v.10", 1}});
    EXPECT_EQ(e.message, "can't backfill more than 3 elements");
    EXPECT_NO_THROW(applier.apply(doc, {{"$set", "v.3", 1}}));
}

TEST(UpdateApplier, custom_operator_can_be_registered) {
    auto registry = OperatorRegistry::builtin();
    registry.add(std::make_unique<TouchOperator>());
    const auto applier = UpdateApplier{
        UpdateOptions{}, std::make_shared<const OperatorRegistry>(std::move(registry))};

    auto doc = Value{Document{}};
    EXPECT_EQ(applier.apply(doc, {{"$touch", "a.b", Null{}}, {"$set", "c", 1}}).modified_count, 1u);
    EXPECT_EQ(doc, (Value{Document{{"a", Document{{"b", "touched"}}}, {"c", 1}}}));
}

TEST(UpdateApplier, null_registry_is_rejected) {
    EXPECT_THROW(UpdateApplier(UpdateOptions{}, nullptr), std::invalid_argument);
}

TEST(OperatorRegistry, builtin_names) {
    const auto registry = OperatorRegistry::builtin();
    EXPECT_EQ(registry.names(), (std::vector<std::string>{
        "$addToSet", "$inc", "$max", "$min", "$mul", "$pop", "$pullAll", "$push", "$set", "$unset",
    }));
    EXPECT_EQ(registry.find("$nope"), nullptr);
    ASSERT_NE(registry.find("$pop"), nullptr);
    EXPECT_EQ(registry.find("$pop")->mode(), ResolveMode::lookup);
}

TEST(OperatorRegistry, default_registry_is_shared) {
    EXPECT_EQ(default_registry().get(), default_registry().get());
    EXPECT_TRUE(default_registry()->contains("$set"));
}
