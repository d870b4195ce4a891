#include <docupdate-cpp/operators.hpp>

#include <docupdate-cpp/error.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace docupdate_cpp {

namespace {

// "{_id: "x"}" when the document has an '_id', otherwise "Document".
auto document_ref(const UpdateContext& ctx) -> std::string {
    if (!ctx.id) return "Document";
    return "{_id: " + to_display_string(*ctx.id) + "}";
}

auto type_name(const Value& v) -> std::string {
    return std::string{to_string_view(v.type())};
}

auto fits_int32(std::int64_t v) -> bool {
    return v >= std::numeric_limits<std::int32_t>::min() &&
           v <= std::numeric_limits<std::int32_t>::max();
}

auto as_int64(const Value& v) -> std::int64_t {
    if (const auto* i = v.get_if<std::int32_t>()) return *i;
    return *v.get_if<std::int64_t>();
}

// Result of an int32-int32 operation: stays int32 when it fits.
auto narrow(std::int64_t v, bool both_int32) -> Value {
    if (both_int32 && fits_int32(v)) return static_cast<std::int32_t>(v);
    return v;
}

// Elements an operand of $push / $addToSet contributes.
auto push_items(const Value& operand) -> Array {
    if (const auto* doc = operand.get_if<Document>()) {
        if (const auto* each = doc->find("$each")) {
            if (const auto* arr = each->get_if<Array>()) return *arr;
        }
    }
    return Array{operand};
}

auto contains_equivalent(const Array& arr, const Value& v) -> bool {
    return std::ranges::any_of(arr, [&](const Value& e) { return compare(e, v) == 0; });
}

}  // anonymous namespace

void UpdateOperator::validate(const FieldPath&, const Value&) const {}

// =============================================================================
// $set / $unset
// =============================================================================

auto SetOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    const auto* current = target.get();
    if (current && *current == ctx.operand) return false;
    target.assign(ctx.operand, ctx.options);
    return true;
}

auto UnsetOperator::apply(Location& target, const UpdateContext&) const -> bool {
    return target.remove();
}

// =============================================================================
// $pop
// =============================================================================

void PopOperator::validate(const FieldPath& path, const Value& operand) const {
    if (!operand.is_number()) {
        throw Error{ErrorKind::failed_to_parse,
            "Expected a number in: " + path.dotted() + ": " + to_display_string(operand)};
    }
    auto direction = operand.to_double();
    if (direction != 1.0 && direction != -1.0) {
        throw Error{ErrorKind::failed_to_parse,
            "$pop expects 1 or -1, found: " + to_display_string(operand)};
    }
}

auto PopOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    auto* current = target.get();
    if (!current) return false;
    auto* arr = current->get_if<Array>();
    if (!arr) {
        throw Error{ErrorKind::type_mismatch,
            "Path '" + ctx.path.dotted() + "' contains an element of non-array type '" +
            type_name(*current) + "'"};
    }
    if (arr->empty()) return false;
    if (ctx.operand.to_double() < 0) {
        arr->erase(arr->begin());
    } else {
        arr->pop_back();
    }
    return true;
}

// =============================================================================
// $inc / $mul
// =============================================================================

void ArithmeticOperator::validate(const FieldPath& path, const Value& operand) const {
    if (!operand.is_number()) {
        throw Error{ErrorKind::type_mismatch,
            "Cannot " + std::string{verb()} + " with non-numeric argument: {" +
            path.dotted() + ": " + to_display_string(operand) + "}"};
    }
}

auto ArithmeticOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    const auto* current = target.get();
    if (!current) {
        target.assign(initial(ctx.operand), ctx.options);
        return true;
    }
    if (!current->is_number()) {
        throw Error{ErrorKind::type_mismatch,
            "Cannot apply " + std::string{name()} + " to a value of non-numeric type. " +
            document_ref(ctx) + " has the field '" + target.component() +
            "' of non-numeric type " + type_name(*current)};
    }
    auto result = Value{};
    try {
        result = combine(*current, ctx.operand);
    } catch (const Error& e) {
        throw Error{e.kind,
            "Failed to apply " + std::string{name()} + " operations to current value (" +
            to_display_string(*current) + ") for document " + document_ref(ctx)};
    }
    if (result == *current) return false;
    target.assign(std::move(result), ctx.options);
    return true;
}

auto IncOperator::combine(const Value& current, const Value& operand) const -> Value {
    if (current.holds<double>() || operand.holds<double>()) {
        return current.to_double() + operand.to_double();
    }
    auto both_int32 = current.holds<std::int32_t>() && operand.holds<std::int32_t>();
    auto sum = std::int64_t{0};
    if (__builtin_add_overflow(as_int64(current), as_int64(operand), &sum)) {
        throw Error{ErrorKind::bad_value, "integer overflow"};
    }
    return narrow(sum, both_int32);
}

auto MulOperator::combine(const Value& current, const Value& operand) const -> Value {
    if (current.holds<double>() || operand.holds<double>()) {
        return current.to_double() * operand.to_double();
    }
    auto both_int32 = current.holds<std::int32_t>() && operand.holds<std::int32_t>();
    auto product = std::int64_t{0};
    if (__builtin_mul_overflow(as_int64(current), as_int64(operand), &product)) {
        throw Error{ErrorKind::bad_value, "integer overflow"};
    }
    return narrow(product, both_int32);
}

auto MulOperator::initial(const Value& operand) const -> Value {
    switch (operand.type()) {
        case ValueType::int32:   return std::int32_t{0};
        case ValueType::int64:   return std::int64_t{0};
        default:                 return 0.0;
    }
}

// =============================================================================
// $min / $max
// =============================================================================

auto MinMaxOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    const auto* current = target.get();
    if (current) {
        auto order = compare(ctx.operand, *current);
        auto replace = is_max_ ? order > 0 : order < 0;
        if (!replace) return false;
    }
    target.assign(ctx.operand, ctx.options);
    return true;
}

// =============================================================================
// $push / $addToSet
// =============================================================================

void PushOperator::validate(const FieldPath&, const Value& operand) const {
    const auto* doc = operand.get_if<Document>();
    if (!doc) return;
    const auto* each = doc->find("$each");
    if (each && !each->is_array()) {
        throw Error{ErrorKind::bad_value,
            "The argument to $each in " + std::string{name()} +
            " must be an array but it was of type: " + type_name(*each)};
    }
}

auto PushOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    auto items = push_items(ctx.operand);
    auto* current = target.get();

    if (!current) {
        auto created = Array{};
        for (auto& item : items) {
            if (unique_ && contains_equivalent(created, item)) continue;
            created.push_back(std::move(item));
        }
        target.assign(std::move(created), ctx.options);
        return true;
    }

    auto* arr = current->get_if<Array>();
    if (!arr) {
        auto message = "The field '" + target.component() + "' must be an array but is of type " +
                       type_name(*current);
        if (ctx.id) message += " in document " + document_ref(ctx);
        throw Error{ErrorKind::bad_value, std::move(message)};
    }

    auto changed = false;
    for (auto& item : items) {
        if (unique_ && contains_equivalent(*arr, item)) continue;
        arr->push_back(std::move(item));
        changed = true;
    }
    return changed;
}

// =============================================================================
// $pullAll
// =============================================================================

void PullAllOperator::validate(const FieldPath&, const Value& operand) const {
    if (!operand.is_array()) {
        throw Error{ErrorKind::bad_value,
            "$pullAll requires an array argument but was given a " + type_name(operand)};
    }
}

auto PullAllOperator::apply(Location& target, const UpdateContext& ctx) const -> bool {
    auto* current = target.get();
    if (!current) return false;
    auto* arr = current->get_if<Array>();
    if (!arr) {
        throw Error{ErrorKind::bad_value, "Cannot apply $pullAll to a non-array value"};
    }
    const auto& unwanted = *ctx.operand.get_if<Array>();
    auto removed = std::ranges::remove_if(*arr, [&](const Value& e) {
        return contains_equivalent(unwanted, e);
    });
    if (removed.empty()) return false;
    arr->erase(removed.begin(), removed.end());
    return true;
}

}  // namespace docupdate_cpp
