/// @file operators.hpp
/// @brief The built-in update operators.

#pragma once

#include <docupdate-cpp/update_operator.hpp>

#include <string_view>

namespace docupdate_cpp {

/// $set: store the operand, creating missing levels as documents.
/// Writing a value equal to the current one is not a change.
class SetOperator final : public UpdateOperator {
public:
    auto name() const -> std::string_view override { return "$set"; }
    auto mode() const -> ResolveMode override { return ResolveMode::create; }
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;
};

/// $unset: erase a field, or null out an array element.
class UnsetOperator final : public UpdateOperator {
public:
    auto name() const -> std::string_view override { return "$unset"; }
    auto mode() const -> ResolveMode override { return ResolveMode::lookup; }
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;
};

/// $pop: remove the last (1) or first (-1) element of an array.
class PopOperator final : public UpdateOperator {
public:
    auto name() const -> std::string_view override { return "$pop"; }
    auto mode() const -> ResolveMode override { return ResolveMode::lookup; }
    void validate(const FieldPath& path, const Value& operand) const override;
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;
};

/// Shared base of $inc and $mul.
class ArithmeticOperator : public UpdateOperator {
public:
    auto mode() const -> ResolveMode override { return ResolveMode::create; }
    void validate(const FieldPath& path, const Value& operand) const override;
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;

protected:
    /// The verb used in messages: "increment" or "multiply".
    virtual auto verb() const -> std::string_view = 0;

    /// Combine the current value with the operand.
    /// @throws Error on 64-bit overflow.
    virtual auto combine(const Value& current, const Value& operand) const -> Value = 0;

    /// The value written when the field doesn't exist yet.
    virtual auto initial(const Value& operand) const -> Value = 0;
};

/// $inc: add the operand to a number; missing fields start at the operand.
class IncOperator final : public ArithmeticOperator {
public:
    auto name() const -> std::string_view override { return "$inc"; }

protected:
    auto verb() const -> std::string_view override { return "increment"; }
    auto combine(const Value& current, const Value& operand) const -> Value override;
    auto initial(const Value& operand) const -> Value override { return operand; }
};

/// $mul: multiply a number; missing fields start at zero.
class MulOperator final : public ArithmeticOperator {
public:
    auto name() const -> std::string_view override { return "$mul"; }

protected:
    auto verb() const -> std::string_view override { return "multiply"; }
    auto combine(const Value& current, const Value& operand) const -> Value override;
    auto initial(const Value& operand) const -> Value override;
};

/// $min / $max: replace when the operand orders before / after the current value.
class MinMaxOperator final : public UpdateOperator {
public:
    explicit MinMaxOperator(bool is_max) : is_max_{is_max} {}

    auto name() const -> std::string_view override { return is_max_ ? "$max" : "$min"; }
    auto mode() const -> ResolveMode override { return ResolveMode::create; }
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;

private:
    bool is_max_;
};

/// $push / $addToSet: append to an array, creating it if missing.
/// An operand of the form {$each: [...]} appends every element.
class PushOperator final : public UpdateOperator {
public:
    explicit PushOperator(bool unique) : unique_{unique} {}

    auto name() const -> std::string_view override { return unique_ ? "$addToSet" : "$push"; }
    auto mode() const -> ResolveMode override { return ResolveMode::create; }
    void validate(const FieldPath& path, const Value& operand) const override;
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;

private:
    bool unique_;
};

/// $pullAll: remove every element equal to one of the operand's elements.
class PullAllOperator final : public UpdateOperator {
public:
    auto name() const -> std::string_view override { return "$pullAll"; }
    auto mode() const -> ResolveMode override { return ResolveMode::lookup; }
    void validate(const FieldPath& path, const Value& operand) const override;
    auto apply(Location& target, const UpdateContext& ctx) const -> bool override;
};

}  // namespace docupdate_cpp
