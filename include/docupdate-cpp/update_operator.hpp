/// @file update_operator.hpp
/// @brief UpdateOperator interface and the name -> operator registry.

#pragma once

#include <docupdate-cpp/field_path.hpp>
#include <docupdate-cpp/options.hpp>
#include <docupdate-cpp/path_resolver.hpp>
#include <docupdate-cpp/value.hpp>

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docupdate_cpp {

/// Everything an operator may need besides the target location.
struct UpdateContext {
    const FieldPath& path;         ///< The full path being updated.
    const Value& operand;          ///< The operand given with the path.
    const Value* id;               ///< The document's '_id', or nullptr.
    const UpdateOptions& options;  ///< Engine configuration.
};

/// A named update action such as "$set" or "$pop".
///
/// The applier resolves the path in the operator's mode() and hands the
/// resulting Location to apply(). In lookup mode a path whose intermediate
/// levels are missing never reaches the operator: that is a no-op.
class UpdateOperator {
public:
    virtual ~UpdateOperator() = default;

    /// The operator name including the leading '$'.
    virtual auto name() const -> std::string_view = 0;

    /// How the target path is resolved.
    virtual auto mode() const -> ResolveMode = 0;

    /// Check the operand before any modification of the update is applied.
    /// @throws Error
    virtual void validate(const FieldPath& path, const Value& operand) const;

    /// Apply the operator at `target`.
    /// @return true if the document changed.
    /// @throws Error
    virtual auto apply(Location& target, const UpdateContext& ctx) const -> bool = 0;
};

/// Maps operator names to their implementations.
///
/// Adding an operator means registering a new UpdateOperator; neither the
/// resolver nor the applier change.
class OperatorRegistry {
public:
    OperatorRegistry() = default;

    OperatorRegistry(OperatorRegistry&&) noexcept = default;
    auto operator=(OperatorRegistry&&) noexcept -> OperatorRegistry& = default;

    /// Register an operator, replacing any operator with the same name.
    void add(std::unique_ptr<UpdateOperator> op);

    /// Look up an operator by name.
    /// @return The operator, or nullptr if the name is unknown.
    auto find(std::string_view name) const -> const UpdateOperator*;

    auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

    /// Registered names, sorted.
    auto names() const -> std::vector<std::string>;

    /// A registry holding every built-in operator.
    static auto builtin() -> OperatorRegistry;

private:
    std::map<std::string, std::unique_ptr<UpdateOperator>, std::less<>> operators_;
};

/// The shared, immutable registry of built-in operators.
auto default_registry() -> std::shared_ptr<const OperatorRegistry>;

}  // namespace docupdate_cpp
