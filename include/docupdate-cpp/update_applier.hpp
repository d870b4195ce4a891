/// @file update_applier.hpp
/// @brief UpdateApplier: validates and applies an ordered list of modifications.

#pragma once

#include <docupdate-cpp/options.hpp>
#include <docupdate-cpp/update_operator.hpp>
#include <docupdate-cpp/value.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace docupdate_cpp {

/// One operator applied at one path: {"$set": {"v.foo": 1}} holds the
/// modification {"$set", "v.foo", 1}.
struct Modification {
    std::string op;    ///< Operator name, e.g. "$set".
    std::string path;  ///< Dotted path, e.g. "v.array.0".
    Value operand;     ///< Operator argument.

    auto operator==(const Modification&) const -> bool = default;
};

/// An update: modifications applied in order.
using UpdateSpec = std::vector<Modification>;

/// The outcome of applying an update to one document.
struct UpdateResult {
    bool matched = true;             ///< A document was handed to the engine.
    std::size_t modified_count = 0;  ///< 1 if any modification changed the document.

    auto operator==(const UpdateResult&) const -> bool = default;
};

/// Applies updates to documents.
///
/// Every call first validates the whole UpdateSpec (operator names, path
/// syntax, operands, conflicting paths) without touching the document, then
/// applies the modifications in order. An error during application leaves
/// the document partially updated: the caller owns the document and must
/// discard it.
///
/// The applier holds no per-call state; one instance can serve any number
/// of documents, including from several threads as long as each call has
/// its own document.
///
/// @code
/// auto doc = Value{Document{{"_id", "a"}, {"v", Array{1, 2, 3}}}};
/// auto applier = UpdateApplier{};
/// auto result = applier.apply(doc, {{"$pop", "v", 1}});
/// // result.modified_count == 1, v == [1, 2]
/// @endcode
class UpdateApplier {
public:
    /// Construct with default options and the built-in operators.
    UpdateApplier();

    explicit UpdateApplier(UpdateOptions options);

    /// Construct with a custom operator registry.
    /// @param registry The operators to accept. Must not be null.
    UpdateApplier(UpdateOptions options, std::shared_ptr<const OperatorRegistry> registry);

    auto options() const noexcept -> const UpdateOptions& { return options_; }
    auto registry() const noexcept -> const OperatorRegistry& { return *registry_; }

    /// Run the validation pass only.
    /// @throws Error for an unknown operator, a malformed path, an invalid
    ///   operand or two conflicting paths.
    void validate(const UpdateSpec& spec) const;

    /// Validate, then apply `spec` to `document` in place.
    /// @param document A Document value.
    /// @throws Error; the document may then be partially updated.
    auto apply(Value& document, const UpdateSpec& spec) const -> UpdateResult;

private:
    UpdateOptions options_;
    std::shared_ptr<const OperatorRegistry> registry_;
};

}  // namespace docupdate_cpp
