/// @file path_resolver.hpp
/// @brief Walking a document along a FieldPath, creating structure on demand.

#pragma once

#include <docupdate-cpp/field_path.hpp>
#include <docupdate-cpp/options.hpp>
#include <docupdate-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace docupdate_cpp {

/// Whether missing intermediate levels are created while resolving.
enum class ResolveMode : std::uint8_t {
    lookup,  ///< Missing levels end the walk; nothing is written.
    create,  ///< Missing levels are created as empty documents.
};

/// The end of a resolved path: the container that holds (or will hold) the
/// final component, plus that component.
///
/// Operators mutate the document through a Location instead of a pointer to
/// the target, so creating or removing the target never invalidates what
/// the caller holds.
class Location {
public:
    /// @param parent The Document or Array holding the final component.
    /// @param component The final path component.
    /// @param parent_field Name of the parent inside its own container
    ///   (empty for the root), used in error messages.
    Location(Value& parent, std::string component, std::string parent_field)
        : parent_{&parent}, component_{std::move(component)},
          parent_field_{std::move(parent_field)} {}

    auto parent() const noexcept -> Value& { return *parent_; }
    auto component() const noexcept -> const std::string& { return component_; }
    auto parent_field() const noexcept -> const std::string& { return parent_field_; }

    /// True if the parent is an Array and the component is an index.
    auto in_array() const noexcept -> bool { return parent_->is_array(); }

    /// The current value at this location, or nullptr if it doesn't exist.
    auto get() const -> Value*;

    /// Store a value, creating the field or element if needed.
    ///
    /// A document field keeps its position when replaced. An array index
    /// past the end pads the array with nulls first.
    /// @throws Error if the padding exceeds UpdateOptions::max_array_padding.
    void assign(Value value, const UpdateOptions& options);

    /// Remove the value: a document field is erased, an array element is
    /// replaced by null so later indices stay put.
    /// @return true if the document changed.
    auto remove() -> bool;

private:
    Value* parent_;
    std::string component_;
    std::string parent_field_;
};

/// Walk `document` to the parent of the last component of `path`.
///
/// On a Document a component is always a field name, even if it looks like
/// a number. On an Array it must be a canonical index. In create mode missing
/// levels become empty documents, and an index past the end of an array pads
/// it with nulls before appending the new document.
///
/// @return The location, or nullopt in lookup mode when a level is missing.
/// @throws Error (path_not_viable) when the walk meets a scalar, or an array
///   addressed by a non-numeric component.
auto resolve_parent(Value& document, const FieldPath& path, ResolveMode mode,
                    const UpdateOptions& options = {}) -> std::optional<Location>;

/// Walk `document` to the node at `path`.
///
/// In create mode a missing final component is created as null.
/// @return The node, or nullptr in lookup mode when it doesn't exist.
/// @throws Error as resolve_parent().
auto resolve(Value& document, const FieldPath& path, ResolveMode mode,
             const UpdateOptions& options = {}) -> Value*;

/// Read-only lookup of the node at `path`.
/// @throws Error as resolve_parent().
auto find(const Value& document, const FieldPath& path) -> const Value*;

}  // namespace docupdate_cpp
