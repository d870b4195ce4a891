/// @file field_path.hpp
/// @brief FieldPath: a parsed dot-separated update path.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docupdate_cpp {

/// A dot-separated path such as "v.array.0", split into components.
///
/// A component is not yet a key or an index: "0" addresses element 0 of an
/// array, but the field named "0" of a document. The meaning is decided by
/// PathResolver against the node actually found.
///
/// Construction validates the syntax and throws Error for an empty path,
/// an empty component ("a..b", ".a", "a."), a positional operator ("a.$",
/// "a.$[]") or any other component starting with '$'.
class FieldPath {
public:
    /// Parse and validate a dotted path.
    /// @throws Error
    explicit FieldPath(std::string_view dotted);

    auto size() const noexcept -> std::size_t { return components_.size(); }

    auto operator[](std::size_t i) const -> const std::string& { return components_[i]; }

    auto components() const noexcept -> const std::vector<std::string>& { return components_; }

    /// The path as written.
    auto dotted() const noexcept -> const std::string& { return dotted_; }

    /// The first n components joined with '.'.
    auto prefix(std::size_t n) const -> std::string;

    /// True if every component of this path starts `other`.
    /// A path is a prefix of itself.
    auto is_prefix_of(const FieldPath& other) const -> bool;

    auto operator==(const FieldPath& other) const -> bool {
        return components_ == other.components_;
    }

private:
    std::string dotted_;
    std::vector<std::string> components_;
};

/// Parse a path component as an array index.
///
/// Accepts canonical non-negative base-10 integers only: no sign, no
/// leading zeros except for "0" itself.
auto try_parse_index(std::string_view component) -> std::optional<std::size_t>;

}  // namespace docupdate_cpp
