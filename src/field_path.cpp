#include <docupdate-cpp/field_path.hpp>

#include <docupdate-cpp/error.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>

namespace docupdate_cpp {

namespace {

auto is_positional(std::string_view component) -> bool {
    return component == "$" ||
           (component.size() >= 3 && component.starts_with("$[") && component.ends_with("]"));
}

}  // anonymous namespace

FieldPath::FieldPath(std::string_view dotted) : dotted_{dotted} {
    if (dotted.empty()) {
        throw Error{ErrorKind::empty_field_name, "An empty update path is not valid."};
    }

    auto pos = std::size_t{0};
    while (true) {
        auto next = dotted.find('.', pos);
        auto component = dotted.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (component.empty()) {
            throw Error{ErrorKind::empty_field_name,
                "The update path '" + dotted_ +
                "' contains an empty field name, which is not allowed."};
        }
        if (is_positional(component)) {
            throw Error{ErrorKind::bad_value,
                "The positional operator is not supported in '" + dotted_ + "'"};
        }
        if (component.front() == '$') {
            throw Error{ErrorKind::dollar_prefixed_field_name,
                "The dollar ($) prefixed field '" + std::string{component} + "' in '" +
                dotted_ + "' is not valid for storage."};
        }
        components_.emplace_back(component);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
}

auto FieldPath::prefix(std::size_t n) const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < n && i < components_.size(); ++i) {
        if (i > 0) result += '.';
        result += components_[i];
    }
    return result;
}

auto FieldPath::is_prefix_of(const FieldPath& other) const -> bool {
    if (components_.size() > other.components_.size()) return false;
    return std::equal(components_.begin(), components_.end(), other.components_.begin());
}

auto try_parse_index(std::string_view component) -> std::optional<std::size_t> {
    if (component.empty()) return std::nullopt;
    // Leading zeros would make "01" and "1" address the same element.
    if (component.size() > 1 && component[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(component.data(), component.data() + component.size(), result);
    if (ec == std::errc{} && ptr == component.data() + component.size()) return result;
    return std::nullopt;
}

}  // namespace docupdate_cpp
