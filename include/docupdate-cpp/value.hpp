/// @file value.hpp
/// @brief The Value tree: scalars, Document and Array.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace docupdate_cpp {

/// Represents a null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

class Value;
struct Field;

/// An ordered sequence of values, indexed from 0.
using Array = std::vector<Value>;

/// An ordered mapping of unique field names to values.
///
/// Fields keep their insertion order. Replacing the value of an existing
/// field leaves it where it is; a new field is appended at the end.
///
/// @code
/// auto doc = Document{{"_id", "a"}, {"v", 42}};
/// doc.set("w", Array{1, 2});
/// @endcode
class Document {
public:
    using iterator = std::vector<Field>::iterator;
    using const_iterator = std::vector<Field>::const_iterator;

    Document() = default;
    Document(std::initializer_list<Field> fields);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    /// Find the value of a field.
    /// @return A pointer to the value, or nullptr if the field doesn't exist.
    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;

    auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }

    /// Replace the value of an existing field in place, or append a new one.
    /// @return The stored value.
    auto set(std::string_view key, Value value) -> Value&;

    /// Remove a field. Later fields keep their relative order.
    /// @return true if the field existed.
    auto erase(std::string_view key) -> bool;

    /// Field names in document order.
    auto keys() const -> std::vector<std::string>;

    auto begin() -> iterator;
    auto end() -> iterator;
    auto begin() const -> const_iterator;
    auto end() const -> const_iterator;

    friend auto operator==(const Document& a, const Document& b) -> bool;

private:
    std::vector<Field> fields_;
};

/// Runtime type of a Value.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    int32,
    int64,
    float64,
    string,
    document,
    array,
};

/// The MongoDB type alias for a ValueType ("int", "object", ...).
///
/// These are the names MongoDB puts into error messages, so they are part
/// of the observable behaviour of the library.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:     return "null";
        case ValueType::boolean:  return "bool";
        case ValueType::int32:    return "int";
        case ValueType::int64:    return "long";
        case ValueType::float64:  return "double";
        case ValueType::string:   return "string";
        case ValueType::document: return "object";
        case ValueType::array:    return "array";
    }
    return "unknown";
}

/// A node in a document tree.
///
/// A closed set of alternatives: Null, bool, int32_t, int64_t, double,
/// string, Document and Array. Containers own their children; trees are
/// never shared and never cyclic.
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int32_t,
        std::int64_t,
        double,
        std::string,
        Document,
        Array
    >;

    Value() = default;
    Value(Null) {}
    Value(bool b) : storage_{b} {}
    Value(std::int32_t i) : storage_{i} {}
    Value(std::int64_t i) : storage_{i} {}
    Value(double d) : storage_{d} {}
    Value(const char* s) : storage_{std::string{s}} {}
    Value(std::string s) : storage_{std::move(s)} {}
    Value(Document d) : storage_{std::move(d)} {}
    Value(Array a) : storage_{std::move(a)} {}

    auto type() const noexcept -> ValueType {
        return static_cast<ValueType>(storage_.index());
    }

    auto is_null() const noexcept -> bool { return holds<Null>(); }
    auto is_document() const noexcept -> bool { return holds<Document>(); }
    auto is_array() const noexcept -> bool { return holds<Array>(); }

    /// True for int32, int64 and double.
    auto is_number() const noexcept -> bool {
        return holds<std::int32_t>() || holds<std::int64_t>() || holds<double>();
    }

    template <typename T>
    auto holds() const noexcept -> bool {
        return std::holds_alternative<T>(storage_);
    }

    /// Typed access, or nullptr on type mismatch.
    /// @code
    /// if (auto* arr = value.get_if<Array>()) arr->push_back(Null{});
    /// @endcode
    template <typename T>
    auto get_if() noexcept -> T* {
        return std::get_if<T>(&storage_);
    }

    template <typename T>
    auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&storage_);
    }

    /// The numeric value widened to double. Only meaningful if is_number().
    auto to_double() const noexcept -> double;

    auto storage() const noexcept -> const Storage& { return storage_; }
    auto storage() noexcept -> Storage& { return storage_; }

    /// Deep, type-strict equality. Doubles compare by bit pattern.
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage storage_{};
};

/// A named value inside a Document.
struct Field {
    std::string key;
    Value value;

    auto operator==(const Field& other) const -> bool = default;
};

// -- Document inline members --------------------------------------------------

inline auto Document::size() const noexcept -> std::size_t { return fields_.size(); }
inline auto Document::empty() const noexcept -> bool { return fields_.empty(); }
inline auto Document::begin() -> iterator { return fields_.begin(); }
inline auto Document::end() -> iterator { return fields_.end(); }
inline auto Document::begin() const -> const_iterator { return fields_.begin(); }
inline auto Document::end() const -> const_iterator { return fields_.end(); }

// -- Ordering and rendering ---------------------------------------------------

/// Compare two values in MongoDB's canonical order.
///
/// null < numbers < string < object < array < bool. Numbers of different
/// types compare by numeric value, so int 1 is equivalent to double 1.0.
/// Documents compare field by field (name, then value), arrays element by
/// element.
auto compare(const Value& a, const Value& b) -> std::weak_ordering;

/// Render a value the way the MongoDB shell prints it in error messages:
/// `42`, `"foo"`, `null`, `{ a: 1, b: "x" }`, `[ 1, 2 ]`.
auto to_display_string(const Value& v) -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace docupdate_cpp
