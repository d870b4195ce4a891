#include <docupdate-cpp/json.hpp>

#include <docupdate-cpp/error.hpp>

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <variant>

namespace docupdate_cpp {

namespace {

template <typename Json>
void value_to_json(Json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int32_t i) { j = i; },
        [&](std::int64_t l) { j = Json{{"$numberLong", std::to_string(l)}}; },
        [&](double d) {
            if (std::isnan(d)) {
                j = Json{{"$numberDouble", "NaN"}};
            } else if (std::isinf(d)) {
                j = Json{{"$numberDouble", d < 0 ? "-Infinity" : "Infinity"}};
            } else {
                j = d;
            }
        },
        [&](const std::string& s) { j = s; },
        [&](const Document& doc) {
            j = Json::object();
            for (const auto& f : doc) {
                auto child = Json{};
                value_to_json(child, f.value);
                j[f.key] = std::move(child);
            }
        },
        [&](const Array& arr) {
            j = Json::array();
            for (const auto& e : arr) {
                auto child = Json{};
                value_to_json(child, e);
                j.push_back(std::move(child));
            }
        },
    }, v.storage());
}

auto parse_double(const std::string& s) -> double {
    if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
    if (s == "Infinity") return std::numeric_limits<double>::infinity();
    if (s == "-Infinity") return -std::numeric_limits<double>::infinity();
    auto result = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        throw Error{ErrorKind::bad_value, "invalid double in Extended JSON: \"" + s + "\""};
    }
    return result;
}

auto parse_integer(const std::string& text) -> std::int64_t {
    auto result = std::int64_t{0};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw Error{ErrorKind::bad_value, "invalid integer in Extended JSON: \"" + text + "\""};
    }
    return result;
}

// Single-key Extended JSON wrapper such as {"$numberLong": "42"}.
template <typename Json>
auto try_extended(const Json& j, Value& v) -> bool {
    if (j.size() != 1) return false;
    auto it = j.begin();
    if (!it.value().is_string()) return false;
    const auto& key = it.key();
    const auto& text = it.value().template get_ref<const std::string&>();
    if (key == "$numberInt") {
        auto i = parse_integer(text);
        if (i < std::numeric_limits<std::int32_t>::min() ||
            i > std::numeric_limits<std::int32_t>::max()) {
            throw Error{ErrorKind::bad_value, "$numberInt out of range: " + text};
        }
        v = static_cast<std::int32_t>(i);
        return true;
    }
    if (key == "$numberLong") {
        v = parse_integer(text);
        return true;
    }
    if (key == "$numberDouble") {
        v = parse_double(text);
        return true;
    }
    return false;
}

auto integer_value(std::int64_t i) -> Value {
    if (i >= std::numeric_limits<std::int32_t>::min() &&
        i <= std::numeric_limits<std::int32_t>::max()) {
        return static_cast<std::int32_t>(i);
    }
    return i;
}

template <typename Json>
void value_from_json(const Json& j, Value& v) {
    if (j.is_null()) {
        v = Null{};
    } else if (j.is_boolean()) {
        v = j.template get<bool>();
    } else if (j.is_number_unsigned()) {
        auto u = j.template get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw Error{ErrorKind::bad_value, "integer out of range: " + std::to_string(u)};
        }
        v = integer_value(static_cast<std::int64_t>(u));
    } else if (j.is_number_integer()) {
        v = integer_value(j.template get<std::int64_t>());
    } else if (j.is_number_float()) {
        v = j.template get<double>();
    } else if (j.is_string()) {
        v = j.template get<std::string>();
    } else if (j.is_array()) {
        auto arr = Array{};
        arr.reserve(j.size());
        for (const auto& e : j) {
            auto child = Value{};
            value_from_json(e, child);
            arr.push_back(std::move(child));
        }
        v = std::move(arr);
    } else if (j.is_object()) {
        if (try_extended(j, v)) return;
        auto doc = Document{};
        for (const auto& [key, e] : j.items()) {
            auto child = Value{};
            value_from_json(e, child);
            doc.set(key, std::move(child));
        }
        v = std::move(doc);
    } else {
        throw Error{ErrorKind::bad_value, "cannot convert JSON to Value"};
    }
}

auto json_type_name(const nlohmann::ordered_json& j) -> std::string {
    auto v = Value{};
    value_from_json(j, v);
    return std::string{to_string_view(v.type())};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Value& v) { value_to_json(j, v); }
void to_json(nlohmann::ordered_json& j, const Value& v) { value_to_json(j, v); }
void from_json(const nlohmann::json& j, Value& v) { value_from_json(j, v); }
void from_json(const nlohmann::ordered_json& j, Value& v) { value_from_json(j, v); }

void to_json(nlohmann::json& j, const UpdateResult& r) {
    j = nlohmann::json{{"n", r.matched ? 1 : 0}, {"nModified", r.modified_count}};
}

void from_json(const nlohmann::json& j, UpdateOptions& options) {
    options = UpdateOptions{};
    if (j.contains("max_array_padding")) {
        options.max_array_padding = j.at("max_array_padding").get<std::size_t>();
    }
    if (j.contains("protect_id")) {
        options.protect_id = j.at("protect_id").get<bool>();
    }
}

void to_json(nlohmann::json& j, const UpdateOptions& options) {
    j = nlohmann::json{
        {"max_array_padding", options.max_array_padding},
        {"protect_id", options.protect_id},
    };
}

// =============================================================================
// Update documents
// =============================================================================

auto parse_update(const nlohmann::ordered_json& update) -> UpdateSpec {
    if (!update.is_object()) {
        throw Error{ErrorKind::failed_to_parse, "Update document must be an object"};
    }
    if (update.empty()) {
        throw Error{ErrorKind::failed_to_parse, "Update document cannot be empty"};
    }

    auto spec = UpdateSpec{};
    for (const auto& [op, fields] : update.items()) {
        if (!fields.is_object()) {
            throw Error{ErrorKind::failed_to_parse,
                "Modifiers operate on fields but we found type " + json_type_name(fields) +
                " instead. For example: {$mod: {<field>: ...}} not {" + op + ": " +
                fields.dump() + "}"};
        }
        if (fields.empty()) {
            throw Error{ErrorKind::failed_to_parse,
                "'" + op + "' is empty. You must specify a field like so: {" + op +
                ": {<field>: ...}}"};
        }
        for (const auto& [path, operand] : fields.items()) {
            spec.push_back(Modification{op, path, operand.get<Value>()});
        }
    }
    return spec;
}

auto apply_update(const UpdateApplier& applier, Value& document,
                  const nlohmann::ordered_json& update) -> UpdateResult {
    return applier.apply(document, parse_update(update));
}

}  // namespace docupdate_cpp
