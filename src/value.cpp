#include <docupdate-cpp/value.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <string>
#include <variant>

namespace docupdate_cpp {

// =============================================================================
// Document
// =============================================================================

Document::Document(std::initializer_list<Field> fields) {
    fields_.reserve(fields.size());
    for (const auto& f : fields) set(f.key, f.value);
}

auto Document::find(std::string_view key) -> Value* {
    auto it = std::ranges::find(fields_, key, &Field::key);
    return it != fields_.end() ? &it->value : nullptr;
}

auto Document::find(std::string_view key) const -> const Value* {
    auto it = std::ranges::find(fields_, key, &Field::key);
    return it != fields_.end() ? &it->value : nullptr;
}

auto Document::set(std::string_view key, Value value) -> Value& {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    fields_.push_back(Field{std::string{key}, std::move(value)});
    return fields_.back().value;
}

auto Document::erase(std::string_view key) -> bool {
    auto it = std::ranges::find(fields_, key, &Field::key);
    if (it == fields_.end()) return false;
    fields_.erase(it);
    return true;
}

auto Document::keys() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(fields_.size());
    std::ranges::transform(fields_, std::back_inserter(result),
        [](const Field& f) { return f.key; });
    return result;
}

auto operator==(const Document& a, const Document& b) -> bool {
    return a.fields_ == b.fields_;
}

// =============================================================================
// Value
// =============================================================================

auto Value::to_double() const noexcept -> double {
    if (const auto* i = get_if<std::int32_t>()) return static_cast<double>(*i);
    if (const auto* l = get_if<std::int64_t>()) return static_cast<double>(*l);
    if (const auto* d = get_if<double>()) return *d;
    return 0.0;
}

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.storage_.index() != b.storage_.index()) return false;
    if (const auto* d = a.get_if<double>()) {
        return std::bit_cast<std::uint64_t>(*d) ==
               std::bit_cast<std::uint64_t>(*b.get_if<double>());
    }
    return a.storage_ == b.storage_;
}

// -- Canonical ordering -------------------------------------------------------

namespace {

// Canonical type rank, numbers share one rank.
auto type_rank(const Value& v) -> int {
    switch (v.type()) {
        case ValueType::null:     return 1;
        case ValueType::int32:
        case ValueType::int64:
        case ValueType::float64:  return 2;
        case ValueType::string:   return 3;
        case ValueType::document: return 4;
        case ValueType::array:    return 5;
        case ValueType::boolean:  return 6;
    }
    return 0;
}

auto compare_numbers(const Value& a, const Value& b) -> std::weak_ordering {
    // Exact comparison when neither side is a double.
    if (!a.holds<double>() && !b.holds<double>()) {
        auto to_i64 = [](const Value& v) -> std::int64_t {
            if (const auto* i = v.get_if<std::int32_t>()) return *i;
            return *v.get_if<std::int64_t>();
        };
        return to_i64(a) <=> to_i64(b);
    }
    auto x = a.to_double();
    auto y = b.to_double();
    // NaN sorts below every other number.
    if (std::isnan(x) || std::isnan(y)) {
        if (std::isnan(x) && std::isnan(y)) return std::weak_ordering::equivalent;
        return std::isnan(x) ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    if (x < y) return std::weak_ordering::less;
    if (x > y) return std::weak_ordering::greater;
    return std::weak_ordering::equivalent;
}

}  // anonymous namespace

auto compare(const Value& a, const Value& b) -> std::weak_ordering {
    auto ra = type_rank(a);
    auto rb = type_rank(b);
    if (ra != rb) return ra <=> rb;

    switch (a.type()) {
        case ValueType::null:
            return std::weak_ordering::equivalent;
        case ValueType::int32:
        case ValueType::int64:
        case ValueType::float64:
            return compare_numbers(a, b);
        case ValueType::string: {
            auto c = a.get_if<std::string>()->compare(*b.get_if<std::string>());
            return c <=> 0;
        }
        case ValueType::boolean:
            return *a.get_if<bool>() <=> *b.get_if<bool>();
        case ValueType::document: {
            const auto& da = *a.get_if<Document>();
            const auto& db = *b.get_if<Document>();
            auto ia = da.begin();
            auto ib = db.begin();
            for (; ia != da.end() && ib != db.end(); ++ia, ++ib) {
                auto ta = type_rank(ia->value);
                auto tb = type_rank(ib->value);
                if (ta != tb) return ta <=> tb;
                if (auto c = ia->key.compare(ib->key); c != 0) return c <=> 0;
                if (auto c = compare(ia->value, ib->value); c != 0) return c;
            }
            return da.size() <=> db.size();
        }
        case ValueType::array: {
            const auto& xa = *a.get_if<Array>();
            const auto& xb = *b.get_if<Array>();
            auto n = std::min(xa.size(), xb.size());
            for (std::size_t i = 0; i < n; ++i) {
                if (auto c = compare(xa[i], xb[i]); c != 0) return c;
            }
            return xa.size() <=> xb.size();
        }
    }
    return std::weak_ordering::equivalent;
}

// -- Rendering ----------------------------------------------------------------

namespace {

auto format_double(double d) -> std::string {
    if (std::isnan(d)) return "nan.0";
    if (std::isinf(d)) return d < 0 ? "-inf.0" : "inf.0";
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    auto s = std::string{buf, ptr};
    // Integral doubles keep a fractional part so they read as doubles.
    if (s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

void render(const Value& v, std::string& out) {
    std::visit(overload{
        [&](Null) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](std::int32_t i) { out += std::to_string(i); },
        [&](std::int64_t l) { out += std::to_string(l); },
        [&](double d) { out += format_double(d); },
        [&](const std::string& s) {
            out += '"';
            out += s;
            out += '"';
        },
        [&](const Document& doc) {
            if (doc.empty()) {
                out += "{}";
                return;
            }
            out += "{ ";
            auto first = true;
            for (const auto& f : doc) {
                if (!first) out += ", ";
                first = false;
                out += f.key;
                out += ": ";
                render(f.value, out);
            }
            out += " }";
        },
        [&](const Array& arr) {
            if (arr.empty()) {
                out += "[]";
                return;
            }
            out += "[ ";
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out += ", ";
                render(arr[i], out);
            }
            out += " ]";
        },
    }, v.storage());
}

}  // anonymous namespace

auto to_display_string(const Value& v) -> std::string {
    auto out = std::string{};
    render(v, out);
    return out;
}

}  // namespace docupdate_cpp
