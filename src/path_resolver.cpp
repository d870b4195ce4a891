#include <docupdate-cpp/path_resolver.hpp>

#include <docupdate-cpp/error.hpp>

#include <glog/logging.h>

#include <string>
#include <utility>

namespace docupdate_cpp {

namespace {

auto element_string(const std::string& field, const Value& value) -> std::string {
    return "{" + field + ": " + to_display_string(value) + "}";
}

[[noreturn]] void throw_not_viable(ResolveMode mode, const FieldPath& path,
                                   const std::string& component,
                                   const std::string& field, const Value& value) {
    if (mode == ResolveMode::create) {
        throw Error{ErrorKind::path_not_viable,
            "Cannot create field '" + component + "' in element " +
            element_string(field, value)};
    }
    throw Error{ErrorKind::path_not_viable,
        "Cannot use the part (" + component + ") of (" + path.dotted() +
        ") to traverse the element (" + element_string(field, value) + ")"};
}

void pad_array(Array& arr, std::size_t index, const UpdateOptions& options) {
    if (index <= arr.size()) return;
    if (index - arr.size() > options.max_array_padding) {
        throw Error{ErrorKind::bad_value,
            "can't backfill more than " + std::to_string(options.max_array_padding) +
            " elements"};
    }
    VLOG(2) << "padding array from " << arr.size() << " to " << index << " elements";
    arr.resize(index);
}

}  // anonymous namespace

// =============================================================================
// Location
// =============================================================================

auto Location::get() const -> Value* {
    if (auto* doc = parent_->get_if<Document>()) return doc->find(component_);
    if (auto* arr = parent_->get_if<Array>()) {
        auto index = try_parse_index(component_);
        if (index && *index < arr->size()) return &(*arr)[*index];
    }
    return nullptr;
}

void Location::assign(Value value, const UpdateOptions& options) {
    if (auto* doc = parent_->get_if<Document>()) {
        doc->set(component_, std::move(value));
        return;
    }
    auto* arr = parent_->get_if<Array>();
    auto index = try_parse_index(component_);
    if (!arr || !index) {
        throw Error{ErrorKind::path_not_viable,
            "Cannot create field '" + component_ + "' in element " +
            element_string(parent_field_, *parent_)};
    }
    if (*index < arr->size()) {
        (*arr)[*index] = std::move(value);
        return;
    }
    pad_array(*arr, *index, options);
    arr->push_back(std::move(value));
}

auto Location::remove() -> bool {
    if (auto* doc = parent_->get_if<Document>()) return doc->erase(component_);
    auto* target = get();
    if (!target || target->is_null()) return false;
    *target = Null{};
    return true;
}

// =============================================================================
// Resolution
// =============================================================================

auto resolve_parent(Value& document, const FieldPath& path, ResolveMode mode,
                    const UpdateOptions& options) -> std::optional<Location> {
    auto* current = &document;
    auto current_field = std::string{};

    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& component = path[i];
        const auto is_last = (i + 1 == path.size());

        if (auto* doc = current->get_if<Document>()) {
            if (is_last) return Location{*current, component, current_field};
            auto* child = doc->find(component);
            if (!child) {
                if (mode == ResolveMode::lookup) return std::nullopt;
                VLOG(2) << "creating document at '" << path.prefix(i + 1) << "'";
                child = &doc->set(component, Document{});
            }
            current = child;
        } else if (auto* arr = current->get_if<Array>()) {
            auto index = try_parse_index(component);
            if (!index) throw_not_viable(mode, path, component, current_field, *current);
            if (is_last) return Location{*current, component, current_field};
            if (*index >= arr->size()) {
                if (mode == ResolveMode::lookup) return std::nullopt;
                VLOG(2) << "creating document at '" << path.prefix(i + 1) << "'";
                pad_array(*arr, *index, options);
                arr->push_back(Document{});
            }
            current = &(*arr)[*index];
        } else {
            throw_not_viable(mode, path, component, current_field, *current);
        }
        current_field = component;
    }
    return std::nullopt;
}

auto resolve(Value& document, const FieldPath& path, ResolveMode mode,
             const UpdateOptions& options) -> Value* {
    auto location = resolve_parent(document, path, mode, options);
    if (!location) return nullptr;
    auto* target = location->get();
    if (!target && mode == ResolveMode::create) {
        location->assign(Null{}, options);
        target = location->get();
    }
    return target;
}

auto find(const Value& document, const FieldPath& path) -> const Value* {
    // Lookup mode never writes, so the cast doesn't lead to mutation.
    return resolve(const_cast<Value&>(document), path, ResolveMode::lookup);
}

}  // namespace docupdate_cpp
