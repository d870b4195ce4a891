#include <docupdate-cpp/update_applier.hpp>

#include <docupdate-cpp/error.hpp>
#include <docupdate-cpp/field_path.hpp>
#include <docupdate-cpp/path_resolver.hpp>

#include <glog/logging.h>

#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace docupdate_cpp {

namespace {

// A modification whose operator and path have been checked.
struct PreparedModification {
    const UpdateOperator* op;
    FieldPath path;
    const Value* operand;
};

void check_conflicts(const std::vector<PreparedModification>& prepared) {
    for (std::size_t i = 1; i < prepared.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            const auto& later = prepared[i].path;
            const auto& earlier = prepared[j].path;
            if (earlier.is_prefix_of(later) || later.is_prefix_of(earlier)) {
                const auto& shorter = earlier.size() <= later.size() ? earlier : later;
                throw Error{ErrorKind::conflicting_update_operators,
                    "Updating the path '" + later.dotted() +
                    "' would create a conflict at '" + shorter.dotted() + "'"};
            }
        }
    }
}

}  // anonymous namespace

UpdateApplier::UpdateApplier() : UpdateApplier{UpdateOptions{}} {}

UpdateApplier::UpdateApplier(UpdateOptions options)
    : UpdateApplier{options, default_registry()} {}

UpdateApplier::UpdateApplier(UpdateOptions options,
                             std::shared_ptr<const OperatorRegistry> registry)
    : options_{options}, registry_{std::move(registry)} {
    if (!registry_) throw std::invalid_argument{"operator registry must not be null"};
}

void UpdateApplier::validate(const UpdateSpec& spec) const {
    // Operator names are checked before anything else.
    for (const auto& m : spec) {
        if (!registry_->contains(m.op)) {
            throw Error{ErrorKind::failed_to_parse,
                "Unknown modifier: " + m.op +
                ". Expected a valid update modifier or pipeline-style update "
                "specified as an array"};
        }
    }

    auto prepared = std::vector<PreparedModification>{};
    prepared.reserve(spec.size());
    for (const auto& m : spec) {
        const auto* op = registry_->find(m.op);
        auto path = FieldPath{m.path};
        op->validate(path, m.operand);
        prepared.push_back(PreparedModification{op, std::move(path), &m.operand});
    }
    check_conflicts(prepared);
}

auto UpdateApplier::apply(Value& document, const UpdateSpec& spec) const -> UpdateResult {
    if (!document.is_document()) {
        throw Error{ErrorKind::bad_value,
            "Update target must be an object, not " +
            std::string{to_string_view(document.type())}};
    }

    try {
        validate(spec);
    } catch (const Error& e) {
        VLOG(1) << "update rejected before application: " << e.what();
        throw;
    }

    auto& root = *document.get_if<Document>();
    auto original_id = std::optional<Value>{};
    if (const auto* id = root.find("_id")) original_id = *id;

    auto result = UpdateResult{};
    for (const auto& m : spec) {
        const auto* op = registry_->find(m.op);
        auto path = FieldPath{m.path};
        auto changed = false;

        try {
            auto location = resolve_parent(document, path, op->mode(), options_);
            if (location) {
                // Re-read '_id' each time: an earlier modification may have set it.
                const auto* id = root.find("_id");
                auto id_copy = id ? std::optional<Value>{*id} : std::nullopt;
                auto ctx = UpdateContext{path, m.operand, id_copy ? &*id_copy : nullptr, options_};
                changed = op->apply(*location, ctx);
            }
        } catch (const Error& e) {
            VLOG(1) << m.op << " on '" << m.path << "' failed: " << e.what();
            throw;
        }

        VLOG(1) << m.op << " on '" << m.path << "': " << (changed ? "changed" : "unchanged");
        if (changed) result.modified_count = 1;
    }

    if (options_.protect_id && original_id) {
        const auto* id = root.find("_id");
        if (!id || !(*id == *original_id)) {
            throw Error{ErrorKind::immutable_field,
                "Performing an update on the path '_id' would modify the immutable field '_id'"};
        }
    }
    return result;
}

}  // namespace docupdate_cpp
