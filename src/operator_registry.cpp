#include <docupdate-cpp/operators.hpp>
#include <docupdate-cpp/update_operator.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace docupdate_cpp {

void OperatorRegistry::add(std::unique_ptr<UpdateOperator> op) {
    auto name = std::string{op->name()};
    operators_.insert_or_assign(std::move(name), std::move(op));
}

auto OperatorRegistry::find(std::string_view name) const -> const UpdateOperator* {
    auto it = operators_.find(name);
    return it != operators_.end() ? it->second.get() : nullptr;
}

auto OperatorRegistry::names() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(operators_.size());
    for (const auto& [name, op] : operators_) result.push_back(name);
    return result;
}

auto OperatorRegistry::builtin() -> OperatorRegistry {
    auto registry = OperatorRegistry{};
    registry.add(std::make_unique<SetOperator>());
    registry.add(std::make_unique<UnsetOperator>());
    registry.add(std::make_unique<PopOperator>());
    registry.add(std::make_unique<IncOperator>());
    registry.add(std::make_unique<MulOperator>());
    registry.add(std::make_unique<MinMaxOperator>(false));
    registry.add(std::make_unique<MinMaxOperator>(true));
    registry.add(std::make_unique<PushOperator>(false));
    registry.add(std::make_unique<PushOperator>(true));
    registry.add(std::make_unique<PullAllOperator>());
    return registry;
}

auto default_registry() -> std::shared_ptr<const OperatorRegistry> {
    static const auto registry =
        std::make_shared<const OperatorRegistry>(OperatorRegistry::builtin());
    return registry;
}

}  // namespace docupdate_cpp
