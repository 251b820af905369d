#include <toolhost/registry/tool.hpp>

#include <set>

namespace toolhost {

namespace {

Error MakeSpecError(const std::string& origin, const std::string& message) {
    return Error::Make(ErrorCategory::Load, "Tool::FromSpec",
                       origin + ": " + message);
}

} // anonymous namespace

Result<Tool, Error> Tool::FromSpec(ToolSpec spec, std::string origin,
                                   std::shared_ptr<const void> library) {
    if (spec.name.empty()) {
        return Result<Tool, Error>::Err(MakeSpecError(origin, "tool name is empty"));
    }
    if (!spec.function) {
        return Result<Tool, Error>::Err(
            MakeSpecError(origin, "tool '" + spec.name + "' has no function"));
    }
    if (spec.description.empty()) {
        return Result<Tool, Error>::Err(
            MakeSpecError(origin, "tool '" + spec.name + "' must have a description"));
    }

    Tool tool;
    std::set<std::string> seen;
    for (auto& param : spec.parameters) {
        if (param.name.empty()) {
            return Result<Tool, Error>::Err(MakeSpecError(
                origin, "tool '" + spec.name + "' declares an unnamed parameter"));
        }
        if (!seen.insert(param.name).second) {
            return Result<Tool, Error>::Err(MakeSpecError(
                origin, "tool '" + spec.name + "' declares parameter '" +
                            param.name + "' twice"));
        }
        if (param.name == kInjectedRegistryParam) {
            tool.needs_registry_ = true;
            continue;
        }
        if (param.type.empty()) {
            param.type = "any";
        }
        tool.parameters_.push_back(std::move(param));
    }

    tool.library_ = std::move(library);
    tool.name_ = std::move(spec.name);
    tool.description_ = std::move(spec.description);
    tool.origin_ = std::move(origin);
    tool.function_ = std::move(spec.function);
    return Result<Tool, Error>::Ok(std::move(tool));
}

nlohmann::json Tool::Definition() const {
    nlohmann::json args = nlohmann::json::array();
    for (const auto& param : parameters_) {
        args.push_back({
            {"name", param.name},
            {"type", param.type},
            {"description", param.description},
            {"required", param.required},
        });
    }
    return {
        {"name", name_},
        {"description", description_},
        {"args_list", std::move(args)},
    };
}

} // namespace toolhost
