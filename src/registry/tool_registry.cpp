#include <toolhost/registry/tool_registry.hpp>

#include <toolhost/core/log.hpp>

namespace toolhost {

std::shared_ptr<const ToolRegistry> ToolRegistry::Empty() {
    return ToolRegistryBuilder().Build();
}

const Tool* ToolRegistry::Find(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return tools_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json ToolRegistry::Catalog() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& [name, tool] : tools_) {
        tools.push_back(tool.Definition());
    }
    return tools;
}

// ---------------------------------------------------------------------------
// ToolRegistryBuilder
// ---------------------------------------------------------------------------
ToolRegistryBuilder::ToolRegistryBuilder(std::uint64_t version)
    // ToolRegistry's constructor is private; make_shared cannot reach it.
    : registry_(new ToolRegistry()) {
    registry_->version_ = version;
}

void ToolRegistryBuilder::Add(Tool tool) {
    auto it = registry_->tools_.find(tool.Name());
    if (it != registry_->tools_.end()) {
        auto note = "tool '" + tool.Name() + "' from " + tool.Origin() +
                    " replaces the one from " + it->second.Origin();
        LogWarn("registry", note);
        replaced_.push_back(std::move(note));
        // Erase rather than assign: destruction drops the function before
        // the library that holds its code.
        registry_->tools_.erase(it);
    }
    auto name = tool.Name();
    registry_->tools_.emplace(std::move(name), std::move(tool));
}

std::shared_ptr<const ToolRegistry> ToolRegistryBuilder::Build() && {
    return std::move(registry_);
}

} // namespace toolhost
