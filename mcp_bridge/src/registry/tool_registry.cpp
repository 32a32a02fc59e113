#include "tool_registry.hpp"

#include "../logger.hpp"

#include <algorithm>
#include <sstream>

#include <log4cplus/loggingmacros.h>

namespace bridge::registry {

void ToolRegistry::register_tool(protocol::ToolDefinition definition, ToolHandler handler) {
    if (definition.name.empty()) {
        LOG4CPLUS_ERROR(registry_logger(), "Cannot register tool without a name");
        return;
    }
    if (!handler) {
        LOG4CPLUS_ERROR(registry_logger(), "Cannot register tool '" << definition.name << "' without a handler");
        return;
    }

    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& binding) { return binding.definition.name == definition.name; });
    if (it != bindings_.end()) {
        LOG4CPLUS_DEBUG(registry_logger(), "Replacing tool: " << definition.name);
        it->definition = std::move(definition);
        it->handler = std::move(handler);
        return;
    }

    LOG4CPLUS_DEBUG(registry_logger(), "Registered tool: " << definition.name);
    bindings_.push_back({std::move(definition), std::move(handler)});
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    if (name.empty()) {
        return false;
    }

    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& binding) { return binding.definition.name == name; });
    if (it == bindings_.end()) {
        return false;
    }
    bindings_.erase(it);
    LOG4CPLUS_DEBUG(registry_logger(), "Unregistered tool: " << name);
    return true;
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return find_binding(name) != nullptr;
}

std::vector<protocol::ToolDefinition> ToolRegistry::all_tools() const {
    std::vector<protocol::ToolDefinition> tools;
    tools.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        tools.push_back(binding.definition);
    }
    return tools;
}

const protocol::ToolDefinition* ToolRegistry::find(const std::string& name) const {
    const Binding* binding = find_binding(name);
    return binding ? &binding->definition : nullptr;
}

const ToolRegistry::Binding* ToolRegistry::find_binding(const std::string& name) const {
    if (name.empty()) {
        return nullptr;
    }
    for (const auto& binding : bindings_) {
        if (binding.definition.name == name) {
            return &binding;
        }
    }
    return nullptr;
}

std::string ToolRegistry::validate_arguments(const protocol::ToolDefinition& definition,
                                             const json::Value& arguments) {
    for (const auto& required : definition.input_schema.required) {
        const json::Value* value = arguments.find(required);
        if (!value || value->is_null()) {
            return "Missing required argument: " + required;
        }
    }
    return "";
}

protocol::ToolResult ToolRegistry::execute(const std::string& name, const json::Value& arguments) const {
    if (name.empty()) {
        return protocol::ToolResult::error("Tool name is required");
    }

    const Binding* binding = find_binding(name);
    if (!binding) {
        LOG4CPLUS_WARN(registry_logger(), "Tool not found: " << name);
        return protocol::ToolResult::error("Tool not found: " + name);
    }

    const json::Value args = arguments.is_object() ? arguments : json::Value::object();

    std::string validation_error = validate_arguments(binding->definition, args);
    if (!validation_error.empty()) {
        LOG4CPLUS_WARN(registry_logger(), name << ": " << validation_error);
        return protocol::ToolResult::error(validation_error);
    }

    try {
        LOG4CPLUS_DEBUG(registry_logger(), "Executing tool: " << name);
        return binding->handler(args);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(registry_logger(), "Tool execution error for '" << name << "': " << exc.what());
        return protocol::ToolResult::error(std::string("Tool execution failed: ") + exc.what());
    } catch (...) {
        LOG4CPLUS_ERROR(registry_logger(), "Tool execution error for '" << name << "': unknown exception");
        return protocol::ToolResult::error("Tool execution failed: unknown exception");
    }
}

void ToolRegistry::clear() {
    bindings_.clear();
    LOG4CPLUS_INFO(registry_logger(), "Cleared all tools");
}

std::string ToolRegistry::debug_listing() const {
    std::vector<const protocol::ToolDefinition*> sorted;
    for (const auto& binding : bindings_) {
        sorted.push_back(&binding.definition);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const auto* lhs, const auto* rhs) { return lhs->name < rhs->name; });

    std::ostringstream out;
    out << "Registered tools (" << sorted.size() << "):\n\n";
    for (const auto* tool : sorted) {
        out << "  - " << tool->name << "\n";
        out << "    " << tool->description << "\n";
        const auto& required = tool->input_schema.required;
        if (!required.empty()) {
            out << "    Required: ";
            for (size_t i = 0; i < required.size(); ++i) {
                out << (i ? ", " : "") << required[i];
            }
            out << "\n";
        }
        out << "\n";
    }
    return out.str();
}

} // namespace bridge::registry
