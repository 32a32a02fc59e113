#include "resource_registry.hpp"

#include "../logger.hpp"

#include <algorithm>

#include <log4cplus/loggingmacros.h>

namespace bridge::registry {

using protocol::RpcError;
namespace error_code = protocol::error_code;

void ResourceRegistry::register_resource(protocol::ResourceDefinition definition, ResourceHandler handler) {
    if (definition.uri.empty()) {
        LOG4CPLUS_ERROR(registry_logger(), "Cannot register resource without a URI");
        return;
    }
    if (!handler) {
        LOG4CPLUS_ERROR(registry_logger(), "Cannot register resource '" << definition.uri << "' without a handler");
        return;
    }

    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& binding) { return binding.definition.uri == definition.uri; });
    if (it != bindings_.end()) {
        it->definition = std::move(definition);
        it->handler = std::move(handler);
        return;
    }

    LOG4CPLUS_DEBUG(registry_logger(), "Registered resource: " << definition.uri);
    bindings_.push_back({std::move(definition), std::move(handler)});
}

bool ResourceRegistry::unregister_resource(const std::string& uri) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& binding) { return binding.definition.uri == uri; });
    if (uri.empty() || it == bindings_.end()) {
        return false;
    }
    bindings_.erase(it);
    LOG4CPLUS_DEBUG(registry_logger(), "Unregistered resource: " << uri);
    return true;
}

bool ResourceRegistry::has_resource(const std::string& uri) const {
    return find_exact(uri) != nullptr;
}

std::vector<protocol::ResourceDefinition> ResourceRegistry::all_resources() const {
    std::vector<protocol::ResourceDefinition> resources;
    resources.reserve(bindings_.size());
    for (const auto& binding : bindings_) {
        resources.push_back(binding.definition);
    }
    return resources;
}

const protocol::ResourceDefinition* ResourceRegistry::find(const std::string& uri) const {
    const Binding* binding = find_exact(uri);
    return binding ? &binding->definition : nullptr;
}

const ResourceRegistry::Binding* ResourceRegistry::find_exact(const std::string& uri) const {
    if (uri.empty()) {
        return nullptr;
    }
    for (const auto& binding : bindings_) {
        if (binding.definition.uri == uri) {
            return &binding;
        }
    }
    return nullptr;
}

const ResourceRegistry::Binding* ResourceRegistry::find_handler(const std::string& uri) const {
    if (const Binding* exact = find_exact(uri)) {
        return exact;
    }
    for (const auto& binding : bindings_) {
        if (matches_pattern(binding.definition.uri, uri)) {
            return &binding;
        }
    }
    return nullptr;
}

bool ResourceRegistry::matches_pattern(const std::string& pattern, const std::string& uri) {
    auto star = pattern.find('*');
    if (star == std::string::npos) {
        return false;
    }
    return uri.size() >= star && uri.compare(0, star, pattern, 0, star) == 0;
}

ReadResult ResourceRegistry::read(const std::string& uri) const {
    if (uri.empty()) {
        return RpcError{error_code::INVALID_PARAMS, "Resource URI is required", {}};
    }

    const Binding* binding = find_handler(uri);
    if (!binding) {
        LOG4CPLUS_WARN(registry_logger(), "Resource not found: " << uri);
        return RpcError{error_code::RESOURCE_NOT_FOUND, "Resource not found: " + uri, {}};
    }

    try {
        LOG4CPLUS_DEBUG(registry_logger(), "Reading resource: " << uri);
        protocol::ResourceContent content = binding->handler();
        if (content.uri.empty()) {
            content.uri = uri;
        }
        protocol::ResourceResult result;
        result.contents.push_back(std::move(content));
        return result;
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(registry_logger(), "Resource read error for '" << uri << "': " << exc.what());
        return RpcError{error_code::EXECUTION_ERROR, std::string("Failed to read resource: ") + exc.what(), {}};
    } catch (...) {
        LOG4CPLUS_ERROR(registry_logger(), "Resource read error for '" << uri << "': unknown exception");
        return RpcError{error_code::EXECUTION_ERROR, "Failed to read resource: unknown exception", {}};
    }
}

void ResourceRegistry::clear() {
    bindings_.clear();
    LOG4CPLUS_INFO(registry_logger(), "Cleared all resources");
}

} // namespace bridge::registry
