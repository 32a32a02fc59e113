#pragma once

#include "../protocol.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace bridge::registry {

/// Resource callable, invoked on every read.
using ResourceHandler = std::function<protocol::ResourceContent()>;

/// Either the resource contents or the protocol error describing why the read failed.
using ReadResult = std::variant<protocol::ResourceResult, protocol::RpcError>;

/**
 * URI-keyed store of resource definitions and their handlers.
 *
 * A registered URI containing '*' is a pattern matching any URI that starts
 * with the text before the '*'. Exact matches win over patterns; among
 * patterns, the earliest registered one wins.
 */
class ResourceRegistry {
public:
    void register_resource(protocol::ResourceDefinition definition, ResourceHandler handler);
    bool unregister_resource(const std::string& uri);
    bool has_resource(const std::string& uri) const;

    std::vector<protocol::ResourceDefinition> all_resources() const;
    const protocol::ResourceDefinition* find(const std::string& uri) const;

    ReadResult read(const std::string& uri) const;

    size_t size() const { return bindings_.size(); }
    void clear();

    static bool matches_pattern(const std::string& pattern, const std::string& uri);

private:
    struct Binding {
        protocol::ResourceDefinition definition;
        ResourceHandler handler;
    };

    const Binding* find_exact(const std::string& uri) const;
    const Binding* find_handler(const std::string& uri) const;

    std::vector<Binding> bindings_;
};

} // namespace bridge::registry
