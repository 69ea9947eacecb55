#pragma once

#include "grpcflow/call_adapters.hpp"
#include "grpcflow/package_discovery.hpp"
#include "grpcflow/pattern_registry.hpp"
#include "grpcflow/types.hpp"
#include <map>
#include <string>
#include <vector>

namespace grpcflow {

struct BoundMethod {
    MethodDescriptor descriptor;
    PatternKey pattern;          // Key the handler was found under
    AdapterKind adapter_kind;
    MethodAdapter adapter;
};

struct ServiceBinding {
    std::string name;
    ServiceDefinition definition;
    std::map<std::string, BoundMethod> methods;   // Keyed by wire method name
};

// Resolves the methods of loaded services against the pattern registry and
// wraps each matched handler in its call adapter.
//
// Lookup order per method: a request-streaming method tries the reactive
// key before the pass-through key, a unary-request method tries the
// no_stream key. When nothing matches and the method has a distinct
// lowerCamelCase name, the lookup is repeated with that name keeping the
// streaming kind already chosen. Methods that still do not match are left
// unbound.
class ServiceBinder {
public:
    explicit ServiceBinder(const PatternRegistry& registry, bool legacy_cancel_detection = false);

    ServiceBinding create_service(const ServiceDefinition& definition, const std::string& name) const;

    // Bind every service below a package node. Throws InvalidPackageError
    // when package is null.
    std::vector<ServiceBinding> create_services(const PackageNode* package,
                                                const std::string& package_name) const;

    static PatternKey create_pattern(const std::string& service, const std::string& rpc,
                                     StreamingKind streaming);

    static AdapterKind select_adapter(const MethodDescriptor& method, StreamingKind matched);

private:
    // Throws BindingError when the handler shape does not fit the adapter
    MethodAdapter create_service_method(const MessageHandler& handler,
                                        const MethodDescriptor& method,
                                        AdapterKind kind) const;

    const PatternRegistry& registry_;
    bool legacy_cancel_detection_;
};

} // namespace grpcflow
