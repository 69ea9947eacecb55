#include "grpcflow/service_binder.hpp"
#include "grpcflow/errors.hpp"
#include <glog/logging.h>

namespace grpcflow {

ServiceBinder::ServiceBinder(const PatternRegistry& registry, bool legacy_cancel_detection)
    : registry_(registry), legacy_cancel_detection_(legacy_cancel_detection) {}

PatternKey ServiceBinder::create_pattern(const std::string& service, const std::string& rpc,
                                         StreamingKind streaming) {
    return PatternKey{service, rpc, streaming};
}

AdapterKind ServiceBinder::select_adapter(const MethodDescriptor& method, StreamingKind matched) {
    if (method.request_streaming) {
        return matched == StreamingKind::REQUEST_ONLY ? AdapterKind::CLIENT_STREAM_PASSTHROUGH
                                                      : AdapterKind::CLIENT_STREAM_REACTIVE;
    }
    return method.response_streaming ? AdapterKind::SERVER_STREAM : AdapterKind::UNARY;
}

ServiceBinding ServiceBinder::create_service(const ServiceDefinition& definition,
                                             const std::string& name) const {
    ServiceBinding binding;
    binding.name = name;
    binding.definition = definition;

    for (const auto& [method_name, method] : definition.methods) {
        StreamingKind streaming = StreamingKind::NONE;
        PatternKey pattern = create_pattern(name, method_name, StreamingKind::NONE);
        PatternRegistry::HandlerPtr handler;

        if (method.request_streaming) {
            pattern = create_pattern(name, method_name, StreamingKind::REQUEST_RESPONSE_PUSH);
            handler = registry_.get_handler(pattern);
            streaming = StreamingKind::REQUEST_RESPONSE_PUSH;
            if (!handler) {
                pattern = create_pattern(name, method_name, StreamingKind::REQUEST_ONLY);
                handler = registry_.get_handler(pattern);
                streaming = StreamingKind::REQUEST_ONLY;
            }
        } else {
            handler = registry_.get_handler(pattern);
        }

        if (!handler && !method.original_name.empty() && method.original_name != method_name) {
            pattern = create_pattern(name, method.original_name, streaming);
            handler = registry_.get_handler(pattern);
        }

        if (!handler) {
            VLOG(1) << "No handler for " << name << "." << method_name << ", skipping";
            continue;
        }

        const AdapterKind kind = select_adapter(method, streaming);
        BoundMethod bound{method, pattern, kind, create_service_method(*handler, method, kind)};
        binding.methods.emplace(method_name, std::move(bound));
        LOG(INFO) << "Bound " << method.path << " -> " << pattern.to_string() << " (" << to_string(kind) << ")";
    }

    return binding;
}

std::vector<ServiceBinding> ServiceBinder::create_services(const PackageNode* package,
                                                           const std::string& package_name) const {
    if (!package) {
        LOG(ERROR) << "Package " << package_name << " not found in loaded definitions";
        throw InvalidPackageError(package_name);
    }

    std::vector<ServiceBinding> bindings;
    for (const auto& named : get_service_names(package)) {
        bindings.push_back(create_service(*named.service, named.name));
    }
    return bindings;
}

MethodAdapter ServiceBinder::create_service_method(const MessageHandler& handler,
                                                   const MethodDescriptor& method,
                                                   AdapterKind kind) const {
    auto mismatch = [&]() {
        return BindingError(std::string("Handler for ") + method.path + " is a " + handler.shape_name() +
                            " handler, cannot bind as " + to_string(kind));
    };

    switch (kind) {
        case AdapterKind::UNARY:
            if (!handler.unary()) {
                throw mismatch();
            }
            return create_unary_service_method(*handler.unary());
        case AdapterKind::SERVER_STREAM:
            if (!handler.unary()) {
                throw mismatch();
            }
            return create_stream_service_method(*handler.unary());
        case AdapterKind::CLIENT_STREAM_REACTIVE:
            if (!handler.stream()) {
                throw mismatch();
            }
            return create_request_stream_method(*handler.stream(), method.response_streaming,
                                                legacy_cancel_detection_);
        case AdapterKind::CLIENT_STREAM_PASSTHROUGH:
            if (!handler.call()) {
                throw mismatch();
            }
            return create_stream_call_method(*handler.call(), method.response_streaming);
    }
    throw BindingError("Unknown adapter kind for " + method.path);
}

} // namespace grpcflow
