#pragma once

#include "grpcflow/config.hpp"
#include "grpcflow/event_loop.hpp"
#include "grpcflow/message_codec.hpp"
#include "grpcflow/pattern_registry.hpp"
#include "grpcflow/proto_loader.hpp"
#include "grpcflow/service_binder.hpp"
#include <google/protobuf/descriptor.pb.h>
#include <grpcpp/server.h>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace grpcflow {

class GenericService;

/// gRPC server dispatching loaded services to registered handlers.
///
/// Register handlers on registry() and provide descriptors (descriptor set
/// files or .proto sources in the options, or add_file_descriptors()), then
/// listen(). A closed server may listen again. Every
/// configured package is bound, followed by the service definitions added
/// with add_service_definition().
class Server {
public:
    using ListenCallback = std::function<void(std::exception_ptr error)>;

    explicit Server(ServerOptions options, std::unique_ptr<ProtoLoader> loader = ProtoLoader::create());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    PatternRegistry& registry() { return registry_; }
    const ServerOptions& options() const { return options_; }

    void add_file_descriptors(std::vector<google::protobuf::FileDescriptorProto> files);

    // Bind a service definition under name in addition to the packages.
    // Its message types must be among the loaded descriptors.
    void add_service_definition(const std::string& name, ServiceDefinition definition);

    // Bind and start. Start errors go to callback when one is given and are
    // thrown otherwise. Throws std::runtime_error while already running.
    void listen(ListenCallback callback = {});

    // Load descriptors and bind every configured service. Throws
    // BindingError subclasses.
    void bind_events();

    // Stop accepting calls and shut down. Graceful shutdown waits for
    // in-flight calls, otherwise they are cancelled. Safe to call twice.
    void close();

    // Block until the server is shut down
    void wait();

    bool is_running() const { return server_ != nullptr && !closed_; }

    // Port actually bound, 0 before listen()
    int bound_port() const { return bound_port_; }

    const std::vector<ServiceBinding>& bindings() const { return bindings_; }

private:
    void start();
    std::shared_ptr<grpc::ServerCredentials> create_credentials() const;

    ServerOptions options_;
    std::unique_ptr<ProtoLoader> loader_;
    PatternRegistry registry_;

    std::vector<google::protobuf::FileDescriptorProto> extra_files_;
    std::vector<std::pair<std::string, ServiceDefinition>> extra_services_;

    LoadedProto loaded_;
    std::shared_ptr<MessageCodec> codec_;
    std::vector<ServiceBinding> bindings_;

    EventLoop loop_;
    std::unique_ptr<GenericService> service_;
    std::unique_ptr<grpc::Server> server_;
    int bound_port_ = 0;
    bool closed_ = false;
};

} // namespace grpcflow
