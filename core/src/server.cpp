#include "grpcflow/server.hpp"
#include "grpcflow/errors.hpp"
#include "generic_service.hpp"
#include <grpc/grpc.h>
#include <grpcpp/security/server_credentials.h>
#include <grpcpp/server_builder.h>
#include <glog/logging.h>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <variant>

namespace grpcflow {

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open credentials file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

Server::Server(ServerOptions options, std::unique_ptr<ProtoLoader> loader)
    : options_(std::move(options)), loader_(std::move(loader)) {}

Server::~Server() {
    close();
}

void Server::add_file_descriptors(std::vector<google::protobuf::FileDescriptorProto> files) {
    for (auto& file : files) {
        extra_files_.push_back(std::move(file));
    }
}

void Server::add_service_definition(const std::string& name, ServiceDefinition definition) {
    extra_services_.emplace_back(name, std::move(definition));
}

void Server::listen(ListenCallback callback) {
    try {
        start();
    } catch (...) {
        auto error = std::current_exception();
        LOG(ERROR) << "Failed to start server on " << options_.url << ": " << describe_exception(error);
        if (!callback) {
            throw;
        }
        callback(error);
        return;
    }
    if (callback) {
        callback(nullptr);
    }
}

void Server::bind_events() {
    std::vector<google::protobuf::FileDescriptorProto> files = extra_files_;
    for (const auto& path : options_.descriptor_sets) {
        auto set_files = loader_->read_descriptor_set(path);
        files.insert(files.end(), set_files.begin(), set_files.end());
    }
    if (!options_.proto_path.empty()) {
        auto proto_files = loader_->read_proto_files(options_.proto_path, options_.include_dirs);
        files.insert(files.end(), proto_files.begin(), proto_files.end());
    }
    loaded_ = loader_->load_files(files);
    codec_ = std::make_shared<MessageCodec>(loaded_.pool);

    ServiceBinder binder(registry_, options_.legacy_cancel_detection);
    bindings_.clear();
    for (const auto& package_name : options_.packages) {
        const auto* package = lookup_package(loaded_.root.get(), package_name);
        auto package_bindings = binder.create_services(package, package_name);
        bindings_.insert(bindings_.end(), package_bindings.begin(), package_bindings.end());
    }
    for (const auto& [name, definition] : extra_services_) {
        bindings_.push_back(binder.create_service(definition, name));
    }

    std::size_t method_count = 0;
    for (const auto& binding : bindings_) {
        method_count += binding.methods.size();
    }
    LOG(INFO) << "Bound " << method_count << " methods in " << bindings_.size() << " services ("
              << registry_.size() << " registered handlers)";
}

void Server::start() {
    if (is_running()) {
        throw std::runtime_error("Server is already listening on " + options_.url);
    }
    // A closed server is rebuilt from scratch; the service must outlive it
    server_.reset();
    service_.reset();
    bound_port_ = 0;
    auto credentials = create_credentials();
    bind_events();

    loop_.start();
    service_ = std::make_unique<GenericService>(loop_, codec_, options_.write_high_watermark);
    service_->install(bindings_);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(options_.url, credentials, &bound_port_);
    if (options_.max_send_message_length) {
        builder.SetMaxSendMessageSize(*options_.max_send_message_length);
    }
    if (options_.max_receive_message_length) {
        builder.SetMaxReceiveMessageSize(*options_.max_receive_message_length);
    }
    if (options_.max_metadata_size) {
        builder.AddChannelArgument(GRPC_ARG_MAX_METADATA_SIZE, *options_.max_metadata_size);
    }
    for (const auto& [key, value] : options_.channel_options) {
        std::visit([&builder, &key](const auto& argument) { builder.AddChannelArgument(key, argument); },
                   value);
    }
    builder.RegisterCallbackGenericService(service_.get());

    server_ = builder.BuildAndStart();
    if (!server_ || bound_port_ == 0) {
        server_.reset();
        loop_.stop();
        throw std::runtime_error("Failed to bind " + options_.url);
    }
    closed_ = false;
    LOG(INFO) << "gRPC server listening on " << options_.url << " (port " << bound_port_ << ")";
}

void Server::close() {
    if (!server_ || closed_) {
        return;
    }
    closed_ = true;

    if (options_.graceful_shutdown) {
        LOG(INFO) << "Shutting down gracefully...";
        server_->Shutdown();
    } else {
        LOG(INFO) << "Shutting down...";
        server_->Shutdown(std::chrono::system_clock::now());
    }
    // Calls finish on the loop, so it stops only after gRPC is done
    loop_.stop();
    LOG(INFO) << "Server stopped";
}

void Server::wait() {
    if (server_) {
        server_->Wait();
    }
}

std::shared_ptr<grpc::ServerCredentials> Server::create_credentials() const {
    const auto& credentials = options_.credentials;
    if (!credentials.enabled()) {
        return grpc::InsecureServerCredentials();
    }
    if (!credentials.cert_chain || !credentials.private_key) {
        throw std::runtime_error("TLS needs both cert_chain and private_key");
    }

    grpc::SslServerCredentialsOptions ssl_options;
    if (credentials.root_certs) {
        ssl_options.pem_root_certs = read_file(*credentials.root_certs);
        ssl_options.client_certificate_request =
            GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;
    }
    grpc::SslServerCredentialsOptions::PemKeyCertPair pair;
    pair.private_key = read_file(*credentials.private_key);
    pair.cert_chain = read_file(*credentials.cert_chain);
    ssl_options.pem_key_cert_pairs.push_back(pair);
    LOG(INFO) << "Using TLS credentials from " << *credentials.cert_chain;
    return grpc::SslServerCredentials(ssl_options);
}

} // namespace grpcflow
