#pragma once

#include "grpcflow/package_discovery.hpp"
#include "grpcflow/types.hpp"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>
#include <memory>
#include <string>
#include <vector>

namespace grpcflow {

// Descriptors of every loaded file plus the namespace tree built from their
// services
struct LoadedProto {
    std::shared_ptr<google::protobuf::DescriptorPool> pool;
    std::shared_ptr<PackageNode> root;
};

class ProtoLoader {
public:
    virtual ~ProtoLoader() = default;

    static std::unique_ptr<ProtoLoader> create();

    // Load serialized FileDescriptorSet files, as written by
    // protoc --descriptor_set_out --include_imports.
    // Throws InvalidProtoDefinitionError naming the offending path.
    virtual LoadedProto load(const std::vector<std::string>& descriptor_set_paths) = 0;

    // Load in-memory file descriptors. Files may come in any order but every
    // import must be among them; duplicates by name are loaded once.
    virtual LoadedProto load_files(const std::vector<google::protobuf::FileDescriptorProto>& files) = 0;

    // Parse .proto sources and their imports. Imports are resolved against
    // include_dirs first, then against the directory of each path.
    // Throws InvalidProtoDefinitionError with the parser's messages.
    virtual LoadedProto load_proto_files(const std::vector<std::string>& paths,
                                         const std::vector<std::string>& include_dirs) = 0;

    // Files of one descriptor set, throws InvalidProtoDefinitionError
    virtual std::vector<google::protobuf::FileDescriptorProto> read_descriptor_set(const std::string& path) = 0;

    // Parsed .proto files with every transitive import, dependencies first
    virtual std::vector<google::protobuf::FileDescriptorProto> read_proto_files(
        const std::vector<std::string>& paths, const std::vector<std::string>& include_dirs) = 0;
};

// Generic definition of one service descriptor
ServiceDefinition service_definition_from_descriptor(const google::protobuf::ServiceDescriptor& service);

// "SayHello" -> "sayHello", "say_hello" -> "sayHello"
std::string to_original_name(const std::string& method_name);

} // namespace grpcflow
