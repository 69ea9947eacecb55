#pragma once

#include "grpcflow/types.hpp"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/dynamic_message.h>
#include <grpcpp/support/byte_buffer.h>
#include <memory>
#include <string>

namespace grpcflow {

// Converts between serialized messages on the wire and handler values.
//
// JSON field names are the proto field names and primitive fields are
// always present. Not thread safe; used from the event loop only.
class MessageCodec {
public:
    explicit MessageCodec(std::shared_ptr<const google::protobuf::DescriptorPool> pool);

    // Throws RpcException(INVALID_ARGUMENT) when the bytes do not parse
    Value decode(const std::string& type_name, const grpc::ByteBuffer& buffer);

    // Throws RpcException(INTERNAL) when the value does not fit the type.
    // A null value encodes the empty message.
    grpc::ByteBuffer encode(const std::string& type_name, const Value& value);

private:
    const google::protobuf::Descriptor* find_type(const std::string& type_name) const;

    std::shared_ptr<const google::protobuf::DescriptorPool> pool_;
    google::protobuf::DynamicMessageFactory factory_;
};

} // namespace grpcflow
