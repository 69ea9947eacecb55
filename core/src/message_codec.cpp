#include "grpcflow/message_codec.hpp"
#include "grpcflow/errors.hpp"
#include <google/protobuf/util/json_util.h>
#include <grpcpp/support/slice.h>
#include <glog/logging.h>
#include <vector>

namespace grpcflow {

MessageCodec::MessageCodec(std::shared_ptr<const google::protobuf::DescriptorPool> pool)
    : pool_(std::move(pool)), factory_(pool_.get()) {}

const google::protobuf::Descriptor* MessageCodec::find_type(const std::string& type_name) const {
    const auto* descriptor = pool_->FindMessageTypeByName(type_name);
    if (!descriptor) {
        throw RpcException(grpc::StatusCode::INTERNAL, "Unknown message type: " + type_name);
    }
    return descriptor;
}

Value MessageCodec::decode(const std::string& type_name, const grpc::ByteBuffer& buffer) {
    const auto* descriptor = find_type(type_name);

    std::vector<grpc::Slice> slices;
    auto dump_status = buffer.Dump(&slices);
    if (!dump_status.ok()) {
        throw RpcException(grpc::StatusCode::INTERNAL, "Cannot read request: " + dump_status.error_message());
    }
    std::string serialized;
    for (const auto& slice : slices) {
        serialized.append(reinterpret_cast<const char*>(slice.begin()), slice.size());
    }

    std::unique_ptr<google::protobuf::Message> message(factory_.GetPrototype(descriptor)->New());
    if (!message->ParseFromString(serialized)) {
        throw RpcException(grpc::StatusCode::INVALID_ARGUMENT, "Failed to parse " + type_name);
    }

    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = false;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json_output;
    auto json_status = google::protobuf::util::MessageToJsonString(*message, &json_output, options);
    if (!json_status.ok()) {
        throw RpcException(grpc::StatusCode::INTERNAL,
                           "Failed to convert " + type_name + " to JSON: " + std::string(json_status.message()));
    }
    return Value::parse(json_output);
}

grpc::ByteBuffer MessageCodec::encode(const std::string& type_name, const Value& value) {
    const auto* descriptor = find_type(type_name);

    std::unique_ptr<google::protobuf::Message> message(factory_.GetPrototype(descriptor)->New());
    const std::string json_input = value.is_null() ? "{}" : value.dump();
    auto json_status = google::protobuf::util::JsonStringToMessage(json_input, message.get());
    if (!json_status.ok()) {
        LOG(WARNING) << "Response does not match " << type_name << ": " << json_input;
        throw RpcException(grpc::StatusCode::INTERNAL,
                           "Invalid " + type_name + " response: " + std::string(json_status.message()));
    }

    std::string serialized;
    if (!message->SerializeToString(&serialized)) {
        throw RpcException(grpc::StatusCode::INTERNAL, "Failed to serialize " + type_name);
    }
    grpc::Slice slice(serialized);
    return grpc::ByteBuffer(&slice, 1);
}

} // namespace grpcflow
