#pragma once

#include <google/protobuf/descriptor.pb.h>
#include <string>

namespace grpcflow::test_support {

// greet.proto of the greeter example, built in code
inline google::protobuf::FileDescriptorProto greet_file_descriptor() {
    using google::protobuf::FieldDescriptorProto;

    google::protobuf::FileDescriptorProto file;
    file.set_name("greet.proto");
    file.set_package("greet");
    file.set_syntax("proto3");

    auto add_string_field = [](google::protobuf::DescriptorProto* message, const std::string& name, int number) {
        auto* field = message->add_field();
        field->set_name(name);
        field->set_number(number);
        field->set_type(FieldDescriptorProto::TYPE_STRING);
        field->set_label(FieldDescriptorProto::LABEL_OPTIONAL);
    };

    auto* request = file.add_message_type();
    request->set_name("GreetRequest");
    add_string_field(request, "to", 1);

    auto* response = file.add_message_type();
    response->set_name("GreetResponse");
    add_string_field(response, "from", 1);
    add_string_field(response, "reply", 2);

    auto* service = file.add_service();
    service->set_name("GreetService");
    auto add_method = [service](const std::string& name, bool client_streaming, bool server_streaming) {
        auto* method = service->add_method();
        method->set_name(name);
        method->set_input_type(".greet.GreetRequest");
        method->set_output_type(".greet.GreetResponse");
        method->set_client_streaming(client_streaming);
        method->set_server_streaming(server_streaming);
    };
    add_method("Hello", false, false);
    add_method("Hi", false, false);
    add_method("HelloStream", false, true);
    add_method("CollectGreetings", true, false);
    add_method("Chat", true, true);

    return file;
}

} // namespace grpcflow::test_support
