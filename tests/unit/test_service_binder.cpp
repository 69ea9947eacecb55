#include <gtest/gtest.h>
#include "fake_call.hpp"
#include "grpcflow/errors.hpp"
#include "grpcflow/service_binder.hpp"
#include <cctype>

using namespace grpcflow;
using grpcflow::test_support::CallbackRecorder;
using grpcflow::test_support::FakeCall;

class ServiceBinderTest : public ::testing::Test {
protected:
    void SetUp() override {
        definition.full_name = "greet.GreetService";
        add_method("Hello", false, false);
        add_method("HelloStream", false, true);
        add_method("CollectGreetings", true, false);
        add_method("Chat", true, true);
    }

    void add_method(const std::string& name, bool request_streaming, bool response_streaming) {
        MethodDescriptor method;
        method.method_name = name;
        method.original_name = std::string(1, static_cast<char>(std::tolower(name[0]))) + name.substr(1);
        method.path = "/greet.GreetService/" + name;
        method.request_streaming = request_streaming;
        method.response_streaming = response_streaming;
        method.request_type = "greet.GreetRequest";
        method.response_type = "greet.GreetResponse";
        definition.methods[name] = method;
    }

    static UnaryHandler unary() {
        return [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
            return Value{{"reply", "ok"}};
        };
    }

    static StreamHandler reactive() {
        return [](ValueStream requests, const Metadata&, std::shared_ptr<Call>) -> Reply {
            return requests;
        };
    }

    static CallHandler passthrough() {
        return [](std::shared_ptr<Call>, Callback) {};
    }

    PatternRegistry registry;
    ServiceDefinition definition;
};

TEST_F(ServiceBinderTest, SkipsMethodsWithoutHandlers) {
    registry.add_method("GreetService", "Hello", unary());
    ServiceBinder binder(registry);

    auto binding = binder.create_service(definition, "GreetService");

    EXPECT_EQ(binding.name, "GreetService");
    ASSERT_EQ(binding.methods.size(), 1u);
    const auto& hello = binding.methods.at("Hello");
    EXPECT_EQ(hello.adapter_kind, AdapterKind::UNARY);
    EXPECT_EQ(hello.pattern, (PatternKey{"GreetService", "Hello", StreamingKind::NONE}));
}

TEST_F(ServiceBinderTest, ServerStreamingMethodUsesNoStreamKey) {
    registry.add_method("GreetService", "HelloStream", unary());

    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    EXPECT_EQ(binding.methods.at("HelloStream").adapter_kind, AdapterKind::SERVER_STREAM);
}

TEST_F(ServiceBinderTest, RequestStreamingPrefersReactiveHandler) {
    registry.add_stream_method("GreetService", "Chat", reactive());
    registry.add_stream_call("GreetService", "Chat", passthrough());

    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    const auto& chat = binding.methods.at("Chat");
    EXPECT_EQ(chat.adapter_kind, AdapterKind::CLIENT_STREAM_REACTIVE);
    EXPECT_EQ(chat.pattern.streaming, StreamingKind::REQUEST_RESPONSE_PUSH);
}

TEST_F(ServiceBinderTest, RequestStreamingFallsBackToPassthrough) {
    registry.add_stream_call("GreetService", "CollectGreetings", passthrough());

    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    const auto& collect = binding.methods.at("CollectGreetings");
    EXPECT_EQ(collect.adapter_kind, AdapterKind::CLIENT_STREAM_PASSTHROUGH);
    EXPECT_EQ(collect.pattern.streaming, StreamingKind::REQUEST_ONLY);
}

TEST_F(ServiceBinderTest, RetriesWithOriginalNameKeepingStreamingKind) {
    registry.add_method("GreetService", "hello", unary());
    registry.add_stream_call("GreetService", "chat", passthrough());
    // A reactive handler under the original name is not tried once the
    // pass-through kind was chosen
    registry.add_stream_method("GreetService", "collectGreetings", reactive());

    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    EXPECT_EQ(binding.methods.at("Hello").pattern.rpc, "hello");
    EXPECT_EQ(binding.methods.at("Chat").pattern,
              (PatternKey{"GreetService", "chat", StreamingKind::REQUEST_ONLY}));
    EXPECT_EQ(binding.methods.count("CollectGreetings"), 0u);
}

TEST_F(ServiceBinderTest, ExactNameWinsOverOriginalName) {
    registry.add_method("GreetService", "Hello", unary());
    registry.add_method("GreetService", "hello", unary());

    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    EXPECT_EQ(binding.methods.at("Hello").pattern.rpc, "Hello");
}

TEST_F(ServiceBinderTest, ShapeMismatchThrowsBindingError) {
    // Hello is unary, so a stream handler under no_stream is a mismatch
    registry.add_handler(PatternKey{"GreetService", "Hello", StreamingKind::NONE},
                         std::make_shared<const MessageHandler>(reactive()));

    EXPECT_THROW(ServiceBinder(registry).create_service(definition, "GreetService"), BindingError);
}

TEST_F(ServiceBinderTest, SelectAdapterTable) {
    const auto& methods = definition.methods;
    EXPECT_EQ(ServiceBinder::select_adapter(methods.at("Hello"), StreamingKind::NONE), AdapterKind::UNARY);
    EXPECT_EQ(ServiceBinder::select_adapter(methods.at("HelloStream"), StreamingKind::NONE),
              AdapterKind::SERVER_STREAM);
    EXPECT_EQ(ServiceBinder::select_adapter(methods.at("CollectGreetings"), StreamingKind::REQUEST_RESPONSE_PUSH),
              AdapterKind::CLIENT_STREAM_REACTIVE);
    EXPECT_EQ(ServiceBinder::select_adapter(methods.at("Chat"), StreamingKind::REQUEST_ONLY),
              AdapterKind::CLIENT_STREAM_PASSTHROUGH);
}

TEST_F(ServiceBinderTest, BoundAdapterRunsHandler) {
    registry.add_method("GreetService", "Hello", unary());
    auto binding = ServiceBinder(registry).create_service(definition, "GreetService");

    auto call = std::make_shared<FakeCall>();
    CallbackRecorder recorder;
    binding.methods.at("Hello").adapter(call, recorder.callback());

    EXPECT_EQ(recorder.count, 1);
    EXPECT_EQ((*recorder.value)["reply"], "ok");
}

TEST_F(ServiceBinderTest, CreateServicesWalksPackage) {
    auto root = PackageNode::make_namespace();
    add_service(*root, "greet.GreetService", definition);
    ServiceDefinition other = definition;
    other.full_name = "greet.admin.AdminService";
    add_service(*root, "greet.admin.AdminService", other);
    registry.add_method("GreetService", "Hello", unary());
    registry.add_method("admin.AdminService", "Hello", unary());

    auto bindings = ServiceBinder(registry).create_services(lookup_package(root.get(), "greet"), "greet");

    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[0].name, "GreetService");
    EXPECT_EQ(bindings[1].name, "admin.AdminService");
    EXPECT_EQ(bindings[1].methods.size(), 1u);
}

TEST_F(ServiceBinderTest, CreateServicesRejectsMissingPackage) {
    ServiceBinder binder(registry);
    try {
        binder.create_services(nullptr, "nowhere");
        FAIL() << "Expected InvalidPackageError";
    } catch (const InvalidPackageError& e) {
        EXPECT_NE(std::string(e.what()).find("nowhere"), std::string::npos);
    }
}
