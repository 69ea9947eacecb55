#include "test_fixture.hpp"
#include "greet_descriptor.hpp"
#include "test_credentials.hpp"
#include "greeter_handlers.hpp"
#include <rpp/rpp.hpp>
#include <fstream>
#include <stdexcept>

using namespace grpcflow;
using grpcflow::test::make_greeting;

class ServerTest : public IntegrationTestFixture {
protected:
    std::unique_ptr<GreeterClient> client_for(const Server& server) {
        return std::make_unique<GreeterClient>(address_of(server), greet_codec());
    }

    static std::string write_temp(const std::string& name, const std::string& content) {
        const auto path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    // Runs listen(callback) and returns what the callback received
    static std::exception_ptr listen_error(Server& server) {
        std::exception_ptr error;
        int calls = 0;
        server.listen([&](std::exception_ptr e) {
            ++calls;
            error = e;
        });
        EXPECT_EQ(calls, 1);
        return error;
    }

    static Reply reply_with(const std::string& text) {
        return Value{{"from", "test"}, {"reply", text}};
    }
};

// =============================================================================
// Startup
// =============================================================================

TEST_F(ServerTest, MissingPackageFailsListen) {
    auto options = local_options();
    options.packages = {"greet.v2"};
    Server server(options);
    server.add_file_descriptors({test_support::greet_file_descriptor()});

    std::exception_ptr error;
    int calls = 0;
    server.listen([&](std::exception_ptr e) {
        ++calls;
        error = e;
    });

    EXPECT_EQ(calls, 1);
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), InvalidPackageError);
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, ListenWithoutCallbackThrows) {
    auto options = local_options();
    options.descriptor_sets = {"/nonexistent/greet.desc"};
    Server server(options);

    EXPECT_THROW(server.listen(), InvalidProtoDefinitionError);
}

TEST_F(ServerTest, SuccessfulListenReportsNoError) {
    Server server(local_options());
    server.add_file_descriptors({test_support::greet_file_descriptor()});

    bool called = false;
    server.listen([&](std::exception_ptr e) {
        called = true;
        EXPECT_FALSE(e);
    });

    EXPECT_TRUE(called);
    EXPECT_TRUE(server.is_running());
    EXPECT_GT(server.bound_port(), 0);
    EXPECT_THROW(server.listen(), std::runtime_error);

    server.close();
    server.close();
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, LoadsDescriptorSetFile) {
    google::protobuf::FileDescriptorSet set;
    *set.add_file() = test_support::greet_file_descriptor();
    const auto path = ::testing::TempDir() + "greet_server_test.desc";
    {
        std::ofstream out(path, std::ios::binary);
        out << set.SerializeAsString();
    }

    auto options = local_options();
    options.descriptor_sets = {path};
    Server server(options);
    test::register_greeter_handlers(server.registry());
    server.listen();

    auto result = client_for(server)->unary("Hello", Value{{"to", "gina"}});
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0], make_greeting("hello", "gina"));
    EXPECT_EQ(server.bindings().size(), 1u);
    EXPECT_EQ(server.bindings()[0].methods.size(), 5u);
}

TEST_F(ServerTest, AddServiceDefinitionBindsUnderGivenName) {
    auto loaded = ProtoLoader::create()->load_files({test_support::greet_file_descriptor()});
    auto definition = *get_service_names(lookup_package(loaded.root.get(), "greet"))[0].service;

    auto options = local_options();
    options.packages.clear();
    Server server(options);
    server.add_file_descriptors({test_support::greet_file_descriptor()});
    server.add_service_definition("Greeter", definition);
    server.registry().add_method("Greeter", "hello",
        [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply { return reply_with("extra"); });
    server.listen();

    auto result = client_for(server)->unary("Hello", Value::object());
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0]["reply"], "extra");
}

TEST_F(ServerTest, ParsesProtoSourcesAtStartup) {
    auto options = local_options();
    options.proto_path = {std::string(GRPCFLOW_GREET_PROTO_DIR) + "/greet.proto"};
    options.include_dirs = {GRPCFLOW_GREET_PROTO_DIR};
    Server server(options);
    test::register_greeter_handlers(server.registry());
    server.listen();

    auto result = client_for(server)->unary("Hi", Value{{"to", "lena"}});
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0], make_greeting("hi", "lena"));
}

TEST_F(ServerTest, UnparsableProtoSourceFailsListen) {
    auto options = local_options();
    options.proto_path = {write_temp("server_broken.proto", "syntax = \"proto3\";\nservice {\n")};
    Server server(options);

    auto error = listen_error(server);
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), InvalidProtoDefinitionError);
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, ListensAgainAfterClose) {
    Server server(local_options());
    server.add_file_descriptors({test_support::greet_file_descriptor()});
    test::register_greeter_handlers(server.registry());

    server.listen();
    server.close();
    EXPECT_FALSE(server.is_running());

    server.listen();
    EXPECT_TRUE(server.is_running());
    EXPECT_GT(server.bound_port(), 0);
    auto result = client_for(server)->unary("Hello", Value{{"to", "kim"}});
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0], make_greeting("hello", "kim"));
}

// =============================================================================
// TLS
// =============================================================================

TEST_F(ServerTest, TlsNeedsBothCertificateAndKey) {
    auto options = local_options();
    options.credentials.cert_chain = write_temp("tls_only_cert.pem", test_support::LOCALHOST_CERT_PEM);
    Server server(options);
    server.add_file_descriptors({test_support::greet_file_descriptor()});

    auto error = listen_error(server);
    ASSERT_TRUE(error);
    EXPECT_EQ(describe_exception(error), "TLS needs both cert_chain and private_key");
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, MissingCredentialsFileFailsListen) {
    auto options = local_options();
    options.credentials.cert_chain = write_temp("tls_cert.pem", test_support::LOCALHOST_CERT_PEM);
    options.credentials.private_key = "/nonexistent/localhost.key";
    Server server(options);
    server.add_file_descriptors({test_support::greet_file_descriptor()});

    auto error = listen_error(server);
    ASSERT_TRUE(error);
    EXPECT_NE(describe_exception(error).find("/nonexistent/localhost.key"), std::string::npos);
    EXPECT_FALSE(server.is_running());
}

TEST_F(ServerTest, SelfSignedPairBindsWithTls) {
    auto options = local_options();
    options.credentials.cert_chain = write_temp("tls_pair_cert.pem", test_support::LOCALHOST_CERT_PEM);
    options.credentials.private_key = write_temp("tls_pair_key.pem", test_support::LOCALHOST_KEY_PEM);
    Server server(options);
    server.add_file_descriptors({test_support::greet_file_descriptor()});

    EXPECT_FALSE(listen_error(server));
    EXPECT_TRUE(server.is_running());
    EXPECT_GT(server.bound_port(), 0);
    server.close();
}

// =============================================================================
// Unary
// =============================================================================

TEST_F(ServerTest, UnboundMethodIsUnimplemented) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "Hello",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply { return reply_with("hello"); });
    });
    auto client = client_for(*server);

    EXPECT_TRUE(client->unary("Hello", Value::object()).status.ok());
    EXPECT_EQ(client->unary("Hi", Value::object()).status.error_code(), grpc::StatusCode::UNIMPLEMENTED);
}

TEST_F(ServerTest, HandlerErrorsBecomeStatuses) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "Hello",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
                throw RpcException(grpc::StatusCode::NOT_FOUND, "nobody home");
            });
        registry.add_method("GreetService", "Hi",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
                return rpp::source::error<Value>(std::make_exception_ptr(std::runtime_error("sequence broke")))
                    .as_dynamic();
            });
    });
    auto client = client_for(*server);

    auto thrown = client->unary("Hello", Value::object());
    EXPECT_EQ(thrown.status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(thrown.status.error_message(), "nobody home");

    auto failed = client->unary("Hi", Value::object());
    EXPECT_EQ(failed.status.error_code(), grpc::StatusCode::UNKNOWN);
    EXPECT_EQ(failed.status.error_message(), "sequence broke");
}

TEST_F(ServerTest, MismatchedResponseIsInternal) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "Hello",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply { return Value{{"bogus", 1}}; });
    });

    auto result = client_for(*server)->unary("Hello", Value::object());
    EXPECT_EQ(result.status.error_code(), grpc::StatusCode::INTERNAL);
}

TEST_F(ServerTest, EmptySequenceAnswersEmptyMessage) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "Hello",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
                return rpp::source::empty<Value>().as_dynamic();
            });
    });

    auto result = client_for(*server)->unary("Hello", Value::object());
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0], (Value{{"from", ""}, {"reply", ""}}));
}

TEST_F(ServerTest, MetadataReachesHandler) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "Hello",
            [](const Value&, const Metadata& metadata, std::shared_ptr<Call>) -> Reply {
                auto it = metadata.find("x-user");
                return reply_with(it == metadata.end() ? "anonymous" : it->second);
            });
    });

    auto result = client_for(*server)->unary("Hello", Value::object(), {{"x-user", "henry"}});
    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    EXPECT_EQ(result.responses[0]["reply"], "henry");
}

// =============================================================================
// Streaming
// =============================================================================

TEST_F(ServerTest, LongServerStreamArrivesInOrder) {
    constexpr int COUNT = 500;
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "HelloStream",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
                return rpp::source::create<Value>([](const rpp::dynamic_observer<Value>& observer) {
                           for (int i = 0; i < COUNT && !observer.is_disposed(); ++i) {
                               observer.on_next(Value{{"from", "test"}, {"reply", std::to_string(i)}});
                           }
                           observer.on_completed();
                       })
                    .as_dynamic();
            });
    });

    auto result = client_for(*server)->stream("HelloStream", {Value::object()});

    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    ASSERT_EQ(result.responses.size(), static_cast<std::size_t>(COUNT));
    for (int i = 0; i < COUNT; ++i) {
        EXPECT_EQ(result.responses[i]["reply"], std::to_string(i));
    }
}

TEST_F(ServerTest, ServerStreamErrorAfterValues) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_method("GreetService", "HelloStream",
            [](const Value&, const Metadata&, std::shared_ptr<Call>) -> Reply {
                return rpp::source::create<Value>([](const rpp::dynamic_observer<Value>& observer) {
                           observer.on_next(Value{{"from", "test"}, {"reply", "first"}});
                           observer.on_error(
                               std::make_exception_ptr(RpcException(grpc::StatusCode::ABORTED, "stopped")));
                       })
                    .as_dynamic();
            });
    });

    auto result = client_for(*server)->stream("HelloStream", {Value::object()});

    EXPECT_EQ(result.status.error_code(), grpc::StatusCode::ABORTED);
    EXPECT_LE(result.responses.size(), 1u);
}

TEST_F(ServerTest, ReactiveBidiStreamsReplies) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_stream_method("GreetService", "Chat",
            [](ValueStream requests, const Metadata&, std::shared_ptr<Call>) -> Reply {
                return (requests | rpp::operators::map([](const Value& request) {
                            return make_greeting("yo", request.value("to", ""));
                        }))
                    .as_dynamic();
            });
    });

    auto result = client_for(*server)->stream("Chat", {Value{{"to", "ivy"}}, Value{{"to", "jo"}}});

    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    ASSERT_EQ(result.responses.size(), 2u);
    EXPECT_EQ(result.responses[0], make_greeting("yo", "ivy"));
    EXPECT_EQ(result.responses[1], make_greeting("yo", "jo"));
}

TEST_F(ServerTest, PassthroughClientStreamAnswersThroughCallback) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_stream_call("GreetService", "CollectGreetings",
            [](std::shared_ptr<Call> call, Callback callback) {
                auto count = std::make_shared<int>(0);
                call->on_data([count](const Value&) { ++*count; });
                call->on_end([count, callback] {
                    callback(nullptr, Value{{"from", "test"}, {"reply", std::to_string(*count)}});
                });
            });
    });

    auto result = client_for(*server)->stream("CollectGreetings",
                                              {Value::object(), Value::object(), Value::object()});

    ASSERT_TRUE(result.status.ok()) << result.status.error_message();
    ASSERT_EQ(result.responses.size(), 1u);
    EXPECT_EQ(result.responses[0]["reply"], "3");
}

TEST_F(ServerTest, ClientStreamHandlerErrorFailsCall) {
    auto server = start_local_server([](PatternRegistry& registry) {
        registry.add_stream_method("GreetService", "CollectGreetings",
            [](ValueStream, const Metadata&, std::shared_ptr<Call>) -> Reply {
                throw RpcException(grpc::StatusCode::RESOURCE_EXHAUSTED, "too many greetings");
            });
    });

    auto result = client_for(*server)->stream("CollectGreetings", {Value::object()});

    EXPECT_EQ(result.status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(result.status.error_message(), "too many greetings");
}
