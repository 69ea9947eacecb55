#pragma once

#include <grpcflow/pattern_registry.hpp>
#include <string>

namespace grpcflow::test {

// Sender name put in every GreetResponse
constexpr const char* GREETER_NAME = "bill";

// Registers the GreetService handlers:
//   Hello, Hi           unary
//   HelloStream         server streaming
//   CollectGreetings    client streaming, reduced from the request stream
//   Chat                bidirectional, driving the raw call
void register_greeter_handlers(PatternRegistry& registry);

Value make_greeting(const std::string& salutation, const std::string& to);

} // namespace grpcflow::test
