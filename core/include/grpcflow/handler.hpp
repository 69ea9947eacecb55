#pragma once

#include "grpcflow/call.hpp"
#include "grpcflow/types.hpp"
#include <rpp/rpp.hpp>
#include <functional>
#include <memory>
#include <variant>

namespace grpcflow {

// Lazy sequence of values, type-erased so handlers may return any pipeline
using ValueStream = rpp::dynamic_observable<Value>;

// Handler result: a single value or a lazy sequence of values
using Reply = std::variant<Value, ValueStream>;

// Unary and server-streaming methods
using UnaryHandler =
    std::function<Reply(const Value& request, const Metadata& metadata, std::shared_ptr<Call> call)>;

// Client-streaming methods with the request stream pushed as a ValueStream
using StreamHandler =
    std::function<Reply(ValueStream requests, const Metadata& metadata, std::shared_ptr<Call> call)>;

// Client-streaming methods that drive the raw call themselves. The callback
// is empty when the method streams its responses.
using CallHandler = std::function<void(std::shared_ptr<Call> call, Callback callback)>;

// A registered handler function of one of the three shapes
class MessageHandler {
public:
    explicit MessageHandler(UnaryHandler handler) : function_(std::move(handler)) {}
    explicit MessageHandler(StreamHandler handler) : function_(std::move(handler)) {}
    explicit MessageHandler(CallHandler handler) : function_(std::move(handler)) {}

    const UnaryHandler* unary() const { return std::get_if<UnaryHandler>(&function_); }
    const StreamHandler* stream() const { return std::get_if<StreamHandler>(&function_); }
    const CallHandler* call() const { return std::get_if<CallHandler>(&function_); }

    const char* shape_name() const {
        switch (function_.index()) {
            case 0: return "unary";
            case 1: return "stream";
            default: return "call";
        }
    }

private:
    std::variant<UnaryHandler, StreamHandler, CallHandler> function_;
};

} // namespace grpcflow
