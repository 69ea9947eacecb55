#pragma once

#include "grpcflow/call.hpp"
#include "grpcflow/handler.hpp"
#include <functional>
#include <memory>

namespace grpcflow {

enum class AdapterKind {
    UNARY,
    SERVER_STREAM,
    CLIENT_STREAM_REACTIVE,
    CLIENT_STREAM_PASSTHROUGH
};

const char* to_string(AdapterKind kind);

// Transport-facing entry point of a bound method. The callback is used by
// methods with a single response and ignored by response-streaming ones.
using MethodAdapter = std::function<void(std::shared_ptr<Call> call, Callback callback)>;

// Lift a handler reply into a sequence
ValueStream to_stream(const Reply& reply);

// Unary: first emitted value answers the call, later values are ignored.
// A sequence that completes empty answers with an empty success.
MethodAdapter create_unary_service_method(UnaryHandler handler);

// Server streaming: every emitted value is written to the call
MethodAdapter create_stream_service_method(UnaryHandler handler);

// Client streaming with the request stream pushed into the handler through
// a publish subject. Client cancellation ends the call and completes the request
// stream instead of erroring it. With legacy_cancel_detection, errors whose
// text mentions "cancelled" are treated as cancellation too.
MethodAdapter create_request_stream_method(StreamHandler handler,
                                           bool response_streaming,
                                           bool legacy_cancel_detection = false);

// Client streaming with the raw call handed to the handler
MethodAdapter create_stream_call_method(CallHandler handler, bool response_streaming);

} // namespace grpcflow
