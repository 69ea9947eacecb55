#include "grpcflow/call_adapters.hpp"
#include "grpcflow/errors.hpp"
#include "grpcflow/stream_writer.hpp"
#include <glog/logging.h>
#include <optional>
#include <vector>

namespace grpcflow {

namespace {

void log_stream_outcome(WriteOutcome outcome, std::exception_ptr error) {
    if (outcome == WriteOutcome::FAILED) {
        VLOG(1) << "Response stream failed: " << describe_exception(error);
    } else {
        VLOG(1) << "Response stream " << to_string(outcome);
    }
}

// Settles a single-response call from the last value of a sequence
struct LastValueState {
    bool settled = false;
    std::optional<Value> last;
    Call::ListenerId cancel_listener = 0;
};

} // namespace

const char* to_string(AdapterKind kind) {
    switch (kind) {
        case AdapterKind::UNARY: return "unary";
        case AdapterKind::SERVER_STREAM: return "server_stream";
        case AdapterKind::CLIENT_STREAM_REACTIVE: return "client_stream_reactive";
        case AdapterKind::CLIENT_STREAM_PASSTHROUGH: return "client_stream_passthrough";
        default: return "unknown";
    }
}

ValueStream to_stream(const Reply& reply) {
    if (const auto* stream = std::get_if<ValueStream>(&reply)) {
        return *stream;
    }
    return rpp::source::just(std::get<Value>(reply)).as_dynamic();
}

MethodAdapter create_unary_service_method(UnaryHandler handler) {
    return [handler = std::move(handler)](std::shared_ptr<Call> call, Callback callback) {
        Reply reply;
        try {
            reply = handler(call->request(), call->metadata(), call);
        } catch (...) {
            callback(std::current_exception(), std::nullopt);
            return;
        }

        auto responded = std::make_shared<bool>(false);
        auto disposable = rpp::composite_disposable_wrapper::make();
        to_stream(reply).subscribe(
            disposable,
            [responded, callback, disposable](const Value& value) {
                if (*responded) {
                    return;
                }
                *responded = true;
                disposable.dispose();
                callback(nullptr, value);
            },
            [responded, callback](const std::exception_ptr& error) {
                if (*responded) {
                    return;
                }
                *responded = true;
                callback(error, std::nullopt);
            },
            [responded, callback] {
                if (*responded) {
                    return;
                }
                *responded = true;
                callback(nullptr, std::nullopt);
            });
    };
}

MethodAdapter create_stream_service_method(UnaryHandler handler) {
    return [handler = std::move(handler)](std::shared_ptr<Call> call, Callback) {
        Reply reply;
        try {
            reply = handler(call->request(), call->metadata(), call);
        } catch (...) {
            call->fail(std::current_exception());
            return;
        }
        StreamWriter::write(to_stream(reply), call, log_stream_outcome);
    };
}

MethodAdapter create_request_stream_method(StreamHandler handler,
                                           bool response_streaming,
                                           bool legacy_cancel_detection) {
    return [handler = std::move(handler), response_streaming, legacy_cancel_detection](
               std::shared_ptr<Call> call, Callback callback) {
        rpp::subjects::publish_subject<Value> requests;
        std::weak_ptr<Call> weak_call = call;
        auto listeners = std::make_shared<std::vector<Call::ListenerId>>();
        auto detach = [weak_call, listeners] {
            if (auto locked = weak_call.lock()) {
                for (auto id : *listeners) {
                    locked->off(id);
                }
            }
            listeners->clear();
        };

        listeners->push_back(
            call->on_data([requests](const Value& value) { requests.get_observer().on_next(value); }));
        listeners->push_back(call->on_end([requests, detach] {
            requests.get_observer().on_completed();
            detach();
        }));
        listeners->push_back(call->on_error(
            [requests, detach, weak_call, legacy_cancel_detection](std::exception_ptr error) {
                if (is_cancellation(error, legacy_cancel_detection)) {
                    VLOG(1) << "Request stream cancelled by client";
                    if (auto locked = weak_call.lock()) {
                        locked->end();
                    }
                    requests.get_observer().on_completed();
                } else {
                    requests.get_observer().on_error(error);
                }
                detach();
            }));

        Reply reply;
        try {
            reply = handler(requests.get_observable().as_dynamic(), call->metadata(), call);
        } catch (...) {
            auto error = std::current_exception();
            detach();
            if (response_streaming) {
                call->fail(error);
            } else {
                callback(error, std::nullopt);
            }
            return;
        }

        if (response_streaming) {
            StreamWriter::write(to_stream(reply), call, log_stream_outcome);
            return;
        }

        auto state = std::make_shared<LastValueState>();
        auto disposable = rpp::composite_disposable_wrapper::make();
        auto settle = [state, weak_call, callback, disposable](std::exception_ptr error) {
            if (state->settled) {
                return;
            }
            state->settled = true;
            disposable.dispose();
            if (auto locked = weak_call.lock()) {
                locked->off(state->cancel_listener);
            }
            if (error) {
                callback(error, std::nullopt);
            } else {
                callback(nullptr, state->last);
            }
        };
        state->cancel_listener = call->on_cancel([settle] { settle(nullptr); });

        to_stream(reply).subscribe(
            disposable,
            [state](const Value& value) { state->last = value; },
            [settle](const std::exception_ptr& error) { settle(error); },
            [settle] { settle(nullptr); });
    };
}

MethodAdapter create_stream_call_method(CallHandler handler, bool response_streaming) {
    return [handler = std::move(handler), response_streaming](std::shared_ptr<Call> call,
                                                              Callback callback) {
        try {
            handler(call, response_streaming ? Callback{} : callback);
        } catch (...) {
            auto error = std::current_exception();
            if (response_streaming) {
                call->fail(error);
            } else {
                callback(error, std::nullopt);
            }
        }
    };
}

} // namespace grpcflow
