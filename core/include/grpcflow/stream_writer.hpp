#pragma once

#include "grpcflow/call.hpp"
#include "grpcflow/handler.hpp"
#include "grpcflow/types.hpp"
#include <rpp/rpp.hpp>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>

namespace grpcflow {

enum class WriteOutcome {
    COMPLETE,    // Source completed and every value was written
    CANCELLED,   // Transport cancelled the call
    FAILED       // Source raised an error
};

const char* to_string(WriteOutcome outcome);

/// Drains a ValueStream into a flow-controlled Call.
///
/// Values are written in emission order. While the call reports
/// backpressure, arriving values are buffered and written one per drain
/// event. The call is ended or failed exactly once, and the drain and
/// cancel listeners are removed on every exit path.
///
/// On source error the error is forwarded to the call and buffered values
/// are dropped. On cancellation the source subscription is disposed, the
/// call is ended and buffered values are dropped.
class StreamWriter : public std::enable_shared_from_this<StreamWriter> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    enum class State {
        STREAMING,   // Clear to write
        DRAINING,    // Waiting for a drain event
        COMPLETE,
        CANCELLED,
        FAILED
    };

    using DoneCallback = std::function<void(WriteOutcome outcome, std::exception_ptr error)>;

    /// Start writing source to call. done runs once when the writer reaches
    /// a terminal state; the returned writer may be dropped by the caller.
    static std::shared_ptr<StreamWriter> write(const ValueStream& source,
                                               std::shared_ptr<Call> call,
                                               DoneCallback done = {});

    StreamWriter(PrivateTag, std::shared_ptr<Call> call, DoneCallback done);

    State state() const { return state_; }
    bool finished() const;
    std::size_t buffered() const { return buffer_.size(); }

private:
    void start(const ValueStream& source);

    void on_next(const Value& value);
    void on_error(std::exception_ptr error);
    void on_complete();
    void on_drain();
    void on_cancel();

    void write_value(const Value& value);
    void flush();
    void finish(State final_state, std::exception_ptr error);

    std::shared_ptr<Call> call_;
    DoneCallback done_;

    std::deque<Value> buffer_;
    bool clear_to_write_ = true;
    bool source_complete_ = false;
    State state_ = State::STREAMING;

    rpp::composite_disposable_wrapper subscription_ = rpp::composite_disposable_wrapper::make();
    Call::ListenerId drain_listener_ = 0;
    Call::ListenerId cancel_listener_ = 0;
};

} // namespace grpcflow
