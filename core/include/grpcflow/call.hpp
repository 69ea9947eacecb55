#pragma once

#include "grpcflow/types.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace grpcflow {

// Single-response channel of a call. Exactly one of error or value is
// meaningful; an empty value is an empty success.
using Callback = std::function<void(std::exception_ptr error, std::optional<Value> value)>;

// One in-flight RPC as seen by handlers and adapters.
//
// All members are called on the call's event loop. Transports implement the
// pure virtuals and raise events through the protected emit_* members.
class Call : public std::enable_shared_from_this<Call> {
public:
    using ListenerId = std::uint64_t;
    using DataListener = std::function<void(const Value& value)>;
    using ErrorListener = std::function<void(std::exception_ptr error)>;
    using SignalListener = std::function<void()>;

    virtual ~Call() = default;

    // Request of a unary or server-streaming call, null otherwise
    virtual const Value& request() const = 0;
    virtual const Metadata& metadata() const = 0;

    // Queue one response value. Returns false when the caller should wait
    // for a drain event before writing again.
    virtual bool write(const Value& value) = 0;

    // Finish successfully once queued writes are flushed
    virtual void end() = 0;

    // Finish with the status derived from error, dropping queued writes
    virtual void fail(std::exception_ptr error) = 0;

    virtual bool is_cancelled() const = 0;

    // Run task later on the call's event loop
    virtual void post(std::function<void()> task) = 0;

    ListenerId on_data(DataListener listener);
    ListenerId on_end(SignalListener listener);
    ListenerId on_error(ErrorListener listener);
    ListenerId on_drain(SignalListener listener);
    ListenerId on_cancel(SignalListener listener);

    // Remove a listener; unknown ids are ignored
    void off(ListenerId id);

    std::size_t listener_count() const { return listeners_.size(); }

protected:
    void emit_data(const Value& value);
    void emit_end();
    void emit_error(std::exception_ptr error);
    void emit_drain();
    void emit_cancel();

    void clear_listeners() { listeners_.clear(); }

private:
    enum class Event { DATA, END, ERROR, DRAIN, CANCEL };

    struct Listener {
        Event event;
        DataListener data;
        ErrorListener error;
        SignalListener signal;
    };

    ListenerId add_listener(Listener listener);
    void emit_signal(Event event);

    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_ = 1;
};

} // namespace grpcflow
