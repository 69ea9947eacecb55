#include "grpcflow/call.hpp"
#include <vector>

namespace grpcflow {

Call::ListenerId Call::add_listener(Listener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

Call::ListenerId Call::on_data(DataListener listener) {
    Listener entry{Event::DATA, std::move(listener), nullptr, nullptr};
    return add_listener(std::move(entry));
}

Call::ListenerId Call::on_end(SignalListener listener) {
    Listener entry{Event::END, nullptr, nullptr, std::move(listener)};
    return add_listener(std::move(entry));
}

Call::ListenerId Call::on_error(ErrorListener listener) {
    Listener entry{Event::ERROR, nullptr, std::move(listener), nullptr};
    return add_listener(std::move(entry));
}

Call::ListenerId Call::on_drain(SignalListener listener) {
    Listener entry{Event::DRAIN, nullptr, nullptr, std::move(listener)};
    return add_listener(std::move(entry));
}

Call::ListenerId Call::on_cancel(SignalListener listener) {
    Listener entry{Event::CANCEL, nullptr, nullptr, std::move(listener)};
    return add_listener(std::move(entry));
}

void Call::off(ListenerId id) {
    listeners_.erase(id);
}

// Listeners may add or remove listeners while an event is dispatched, so
// dispatch works on a snapshot of ids and copies each function before
// invoking it. A listener removed by an earlier one is skipped.

void Call::emit_data(const Value& value) {
    std::vector<ListenerId> ids;
    for (const auto& [id, listener] : listeners_) {
        if (listener.event == Event::DATA) {
            ids.push_back(id);
        }
    }
    for (const auto id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            continue;
        }
        auto fn = it->second.data;
        fn(value);
    }
}

void Call::emit_error(std::exception_ptr error) {
    std::vector<ListenerId> ids;
    for (const auto& [id, listener] : listeners_) {
        if (listener.event == Event::ERROR) {
            ids.push_back(id);
        }
    }
    for (const auto id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            continue;
        }
        auto fn = it->second.error;
        fn(error);
    }
}

void Call::emit_signal(Event event) {
    std::vector<ListenerId> ids;
    for (const auto& [id, listener] : listeners_) {
        if (listener.event == event) {
            ids.push_back(id);
        }
    }
    for (const auto id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end()) {
            continue;
        }
        auto fn = it->second.signal;
        fn();
    }
}

void Call::emit_end() {
    emit_signal(Event::END);
}

void Call::emit_drain() {
    emit_signal(Event::DRAIN);
}

void Call::emit_cancel() {
    emit_signal(Event::CANCEL);
}

} // namespace grpcflow
