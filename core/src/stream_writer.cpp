#include "grpcflow/stream_writer.hpp"
#include "grpcflow/errors.hpp"
#include <glog/logging.h>

namespace grpcflow {

const char* to_string(WriteOutcome outcome) {
    switch (outcome) {
        case WriteOutcome::COMPLETE: return "complete";
        case WriteOutcome::CANCELLED: return "cancelled";
        case WriteOutcome::FAILED: return "failed";
        default: return "unknown";
    }
}

StreamWriter::StreamWriter(PrivateTag, std::shared_ptr<Call> call, DoneCallback done)
    : call_(std::move(call)), done_(std::move(done)) {}

std::shared_ptr<StreamWriter> StreamWriter::write(const ValueStream& source,
                                                  std::shared_ptr<Call> call,
                                                  DoneCallback done) {
    auto writer = std::make_shared<StreamWriter>(PrivateTag{}, std::move(call), std::move(done));
    writer->start(source);
    return writer;
}

bool StreamWriter::finished() const {
    return state_ == State::COMPLETE || state_ == State::CANCELLED || state_ == State::FAILED;
}

void StreamWriter::start(const ValueStream& source) {
    if (call_->is_cancelled()) {
        VLOG(1) << "Call cancelled before streaming started";
        call_->end();
        finish(State::CANCELLED, nullptr);
        return;
    }

    // Listeners and the observer keep the writer alive until finish()
    auto self = shared_from_this();
    drain_listener_ = call_->on_drain([self] { self->on_drain(); });
    cancel_listener_ = call_->on_cancel([self] { self->on_cancel(); });

    source.subscribe(
        subscription_,
        [self](const Value& value) { self->on_next(value); },
        [self](const std::exception_ptr& error) { self->on_error(error); },
        [self] { self->on_complete(); });
}

void StreamWriter::on_next(const Value& value) {
    if (finished()) {
        return;
    }
    // A non-empty buffer means older values are still waiting
    if (clear_to_write_ && buffer_.empty()) {
        write_value(value);
    } else {
        buffer_.push_back(value);
    }
}

void StreamWriter::on_error(std::exception_ptr error) {
    if (finished()) {
        return;
    }
    LOG(ERROR) << "Response stream failed with " << buffer_.size()
               << " unwritten values: " << describe_exception(error);
    buffer_.clear();
    call_->fail(error);
    finish(State::FAILED, error);
}

void StreamWriter::on_complete() {
    if (finished()) {
        return;
    }
    source_complete_ = true;
    if (buffer_.empty()) {
        call_->end();
        finish(State::COMPLETE, nullptr);
        return;
    }
    VLOG(1) << "Response stream complete, " << buffer_.size() << " values left to drain";
}

void StreamWriter::on_drain() {
    if (finished() || clear_to_write_) {
        return;
    }
    clear_to_write_ = true;
    state_ = State::STREAMING;
    flush();
}

void StreamWriter::on_cancel() {
    if (finished()) {
        return;
    }
    VLOG(1) << "Call cancelled, dropping " << buffer_.size() << " buffered values";
    subscription_.dispose();
    buffer_.clear();
    call_->end();
    finish(State::CANCELLED, nullptr);
}

void StreamWriter::write_value(const Value& value) {
    clear_to_write_ = call_->write(value);
    state_ = clear_to_write_ ? State::STREAMING : State::DRAINING;
}

void StreamWriter::flush() {
    // One write per drain while the call keeps reporting backpressure
    while (clear_to_write_ && !buffer_.empty()) {
        Value value = std::move(buffer_.front());
        buffer_.pop_front();
        write_value(value);
    }
    if (clear_to_write_ && buffer_.empty() && source_complete_) {
        call_->end();
        finish(State::COMPLETE, nullptr);
    }
}

void StreamWriter::finish(State final_state, std::exception_ptr error) {
    state_ = final_state;
    if (drain_listener_ != 0) {
        call_->off(drain_listener_);
        drain_listener_ = 0;
    }
    if (cancel_listener_ != 0) {
        call_->off(cancel_listener_);
        cancel_listener_ = 0;
    }
    subscription_.dispose();

    WriteOutcome outcome = WriteOutcome::COMPLETE;
    if (final_state == State::CANCELLED) {
        outcome = WriteOutcome::CANCELLED;
    } else if (final_state == State::FAILED) {
        outcome = WriteOutcome::FAILED;
    }

    auto done = std::move(done_);
    done_ = nullptr;
    if (done) {
        done(outcome, error);
    }
}

} // namespace grpcflow
