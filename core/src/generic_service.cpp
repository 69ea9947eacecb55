#include "generic_service.hpp"
#include "grpcflow/errors.hpp"
#include <glog/logging.h>

namespace grpcflow {

namespace {

const grpc::Status kShuttingDown(grpc::StatusCode::UNAVAILABLE, "Server is shutting down");

// Answers calls to paths nothing is bound to
class UnimplementedReactor : public grpc::ServerGenericBidiReactor {
public:
    explicit UnimplementedReactor(const std::string& path) {
        Finish(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "Method not found: " + path));
    }

    void OnDone() override { delete this; }
};

} // namespace

// =============================================================================
// GrpcCall
// =============================================================================

GrpcCall::GrpcCall(CallReactor* reactor,
                   grpc::GenericCallbackServerContext* context,
                   const BoundMethod& method,
                   MessageCodec& codec,
                   EventLoop& loop,
                   std::size_t write_high_watermark)
    : reactor_(reactor),
      method_(method),
      codec_(codec),
      loop_(loop),
      write_high_watermark_(write_high_watermark) {
    for (const auto& [key, value] : context->client_metadata()) {
        metadata_.emplace(std::string(key.data(), key.size()), std::string(value.data(), value.size()));
    }
}

void GrpcCall::start() {
    VLOG(1) << "Call started: " << method_.descriptor.path;
    if (method_.descriptor.request_streaming) {
        // Listeners must be in place before the first message arrives
        dispatch();
    }
    start_read();
}

void GrpcCall::start_read() {
    if (finish_issued_ || cancelled_) {
        return;
    }
    reactor_->StartRead(&read_buffer_);
}

void GrpcCall::handle_read(bool ok) {
    if (!method_.descriptor.request_streaming) {
        if (!ok) {
            if (!cancelled_) {
                LOG(WARNING) << "No request message received for " << method_.descriptor.path;
                request_finish(grpc::Status(grpc::StatusCode::INTERNAL, "No request message received"));
            }
            return;
        }
        try {
            request_ = codec_.decode(method_.descriptor.request_type, read_buffer_);
        } catch (const RpcException& e) {
            LOG(WARNING) << "Undecodable request for " << method_.descriptor.path << ": " << e.what();
            request_finish(e.to_status());
            return;
        }
        read_buffer_.Clear();
        dispatch();
        return;
    }

    if (input_closed_) {
        return;
    }
    if (!ok) {
        input_closed_ = true;
        if (cancelled_) {
            emit_error(std::make_exception_ptr(CancelledError()));
        } else {
            emit_end();
        }
        return;
    }

    Value value;
    try {
        value = codec_.decode(method_.descriptor.request_type, read_buffer_);
    } catch (const RpcException& e) {
        LOG(WARNING) << "Undecodable message on " << method_.descriptor.path << ": " << e.what();
        input_closed_ = true;
        emit_error(std::current_exception());
        request_finish(e.to_status());
        return;
    }
    read_buffer_.Clear();
    emit_data(value);
    start_read();
}

bool GrpcCall::write(const Value& value) {
    if (finish_requested_ || cancelled_) {
        VLOG(1) << "Dropping write on finished call " << method_.descriptor.path;
        return true;
    }

    grpc::ByteBuffer buffer;
    try {
        buffer = codec_.encode(method_.descriptor.response_type, value);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Cannot encode response for " << method_.descriptor.path << ": " << e.what();
        fail(std::current_exception());
        return true;
    }

    pending_writes_.push_back(std::move(buffer));
    pump();
    if (pending_writes_.size() < write_high_watermark_) {
        return true;
    }
    need_drain_ = true;
    return false;
}

void GrpcCall::pump() {
    if (write_in_flight_ || pending_writes_.empty() || finish_issued_) {
        return;
    }
    current_write_ = std::move(pending_writes_.front());
    pending_writes_.pop_front();
    write_in_flight_ = true;
    reactor_->StartWrite(&current_write_);
}

void GrpcCall::handle_write_done(bool ok) {
    write_in_flight_ = false;
    if (!ok) {
        VLOG(1) << "Write failed on " << method_.descriptor.path << ", stream closed by peer";
        pending_writes_.clear();
        request_finish(grpc::Status(grpc::StatusCode::UNAVAILABLE, "Write failed"));
        finish_if_idle();
        return;
    }

    pump();
    if (need_drain_ && pending_writes_.size() < write_high_watermark_) {
        need_drain_ = false;
        emit_drain();
    }
    finish_if_idle();
}

void GrpcCall::end() {
    request_finish(grpc::Status::OK);
}

void GrpcCall::fail(std::exception_ptr error) {
    if (finish_requested_) {
        return;
    }
    VLOG(1) << "Call " << method_.descriptor.path << " failed: " << describe_exception(error);
    pending_writes_.clear();
    request_finish(status_from_exception(error));
}

void GrpcCall::post(std::function<void()> task) {
    if (!loop_.post(std::move(task))) {
        LOG(WARNING) << "Event loop stopped, dropping task for " << method_.descriptor.path;
    }
}

void GrpcCall::handle_cancel() {
    VLOG(1) << "Call cancelled: " << method_.descriptor.path;
    pending_writes_.clear();

    if (method_.descriptor.request_streaming && !input_closed_) {
        input_closed_ = true;
        emit_error(std::make_exception_ptr(CancelledError()));
    }
    emit_cancel();
    request_finish(grpc::Status(grpc::StatusCode::CANCELLED, "Cancelled"));
}

void GrpcCall::handle_done() {
    VLOG(1) << "Call done: " << method_.descriptor.path;
    clear_listeners();
}

void GrpcCall::finish_now(const grpc::Status& status) {
    if (finish_issued_.exchange(true)) {
        return;
    }
    reactor_->Finish(status);
}

void GrpcCall::dispatch() {
    auto self = std::static_pointer_cast<GrpcCall>(shared_from_this());
    Callback callback = [self](std::exception_ptr error, std::optional<Value> value) {
        self->respond(error, std::move(value));
    };
    try {
        method_.adapter(self, callback);
    } catch (...) {
        auto error = std::current_exception();
        LOG(ERROR) << "Handler for " << method_.descriptor.path << " failed: " << describe_exception(error);
        fail(error);
    }
}

void GrpcCall::respond(std::exception_ptr error, std::optional<Value> value) {
    if (error) {
        fail(error);
        return;
    }
    write(value ? *value : Value());
    end();
}

void GrpcCall::request_finish(const grpc::Status& status) {
    if (finish_requested_) {
        return;
    }
    finish_requested_ = true;
    finish_status_ = status;
    finish_if_idle();
}

void GrpcCall::finish_if_idle() {
    if (!finish_requested_ || write_in_flight_ || !pending_writes_.empty()) {
        return;
    }
    finish_now(finish_status_);
}

// =============================================================================
// CallReactor
// =============================================================================

CallReactor::CallReactor(grpc::GenericCallbackServerContext* context,
                         const BoundMethod& method,
                         MessageCodec& codec,
                         EventLoop& loop,
                         std::size_t write_high_watermark)
    : loop_(loop),
      call_(std::make_shared<GrpcCall>(this, context, method, codec, loop, write_high_watermark)) {
    auto call = call_;
    dispatch_event([call] { call->start(); });
}

void CallReactor::OnReadDone(bool ok) {
    auto call = call_;
    dispatch_event([call, ok] { call->handle_read(ok); });
}

void CallReactor::OnWriteDone(bool ok) {
    auto call = call_;
    dispatch_event([call, ok] { call->handle_write_done(ok); });
}

void CallReactor::OnCancel() {
    call_->mark_cancelled();
    auto call = call_;
    dispatch_event([call] { call->handle_cancel(); });
}

void CallReactor::OnDone() {
    auto call = std::move(call_);
    if (!loop_.post([call] { call->handle_done(); })) {
        call->handle_done();
    }
    delete this;
}

void CallReactor::dispatch_event(EventLoop::Task task) {
    if (!loop_.post(std::move(task))) {
        call_->finish_now(kShuttingDown);
    }
}

// =============================================================================
// GenericService
// =============================================================================

GenericService::GenericService(EventLoop& loop, std::shared_ptr<MessageCodec> codec,
                               std::size_t write_high_watermark)
    : loop_(loop), codec_(std::move(codec)), write_high_watermark_(write_high_watermark) {}

void GenericService::install(const std::vector<ServiceBinding>& bindings) {
    for (const auto& binding : bindings) {
        for (const auto& [name, method] : binding.methods) {
            auto [it, inserted] = routes_.insert_or_assign(method.descriptor.path, method);
            if (!inserted) {
                LOG(WARNING) << "Replacing route for " << it->first;
            }
        }
    }
    LOG(INFO) << "Installed " << routes_.size() << " routes";
}

grpc::ServerGenericBidiReactor* GenericService::CreateReactor(grpc::GenericCallbackServerContext* context) {
    auto it = routes_.find(context->method());
    if (it == routes_.end()) {
        LOG(WARNING) << "No handler bound for " << context->method();
        return new UnimplementedReactor(context->method());
    }
    return new CallReactor(context, it->second, *codec_, loop_, write_high_watermark_);
}

} // namespace grpcflow
