#pragma once

#include "grpcflow/call.hpp"
#include "grpcflow/event_loop.hpp"
#include "grpcflow/message_codec.hpp"
#include "grpcflow/service_binder.hpp"
#include <grpcpp/generic/async_generic_service.h>
#include <grpcpp/support/byte_buffer.h>
#include <atomic>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace grpcflow {

class CallReactor;

// Call backed by one gRPC callback reactor.
//
// Reactor events are posted to the event loop; every member except
// mark_cancelled() and finish_now() runs there. The reactor pointer is only
// used before Finish is issued, and the reactor cannot be destroyed before
// that.
class GrpcCall : public Call {
public:
    GrpcCall(CallReactor* reactor,
             grpc::GenericCallbackServerContext* context,
             const BoundMethod& method,
             MessageCodec& codec,
             EventLoop& loop,
             std::size_t write_high_watermark);

    const Value& request() const override { return request_; }
    const Metadata& metadata() const override { return metadata_; }
    bool write(const Value& value) override;
    void end() override;
    void fail(std::exception_ptr error) override;
    bool is_cancelled() const override { return cancelled_; }
    void post(std::function<void()> task) override;

    void start();
    void handle_read(bool ok);
    void handle_write_done(bool ok);
    void handle_cancel();
    void handle_done();

    // Any thread
    void mark_cancelled() { cancelled_ = true; }
    void finish_now(const grpc::Status& status);

private:
    void dispatch();
    void respond(std::exception_ptr error, std::optional<Value> value);
    void start_read();
    void pump();
    void request_finish(const grpc::Status& status);
    void finish_if_idle();

    CallReactor* reactor_;
    const BoundMethod& method_;
    MessageCodec& codec_;
    EventLoop& loop_;
    const std::size_t write_high_watermark_;

    Value request_;
    Metadata metadata_;

    grpc::ByteBuffer read_buffer_;
    bool input_closed_ = false;

    grpc::ByteBuffer current_write_;
    std::deque<grpc::ByteBuffer> pending_writes_;
    bool write_in_flight_ = false;
    bool need_drain_ = false;

    bool finish_requested_ = false;
    grpc::Status finish_status_;
    std::atomic<bool> finish_issued_{false};
    std::atomic<bool> cancelled_{false};
};

class CallReactor : public grpc::ServerGenericBidiReactor {
public:
    CallReactor(grpc::GenericCallbackServerContext* context,
                const BoundMethod& method,
                MessageCodec& codec,
                EventLoop& loop,
                std::size_t write_high_watermark);

    void OnReadDone(bool ok) override;
    void OnWriteDone(bool ok) override;
    void OnCancel() override;
    void OnDone() override;

private:
    void dispatch_event(EventLoop::Task task);

    EventLoop& loop_;
    std::shared_ptr<GrpcCall> call_;
};

// Routes every inbound call by wire path to its bound method
class GenericService : public grpc::CallbackGenericService {
public:
    GenericService(EventLoop& loop, std::shared_ptr<MessageCodec> codec, std::size_t write_high_watermark);

    // Must be called before the server starts
    void install(const std::vector<ServiceBinding>& bindings);

    std::size_t route_count() const { return routes_.size(); }

    grpc::ServerGenericBidiReactor* CreateReactor(grpc::GenericCallbackServerContext* context) override;

private:
    EventLoop& loop_;
    std::shared_ptr<MessageCodec> codec_;
    std::size_t write_high_watermark_;
    std::map<std::string, BoundMethod> routes_;
};

} // namespace grpcflow
