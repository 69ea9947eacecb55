#include "greeter_handlers.hpp"
#include <grpcflow/errors.hpp>
#include <glog/logging.h>
#include <memory>
#include <rpp/rpp.hpp>
#include <string>
#include <vector>

namespace grpcflow::test {

namespace {

constexpr const char* SERVICE = "GreetService";

std::string recipient(const Value& request) {
    return request.is_object() ? request.value("to", "") : "";
}

} // namespace

Value make_greeting(const std::string& salutation, const std::string& to) {
    return Value{{"from", GREETER_NAME}, {"reply", salutation + " " + to}};
}

void register_greeter_handlers(PatternRegistry& registry) {
    registry.add_method(SERVICE, "Hello",
        [](const Value& request, const Metadata&, std::shared_ptr<Call>) -> Reply {
            LOG(INFO) << "Hello called for " << recipient(request);
            return make_greeting("hello", recipient(request));
        });

    registry.add_method(SERVICE, "Hi",
        [](const Value& request, const Metadata&, std::shared_ptr<Call>) -> Reply {
            LOG(INFO) << "Hi called for " << recipient(request);
            return make_greeting("hi", recipient(request));
        });

    registry.add_method(SERVICE, "HelloStream",
        [](const Value& request, const Metadata&, std::shared_ptr<Call>) -> Reply {
            const auto to = recipient(request);
            LOG(INFO) << "HelloStream called for " << to;
            return rpp::source::from_iterable(std::vector<Value>{
                       make_greeting("hello", to),
                       make_greeting("hi", to),
                       make_greeting("hey", to),
                   })
                .as_dynamic();
        });

    registry.add_stream_method(SERVICE, "CollectGreetings",
        [](ValueStream requests, const Metadata&, std::shared_ptr<Call>) -> Reply {
            auto names = requests
                | rpp::operators::reduce(std::vector<std::string>{},
                                         [](std::vector<std::string>&& seen, const Value& request) {
                                             seen.push_back(recipient(request));
                                             return std::move(seen);
                                         });
            return (names
                | rpp::operators::map([](const std::vector<std::string>& seen) {
                      std::string joined;
                      for (const auto& name : seen) {
                          joined += joined.empty() ? name : ", " + name;
                      }
                      LOG(INFO) << "CollectGreetings received " << seen.size() << " names";
                      return make_greeting("hello", joined);
                  }))
                .as_dynamic();
        });

    registry.add_stream_call(SERVICE, "Chat", [](std::shared_ptr<Call> call, Callback) {
        std::weak_ptr<Call> weak_call = call;
        call->on_data([weak_call](const Value& request) {
            if (auto locked = weak_call.lock()) {
                if (!locked->write(make_greeting("hi", recipient(request)))) {
                    VLOG(1) << "Chat reply queued behind a slow reader";
                }
            }
        });
        call->on_end([weak_call] {
            if (auto locked = weak_call.lock()) {
                locked->end();
            }
        });
        call->on_error([weak_call](std::exception_ptr error) {
            auto locked = weak_call.lock();
            if (!locked) {
                return;
            }
            if (is_cancellation(error)) {
                locked->end();
            } else {
                locked->fail(error);
            }
        });
    });

    LOG(INFO) << "Registered " << registry.size() << " GreetService handlers";
}

} // namespace grpcflow::test
