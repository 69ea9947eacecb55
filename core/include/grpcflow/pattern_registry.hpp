#pragma once

#include "grpcflow/handler.hpp"
#include "grpcflow/types.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace grpcflow {

// Maps pattern keys to handlers.
//
// Populated before the server starts and only read afterwards, so it is not
// synchronized. A second registration under an equal key replaces the first.
class PatternRegistry {
public:
    using HandlerPtr = std::shared_ptr<const MessageHandler>;

    void add_handler(const PatternKey& key, HandlerPtr handler);

    // Pattern in its JSON string form, throws std::invalid_argument
    void add_handler(const std::string& pattern, HandlerPtr handler);

    // Registration helpers, one per handler shape. Each returns the stored
    // handler.
    HandlerPtr add_method(const std::string& service, const std::string& rpc, UnaryHandler handler);
    HandlerPtr add_stream_method(const std::string& service, const std::string& rpc, StreamHandler handler);
    HandlerPtr add_stream_call(const std::string& service, const std::string& rpc, CallHandler handler);

    // Null when nothing is registered under the key
    HandlerPtr get_handler(const PatternKey& key) const;
    HandlerPtr get_handler(const std::string& pattern) const;

    std::size_t size() const { return handlers_.size(); }
    std::vector<PatternKey> patterns() const;

private:
    std::unordered_map<PatternKey, HandlerPtr, PatternKeyHash> handlers_;
};

} // namespace grpcflow
