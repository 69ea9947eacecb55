#include "grpcflow/pattern_registry.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>

namespace grpcflow {

void PatternRegistry::add_handler(const PatternKey& key, HandlerPtr handler) {
    if (!handler) {
        throw std::invalid_argument("Null handler for pattern " + key.to_string());
    }
    auto [it, inserted] = handlers_.insert_or_assign(key, std::move(handler));
    if (!inserted) {
        LOG(WARNING) << "Replacing handler registered for pattern " << key.to_string();
    }
    VLOG(1) << "Registered " << it->second->shape_name() << " handler for " << key.to_string();
}

void PatternRegistry::add_handler(const std::string& pattern, HandlerPtr handler) {
    add_handler(PatternKey::parse(pattern), std::move(handler));
}

PatternRegistry::HandlerPtr PatternRegistry::add_method(const std::string& service,
                                                        const std::string& rpc,
                                                        UnaryHandler handler) {
    auto stored = std::make_shared<const MessageHandler>(std::move(handler));
    add_handler(PatternKey{service, rpc, StreamingKind::NONE}, stored);
    return stored;
}

PatternRegistry::HandlerPtr PatternRegistry::add_stream_method(const std::string& service,
                                                               const std::string& rpc,
                                                               StreamHandler handler) {
    auto stored = std::make_shared<const MessageHandler>(std::move(handler));
    add_handler(PatternKey{service, rpc, StreamingKind::REQUEST_RESPONSE_PUSH}, stored);
    return stored;
}

PatternRegistry::HandlerPtr PatternRegistry::add_stream_call(const std::string& service,
                                                             const std::string& rpc,
                                                             CallHandler handler) {
    auto stored = std::make_shared<const MessageHandler>(std::move(handler));
    add_handler(PatternKey{service, rpc, StreamingKind::REQUEST_ONLY}, stored);
    return stored;
}

PatternRegistry::HandlerPtr PatternRegistry::get_handler(const PatternKey& key) const {
    auto it = handlers_.find(key);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

PatternRegistry::HandlerPtr PatternRegistry::get_handler(const std::string& pattern) const {
    return get_handler(PatternKey::parse(pattern));
}

std::vector<PatternKey> PatternRegistry::patterns() const {
    std::vector<PatternKey> keys;
    keys.reserve(handlers_.size());
    for (const auto& [key, handler] : handlers_) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end(), [](const PatternKey& a, const PatternKey& b) {
        return a.to_string() < b.to_string();
    });
    return keys;
}

} // namespace grpcflow
