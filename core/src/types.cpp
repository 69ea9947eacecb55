#include "grpcflow/types.hpp"
#include <functional>
#include <stdexcept>

namespace grpcflow {

const char* to_string(StreamingKind kind) {
    switch (kind) {
        case StreamingKind::NONE: return "no_stream";
        case StreamingKind::REQUEST_ONLY: return "pt_stream";
        case StreamingKind::REQUEST_RESPONSE_PUSH: return "rx_stream";
        default: return "unknown";
    }
}

StreamingKind streaming_kind_from_string(const std::string& value) {
    if (value == "no_stream") return StreamingKind::NONE;
    if (value == "pt_stream") return StreamingKind::REQUEST_ONLY;
    if (value == "rx_stream") return StreamingKind::REQUEST_RESPONSE_PUSH;
    throw std::invalid_argument("Unknown streaming kind: " + value);
}

std::string PatternKey::to_string() const {
    // Ordered keys keep the string stable for a given key
    nlohmann::ordered_json pattern;
    pattern["service"] = service;
    pattern["rpc"] = rpc;
    pattern["streaming"] = grpcflow::to_string(streaming);
    return pattern.dump();
}

PatternKey PatternKey::parse(const std::string& pattern) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(pattern);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid pattern: " + std::string(e.what()));
    }

    if (!root.is_object() || !root.contains("service") || !root.contains("rpc")) {
        throw std::invalid_argument("Pattern must be an object with 'service' and 'rpc': " + pattern);
    }
    if (!root["service"].is_string() || !root["rpc"].is_string()) {
        throw std::invalid_argument("Pattern 'service' and 'rpc' must be strings: " + pattern);
    }

    PatternKey key;
    key.service = root["service"].get<std::string>();
    key.rpc = root["rpc"].get<std::string>();
    if (root.contains("streaming")) {
        if (!root["streaming"].is_string()) {
            throw std::invalid_argument("Pattern 'streaming' must be a string: " + pattern);
        }
        key.streaming = streaming_kind_from_string(root["streaming"].get<std::string>());
    }
    return key;
}

std::size_t PatternKeyHash::operator()(const PatternKey& key) const noexcept {
    std::size_t seed = std::hash<std::string>{}(key.service);
    seed ^= std::hash<std::string>{}(key.rpc) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= std::hash<int>{}(static_cast<int>(key.streaming)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

} // namespace grpcflow
