#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <string>

namespace grpcflow {

// Request and response payloads as handlers see them
using Value = nlohmann::json;

// Client metadata of one call
using Metadata = std::multimap<std::string, std::string>;

// How a handler consumes a request stream
enum class StreamingKind {
    NONE,                   // Single request value
    REQUEST_ONLY,           // Pass-through: handler drives the raw call
    REQUEST_RESPONSE_PUSH   // Request stream is pushed as a ValueStream
};

const char* to_string(StreamingKind kind);
StreamingKind streaming_kind_from_string(const std::string& value);

// Lookup key of the pattern registry
struct PatternKey {
    std::string service;
    std::string rpc;
    StreamingKind streaming = StreamingKind::NONE;

    // {"service":"...","rpc":"...","streaming":"no_stream"}
    std::string to_string() const;

    // Inverse of to_string(), throws std::invalid_argument
    static PatternKey parse(const std::string& pattern);

    bool operator==(const PatternKey& other) const {
        return streaming == other.streaming && service == other.service && rpc == other.rpc;
    }
    bool operator!=(const PatternKey& other) const {
        return !(*this == other);
    }
};

struct PatternKeyHash {
    std::size_t operator()(const PatternKey& key) const noexcept;
};

// One method of a loaded service
struct MethodDescriptor {
    std::string method_name;
    std::string original_name;   // lowerCamelCase variant of method_name
    std::string path;            // "/package.Service/Method"
    bool request_streaming = false;
    bool response_streaming = false;
    std::string request_type;    // Fully qualified message names
    std::string response_type;
};

// Generic service definition: method name -> descriptor
struct ServiceDefinition {
    std::string full_name;       // "package.Service"
    std::map<std::string, MethodDescriptor> methods;
};

} // namespace grpcflow
