#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace grpcflow {

// PEM file paths; the server listens without TLS when none is set
struct TlsCredentials {
    std::optional<std::string> root_certs;
    std::optional<std::string> cert_chain;
    std::optional<std::string> private_key;

    bool enabled() const { return cert_chain.has_value() || private_key.has_value(); }
};

using ChannelOption = std::variant<int, std::string>;

struct ServerOptions {
    std::string url = "localhost:5000";
    std::vector<std::string> packages;
    std::vector<std::string> descriptor_sets;

    // .proto sources parsed at startup; imports resolve against include_dirs
    std::vector<std::string> proto_path;
    std::vector<std::string> include_dirs;

    std::optional<int> max_send_message_length;
    std::optional<int> max_receive_message_length;
    std::optional<int> max_metadata_size;
    std::map<std::string, ChannelOption> channel_options;

    bool graceful_shutdown = false;
    TlsCredentials credentials;

    bool legacy_cancel_detection = false;

    // Writes queued on one call before write() reports backpressure
    std::size_t write_high_watermark = 1;

    // Keys absent from the document keep their defaults.
    // Throws std::runtime_error on malformed YAML or mistyped values.
    static ServerOptions from_yaml(const std::string& yaml);
    static ServerOptions from_yaml_file(const std::string& path);

    // GRPCFLOW_URL, GRPCFLOW_DESCRIPTOR_SETS and GRPCFLOW_PROTO_PATH
    // (path lists are colon separated)
    void apply_environment();
};

} // namespace grpcflow
