#include "grpcflow/config.hpp"
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace grpcflow {

namespace {

std::vector<std::string> string_list(const YAML::Node& node) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            values.push_back(item.as<std::string>());
        }
    }
    return values;
}

std::optional<std::string> optional_string(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node.as<std::string>();
}

std::optional<int> optional_int(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node.as<int>();
}

std::vector<std::string> split_paths(const std::string& value) {
    std::vector<std::string> paths;
    std::stringstream ss(value);
    std::string path;
    while (std::getline(ss, path, ':')) {
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

} // namespace

ServerOptions ServerOptions::from_yaml(const std::string& yaml) {
    ServerOptions options;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root || root.IsNull()) {
            return options;
        }

        if (root["url"]) {
            options.url = root["url"].as<std::string>();
        }
        if (root["package"]) {
            options.packages = string_list(root["package"]);
        }
        if (root["descriptor_sets"]) {
            options.descriptor_sets = string_list(root["descriptor_sets"]);
        }
        if (root["proto_path"]) {
            options.proto_path = string_list(root["proto_path"]);
        }
        if (root["include_dirs"]) {
            options.include_dirs = string_list(root["include_dirs"]);
        }

        options.max_send_message_length = optional_int(root["max_send_message_length"]);
        options.max_receive_message_length = optional_int(root["max_receive_message_length"]);
        options.max_metadata_size = optional_int(root["max_metadata_size"]);

        if (const auto channel_options = root["channel_options"]) {
            for (const auto& entry : channel_options) {
                const auto key = entry.first.as<std::string>();
                int int_value = 0;
                if (YAML::convert<int>::decode(entry.second, int_value)) {
                    options.channel_options[key] = int_value;
                } else {
                    options.channel_options[key] = entry.second.as<std::string>();
                }
            }
        }

        options.graceful_shutdown = root["graceful_shutdown"].as<bool>(false);
        options.legacy_cancel_detection = root["legacy_cancel_detection"].as<bool>(false);

        if (root["write_high_watermark"]) {
            const int watermark = root["write_high_watermark"].as<int>();
            if (watermark < 1) {
                throw std::runtime_error("write_high_watermark must be at least 1");
            }
            options.write_high_watermark = static_cast<std::size_t>(watermark);
        }

        if (const auto credentials = root["credentials"]) {
            options.credentials.root_certs = optional_string(credentials["root_certs"]);
            options.credentials.cert_chain = optional_string(credentials["cert_chain"]);
            options.credentials.private_key = optional_string(credentials["private_key"]);
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse server configuration: " << e.what();
        throw std::runtime_error("Invalid server configuration: " + std::string(e.what()));
    }
    return options;
}

ServerOptions ServerOptions::from_yaml_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    LOG(INFO) << "Loaded configuration from " << path;
    return from_yaml(buffer.str());
}

void ServerOptions::apply_environment() {
    if (const char* url_env = std::getenv("GRPCFLOW_URL")) {
        url = url_env;
    }
    if (const char* sets_env = std::getenv("GRPCFLOW_DESCRIPTOR_SETS")) {
        descriptor_sets = split_paths(sets_env);
    }
    if (const char* proto_env = std::getenv("GRPCFLOW_PROTO_PATH")) {
        proto_path = split_paths(proto_env);
    }
}

} // namespace grpcflow
