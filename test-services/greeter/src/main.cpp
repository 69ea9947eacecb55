#include "greeter_handlers.hpp"
#include <grpcflow/grpcflow.hpp>
#include <glog/logging.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested.store(true);
}

int main(int argc, char* argv[]) {
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();

    // Set up signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Parse command line arguments
    std::string config_path;
    std::string listen_address;
    std::vector<std::string> descriptor_sets;
    std::vector<std::string> proto_paths;
    std::vector<std::string> include_dirs;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--config=") == 0) {
            config_path = arg.substr(9);
        } else if (arg.find("--listen=") == 0) {
            listen_address = arg.substr(9);
        } else if (arg.find("--descriptor-set=") == 0) {
            descriptor_sets.push_back(arg.substr(17));
        } else if (arg.find("--proto-path=") == 0) {
            proto_paths.push_back(arg.substr(13));
        } else if (arg.find("--include-dir=") == 0) {
            include_dirs.push_back(arg.substr(14));
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --config=PATH          YAML server configuration\n"
                      << "  --listen=ADDRESS       Listen address (default: localhost:5000)\n"
                      << "  --descriptor-set=PATH  Descriptor set with GreetService, repeatable\n"
                      << "  --proto-path=PATH      greet.proto source parsed at startup, repeatable\n"
                      << "  --include-dir=DIR      Import directory for --proto-path, repeatable\n"
                      << "  --help, -h             Show this help message\n"
                      << "Environment (command line overrides env):\n"
                      << "  GRPCFLOW_URL              Listen address\n"
                      << "  GRPCFLOW_DESCRIPTOR_SETS  Descriptor sets, colon separated\n"
                      << "  GRPCFLOW_PROTO_PATH       Proto sources, colon separated\n";
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    try {
        grpcflow::ServerOptions options;
        if (!config_path.empty()) {
            options = grpcflow::ServerOptions::from_yaml_file(config_path);
        }
        options.apply_environment();
        if (!listen_address.empty()) {
            options.url = listen_address;
        }
        if (!descriptor_sets.empty()) {
            options.descriptor_sets = descriptor_sets;
        }
        if (!proto_paths.empty()) {
            options.proto_path = proto_paths;
        }
        if (!include_dirs.empty()) {
            options.include_dirs = include_dirs;
        }
        if (options.packages.empty()) {
            options.packages.push_back("greet");
        }
        if (options.descriptor_sets.empty() && options.proto_path.empty()) {
            LOG(ERROR) << "No service definitions given, use --descriptor-set=PATH or --proto-path=PATH";
            return 1;
        }

        LOG(INFO) << "Starting Greeter Service on " << options.url;

        grpcflow::Server server(options);
        grpcflow::test::register_greeter_handlers(server.registry());

        bool started = false;
        server.listen([&started](std::exception_ptr error) {
            if (error) {
                LOG(ERROR) << "Failed to start greeter service: " << grpcflow::describe_exception(error);
                return;
            }
            started = true;
        });
        if (!started) {
            return 1;
        }

        LOG(INFO) << "Greeter service is running on port " << server.bound_port() << ". Press Ctrl+C to stop.";

        // Wait for shutdown signal
        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        LOG(INFO) << "Shutdown requested, stopping server...";
        server.close();

    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to start greeter service: " << e.what();
        return 1;
    }

    LOG(INFO) << "Greeter service stopped.";
    return 0;
}
