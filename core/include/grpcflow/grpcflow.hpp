#pragma once

// Main header file for the grpcflow library

#include "grpcflow/types.hpp"
#include "grpcflow/errors.hpp"
#include "grpcflow/call.hpp"
#include "grpcflow/handler.hpp"
#include "grpcflow/pattern_registry.hpp"
#include "grpcflow/stream_writer.hpp"
#include "grpcflow/call_adapters.hpp"
#include "grpcflow/package_discovery.hpp"
#include "grpcflow/service_binder.hpp"
#include "grpcflow/proto_loader.hpp"
#include "grpcflow/config.hpp"
#include "grpcflow/server.hpp"

#define GRPCFLOW_VERSION_MAJOR 0
#define GRPCFLOW_VERSION_MINOR 1
#define GRPCFLOW_VERSION_PATCH 0

namespace grpcflow {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = GRPCFLOW_VERSION_MAJOR;
constexpr int VERSION_MINOR = GRPCFLOW_VERSION_MINOR;
constexpr int VERSION_PATCH = GRPCFLOW_VERSION_PATCH;

} // namespace grpcflow
