#pragma once

#include <grpcpp/support/status.h>
#include <exception>
#include <stdexcept>
#include <string>

namespace grpcflow {

// Handler error carrying an explicit gRPC status
class RpcException : public std::runtime_error {
public:
    RpcException(grpc::StatusCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    grpc::StatusCode code() const { return code_; }
    grpc::Status to_status() const { return grpc::Status(code_, what()); }

private:
    grpc::StatusCode code_;
};

// Explicit cancellation signal raised by the transport
class CancelledError : public RpcException {
public:
    explicit CancelledError(const std::string& message = "Cancelled")
        : RpcException(grpc::StatusCode::CANCELLED, message) {}
};

// Startup failure while binding services
class BindingError : public std::runtime_error {
public:
    explicit BindingError(const std::string& message) : std::runtime_error(message) {}
};

class InvalidPackageError : public BindingError {
public:
    explicit InvalidPackageError(const std::string& package_name)
        : BindingError("The invalid gRPC package (package not found): " + package_name),
          package_name_(package_name) {}

    const std::string& package_name() const { return package_name_; }

private:
    std::string package_name_;
};

class InvalidProtoDefinitionError : public BindingError {
public:
    InvalidProtoDefinitionError(const std::string& path, const std::string& reason)
        : BindingError("The invalid .proto definition (file not found or not parsable): " +
                       path + (reason.empty() ? "" : " (" + reason + ")")),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Status the transport finishes a call with for the given error
grpc::Status status_from_exception(std::exception_ptr error);

// Text of an error for logging
std::string describe_exception(std::exception_ptr error);

// True if the error signals that the peer cancelled the call. With
// legacy_text_match an error whose message contains "cancelled" in any
// case also counts.
bool is_cancellation(std::exception_ptr error, bool legacy_text_match = false);

} // namespace grpcflow
