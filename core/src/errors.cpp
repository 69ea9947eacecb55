#include "grpcflow/errors.hpp"
#include <algorithm>
#include <cctype>

namespace grpcflow {

grpc::Status status_from_exception(std::exception_ptr error) {
    if (!error) {
        return grpc::Status::OK;
    }
    try {
        std::rethrow_exception(error);
    } catch (const RpcException& e) {
        return e.to_status();
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::UNKNOWN, e.what());
    } catch (...) {
        return grpc::Status(grpc::StatusCode::UNKNOWN, "Unknown error");
    }
}

std::string describe_exception(std::exception_ptr error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

bool is_cancellation(std::exception_ptr error, bool legacy_text_match) {
    if (!error) {
        return false;
    }
    if (status_from_exception(error).error_code() == grpc::StatusCode::CANCELLED) {
        return true;
    }
    if (!legacy_text_match) {
        return false;
    }
    std::string text = describe_exception(error);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text.find("cancelled") != std::string::npos;
}

} // namespace grpcflow
