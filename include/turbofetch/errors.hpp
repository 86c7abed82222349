#pragma once

#include <stdexcept>
#include <string>

namespace turbofetch {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Metadata probe failed after all retries.
class RequestError : public Error {
public:
    using Error::Error;
};

// A range fetch or a write failed; fatal to the whole transfer.
class DownloadError : public Error {
public:
    using Error::Error;
};

class InsufficientSpaceError : public Error {
public:
    using Error::Error;
};

class HashVerificationError : public Error {
public:
    using Error::Error;
};

class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

// A ranged GET was answered with the whole resource (200). Not retried; the
// orchestrator falls back to one unranged fetch.
class RangeNotHonoredError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Failures retryWithBackoff() is allowed to retry.
class RetryableError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class TransportError : public RetryableError {
public:
    using RetryableError::RetryableError;
};

class HttpStatusError : public RetryableError {
public:
    HttpStatusError(long status_code, const std::string& message)
        : RetryableError(message), status_code_(status_code) {}

    [[nodiscard]] long statusCode() const { return status_code_; }

private:
    long status_code_;
};

// Thrown inside workers when the transfer is being torn down; never leaves
// TransferOrchestrator::download().
class TransferCancelled : public std::runtime_error {
public:
    TransferCancelled() : std::runtime_error("transfer cancelled") {}
};

} // namespace turbofetch
