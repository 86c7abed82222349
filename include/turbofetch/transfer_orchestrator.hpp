#pragma once

#include "http_transport.hpp"
#include "options.hpp"
#include "progress.hpp"
#include "storage_probe.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace turbofetch {

struct DownloadResult {
    std::string output_path;
    std::uint64_t bytes_written{0};
    std::optional<std::string> digest;
};

class TransferOrchestrator final {
public:
    explicit TransferOrchestrator(DownloadOptions options = {});
    TransferOrchestrator(DownloadOptions options, HttpTransportPtr transport,
                         StorageProbePtr storage);
    ~TransferOrchestrator();

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

    // Downloads `url` according to `request`. Returns std::nullopt when the
    // transfer was cancelled; the partial file is removed in that case and on
    // every error.
    std::optional<DownloadResult> download(const std::string& url, const DownloadRequest& request);

    // Stops an in-flight download() from any thread. Has no effect while no
    // download() is running.
    void cancel();

    [[nodiscard]] Progress getProgress() const;
    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] bool hasError() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace turbofetch
