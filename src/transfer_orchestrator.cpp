#include "turbofetch/transfer_orchestrator.hpp"

#include "turbofetch/chunk_buffer.hpp"
#include "turbofetch/curl_transport.hpp"
#include "turbofetch/digest.hpp"
#include "turbofetch/errors.hpp"
#include "turbofetch/file_writer.hpp"
#include "turbofetch/metadata.hpp"
#include "turbofetch/range_planner.hpp"
#include "turbofetch/segment_fetcher.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace turbofetch {

namespace fs = std::filesystem;

class TransferOrchestrator::Impl {
public:
    Impl(DownloadOptions options, HttpTransportPtr transport, StorageProbePtr storage)
        : options_(std::move(options)),
          transport_(std::move(transport)),
          storage_(std::move(storage)) {
        options_.validate();
        if (!transport_) {
            transport_ = std::make_shared<CurlTransport>();
        }
        if (!storage_) {
            storage_ = std::make_shared<SystemStorageProbe>();
        }
        headers_ = buildRequestHeaders(options_.custom_headers);
    }

    std::optional<DownloadResult> download(const std::string& url, const DownloadRequest& request) {
        resetState(url);

        try {
            request.validate();
            auto result = run(url, request);
            setState(TransferState::Done);
            return result;
        } catch (const TransferCancelled&) {
            removePartialFile();
            spdlog::info("Download of {} cancelled", url);
            setState(TransferState::Cancelled);
            return std::nullopt;
        } catch (const Error& e) {
            removePartialFile();
            registerError(e.what());
            throw;
        } catch (const std::exception& e) {
            removePartialFile();
            registerError(e.what());
            throw DownloadError(fmt::format("An error occurred while downloading file: {}", e.what()));
        }
    }

    // Only a download() that has started is affected; the flags are reset
    // under the same lock that marks the transfer running.
    void cancel() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!is_running_) {
            return;
        }
        user_cancelled_.store(true);
        abort_.cancel();
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return {
            url_,
            output_path_,
            total_bytes_,
            downloaded_bytes_.load(std::memory_order_relaxed),
            state_,
            is_running_,
            has_error_,
            error_message_
        };
    }

    [[nodiscard]] bool isRunning() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return is_running_;
    }

    [[nodiscard]] bool hasError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return has_error_;
    }

private:
    using RangeWorker = std::function<void(const ByteRange&)>;

    DownloadResult run(const std::string& url, const DownloadRequest& request) {
        setState(TransferState::Planning);

        MetadataResolver resolver(*transport_, headers_, options_.timeout_seconds,
                                  options_.metadata_retry, &abort_);
        const FileMetadata metadata = resolver.resolve(url);
        throwIfCancelled();

        const fs::path destination = resolveOutputPath(request.output_path, metadata.filename);
        if (!storage_->hasAvailableSpace(destination.string(), metadata.size)) {
            throw InsufficientSpaceError(fmt::format("Not enough space to download {} bytes to \"{}\"",
                                                     metadata.size, destination.string()));
        }

        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw DownloadError(fmt::format("Failed to create download directory: {} - {}",
                                            destination.parent_path().string(), ec.message()));
        }

        const std::string path = destination.string();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            output_path_ = path;
            total_bytes_ = metadata.size;
        }

        prepareOutputFile(path, metadata.size, request.pre_allocate);
        file_created_ = true;

        setState(TransferState::Fetching);
        if (metadata.size == 0) {
            spdlog::info("Downloading {} -> {} (size unknown, single connection)", url, path);
            fetchWhole(url, path);
        } else {
            if (!metadata.accepts_ranges) {
                spdlog::debug("{} does not advertise byte ranges, trying ranged requests anyway",
                              url);
            }
            const TransferPlan plan =
                buildPlan(metadata.size, options_.connection_speed_mbps, options_.max_connections);
            const bool buffered = resolveWriteMode(request.use_ram_buffer, path);

            spdlog::info("Downloading {} -> {} ({} bytes, {} connections, {} mode)", url, path,
                         plan.total_size, plan.worker_count, buffered ? "buffered" : "direct");
            try {
                if (buffered) {
                    fetchBuffered(url, path, plan);
                } else {
                    fetchDirect(url, path, plan);
                }
            } catch (const RangeNotHonoredError& e) {
                spdlog::warn("{}; restarting as a single connection", e.what());
                restartUnranged(path, metadata.size, request.pre_allocate);
                fetchWhole(url, path);
            }
        }

        const std::uint64_t written = fs::file_size(destination);
        if (metadata.size > 0 && written != metadata.size) {
            throw DownloadError(fmt::format("Downloaded file has {} bytes, expected {}", written,
                                            metadata.size));
        }

        DownloadResult result;
        result.output_path = path;
        result.bytes_written = written;

        if (request.expected_hash) {
            setState(TransferState::Verifying);
            result.digest = verifyDigest(path, *request.expected_hash, request.hash_type);
        }

        spdlog::info("Downloaded {} bytes to {}", written, path);
        return result;
    }

    // Discards what the ranged workers wrote and clears the abort they raised.
    void restartUnranged(const std::string& path, std::uint64_t size, bool pre_allocate) {
        abort_.reset();
        throwIfCancelled();
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            first_failure_ = nullptr;
        }
        downloaded_bytes_.store(0, std::memory_order_relaxed);
        prepareOutputFile(path, size, pre_allocate);
    }

    fs::path resolveOutputPath(const std::string& requested, const std::string& suggested) const {
        fs::path path = fs::absolute(fs::path(requested));
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            path /= suggested;
        }

        if (!options_.overwrite) {
            const fs::path parent = path.parent_path();
            const std::string stem = path.stem().string();
            const std::string extension = path.extension().string();
            for (int counter = 1; fs::exists(path, ec); ++counter) {
                path = parent / fmt::format("{}_{}{}", stem, counter, extension);
            }
        }
        return path.lexically_normal();
    }

    // Collapses the tri-state choice into one decision before any worker runs.
    bool resolveWriteMode(WriteMode mode, const std::string& path) {
        switch (mode) {
        case WriteMode::Buffered:
            return true;
        case WriteMode::Direct:
            return false;
        case WriteMode::Auto:
            break;
        }

        if (storage_->isRamBacked(path)) {
            spdlog::debug("{} is RAM backed, writing directly", path);
            return false;
        }
        const std::uint64_t ceiling =
            ChunkBuffer::memoryCeiling(options_.max_buffer_bytes, storage_->availableMemory());
        if (ceiling < kBufferedReadSize) {
            spdlog::debug("Only {} bytes available for staging, writing directly", ceiling);
            return false;
        }
        return true;
    }

    SegmentFetcher makeFetcher(std::size_t read_size) {
        SegmentFetcher::Settings settings;
        settings.headers = headers_;
        settings.timeout_seconds = options_.timeout_seconds;
        settings.read_size = read_size;
        settings.retry = options_.segment_retry;
        return SegmentFetcher(*transport_, std::move(settings), &abort_, &downloaded_bytes_);
    }

    void fetchWhole(const std::string& url, const std::string& path) {
        DirectFileWriter writer(path);
        std::uint64_t offset = 0;
        SegmentFetcher fetcher = makeFetcher(kSimpleReadSize);
        fetcher.fetch(url, ByteRange::wholeBody(), [&](const char* data, std::size_t size) {
            writer.write(data, size, offset);
            offset += size;
        });
        writer.close();
        throwIfCancelled();

        std::lock_guard<std::mutex> lock(state_mutex_);
        total_bytes_ = offset;
    }

    void fetchBuffered(const std::string& url, const std::string& path, const TransferPlan& plan) {
        MappedFileWriter writer(path, plan.total_size);

        runWorkers(plan, [&](const ByteRange& range) {
            // Sampled once per buffer; not re-checked while the range downloads.
            ChunkBuffer buffer(range.size(), options_.flush_threshold, options_.max_buffer_bytes,
                               storage_->availableMemory());
            std::uint64_t position = range.start;
            const auto write_block = [&](const std::vector<char>& block) {
                writer.flush(block.data(), block.size(), position);
                position += block.size();
            };

            SegmentFetcher fetcher = makeFetcher(kBufferedReadSize);
            fetcher.fetch(url, range, [&](const char* data, std::size_t size) {
                ChunkBuffer::Result result = buffer.write(data, size);
                switch (result.status) {
                case ChunkBuffer::Status::Staged:
                    break;
                case ChunkBuffer::Status::Flushed:
                    write_block(result.block);
                    break;
                case ChunkBuffer::Status::Rejected:
                    write_block(buffer.drain());
                    writer.flush(data, size, position);
                    buffer.recordBypass(size);
                    position += size;
                    break;
                }
            });
            write_block(buffer.drain());
        });
    }

    void fetchDirect(const std::string& url, const std::string& path, const TransferPlan& plan) {
        DirectFileWriter writer(path);

        runWorkers(plan, [&](const ByteRange& range) {
            std::uint64_t offset = range.start;
            SegmentFetcher fetcher = makeFetcher(kSimpleReadSize);
            fetcher.fetch(url, range, [&](const char* data, std::size_t size) {
                writer.write(data, size, offset);
                offset += size;
            });
        });
        writer.close();
    }

    // One thread per range. The first failure aborts the others; it is
    // rethrown once every thread has joined.
    void runWorkers(const TransferPlan& plan, const RangeWorker& worker) {
        std::vector<std::thread> workers;
        workers.reserve(plan.ranges.size());

        try {
            for (const ByteRange& range : plan.ranges) {
                workers.emplace_back([this, &worker, range]() {
                    try {
                        worker(range);
                    } catch (const TransferCancelled&) {
                        // Teardown in progress; the cause is already recorded.
                    } catch (const RangeNotHonoredError&) {
                        recordFailure(std::current_exception(), range, false);
                    } catch (...) {
                        recordFailure(std::current_exception(), range);
                    }
                });
            }
        } catch (...) {
            abort_.cancel();
            joinAll(workers);
            throw;
        }
        joinAll(workers);

        throwIfCancelled();
        std::lock_guard<std::mutex> lock(failure_mutex_);
        if (first_failure_) {
            std::rethrow_exception(first_failure_);
        }
    }

    static void joinAll(std::vector<std::thread>& workers) {
        for (auto& thread : workers) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        workers.clear();
    }

    void recordFailure(std::exception_ptr failure, const ByteRange& range, bool log = true) {
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            if (!first_failure_) {
                first_failure_ = failure;
            }
            if (log && first_failure_ == failure) {
                try {
                    std::rethrow_exception(failure);
                } catch (const std::exception& e) {
                    spdlog::error("Range {}-{} failed: {}", range.start, range.end, e.what());
                } catch (...) {
                    spdlog::error("Range {}-{} failed with a non-standard exception", range.start,
                                  range.end);
                }
            }
        }
        abort_.cancel();
    }

    std::string verifyDigest(const std::string& path, const std::string& expected,
                             const std::string& hash_type) {
        std::string wanted = expected;
        std::transform(wanted.begin(), wanted.end(), wanted.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        const std::string actual = hashFile(path, hash_type, wanted.size() / 2);
        if (actual != wanted) {
            removePartialFile();
            throw HashVerificationError(fmt::format(
                "Hash verification failed. Hash type: \"{}\". Expected hash: \"{}\". Actual hash: \"{}\"",
                hash_type, wanted, actual));
        }
        spdlog::debug("{} digest of {} verified", hash_type, path);
        return actual;
    }

    void throwIfCancelled() const {
        if (user_cancelled_.load()) {
            throw TransferCancelled();
        }
    }

    void removePartialFile() {
        if (!file_created_) {
            return;
        }
        std::string path;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            path = output_path_;
        }
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            spdlog::warn("Failed to remove partial file {}: {}", path, ec.message());
        }
        file_created_ = false;
    }

    void resetState(const std::string& url) {
        downloaded_bytes_.store(0, std::memory_order_relaxed);
        file_created_ = false;
        {
            std::lock_guard<std::mutex> lock(failure_mutex_);
            first_failure_ = nullptr;
        }

        std::lock_guard<std::mutex> lock(state_mutex_);
        abort_.reset();
        user_cancelled_.store(false);
        url_ = url;
        output_path_.clear();
        total_bytes_ = 0;
        state_ = TransferState::Idle;
        is_running_ = true;
        has_error_ = false;
        error_message_.clear();
    }

    void setState(TransferState state) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
        is_running_ = state != TransferState::Done && state != TransferState::Failed &&
                      state != TransferState::Cancelled;
        spdlog::debug("Transfer state: {}", toString(state));
    }

    void registerError(std::string message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        has_error_ = true;
        if (error_message_.empty()) {
            error_message_ = std::move(message);
        }
        state_ = TransferState::Failed;
        is_running_ = false;
    }

    DownloadOptions options_;
    HttpTransportPtr transport_;
    StorageProbePtr storage_;
    HeaderMap headers_;

    CancellationToken abort_;
    std::atomic<bool> user_cancelled_{false};
    std::atomic<std::uint64_t> downloaded_bytes_{0};
    bool file_created_{false};

    std::mutex failure_mutex_;
    std::exception_ptr first_failure_;

    mutable std::mutex state_mutex_;
    std::string url_;
    std::string output_path_;
    std::uint64_t total_bytes_{0};
    TransferState state_{TransferState::Idle};
    bool is_running_{false};
    bool has_error_{false};
    std::string error_message_;
};

TransferOrchestrator::TransferOrchestrator(DownloadOptions options)
    : TransferOrchestrator(std::move(options), nullptr, nullptr) {}

TransferOrchestrator::TransferOrchestrator(DownloadOptions options, HttpTransportPtr transport,
                                           StorageProbePtr storage)
    : impl_(std::make_unique<Impl>(std::move(options), std::move(transport), std::move(storage))) {}

TransferOrchestrator::~TransferOrchestrator() = default;

std::optional<DownloadResult> TransferOrchestrator::download(const std::string& url,
                                                             const DownloadRequest& request) {
    return impl_->download(url, request);
}

void TransferOrchestrator::cancel() { impl_->cancel(); }

Progress TransferOrchestrator::getProgress() const { return impl_->getProgress(); }

bool TransferOrchestrator::isRunning() const { return impl_->isRunning(); }

bool TransferOrchestrator::hasError() const { return impl_->hasError(); }

} // namespace turbofetch
