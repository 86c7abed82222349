#include "turbofetch/segment_fetcher.hpp"

#include "test_support.hpp"

#include <atomic>
#include <string>

#include <gtest/gtest.h>

using turbofetch::ByteRange;
using turbofetch::SegmentFetcher;
using turbofetch::testing::FakeTransport;

namespace {

SegmentFetcher::Settings fastSettings() {
    SegmentFetcher::Settings settings;
    settings.headers = {{"Accept", "*/*"}};
    settings.retry = turbofetch::testing::fastRetry();
    return settings;
}

} // namespace

TEST(SegmentFetcher, FetchesRequestedRange) {
    const std::string body = turbofetch::testing::makePattern(20000);
    FakeTransport transport(body);
    std::atomic<std::uint64_t> progress{0};
    SegmentFetcher fetcher(transport, fastSettings(), nullptr, &progress);

    std::string received;
    int reads = 0;
    const auto bytes = fetcher.fetch("http://example.test/file.bin", ByteRange{1000, 9999, false},
                                     [&](const char* data, std::size_t size) {
                                         received.append(data, size);
                                         ++reads;
                                     });

    EXPECT_EQ(bytes, 9000u);
    EXPECT_EQ(received, body.substr(1000, 9000));
    EXPECT_EQ(progress.load(), 9000u);
    EXPECT_GT(reads, 1);
    EXPECT_EQ(transport.getRanges(), std::vector<std::string>{"1000-9999"});
    EXPECT_EQ(transport.requests().front().headers.at("Accept"), "*/*");
}

TEST(SegmentFetcher, WholeBodyRangeSendsNoRangeHeader) {
    const std::string body = turbofetch::testing::makePattern(5000);
    FakeTransport transport(body);
    SegmentFetcher fetcher(transport, fastSettings());

    std::string received;
    fetcher.fetch("http://example.test/f", ByteRange::wholeBody(),
                  [&](const char* data, std::size_t size) { received.append(data, size); });

    EXPECT_EQ(received, body);
    EXPECT_TRUE(transport.getRanges().empty());
}

TEST(SegmentFetcher, FirstByteRangeIsRequestedExplicitly) {
    FakeTransport transport("ab");
    SegmentFetcher fetcher(transport, fastSettings());

    std::string received;
    fetcher.fetch("http://example.test/f", ByteRange{0, 0, false},
                  [&](const char* data, std::size_t size) { received.append(data, size); });

    EXPECT_EQ(received, "a");
    EXPECT_EQ(transport.getRanges(), std::vector<std::string>{"0-0"});
}

TEST(SegmentFetcher, ResumesAfterBrokenConnection) {
    const std::string body = turbofetch::testing::makePattern(40000);
    FakeTransport transport(body);
    transport.failing_gets = 1;
    transport.fail_after_bytes = 8192;
    SegmentFetcher fetcher(transport, fastSettings());

    std::string received;
    const auto bytes = fetcher.fetch("http://example.test/f", ByteRange{100, 30099, false},
                                     [&](const char* data, std::size_t size) {
                                         received.append(data, size);
                                     });

    EXPECT_EQ(bytes, 30000u);
    EXPECT_EQ(received, body.substr(100, 30000));
    const auto ranges = transport.getRanges();
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], "100-30099");
    EXPECT_EQ(ranges[1], "8292-30099");
}

TEST(SegmentFetcher, RetriesHttpErrors) {
    const std::string body = turbofetch::testing::makePattern(1000);
    FakeTransport transport(body);
    transport.failing_gets = 2;
    transport.fail_status = 503;
    SegmentFetcher fetcher(transport, fastSettings());

    std::string received;
    fetcher.fetch("http://example.test/f", ByteRange{0, 999, false},
                  [&](const char* data, std::size_t size) { received.append(data, size); });
    EXPECT_EQ(received, body);
    EXPECT_EQ(transport.get_calls.load(), 3);
}

TEST(SegmentFetcher, ExhaustedRetriesBecomeDownloadError) {
    FakeTransport transport(turbofetch::testing::makePattern(1000));
    transport.failing_gets = 100;
    transport.fail_status = 500;
    SegmentFetcher fetcher(transport, fastSettings());

    try {
        fetcher.fetch("http://example.test/f", ByteRange{0, 999, false},
                      [](const char*, std::size_t) {});
        FAIL() << "expected DownloadError";
    } catch (const turbofetch::RetryableError&) {
        FAIL() << "retryable error leaked out of the fetcher";
    } catch (const turbofetch::DownloadError& e) {
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }
    EXPECT_EQ(transport.get_calls.load(), 3);
}

TEST(SegmentFetcher, ServerIgnoringRangeOnResumeSkipsDeliveredPrefix) {
    const std::string body = turbofetch::testing::makePattern(30000);
    FakeTransport transport(body);
    transport.support_ranges = false;
    transport.failing_gets = 1;
    transport.fail_after_bytes = 4096 * 3;
    SegmentFetcher fetcher(transport, fastSettings());

    std::string received;
    fetcher.fetch("http://example.test/f", ByteRange::wholeBody(),
                  [&](const char* data, std::size_t size) { received.append(data, size); });
    EXPECT_EQ(received, body);
}

TEST(SegmentFetcher, ServerIgnoringRangeForASliceIsReportedWithoutRetry) {
    FakeTransport transport(turbofetch::testing::makePattern(30000));
    transport.support_ranges = false;
    SegmentFetcher fetcher(transport, fastSettings());

    std::size_t delivered = 0;
    EXPECT_THROW(fetcher.fetch("http://example.test/f", ByteRange{10000, 19999, false},
                               [&](const char*, std::size_t size) { delivered += size; }),
                 turbofetch::RangeNotHonoredError);
    EXPECT_EQ(transport.get_calls.load(), 1);
    EXPECT_EQ(delivered, 0u);
}

TEST(SegmentFetcher, CancelledTokenStopsTheFetch) {
    FakeTransport transport(turbofetch::testing::makePattern(100000));
    turbofetch::CancellationToken token;
    SegmentFetcher fetcher(transport, fastSettings(), &token);

    std::size_t received = 0;
    EXPECT_THROW(fetcher.fetch("http://example.test/f", ByteRange{0, 99999, false},
                               [&](const char*, std::size_t size) {
                                   received += size;
                                   if (received > 10000) {
                                       token.cancel();
                                   }
                               }),
                 turbofetch::TransferCancelled);
    EXPECT_LT(received, 100000u);
}

TEST(SegmentFetcher, SinkErrorsAreNotRetried) {
    FakeTransport transport(turbofetch::testing::makePattern(1000));
    SegmentFetcher fetcher(transport, fastSettings());

    EXPECT_THROW(fetcher.fetch("http://example.test/f", ByteRange{0, 999, false},
                               [](const char*, std::size_t) {
                                   throw turbofetch::DownloadError("write failed");
                               }),
                 turbofetch::DownloadError);
    EXPECT_EQ(transport.get_calls.load(), 1);
}
