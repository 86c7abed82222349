#include "turbofetch/metadata.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

using turbofetch::filenameFromContentDisposition;
using turbofetch::filenameFromUrl;
using turbofetch::parseMetadata;
using turbofetch::testing::FakeTransport;

TEST(Metadata, ContentDispositionPlainFilename) {
    EXPECT_EQ(filenameFromContentDisposition("attachment; filename=\"report.pdf\""), "report.pdf");
    EXPECT_EQ(filenameFromContentDisposition("attachment; filename=data.csv; size=10"), "data.csv");
}

TEST(Metadata, ContentDispositionExtendedFilenameWins) {
    EXPECT_EQ(filenameFromContentDisposition(
                  "attachment; filename=\"fallback.bin\"; filename*=UTF-8''na%C3%AFve%20file.txt"),
              "na\xC3\xAFve file.txt");
}

TEST(Metadata, ContentDispositionCannotEscapeDirectory) {
    EXPECT_EQ(filenameFromContentDisposition("attachment; filename=\"../../etc/passwd\""), "passwd");
    EXPECT_FALSE(filenameFromContentDisposition("attachment; filename=\"..\"").has_value());
    EXPECT_FALSE(filenameFromContentDisposition("inline").has_value());
}

TEST(Metadata, FilenameFromUrlPath) {
    EXPECT_EQ(filenameFromUrl("https://host.test/a/b/archive%20v2.tar.gz?sig=1#frag"),
              "archive v2.tar.gz");
    EXPECT_EQ(filenameFromUrl("https://host.test/"), "");
    EXPECT_EQ(filenameFromUrl("https://host.test"), "");
}

TEST(Metadata, ParseHeaders) {
    const auto meta = parseMetadata("https://host.test/dl?id=3",
                                    {{"content-length", "2048"},
                                     {"content-type", "application/zip; charset=binary"},
                                     {"accept-ranges", "bytes"}});
    EXPECT_EQ(meta.size, 2048u);
    EXPECT_EQ(meta.mimetype, "application/zip");
    EXPECT_EQ(meta.filename, "dl");
    EXPECT_TRUE(meta.accepts_ranges);
}

TEST(Metadata, FallbackNameUsesMimeExtension) {
    const auto meta = parseMetadata("https://host.test/", {{"content-type", "image/png"}});
    EXPECT_EQ(meta.filename, "downloaded_file.png");
    EXPECT_EQ(meta.size, 0u);
    EXPECT_FALSE(meta.accepts_ranges);

    EXPECT_EQ(parseMetadata("https://host.test/", {}).filename, "downloaded_file");
}

TEST(Metadata, MalformedLengthMeansUnknownSize) {
    EXPECT_EQ(parseMetadata("https://host.test/x", {{"content-length", "lots"}}).size, 0u);
}

TEST(MetadataResolver, ProbesWithHead) {
    FakeTransport transport(std::string(777, 'a'));
    transport.content_disposition = "attachment; filename=\"named.iso\"";
    turbofetch::MetadataResolver resolver(transport, {{"User-Agent", "ua"}}, 30L,
                                          turbofetch::testing::fastRetry());

    const auto meta = resolver.resolve("https://host.test/download");
    EXPECT_EQ(meta.size, 777u);
    EXPECT_EQ(meta.filename, "named.iso");
    EXPECT_EQ(transport.head_calls.load(), 1);
    EXPECT_EQ(transport.requests().front().headers.at("User-Agent"), "ua");
    EXPECT_EQ(transport.requests().front().timeout_seconds, 30L);
}

TEST(MetadataResolver, RefusedHeadMeansUnknownMetadata) {
    FakeTransport transport("payload");
    transport.head_status = 405;
    turbofetch::MetadataResolver resolver(transport, {}, std::nullopt,
                                          turbofetch::testing::fastRetry());

    const auto meta = resolver.resolve("https://host.test/files/thing.bin");
    EXPECT_EQ(meta.size, 0u);
    EXPECT_EQ(meta.filename, "thing.bin");
    EXPECT_EQ(transport.head_calls.load(), 1);
}

TEST(MetadataResolver, PersistentServerErrorIsRequestError) {
    FakeTransport transport("payload");
    transport.head_status = 503;
    turbofetch::MetadataResolver resolver(transport, {}, std::nullopt,
                                          turbofetch::testing::fastRetry());

    try {
        static_cast<void>(resolver.resolve("https://host.test/x.bin"));
        FAIL() << "expected RequestError";
    } catch (const turbofetch::RequestError& e) {
        EXPECT_NE(std::string(e.what()).find("503"), std::string::npos);
    }
    EXPECT_EQ(transport.head_calls.load(), 3);
}

namespace {
class UnreachableTransport final : public turbofetch::HttpTransport {
public:
    int calls{0};
    turbofetch::HttpResponse head(const turbofetch::HttpRequest&) override {
        ++calls;
        throw turbofetch::TransportError("could not resolve host");
    }
    turbofetch::HttpResponse get(const turbofetch::HttpRequest&,
                                 const turbofetch::ResponseCallbacks&) override {
        throw turbofetch::TransportError("could not resolve host");
    }
};
} // namespace

TEST(MetadataResolver, TransportFailureIsRequestError) {
    UnreachableTransport transport;
    turbofetch::MetadataResolver resolver(transport, {}, std::nullopt,
                                          turbofetch::testing::fastRetry());
    EXPECT_THROW(static_cast<void>(resolver.resolve("https://nowhere.test/")),
                 turbofetch::RequestError);
    EXPECT_EQ(transport.calls, 3);
}
