#include "turbofetch/progress_monitor.hpp"

#include <algorithm>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

using turbofetch::Progress;
using turbofetch::ProgressMonitor;
using turbofetch::TransferState;

TEST(ProgressMonitor, FormatSizePicksLargestFittingUnit) {
    EXPECT_EQ(ProgressMonitor::formatSize(0), "0 B");
    EXPECT_EQ(ProgressMonitor::formatSize(1023), "1023 B");
    EXPECT_EQ(ProgressMonitor::formatSize(1024), "1.0 KB");
    EXPECT_EQ(ProgressMonitor::formatSize(1536), "1.5 KB");
    EXPECT_EQ(ProgressMonitor::formatSize(5ULL * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(ProgressMonitor::formatSize(3ULL * 1024 * 1024 * 1024), "3.0 GB");
    EXPECT_EQ(ProgressMonitor::formatSize(2ULL * 1024 * 1024 * 1024 * 1024), "2.0 TB");
    EXPECT_EQ(ProgressMonitor::formatSize(4096ULL * 1024 * 1024 * 1024 * 1024), "4096.0 TB");
}

TEST(ProgressMonitor, TaskLineShowsPercentAndSizes) {
    Progress progress;
    progress.filename = "/tmp/out/archive.tar";
    progress.total_bytes = 4 * 1024;
    progress.downloaded_bytes = 1024;
    progress.state = TransferState::Fetching;

    const std::string line = ProgressMonitor::formatTaskLine(progress);
    EXPECT_EQ(line.rfind("archive.tar", 0), 0u);
    EXPECT_NE(line.find(" 25%"), std::string::npos);
    EXPECT_NE(line.find("(1.0 KB/4.0 KB)"), std::string::npos);
}

TEST(ProgressMonitor, TaskLineForUnknownSizeAndErrors) {
    Progress progress;
    progress.downloaded_bytes = 2048;
    progress.has_error = true;
    progress.error_message = "boom";

    const std::string line = ProgressMonitor::formatTaskLine(progress);
    EXPECT_NE(line.find("(resolving)"), std::string::npos);
    EXPECT_NE(line.find("[size unknown] 2.0 KB"), std::string::npos);
    EXPECT_NE(line.find("boom"), std::string::npos);
}

TEST(ProgressMonitor, RunStopsWhenTransferFinishes) {
    int polls = 0;
    Progress progress;
    progress.filename = "file.bin";
    progress.total_bytes = 10;
    progress.downloaded_bytes = 10;
    progress.state = TransferState::Done;

    std::ostringstream out;
    ProgressMonitor monitor([&]() { return progress; },
                            [&]() {
                                ++polls;
                                return true;
                            },
                            out);
    monitor.run();

    EXPECT_EQ(polls, 1);
    EXPECT_NE(out.str().find("[done]"), std::string::npos);
    EXPECT_EQ(out.str().find("\033["), std::string::npos);
}

TEST(ProgressMonitor, RedrawMovesBackOverThePreviousPanel) {
    int polls = 0;
    Progress progress;
    progress.state = TransferState::Fetching;
    progress.is_running = true;

    std::ostringstream out;
    ProgressMonitor monitor([&]() { return progress; }, [&]() { return ++polls < 2; }, out);
    monitor.run();

    const std::string panel = ProgressMonitor::buildProgressPanel(progress);
    const auto lines = std::count(panel.begin(), panel.end(), '\n');
    EXPECT_EQ(polls, 2);
    EXPECT_NE(out.str().find("\033[" + std::to_string(lines) + "F\033[J"), std::string::npos);
}
