#include "turbofetch/progress_monitor.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace turbofetch {

ProgressMonitor::ProgressMonitor(ProgressSource source, Poll on_tick, std::ostream& out)
    : source_(std::move(source)), on_tick_(std::move(on_tick)), out_(out) {}

void ProgressMonitor::run() {
    while (true) {
        const bool active = on_tick_ ? on_tick_() : true;

        const Progress progress = source_();
        redraw(buildProgressPanel(progress));

        if (!active || (!progress.is_running && progress.state != TransferState::Idle)) {
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    out_.flush();
}

std::string ProgressMonitor::buildProgressPanel(const Progress& progress) {
    std::string panel;
    panel.reserve(512);
    panel.append("==================================================\n");
    panel += fmt::format("turbofetch [{}]\n", toString(progress.state));
    panel.append("--------------------------------------------------\n");
    panel += formatTaskLine(progress);
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressMonitor::formatTaskLine(const Progress& progress) {
    std::string line;
    line.reserve(256);

    std::string display_name;
    if (!progress.filename.empty()) {
        display_name = std::filesystem::path{progress.filename}.filename().string();
    }
    if (display_name.size() > 20) {
        display_name = display_name.substr(0, 20);
    }
    if (display_name.empty()) {
        display_name = "(resolving)";
    }

    if (progress.total_bytes > 0) {
        const double ratio = std::min(1.0, static_cast<double>(progress.downloaded_bytes) /
                                               static_cast<double>(progress.total_bytes));
        const int percent = static_cast<int>(ratio * 100.0);
        constexpr int bar_width = 30;
        const int bar_pos = static_cast<int>(ratio * bar_width);

        std::string bar;
        bar.reserve(static_cast<std::size_t>(bar_width) * 3);
        for (int i = 0; i < bar_width; ++i) {
            bar += (i < bar_pos) ? "█" : "░";
        }

        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})", display_name, bar, percent,
                            formatSize(progress.downloaded_bytes),
                            formatSize(progress.total_bytes));
    } else if (progress.downloaded_bytes > 0) {
        line += fmt::format("{:<20} [size unknown] {}", display_name,
                            formatSize(progress.downloaded_bytes));
    } else {
        line += fmt::format("{:<20} [Initializing...]", display_name);
    }

    if (progress.has_error) {
        line += fmt::format("  ❌ {}", progress.error_message);
    } else if (progress.state == TransferState::Done) {
        line.append("  ✅ Done");
    } else if (progress.state == TransferState::Cancelled) {
        line.append("  Cancelled");
    }
    return line;
}

std::string ProgressMonitor::formatSize(std::uint64_t bytes) {
    static constexpr const char* kUnits[] = {"KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }

    double value = static_cast<double>(bytes) / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(kUnits)) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.1f} {}", value, kUnits[unit]);
}

// Moves the cursor back over the previous panel and clears to the end of the
// screen before printing the new one.
void ProgressMonitor::redraw(const std::string& panel) {
    if (drawn_lines_ > 0) {
        out_ << fmt::format("\033[{}F\033[J", drawn_lines_);
    }
    out_ << panel << std::flush;
    drawn_lines_ = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
}

} // namespace turbofetch
