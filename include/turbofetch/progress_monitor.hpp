#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <ostream>
#include <string>

namespace turbofetch {

// Redraws a one-transfer progress panel in place until the transfer stops.
class ProgressMonitor {
public:
    using ProgressSource = std::function<Progress()>;
    // Called before every redraw; returning false ends run().
    using Poll = std::function<bool()>;

    explicit ProgressMonitor(ProgressSource source, Poll on_tick = {},
                             std::ostream& out = std::cout);

    // Blocks until the source reports a stopped transfer or `on_tick` says stop.
    void run();

    [[nodiscard]] static std::string buildProgressPanel(const Progress& progress);
    [[nodiscard]] static std::string formatTaskLine(const Progress& progress);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    void redraw(const std::string& panel);

    ProgressSource source_;
    Poll on_tick_;
    std::ostream& out_;
    std::size_t drawn_lines_{0};
};

} // namespace turbofetch
