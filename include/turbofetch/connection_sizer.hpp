#pragma once

#include <cstdint>

namespace turbofetch {

inline constexpr int kMaxConnections = 32;
inline constexpr int kMinAutoConnections = 2;

// Either "auto" (derive from file size and link speed) or a fixed count.
class ConnectionCount {
public:
    static ConnectionCount automatic() { return ConnectionCount{true, 0}; }
    static ConnectionCount fixed(int count) { return ConnectionCount{false, count}; }

    [[nodiscard]] bool isAuto() const { return auto_; }
    [[nodiscard]] int value() const { return value_; }

private:
    ConnectionCount(bool is_auto, int value) : auto_(is_auto), value_(value) {}

    bool auto_;
    int value_;
};

[[nodiscard]] int sizeConnections(std::uint64_t file_size_bytes, double link_speed_mbps,
                                  ConnectionCount requested = ConnectionCount::automatic());

} // namespace turbofetch
