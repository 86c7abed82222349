#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace turbofetch {

// Hash families accepted for post-download verification.
[[nodiscard]] const std::vector<std::string>& supportedHashTypes();
[[nodiscard]] bool isSupportedHashType(const std::string& hash_type);

// Streams `path` through the digest and returns lower-case hex. For the
// extendable-output types (shake_128, shake_256) `output_bytes` selects the
// length; 0 picks the algorithm's default security length.
[[nodiscard]] std::string hashFile(const std::string& path, const std::string& hash_type,
                                   std::size_t output_bytes = 0);

[[nodiscard]] std::string hashBytes(const std::string& data, const std::string& hash_type,
                                    std::size_t output_bytes = 0);

} // namespace turbofetch
