#include "turbofetch/digest.hpp"

#include "turbofetch/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <utility>

#include <fmt/format.h>
#include <openssl/evp.h>

namespace turbofetch {

namespace {

constexpr std::size_t kHashReadSize = 1024 * 1024;

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const std::vector<std::pair<std::string, std::string>>& hashTable() {
    // User facing name -> OpenSSL digest name.
    static const std::vector<std::pair<std::string, std::string>> table = {
        {"md5", "MD5"},           {"sha1", "SHA1"},         {"sha224", "SHA224"},
        {"sha256", "SHA256"},     {"sha384", "SHA384"},     {"sha512", "SHA512"},
        {"blake2b", "BLAKE2B512"}, {"blake2s", "BLAKE2S256"}, {"sha3_224", "SHA3-224"},
        {"sha3_256", "SHA3-256"}, {"sha3_384", "SHA3-384"}, {"sha3_512", "SHA3-512"},
        {"shake_128", "SHAKE128"}, {"shake_256", "SHAKE256"},
    };
    return table;
}

const EVP_MD* lookupDigest(const std::string& hash_type) {
    const auto& table = hashTable();
    const auto it = std::find_if(table.begin(), table.end(),
                                 [&](const auto& entry) { return entry.first == hash_type; });
    if (it == table.end()) {
        throw InvalidArgumentError(fmt::format("Unsupported hash type \"{}\"", hash_type));
    }
    const EVP_MD* md = EVP_get_digestbyname(it->second.c_str());
    if (!md) {
        throw InvalidArgumentError(
            fmt::format("Hash type \"{}\" is not available in this OpenSSL build", hash_type));
    }
    return md;
}

class Hasher {
public:
    Hasher(const std::string& hash_type, std::size_t output_bytes)
        : md_(lookupDigest(hash_type)), ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
            throw Error(fmt::format("Failed to initialise {} digest", hash_type));
        }
        xof_ = (EVP_MD_flags(md_) & EVP_MD_FLAG_XOF) != 0;
        output_bytes_ = (xof_ && output_bytes > 0) ? output_bytes
                                                   : static_cast<std::size_t>(EVP_MD_size(md_));
    }

    void update(const void* data, std::size_t size) {
        if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
            throw Error("Failed to update digest");
        }
    }

    std::string hexDigest() {
        std::vector<unsigned char> digest(std::max<std::size_t>(output_bytes_, EVP_MAX_MD_SIZE));
        int rc = 0;
        if (xof_) {
            rc = EVP_DigestFinalXOF(ctx_.get(), digest.data(), output_bytes_);
        } else {
            unsigned int length = 0;
            rc = EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length);
            output_bytes_ = length;
        }
        if (rc != 1) {
            throw Error("Failed to finalise digest");
        }

        std::string hex;
        hex.reserve(output_bytes_ * 2);
        for (std::size_t i = 0; i < output_bytes_; ++i) {
            hex += fmt::format("{:02x}", digest[i]);
        }
        return hex;
    }

private:
    const EVP_MD* md_;
    DigestContext ctx_;
    bool xof_{false};
    std::size_t output_bytes_{0};
};

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

} // namespace

const std::vector<std::string>& supportedHashTypes() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : hashTable()) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return names;
}

bool isSupportedHashType(const std::string& hash_type) {
    const auto& names = supportedHashTypes();
    return std::find(names.begin(), names.end(), hash_type) != names.end();
}

std::string hashFile(const std::string& path, const std::string& hash_type,
                     std::size_t output_bytes) {
    Hasher hasher(hash_type, output_bytes);

    std::unique_ptr<FILE, FileDeleter> file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        throw Error(fmt::format("Cannot open {} for hashing: {}", path, std::strerror(errno)));
    }

    std::vector<char> buffer(kHashReadSize);
    while (true) {
        const size_t read = std::fread(buffer.data(), 1, buffer.size(), file.get());
        if (read > 0) {
            hasher.update(buffer.data(), read);
        }
        if (read < buffer.size()) {
            if (std::ferror(file.get())) {
                throw Error(fmt::format("Failed to read {} for hashing", path));
            }
            break;
        }
    }
    return hasher.hexDigest();
}

std::string hashBytes(const std::string& data, const std::string& hash_type,
                      std::size_t output_bytes) {
    Hasher hasher(hash_type, output_bytes);
    hasher.update(data.data(), data.size());
    return hasher.hexDigest();
}

} // namespace turbofetch
