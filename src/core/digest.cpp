#include "syncmd/core/digest.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <fstream>
#include <memory>
#include <mutex>

namespace syncmd {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

struct EvpContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpContext = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

std::string to_hex(const unsigned char* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[(data[i] >> 4) & 0xF]);
        out.push_back(kHexDigits[data[i] & 0xF]);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string sha256_hex(const std::uint8_t* data, std::size_t size) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data, size, digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        spdlog::error("SHA-256 digest failed for {} bytes", size);
        return {};
    }
    return to_hex(digest.data(), length);
}

std::string sha256_hex(const std::vector<std::uint8_t>& data) {
    return sha256_hex(data.data(), data.size());
}

std::string sha256_hex(const std::string& data) {
    return sha256_hex(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorKind::Io, "Failed to open file: " + path.string());
    }

    EvpContext ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(ErrorKind::Io, "Failed to initialise SHA-256 context");
    }

    char buffer[8192];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(input.gcount())) != 1) {
            return Err<std::string>(ErrorKind::Io, "SHA-256 update failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorKind::Io, "Failed to read file: " + path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return Err<std::string>(ErrorKind::Io, "SHA-256 finalisation failed for " + path.string());
    }
    return Ok(to_hex(digest.data(), length));
}

bool is_digest_hex(const std::string& text) {
    if (text.size() != kDigestHexLength) {
        return false;
    }
    for (char c : text) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

std::string hex_encode(const std::vector<std::uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

Result<std::vector<std::uint8_t>> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::Serialization, "Hex payload has odd length");
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_value(hex[i]);
        const int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<std::vector<std::uint8_t>>(ErrorKind::Serialization, "Invalid hex digit in payload");
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return Ok(std::move(bytes));
}

std::string random_id(const std::string& prefix) {
    // random_generator is not thread-safe
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::lock_guard lock(mutex);
    return prefix + boost::uuids::to_string(generator());
}

} // namespace syncmd
