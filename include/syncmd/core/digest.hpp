#pragma once

#include "syncmd/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace syncmd {

/// Length of a SHA-256 digest rendered as lowercase hex.
constexpr std::size_t kDigestHexLength = 64;

std::string sha256_hex(const std::uint8_t* data, std::size_t size);
std::string sha256_hex(const std::vector<std::uint8_t>& data);
std::string sha256_hex(const std::string& data);

/**
 * @brief Stream a file through SHA-256 without loading it whole
 */
Result<std::string> sha256_file(const std::filesystem::path& path);

bool is_digest_hex(const std::string& text);

std::string hex_encode(const std::vector<std::uint8_t>& data);

/**
 * @brief Decode lowercase or uppercase hex; odd length or non-hex input is a Serialization error
 */
Result<std::vector<std::uint8_t>> hex_decode(const std::string& hex);

/**
 * @brief Fresh random identifier, optionally prefixed ("syncmd_" + uuid)
 */
std::string random_id(const std::string& prefix = {});

} // namespace syncmd
