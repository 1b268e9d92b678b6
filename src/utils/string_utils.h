/**
 * @file string_utils.h
 * @brief String utility functions for encoding and list handling
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace talentvault::utils {

/**
 * @brief Encode bytes as lowercase hexadecimal
 *
 * @param data Raw bytes
 * @return Hex string (two characters per byte)
 */
std::string ToHex(std::string_view data);

/**
 * @brief Decode a hexadecimal string
 *
 * Accepts upper and lower case digits.
 *
 * @param hex Hex string (even length)
 * @return Decoded bytes, or std::nullopt if the input is not valid hex
 */
std::optional<std::string> FromHex(std::string_view hex);

/**
 * @brief ASCII lowercase conversion
 */
std::string ToLower(std::string_view text);

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string Trim(std::string_view text);

/**
 * @brief Split on a delimiter, dropping empty items
 *
 * "a,,b" -> {"a", "b"}
 */
std::vector<std::string> SplitNonEmpty(std::string_view text, char delimiter);

/**
 * @brief Join items with a separator
 */
std::string Join(const std::vector<std::string>& items, std::string_view separator);

/**
 * @brief Format bytes to human-readable string (e.g., "1.5MB", "500KB")
 *
 * @param bytes Number of bytes
 * @return Human-readable string
 */
std::string FormatBytes(size_t bytes);

}  // namespace talentvault::utils
