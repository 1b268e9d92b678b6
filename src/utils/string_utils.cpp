/**
 * @file string_utils.cpp
 * @brief String utility implementations
 */

#include "utils/string_utils.h"

#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace talentvault::utils {

namespace {

constexpr int kNibbleBits = 4;

int HexDigitValue(char chr) {
  if (chr >= '0' && chr <= '9') {
    return chr - '0';
  }
  if (chr >= 'a' && chr <= 'f') {
    return chr - 'a' + 10;
  }
  if (chr >= 'A' && chr <= 'F') {
    return chr - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string ToHex(std::string_view data) {
  std::ostringstream oss;
  for (char byte : data) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(byte));
  }
  return oss.str();
}

std::optional<std::string> FromHex(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return std::nullopt;
  }

  std::string result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int high = HexDigitValue(hex[i]);
    int low = HexDigitValue(hex[i + 1]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    result.push_back(static_cast<char>((high << kNibbleBits) | low));
  }
  return result;
}

std::string ToLower(std::string_view text) {
  std::string result(text);
  for (auto& chr : result) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return result;
}

std::string Trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> SplitNonEmpty(std::string_view text, char delimiter) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= text.size()) {
    size_t pos = text.find(delimiter, start);
    if (pos == std::string_view::npos) {
      pos = text.size();
    }
    std::string item = Trim(text.substr(start, pos - start));
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
    start = pos + 1;
  }
  return items;
}

std::string Join(const std::vector<std::string>& items, std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      result += separator;
    }
    result += items[i];
  }
  return result;
}

std::string FormatBytes(size_t bytes) {
  constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

  if (bytes == 0) {
    return "0B";
  }

  size_t unit_index = 0;
  auto size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit_index < kUnits.size() - 1) {
    size /= 1024.0;
    unit_index++;
  }

  std::ostringstream oss;
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-constant-array-index)
  if (size >= 100.0) {
    oss << std::fixed << std::setprecision(0) << size << kUnits[unit_index];
  } else if (size >= 10.0) {
    oss << std::fixed << std::setprecision(1) << size << kUnits[unit_index];
  } else {
    oss << std::fixed << std::setprecision(2) << size << kUnits[unit_index];
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-constant-array-index)

  return oss.str();
}

}  // namespace talentvault::utils
