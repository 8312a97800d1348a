#pragma once
#include <format>
#include <fstream>
#include <sstream>
#include <geocluster/common/error.hpp>
#include <string>

namespace geocluster::io::detail {

inline std::string read_text_file(const std::string& path, const char* what) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IoError(std::format("Failed to open {} file: {}", what, path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

inline void write_file(const std::string& path, const std::string& data, const char* what,
                       bool binary = false) {
  std::ofstream file(path, binary ? std::ios::binary : std::ios::out);
  if (!file.is_open()) {
    throw IoError(std::format("Failed to open {} file for writing: {}", what, path));
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
  if (!file) {
    throw IoError(std::format("Failed to write {} file: {}", what, path));
  }
}

}  // namespace geocluster::io::detail
