#pragma once

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace logpager::test {

// Scratch directory removed again when the fixture goes away
class TempDirectory {
public:
  TempDirectory() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("logpager_test_" + std::to_string(rd()) + "_" +
             std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }

  ~TempDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDirectory(const TempDirectory &) = delete;
  TempDirectory &operator=(const TempDirectory &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::filesystem::path write(const std::string &name,
                              const std::string &bytes) const {
    auto file = path_ / name;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return file;
  }

private:
  std::filesystem::path path_;
};

// "0001 lorem ipsum dolor sit amet" .. numbered from 1, all the same width
inline std::vector<std::string> loremLines(int count) {
  std::vector<std::string> lines;
  lines.reserve(count);
  for (int i = 1; i <= count; ++i) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%04d lorem ipsum dolor sit amet", i);
    lines.emplace_back(buffer);
  }
  return lines;
}

inline std::string joinLines(const std::vector<std::string> &lines,
                             const std::string &terminator = "\n") {
  std::string text;
  for (const auto &line : lines) {
    text += line;
    text += terminator;
  }
  return text;
}

inline std::vector<std::string> slice(const std::vector<std::string> &lines,
                                      int firstNumber, int lastNumber) {
  return std::vector<std::string>(lines.begin() + (firstNumber - 1),
                                  lines.begin() + lastNumber);
}

// UTF-16 / UTF-32 encodings of a UTF-8 string made of BMP characters
inline std::string toUtf16(const std::u16string &text, bool bigEndian) {
  std::string bytes;
  for (char16_t unit : text) {
    const char hi = static_cast<char>((unit >> 8) & 0xFF);
    const char lo = static_cast<char>(unit & 0xFF);
    if (bigEndian) {
      bytes += hi;
      bytes += lo;
    } else {
      bytes += lo;
      bytes += hi;
    }
  }
  return bytes;
}

inline std::string toUtf32(const std::u32string &text, bool bigEndian) {
  std::string bytes;
  for (char32_t cp : text) {
    char b[4] = {static_cast<char>(cp & 0xFF),
                 static_cast<char>((cp >> 8) & 0xFF),
                 static_cast<char>((cp >> 16) & 0xFF),
                 static_cast<char>((cp >> 24) & 0xFF)};
    if (bigEndian) {
      bytes.append({b[3], b[2], b[1], b[0]});
    } else {
      bytes.append(b, 4);
    }
  }
  return bytes;
}

} // namespace logpager::test
