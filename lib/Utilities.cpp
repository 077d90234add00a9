#include "Utilities.h"

#include <sodium.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cb {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;

bool parseFixedDigits(const std::string &str, size_t pos, size_t len,
                      int &value) {
  if (pos + len > str.size()) {
    return false;
  }
  int result = 0;
  for (size_t i = pos; i < pos + len; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      return false;
    }
    result = result * 10 + (str[i] - '0');
  }
  value = result;
  return true;
}
} // namespace

int64_t getCurrentTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool parseIsoDate(const std::string &str, int64_t &unixSeconds) {
  // YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ
  if (str.size() != 10 && str.size() != 20) {
    return false;
  }
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!parseFixedDigits(str, 0, 4, year) || str[4] != '-' ||
      !parseFixedDigits(str, 5, 2, month) || str[7] != '-' ||
      !parseFixedDigits(str, 8, 2, day)) {
    return false;
  }
  if (str.size() == 20) {
    if (str[10] != 'T' || str[13] != ':' || str[16] != ':' || str[19] != 'Z' ||
        !parseFixedDigits(str, 11, 2, hour) ||
        !parseFixedDigits(str, 14, 2, minute) ||
        !parseFixedDigits(str, 17, 2, second)) {
      return false;
    }
  }
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 ||
      minute > 59 || second > 59) {
    return false;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  time_t t = timegm(&tm);

  // timegm normalizes 2024-02-30 into March; reject instead
  if (tm.tm_mday != day || tm.tm_mon != month - 1) {
    return false;
  }
  unixSeconds = static_cast<int64_t>(t);
  return true;
}

std::string formatIsoDate(int64_t unixSeconds) {
  time_t t = static_cast<time_t>(unixSeconds);
  std::tm tm{};
  if (!gmtime_r(&t, &tm)) {
    return std::to_string(unixSeconds);
  }
  char buf[32];
  if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) {
    return std::to_string(unixSeconds);
  }
  return std::string(buf);
}

std::string formatIsoDay(int64_t unixSeconds) {
  return formatIsoDate(unixSeconds).substr(0, 10);
}

bool parseJsonDate(const nlohmann::json &jd, int64_t &unixSeconds) {
  if (jd.is_string()) {
    return parseIsoDate(jd.get<std::string>(), unixSeconds);
  }
  if (jd.is_number_integer()) {
    unixSeconds = jd.get<int64_t>();
    return true;
  }
  return false;
}

std::string toUpper(const std::string &str) {
  std::string out(str);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string trim(const std::string &str) {
  size_t start = str.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = str.find_last_not_of(" \t\r\n");
  return str.substr(start, end - start + 1);
}


cb::Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open file: " + path);
  }

  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  file.close();

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " +
                        std::string(e.what()));
  }

  return doc;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(
      std::string(reinterpret_cast<const char *>(hash), sizeof(hash)));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

cb::Roe<void> writeToNewFile(const std::string &filePath,
                             const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create parent directories for " + filePath +
                          ": " + ec.message());
    }
  }

  std::ofstream file(filePath);
  if (!file.is_open()) {
    return Error(3, "Failed to open file for writing: " + filePath);
  }

  file << content;
  file.close();

  if (!file.good()) {
    return Error(4, "Failed to write content to file: " + filePath);
  }

  return {};
}

} // namespace utl
} // namespace cb
