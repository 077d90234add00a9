#ifndef CB_LEDGER_UTILITIES_H
#define CB_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace cb {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in seconds since the epoch
 * @return Current time in seconds
 */
int64_t getCurrentTime();

/**
 * Parse a UTC date, either "YYYY-MM-DD" (midnight) or
 * "YYYY-MM-DDTHH:MM:SSZ"
 * @param str Date string
 * @param unixSeconds Output parameter for seconds since the epoch
 * @return true if the string is a valid calendar date/time
 */
bool parseIsoDate(const std::string &str, int64_t &unixSeconds);

/**
 * Format seconds since the epoch as "YYYY-MM-DDTHH:MM:SSZ"
 */
std::string formatIsoDate(int64_t unixSeconds);

/**
 * Format seconds since the epoch as "YYYY-MM-DD"
 */
std::string formatIsoDay(int64_t unixSeconds);

/**
 * Read a date from JSON: an ISO string accepted by parseIsoDate(), or an
 * integer count of unix seconds
 */
bool parseJsonDate(const nlohmann::json &jd, int64_t &unixSeconds);

/**
 * ASCII upper-case copy of a string (asset symbols)
 */
std::string toUpper(const std::string &str);

/**
 * Copy with leading and trailing whitespace removed
 */
std::string trim(const std::string &str);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Roe<nlohmann::json> with the parsed document or error
 */
cb::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Compute SHA-256 hash using Libsodium
 * @param input Input string to hash
 * @return Lowercase hexadecimal string of the 32-byte digest
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Encode binary data as lowercase hex (two chars per byte)
 */
std::string hexEncode(const std::string &data);

/**
 * Write a string to a file that does not exist yet.
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 * @return Roe<void> indicating success or error
 */
cb::Roe<void> writeToNewFile(const std::string &filePath,
                             const std::string &content);

} // namespace utl
} // namespace cb

#endif // CB_LEDGER_UTILITIES_H
