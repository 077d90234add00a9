#ifndef CB_LEDGER_SERIALIZE_HPP
#define CB_LEDGER_SERIALIZE_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cb {

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Integers are written big endian so archives are machine independent
template <typename U> inline void putBigEndian(std::ostream &os, U value) {
  static_assert(std::is_unsigned_v<U>, "putBigEndian needs an unsigned type");
  char bytes[sizeof(U)];
  for (size_t i = 0; i < sizeof(U); ++i) {
    bytes[sizeof(U) - 1 - i] = static_cast<char>(value & 0xFF);
    value = static_cast<U>(value >> 8);
  }
  os.write(bytes, sizeof(U));
}

template <typename U> inline bool getBigEndian(std::istream &is, U &value) {
  static_assert(std::is_unsigned_v<U>, "getBigEndian needs an unsigned type");
  unsigned char bytes[sizeof(U)];
  if (!is.read(reinterpret_cast<char *>(bytes), sizeof(U))) {
    return false;
  }
  U result = 0;
  for (size_t i = 0; i < sizeof(U); ++i) {
    result = static_cast<U>((result << 8) | bytes[i]);
  }
  value = result;
  return true;
}

template <typename T>
static constexpr bool is_archive_integer_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool>;

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  OutputArchive &operator&(bool value) {
    uint8_t byte = value ? 1 : 0;
    detail::putBigEndian(os_, byte);
    return *this;
  }

  template <typename T>
  std::enable_if_t<detail::is_archive_integer_v<T>, OutputArchive &>
  operator&(T value) {
    detail::putBigEndian(os_, static_cast<std::make_unsigned_t<T>>(value));
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    uint64_t size = value.size();
    detail::putBigEndian(os_, size);
    if (size > 0) {
      os_.write(value.data(), static_cast<std::streamsize>(size));
    }
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    uint64_t size = value.size();
    detail::putBigEndian(os_, size);
    for (const auto &item : value) {
      (*this) & item;
    }
    return *this;
  }

  template <typename K, typename V>
  OutputArchive &operator&(const std::map<K, V> &value) {
    static_assert(!detail::is_pointer_v<K> && !detail::is_pointer_v<V>,
                  "Archive does not support pointers");
    uint64_t size = value.size();
    detail::putBigEndian(os_, size);
    for (const auto &pair : value) {
      (*this) & pair.first;
      (*this) & pair.second;
    }
    return *this;
  }

  // Presence flag followed by the value
  template <typename T>
  OutputArchive &operator&(const std::optional<T> &value) {
    (*this) & value.has_value();
    if (value) {
      (*this) & *value;
    }
    return *this;
  }

  // Custom types; serialize() is non-const but only reads here
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    const_cast<T &>(value).template serialize<OutputArchive>(*this);
    return *this;
  }

private:
  std::ostream &os_;
};

/**
 * InputArchive for deserialization (reading)
 *
 * Usage:
 *   std::istringstream iss(data);
 *   InputArchive ar(iss);
 *   ar & myValue;
 *   if (ar.failed()) { handle error }
 */
class InputArchive {
public:
  explicit InputArchive(std::istream &is) : is_(is) {}

  InputArchive &operator&(bool &value) {
    uint8_t byte = 0;
    if (!failed_ && detail::getBigEndian(is_, byte)) {
      value = (byte != 0);
    } else {
      failed_ = true;
    }
    return *this;
  }

  template <typename T>
  std::enable_if_t<detail::is_archive_integer_v<T>, InputArchive &>
  operator&(T &value) {
    std::make_unsigned_t<T> raw = 0;
    if (!failed_ && detail::getBigEndian(is_, raw)) {
      value = static_cast<T>(raw);
    } else {
      failed_ = true;
    }
    return *this;
  }

  InputArchive &operator&(std::string &value) {
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.resize(size);
    if (size > 0 &&
        !is_.read(&value[0], static_cast<std::streamsize>(size))) {
      failed_ = true;
    }
    return *this;
  }

  template <typename T> InputArchive &operator&(std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.clear();
    for (uint64_t i = 0; i < size && !failed_; ++i) {
      T item{};
      (*this) & item;
      if (!failed_) {
        value.push_back(std::move(item));
      }
    }
    return *this;
  }

  template <typename K, typename V>
  InputArchive &operator&(std::map<K, V> &value) {
    static_assert(!detail::is_pointer_v<K> && !detail::is_pointer_v<V>,
                  "Archive does not support pointers");
    uint64_t size = 0;
    if (!readSize(size)) {
      return *this;
    }
    value.clear();
    for (uint64_t i = 0; i < size && !failed_; ++i) {
      K key{};
      V val{};
      (*this) & key;
      (*this) & val;
      if (!failed_) {
        value[std::move(key)] = std::move(val);
      }
    }
    return *this;
  }

  template <typename T> InputArchive &operator&(std::optional<T> &value) {
    bool present = false;
    (*this) & present;
    if (failed_) {
      return *this;
    }
    if (present) {
      T item{};
      (*this) & item;
      if (!failed_) {
        value = std::move(item);
      }
    } else {
      value.reset();
    }
    return *this;
  }

  template <typename T>
  auto operator&(T &value)
      -> decltype(value.template serialize<InputArchive>(*this), *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    value.template serialize<InputArchive>(*this);
    return *this;
  }

  bool failed() const { return failed_; }

  // True once every byte of the underlying stream has been consumed
  bool atEnd() const { return is_.peek() == std::char_traits<char>::eof(); }

private:
  // Sizes larger than the remaining input are corrupt
  bool readSize(uint64_t &size) {
    if (failed_ || !detail::getBigEndian(is_, size)) {
      failed_ = true;
      return false;
    }
    if (size > MAX_ELEMENTS) {
      failed_ = true;
      return false;
    }
    return true;
  }

  static constexpr uint64_t MAX_ELEMENTS = 64ull * 1024 * 1024;

  std::istream &is_;
  bool failed_ = false;
};

} // namespace cb

#endif // CB_LEDGER_SERIALIZE_HPP
