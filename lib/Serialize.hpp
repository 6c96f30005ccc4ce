#ifndef HR_SERIALIZE_HPP
#define HR_SERIALIZE_HPP

#include <cstdint>
#include <cstring>
#include <istream>
#include <map>
#include <ostream>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

namespace hr {

namespace detail {

template <typename T> struct IsVector : std::false_type {};
template <typename T, typename A>
struct IsVector<std::vector<T, A>> : std::true_type {};

template <typename T> struct IsSet : std::false_type {};
template <typename T, typename C, typename A>
struct IsSet<std::set<T, C, A>> : std::true_type {};

template <typename T> struct IsMap : std::false_type {};
template <typename K, typename V, typename C, typename A>
struct IsMap<std::map<K, V, C, A>> : std::true_type {};

// Unsigned integers go out most significant byte first
template <typename U> void putBigEndian(std::ostream &os, U value) {
  uint8_t bytes[sizeof(U)];
  for (size_t i = 0; i < sizeof(U); ++i) {
    bytes[sizeof(U) - 1 - i] = static_cast<uint8_t>(value & 0xFF);
    value = static_cast<U>(value >> 8);
  }
  os.write(reinterpret_cast<const char *>(bytes), sizeof(U));
}

template <typename U> bool getBigEndian(std::istream &is, U &value) {
  uint8_t bytes[sizeof(U)];
  if (!is.read(reinterpret_cast<char *>(bytes), sizeof(U))) {
    return false;
  }
  value = 0;
  for (size_t i = 0; i < sizeof(U); ++i) {
    value = static_cast<U>((value << 8) | bytes[i]);
  }
  return true;
}

} // namespace detail

/**
 * OutputArchive writes values in a machine independent binary layout.
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & entry.index & entry.term & entry.payload;
 *
 * Structs take part by providing
 *   template <typename Archive> void serialize(Archive &ar);
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  template <typename T> OutputArchive &operator&(const T &value) {
    write(value);
    return *this;
  }

private:
  template <typename T> void write(const T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    if constexpr (std::is_same_v<T, bool>) {
      detail::putBigEndian<uint8_t>(os_, value ? 1 : 0);
    } else if constexpr (std::is_enum_v<T>) {
      write(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (std::is_integral_v<T>) {
      detail::putBigEndian(os_, static_cast<std::make_unsigned_t<T>>(value));
    } else if constexpr (std::is_same_v<T, double>) {
      uint64_t bits = 0;
      std::memcpy(&bits, &value, sizeof(bits));
      detail::putBigEndian(os_, bits);
    } else if constexpr (std::is_same_v<T, std::string>) {
      detail::putBigEndian<uint64_t>(os_, value.size());
      os_.write(value.data(), static_cast<std::streamsize>(value.size()));
    } else if constexpr (detail::IsVector<T>::value ||
                         detail::IsSet<T>::value) {
      detail::putBigEndian<uint64_t>(os_, value.size());
      for (const auto &item : value) {
        write(item);
      }
    } else if constexpr (detail::IsMap<T>::value) {
      detail::putBigEndian<uint64_t>(os_, value.size());
      for (const auto &[k, v] : value) {
        write(k);
        write(v);
      }
    } else {
      const_cast<T &>(value).serialize(*this);
    }
  }

  std::ostream &os_;
};

/**
 * InputArchive reads what OutputArchive wrote. Once a read fails the
 * archive stays failed and further reads are no-ops.
 */
class InputArchive {
public:
  // Upper bound on any length prefix, guards against corrupted input
  constexpr static uint64_t MAX_LENGTH = 256ull * 1024 * 1024;

  explicit InputArchive(std::istream &is) : is_(is) {}

  bool failed() const { return failed_; }

  template <typename T> InputArchive &operator&(T &value) {
    if (!failed_) {
      read(value);
    }
    return *this;
  }

private:
  bool readLength(uint64_t &size) {
    if (!detail::getBigEndian(is_, size) || size > MAX_LENGTH) {
      failed_ = true;
      return false;
    }
    return true;
  }

  template <typename T> void read(T &value) {
    static_assert(!std::is_pointer_v<T>, "Archive does not support pointers");
    if (failed_) {
      return;
    }
    if constexpr (std::is_same_v<T, bool>) {
      uint8_t byte = 0;
      failed_ = !detail::getBigEndian(is_, byte);
      value = byte != 0;
    } else if constexpr (std::is_enum_v<T>) {
      std::underlying_type_t<T> raw{};
      read(raw);
      value = static_cast<T>(raw);
    } else if constexpr (std::is_integral_v<T>) {
      std::make_unsigned_t<T> raw = 0;
      failed_ = !detail::getBigEndian(is_, raw);
      value = static_cast<T>(raw);
    } else if constexpr (std::is_same_v<T, double>) {
      uint64_t bits = 0;
      failed_ = !detail::getBigEndian(is_, bits);
      std::memcpy(&value, &bits, sizeof(bits));
    } else if constexpr (std::is_same_v<T, std::string>) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.resize(size);
      if (size > 0 && !is_.read(value.data(), static_cast<std::streamsize>(size))) {
        failed_ = true;
      }
    } else if constexpr (detail::IsVector<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::value_type item{};
        read(item);
        value.push_back(std::move(item));
      }
    } else if constexpr (detail::IsSet<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::value_type item{};
        read(item);
        value.insert(std::move(item));
      }
    } else if constexpr (detail::IsMap<T>::value) {
      uint64_t size = 0;
      if (!readLength(size)) {
        return;
      }
      value.clear();
      for (uint64_t i = 0; i < size && !failed_; ++i) {
        typename T::key_type k{};
        typename T::mapped_type v{};
        read(k);
        read(v);
        value.emplace(std::move(k), std::move(v));
      }
    } else {
      value.serialize(*this);
    }
  }

  std::istream &is_;
  bool failed_{ false };
};

} // namespace hr

#endif // HR_SERIALIZE_HPP
