#ifndef HR_BINARY_PACK_HPP
#define HR_BINARY_PACK_HPP

#include "ResultOrError.hpp"
#include "Serialize.hpp"
#include <sstream>
#include <string>

namespace hr {
namespace utl {

struct BinaryUnpackError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

/**
 * Decode an object written by binaryPack(). Trailing bytes are an error.
 */
template <typename T>
ResultOrError<T, BinaryUnpackError> binaryUnpack(const std::string &data) {
  std::istringstream iss(data);
  InputArchive ar(iss);
  T result{};
  ar &result;
  if (ar.failed()) {
    return BinaryUnpackError(1, "Failed to deserialize binary data");
  }
  if (iss.peek() != std::char_traits<char>::eof()) {
    return BinaryUnpackError(2, "Unexpected trailing bytes");
  }
  return result;
}

} // namespace utl
} // namespace hr

#endif // HR_BINARY_PACK_HPP
