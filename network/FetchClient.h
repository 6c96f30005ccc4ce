#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include "Types.hpp"

#include <chrono>
#include <string>

namespace hr {
namespace network {

/**
 * FetchClient - sends one request per connection and reads the response.
 *
 * Pattern: connect, send, half-close, read until the server closes.
 */
class FetchClient : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static std::chrono::milliseconds DEFAULT_TIMEOUT{ 5000 };
  constexpr static size_t MAX_RESPONSE_BYTES = 64 * 1024 * 1024;

  FetchClient();
  ~FetchClient() override = default;

  /**
   * Blocks until the response is received or the timeout expires
   */
  Roe<std::string> fetchSync(const IpEndpoint &endpoint,
                             const std::string &data,
                             std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
};

} // namespace network
} // namespace hr
