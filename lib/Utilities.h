#ifndef HR_UTILITIES_H
#define HR_UTILITIES_H

#include "ResultOrError.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace hr {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Current wall clock time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

bool parseInt(const std::string &str, int &value);
bool parseInt64(const std::string &str, int64_t &value);
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Parse a port number from a string (validates range 0-65535)
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Split "host:port" into its parts
 * @return false when the string has no host, no port or a bad port
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Load and parse a JSON file
 * Error codes: 1 not found, 2 cannot open, 3 parse error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Parse a JSON document held in a string
 * Error codes: 1 parse error
 */
Roe<nlohmann::json> parseJson(const std::string &text);

/**
 * Parse a request string, which must be a JSON object with a "type" field
 * Error codes: 1 parse error, 2 not an object or no type
 */
Roe<nlohmann::json> parseJsonRequest(const std::string &request);

/**
 * Write a string to a file that must not exist yet. Creates parent
 * directories as needed.
 */
Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content);

/**
 * SHA-256 (libsodium) of the input, as 64 lowercase hex characters
 */
std::string sha256(const std::string &input);

std::string hexEncode(const std::string &data);

/**
 * @return Decoded bytes, or empty string if input is not valid hex
 */
std::string hexDecode(const std::string &hex);

// --- Ed25519 (raw binary: 32-byte public key, 32-byte seed, 64-byte signature)

struct Ed25519KeyPair {
  std::string publicKey;
  std::string privateKey;
};

Roe<Ed25519KeyPair> ed25519Generate();
Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message);
bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature);

/**
 * Read a private key given inline or as a path to a file, either 64 hex
 * characters (optionally 0x prefixed) or 32 raw bytes.
 */
Roe<std::string> readPrivateKey(const std::string &keyOrPath);

} // namespace utl
} // namespace hr

#endif // HR_UTILITIES_H
