#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace hr {
namespace utl {

namespace {

struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodiumInitializer;

constexpr size_t ED25519_SEED_SIZE = 32;

template <typename T> bool parseNumber(const std::string &str, T &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return !str.empty() && ec == std::errc{} && ptr == str.data() + str.size();
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string trimWhitespace(const std::string &s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

bool parseInt(const std::string &str, int &value) {
  return parseNumber(str, value);
}

bool parseInt64(const std::string &str, int64_t &value) {
  return parseNumber(str, value);
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  return parseNumber(str, value);
}

bool parsePort(const std::string &str, uint16_t &port) {
  int portInt = 0;
  if (!parseInt(str, portInt) || portInt < 0 || portInt > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(portInt);
  return true;
}

bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port) {
  size_t colonPos = hostPort.find_last_of(':');
  if (colonPos == std::string::npos || colonPos == 0 ||
      colonPos == hostPort.length() - 1) {
    return false;
  }
  host = hostPort.substr(0, colonPos);
  return parsePort(hostPort.substr(colonPos + 1), port);
}

Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "Configuration file not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Error(2, "Failed to open configuration file: " + path);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());

  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON: " + std::string(e.what()));
  }
}

Roe<nlohmann::json> parseJson(const std::string &text) {
  try {
    return nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    return Error(1, "Failed to parse JSON: " + std::string(e.what()));
  }
}

Roe<nlohmann::json> parseJsonRequest(const std::string &request) {
  auto parsed = parseJson(request);
  if (!parsed) {
    return parsed;
  }

  const nlohmann::json &reqJson = *parsed;
  if (!reqJson.is_object() || !reqJson.contains("type") ||
      !reqJson["type"].is_string()) {
    return Error(2, "missing type field");
  }
  return reqJson;
}

Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content) {
  if (std::filesystem::exists(filePath)) {
    return Error(1, "File already exists: " + filePath);
  }

  std::filesystem::path parentDir = std::filesystem::path(filePath).parent_path();
  if (!parentDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(2, "Failed to create directories for " + filePath + ": " +
                          ec.message());
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

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];
  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }
  return hexEncode(std::string(reinterpret_cast<const char *>(hash),
                               crypto_hash_sha256_BYTES));
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string hexDecode(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexValue(hex[i]);
    int lo = hexValue(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      return {};
    }
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

// --- Ed25519

Roe<Ed25519KeyPair> ed25519Generate() {
  Ed25519KeyPair pair;
  pair.publicKey.resize(crypto_sign_PUBLICKEYBYTES);
  pair.privateKey.resize(crypto_sign_SECRETKEYBYTES);
  if (crypto_sign_keypair(
          reinterpret_cast<unsigned char *>(pair.publicKey.data()),
          reinterpret_cast<unsigned char *>(pair.privateKey.data())) != 0) {
    return Error(1, "crypto_sign_keypair failed");
  }
  // libsodium's secret key is seed followed by public key; keep the seed
  pair.privateKey.resize(ED25519_SEED_SIZE);
  return pair;
}

Roe<std::string> ed25519Sign(const std::string &privateKey,
                             const std::string &message) {
  if (privateKey.size() != ED25519_SEED_SIZE) {
    return Error(1, "ed25519Sign: private key must be 32 bytes");
  }

  std::vector<unsigned char> pk(crypto_sign_PUBLICKEYBYTES);
  std::vector<unsigned char> sk(crypto_sign_SECRETKEYBYTES);
  if (crypto_sign_seed_keypair(
          pk.data(), sk.data(),
          reinterpret_cast<const unsigned char *>(privateKey.data())) != 0) {
    return Error(2, "crypto_sign_seed_keypair failed");
  }

  std::string signature(crypto_sign_BYTES, '\0');
  if (crypto_sign_detached(
          reinterpret_cast<unsigned char *>(signature.data()), nullptr,
          reinterpret_cast<const unsigned char *>(message.data()),
          message.size(), sk.data()) != 0) {
    return Error(3, "crypto_sign_detached failed");
  }
  return signature;
}

bool ed25519Verify(const std::string &publicKey, const std::string &message,
                   const std::string &signature) {
  if (publicKey.size() != crypto_sign_PUBLICKEYBYTES ||
      signature.size() != crypto_sign_BYTES) {
    return false;
  }
  return crypto_sign_verify_detached(
             reinterpret_cast<const unsigned char *>(signature.data()),
             reinterpret_cast<const unsigned char *>(message.data()),
             message.size(),
             reinterpret_cast<const unsigned char *>(publicKey.data())) == 0;
}

Roe<std::string> readPrivateKey(const std::string &keyOrPath) {
  if (keyOrPath.empty()) {
    return Error(1, "Key path or value cannot be empty");
  }

  std::string content = keyOrPath;
  if (std::filesystem::exists(keyOrPath)) {
    std::ifstream file(keyOrPath);
    if (!file.is_open()) {
      return Error(2, "Failed to read key from: " + keyOrPath);
    }
    content.assign((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());
  }
  content = trimWhitespace(content);
  if (content.size() >= 2 && content[0] == '0' &&
      (content[1] == 'x' || content[1] == 'X')) {
    content = content.substr(2);
  }

  if (content.size() == 2 * ED25519_SEED_SIZE) {
    std::string raw = hexDecode(content);
    if (raw.size() == ED25519_SEED_SIZE) {
      return raw;
    }
  }
  if (content.size() == ED25519_SEED_SIZE) {
    return content;
  }
  return Error(3, "Private key must be 32 bytes raw or 64 hex characters");
}

} // namespace utl
} // namespace hr
