#pragma once

#include "Module.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <fstream>
#include <shared_mutex>
#include <string>
#include <vector>

namespace hr {

/**
 * One record of the replicated log. Indexes start at 1 and are assigned by
 * the store on append.
 */
struct LogEntry {
  enum class Type : uint8_t {
    BLOCK = 1,  // payload is a finalized block
    CONFIG = 2, // payload is a validator set change
  };

  uint64_t index{ 0 };
  uint64_t term{ 0 };
  Type type{ Type::BLOCK };
  std::string payload;
  bool committed{ false };

  template <typename Archive> void serialize(Archive &ar) {
    ar & index & term & type & payload & committed;
  }
};

/**
 * LogStore - append-only durable log of committed entries.
 *
 * File format (<workDir>/consensus.log):
 * - Header: magic, version, reserved
 * - Records: [size (8 bytes)][packed LogEntry (size bytes)]*
 *
 * There is no API to modify or remove an entry once appended. A torn record
 * at the end of the file (crash during append) is cut off on mount.
 * A single writer appends while any number of readers read; a reader sees
 * the log either before or after a given append.
 * With an empty workDir the log lives in memory only.
 */
class LogStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_IO = 1;
  constexpr static int32_t E_FORMAT = 2;
  constexpr static int32_t E_INVALID_ENTRY = 3;
  constexpr static int32_t E_NOT_FOUND = 4;
  constexpr static int32_t E_STATE = 5;

  constexpr static const char *FILE_NAME = "consensus.log";
  constexpr static size_t HEADER_SIZE = 8;
  constexpr static size_t SIZE_PREFIX_BYTES = 8;

  struct Config {
    std::string workDir;
  };

  LogStore();
  ~LogStore() override;

  /**
   * Create the log file, or mount it and reload its entries if it exists
   */
  Roe<void> init(const Config &config);

  /**
   * Append a committed entry. The index is assigned by the store
   * (entry.index must be 0 or equal to lastIndex() + 1) and terms never
   * decrease along the log.
   * @return Index of the new entry
   */
  virtual Roe<uint64_t> append(LogEntry entry);

  Roe<LogEntry> read(uint64_t index) const;
  Roe<LogEntry> readLast() const;

  /**
   * Up to maxCount entries starting at index fromIndex
   */
  std::vector<LogEntry> readRange(uint64_t fromIndex, size_t maxCount) const;

  uint64_t size() const;
  uint64_t lastIndex() const;
  uint64_t lastTerm() const;

  bool isPersistent() const { return !filePath_.empty(); }
  const std::string &getFilePath() const { return filePath_; }

  void close();

private:
  struct FileHeader {
    constexpr static uint32_t MAGIC = 0x48524C47; // "HRLG"
    constexpr static uint16_t CURRENT_VERSION = 1;

    uint32_t magic{ MAGIC };
    uint16_t version{ CURRENT_VERSION };
    uint16_t reserved{ 0 };

    template <typename Archive> void serialize(Archive &ar) {
      ar & magic & version & reserved;
    }
  };

  Roe<void> createFile();
  Roe<void> mountFile();
  Roe<void> writeRecord(const std::string &record);

  mutable std::shared_mutex mutex_;
  std::vector<LogEntry> entries_;
  std::string filePath_;
  std::fstream file_;
  uint64_t fileSize_{ 0 };
  bool initialized_{ false };
};

} // namespace hr
