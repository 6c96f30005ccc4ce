#include "LogStore.h"
#include "BinaryPack.hpp"
#include "Serialize.hpp"

#include <filesystem>
#include <mutex>
#include <sstream>

namespace hr {

LogStore::LogStore() : Module("ledger.log_store") {}

LogStore::~LogStore() { close(); }

LogStore::Roe<void> LogStore::init(const Config &config) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (initialized_) {
    return Error(E_STATE, "Log store is already initialized");
  }
  entries_.clear();
  fileSize_ = 0;

  if (config.workDir.empty()) {
    filePath_.clear();
    initialized_ = true;
    log().info << "Using in-memory log";
    return {};
  }

  std::error_code ec;
  std::filesystem::create_directories(config.workDir, ec);
  if (ec) {
    return Error(E_IO, "Failed to create directory " + config.workDir + ": " +
                           ec.message());
  }
  filePath_ = (std::filesystem::path(config.workDir) / FILE_NAME).string();

  auto result = std::filesystem::exists(filePath_) ? mountFile() : createFile();
  if (!result) {
    file_.close();
    filePath_.clear();
    entries_.clear();
    return result;
  }

  initialized_ = true;
  return {};
}

LogStore::Roe<void> LogStore::createFile() {
  file_.open(filePath_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!file_.is_open()) {
    return Error(E_IO, "Failed to create log file: " + filePath_);
  }

  std::string header = utl::binaryPack(FileHeader{});
  file_.write(header.data(), static_cast<std::streamsize>(header.size()));
  file_.flush();
  if (!file_.good()) {
    return Error(E_IO, "Failed to write log header: " + filePath_);
  }
  fileSize_ = header.size();
  log().info << "Created log file " << filePath_;
  return {};
}

LogStore::Roe<void> LogStore::mountFile() {
  std::ifstream in(filePath_, std::ios::binary);
  if (!in.is_open()) {
    return Error(E_IO, "Failed to open log file: " + filePath_);
  }

  std::string headerBytes(HEADER_SIZE, '\0');
  if (!in.read(headerBytes.data(), HEADER_SIZE)) {
    return Error(E_FORMAT, "Log file too short for header: " + filePath_);
  }
  auto header = utl::binaryUnpack<FileHeader>(headerBytes);
  if (!header || header->magic != FileHeader::MAGIC) {
    return Error(E_FORMAT, "Invalid log file magic: " + filePath_);
  }
  if (header->version != FileHeader::CURRENT_VERSION) {
    return Error(E_FORMAT, "Unsupported log file version " +
                               std::to_string(header->version));
  }

  // Only a record that runs past the end of the file is a torn write.
  // Anything else that fails to decode is corruption of committed entries.
  uint64_t actualSize = std::filesystem::file_size(filePath_);
  uint64_t validSize = HEADER_SIZE;
  while (validSize < actualSize) {
    uint64_t remaining = actualSize - validSize;
    if (remaining < SIZE_PREFIX_BYTES) {
      break;
    }
    std::string prefix(SIZE_PREFIX_BYTES, '\0');
    if (!in.read(prefix.data(), SIZE_PREFIX_BYTES)) {
      return Error(E_IO, "Failed to read log file: " + filePath_);
    }
    auto size = utl::binaryUnpack<uint64_t>(prefix);
    if (!size || *size > InputArchive::MAX_LENGTH) {
      return Error(E_FORMAT, "Corrupt record size at offset " +
                                 std::to_string(validSize) + " of " +
                                 filePath_);
    }
    if (*size > remaining - SIZE_PREFIX_BYTES) {
      break;
    }
    std::string record(*size, '\0');
    if (*size > 0 &&
        !in.read(record.data(), static_cast<std::streamsize>(*size))) {
      return Error(E_IO, "Failed to read log file: " + filePath_);
    }
    auto entry = utl::binaryUnpack<LogEntry>(record);
    if (!entry) {
      return Error(E_FORMAT, "Corrupt log record at offset " +
                                 std::to_string(validSize) + " of " +
                                 filePath_);
    }
    uint64_t expected = entries_.size() + 1;
    if (entry->index != expected) {
      return Error(E_FORMAT, "Log record out of sequence: expected index " +
                                 std::to_string(expected) + ", found " +
                                 std::to_string(entry->index));
    }
    entries_.push_back(std::move(*entry));
    validSize += SIZE_PREFIX_BYTES + *size;
  }
  in.close();

  if (actualSize > validSize) {
    log().warning << "Cutting " << (actualSize - validSize)
                  << " trailing bytes of torn record from " << filePath_;
    std::error_code ec;
    std::filesystem::resize_file(filePath_, validSize, ec);
    if (ec) {
      return Error(E_IO, "Failed to truncate log file: " + ec.message());
    }
  }

  file_.open(filePath_, std::ios::binary | std::ios::in | std::ios::out);
  if (!file_.is_open()) {
    return Error(E_IO, "Failed to reopen log file: " + filePath_);
  }
  fileSize_ = validSize;
  log().info << "Mounted log file " << filePath_ << " with " << entries_.size()
             << " entries";
  return {};
}

LogStore::Roe<void> LogStore::writeRecord(const std::string &record) {
  std::string bytes = utl::binaryPack(static_cast<uint64_t>(record.size()));
  bytes += record;

  file_.seekp(static_cast<std::streamoff>(fileSize_), std::ios::beg);
  file_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file_.flush();
  if (!file_.good()) {
    // Leave no partial record behind for the next append
    file_.clear();
    std::error_code ec;
    std::filesystem::resize_file(filePath_, fileSize_, ec);
    return Error(E_IO, "Failed to write log record to " + filePath_);
  }
  fileSize_ += bytes.size();
  return {};
}

LogStore::Roe<uint64_t> LogStore::append(LogEntry entry) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (!initialized_) {
    return Error(E_STATE, "Log store is not initialized");
  }
  if (!entry.committed) {
    return Error(E_INVALID_ENTRY, "Only committed entries can be appended");
  }
  if (entry.term == 0) {
    return Error(E_INVALID_ENTRY, "Entry term must be at least 1");
  }

  uint64_t nextIndex = entries_.size() + 1;
  if (entry.index != 0 && entry.index != nextIndex) {
    return Error(E_INVALID_ENTRY, "Entry index " + std::to_string(entry.index) +
                                      " does not follow last index " +
                                      std::to_string(nextIndex - 1));
  }
  if (!entries_.empty() && entry.term < entries_.back().term) {
    return Error(E_INVALID_ENTRY, "Entry term " + std::to_string(entry.term) +
                                      " is lower than last term " +
                                      std::to_string(entries_.back().term));
  }
  entry.index = nextIndex;

  if (isPersistent()) {
    auto result = writeRecord(utl::binaryPack(entry));
    if (!result) {
      log().error << result.error().message;
      return result.error();
    }
  }

  entries_.push_back(std::move(entry));
  log().debug << "Appended entry " << nextIndex;
  return nextIndex;
}

LogStore::Roe<LogEntry> LogStore::read(uint64_t index) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (index == 0 || index > entries_.size()) {
    return Error(E_NOT_FOUND, "No log entry at index " + std::to_string(index));
  }
  return entries_[index - 1];
}

LogStore::Roe<LogEntry> LogStore::readLast() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (entries_.empty()) {
    return Error(E_NOT_FOUND, "Log is empty");
  }
  return entries_.back();
}

std::vector<LogEntry> LogStore::readRange(uint64_t fromIndex,
                                          size_t maxCount) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<LogEntry> result;
  if (fromIndex == 0) {
    fromIndex = 1;
  }
  for (uint64_t i = fromIndex; i <= entries_.size() && result.size() < maxCount;
       ++i) {
    result.push_back(entries_[i - 1]);
  }
  return result;
}

uint64_t LogStore::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

uint64_t LogStore::lastIndex() const { return size(); }

uint64_t LogStore::lastTerm() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.empty() ? 0 : entries_.back().term;
}

void LogStore::close() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  initialized_ = false;
}

} // namespace hr
