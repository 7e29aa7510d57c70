#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace tilext {

// RAII wrapper for memory-mapped files
// Supports read-only, in-place update and create-with-size modes
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Open existing file for reading
  bool openRead(const std::filesystem::path &path, std::string *outError = nullptr);

  // Open existing file for in-place modification
  // The mapping covers the current file size and can never grow or shrink it
  bool openUpdate(const std::filesystem::path &path, std::string *outError = nullptr);

  // Create (or truncate) a file of exactly the given size, zero filled
  bool openWrite(const std::filesystem::path &path, size_t size, std::string *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Flush changes to disk (update and write modes only)
  bool flush(std::string *outError = nullptr);

  void close() noexcept;

  bool isOpen() const { return data_ != nullptr; }

  bool isWritable() const { return writable_; }

  size_t size() const { return size_; }

private:
  enum class Mode { Read, Update, Create };

  // Create mode sizes the file to size, the other modes map the file as it is
  bool map(const std::filesystem::path &path, Mode mode, size_t size, std::string *outError);

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace tilext
