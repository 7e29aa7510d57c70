#include <format>
#include <utility>

#include <tilext/mmap.hpp>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace tilext {

namespace {

bool fail(std::string *outError, std::string message) {
  if (outError) {
    *outError = std::move(message);
  }
  return false;
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept {
  *this = std::move(other);
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
#ifdef _WIN32
    fileHandle_ = std::exchange(other.fileHandle_, nullptr);
    mappingHandle_ = std::exchange(other.mappingHandle_, nullptr);
#else
    fd_ = std::exchange(other.fd_, -1);
#endif
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, std::string *outError) {
  return map(path, Mode::Read, 0, outError);
}

bool MappedFile::openUpdate(const std::filesystem::path &path, std::string *outError) {
  return map(path, Mode::Update, 0, outError);
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, std::string *outError) {
  close();
  if (size == 0) {
    return fail(outError, "Cannot create file mapping with zero size");
  }
  return map(path, Mode::Create, size, outError);
}

bool MappedFile::map(const std::filesystem::path &path, Mode mode, size_t size,
                     std::string *outError) {
  close();

  const bool writable = mode != Mode::Read;
  const char *purpose = mode == Mode::Read     ? "reading"
                        : mode == Mode::Update ? "update"
                                               : "writing";

#ifdef _WIN32
  HANDLE file = CreateFileW(path.c_str(), writable ? (GENERIC_READ | GENERIC_WRITE) : GENERIC_READ,
                            mode == Mode::Create ? 0 : FILE_SHARE_READ, nullptr,
                            mode == Mode::Create ? CREATE_ALWAYS : OPEN_EXISTING,
                            FILE_ATTRIBUTE_NORMAL, nullptr);
  if (file == INVALID_HANDLE_VALUE) {
    return fail(outError, std::format("Failed to open {} for {} (error: {})", path.string(),
                                      purpose, GetLastError()));
  }
  fileHandle_ = file;

  LARGE_INTEGER fileSize;
  if (mode == Mode::Create) {
    // Growing the file zero fills it
    fileSize.QuadPart = static_cast<LONGLONG>(size);
    if (!SetFilePointerEx(file, fileSize, nullptr, FILE_BEGIN) || !SetEndOfFile(file)) {
      DWORD err = GetLastError();
      close();
      return fail(outError, std::format("Failed to resize {} (error: {})", path.string(), err));
    }
  } else if (!GetFileSizeEx(file, &fileSize)) {
    DWORD err = GetLastError();
    close();
    return fail(outError, std::format("Failed to get size of {} (error: {})", path.string(), err));
  }

  if (fileSize.QuadPart == 0) {
    close();
    return fail(outError, std::format("File is empty: {}", path.string()));
  }

  mappingHandle_ =
      CreateFileMappingW(file, nullptr, writable ? PAGE_READWRITE : PAGE_READONLY, 0, 0, nullptr);
  if (mappingHandle_) {
    data_ = MapViewOfFile(static_cast<HANDLE>(mappingHandle_),
                          writable ? FILE_MAP_WRITE : FILE_MAP_READ, 0, 0, 0);
  }
  if (!data_) {
    DWORD err = GetLastError();
    close();
    return fail(outError, std::format("Failed to map {} (error: {})", path.string(), err));
  }
  size_ = static_cast<size_t>(fileSize.QuadPart);
#else
  int flags = mode == Mode::Read     ? O_RDONLY
              : mode == Mode::Update ? O_RDWR
                                     : (O_RDWR | O_CREAT | O_TRUNC);
  fd_ = ::open(path.c_str(), flags, 0644);
  if (fd_ < 0) {
    return fail(outError, std::format("Failed to open {} for {} (errno: {})", path.string(),
                                      purpose, errno));
  }

  if (mode == Mode::Create) {
    // Growing the file zero fills it
    if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
      int err = errno;
      close();
      return fail(outError, std::format("Failed to resize {} (errno: {})", path.string(), err));
    }
  } else {
    struct stat st;
    if (fstat(fd_, &st) < 0) {
      int err = errno;
      close();
      return fail(outError,
                  std::format("Failed to get size of {} (errno: {})", path.string(), err));
    }
    size = static_cast<size_t>(st.st_size);
  }

  if (size == 0) {
    close();
    return fail(outError, std::format("File is empty: {}", path.string()));
  }

  // Shared so that updates reach the file; plain reads stay private
  void *addr = mmap(nullptr, size, writable ? (PROT_READ | PROT_WRITE) : PROT_READ,
                    writable ? MAP_SHARED : MAP_PRIVATE, fd_, 0);
  if (addr == MAP_FAILED) {
    int err = errno;
    close();
    return fail(outError, std::format("Failed to map {} (errno: {})", path.string(), err));
  }
  data_ = addr;
  size_ = size;
#endif

  writable_ = writable;
  return true;
}

bool MappedFile::flush(std::string *outError) {
  if (!data_ || !writable_) {
    return fail(outError, "Cannot flush: file not open or not writable");
  }

#ifdef _WIN32
  if (!FlushViewOfFile(data_, 0) || !FlushFileBuffers(static_cast<HANDLE>(fileHandle_))) {
    return fail(outError, std::format("Failed to flush mapped file (error: {})", GetLastError()));
  }
#else
  if (msync(data_, size_, MS_SYNC) < 0) {
    return fail(outError, std::format("Failed to sync mapped file (errno: {})", errno));
  }
#endif

  return true;
}

void MappedFile::close() noexcept {
#ifdef _WIN32
  if (data_) {
    UnmapViewOfFile(data_);
  }
  if (mappingHandle_) {
    CloseHandle(static_cast<HANDLE>(mappingHandle_));
  }
  if (fileHandle_) {
    CloseHandle(static_cast<HANDLE>(fileHandle_));
  }
  mappingHandle_ = nullptr;
  fileHandle_ = nullptr;
#else
  if (data_) {
    munmap(data_, size_);
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
#endif

  data_ = nullptr;
  size_ = 0;
  writable_ = false;
}

} // namespace tilext
