#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace rs {

// Raised by a ByteStream when the underlying read fails (not at EOF).
class IoError : public std::runtime_error {
public:
  IoError(const std::string& what, int err) : std::runtime_error(what), errno_(err) {}
  int error_code() const noexcept { return errno_; }
private:
  int errno_;
};

class ByteStream {
public:
  virtual ~ByteStream() = default;

  // Total length in bytes; 0 if unknown.
  virtual std::uint64_t size() const = 0;

  // Read up to n bytes into dst. 0 means end of stream; throws IoError.
  virtual std::size_t read(char* dst, std::size_t n) = 0;
};

class FileSystem {
public:
  virtual ~FileSystem() = default;
  virtual bool exists(const std::string& path) const = 0;
  // Throws IoError if the file cannot be opened.
  virtual std::unique_ptr<ByteStream> open(const std::string& path) const = 0;
};

// stdio-backed implementation.
class LocalFileSystem : public FileSystem {
public:
  bool exists(const std::string& path) const override;
  std::unique_ptr<ByteStream> open(const std::string& path) const override;

  static const LocalFileSystem& instance();
};

}
