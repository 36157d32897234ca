#include "record_stream/file_source.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace rs {

namespace {

class FileByteStream : public ByteStream {
public:
  FileByteStream(std::FILE* f, std::uint64_t size, std::string path)
    : f_(f), size_(size), path_(std::move(path)) {}
  ~FileByteStream() override { if (f_) std::fclose(f_); }

  FileByteStream(const FileByteStream&) = delete;
  FileByteStream& operator=(const FileByteStream&) = delete;

  std::uint64_t size() const override { return size_; }

  std::size_t read(char* dst, std::size_t n) override {
    std::size_t got = std::fread(dst, 1, n, f_);
    if (got == 0 && std::ferror(f_)) {
      int e = errno;
      throw IoError("read failed: " + path_ + " (" + std::strerror(e) + ")", e);
    }
    return got;
  }

private:
  std::FILE* f_;
  std::uint64_t size_;
  std::string path_;
};

}

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

std::unique_ptr<ByteStream> LocalFileSystem::open(const std::string& path) const {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    int e = errno;
    throw IoError("open failed: " + path + " (" + std::strerror(e) + ")", e);
  }
  std::error_code ec;
  auto sz = std::filesystem::file_size(path, ec);
  return std::make_unique<FileByteStream>(f, ec ? 0 : static_cast<std::uint64_t>(sz), path);
}

const LocalFileSystem& LocalFileSystem::instance() {
  static const LocalFileSystem fs;
  return fs;
}

}
