#include "internal/storage/posix_file_system.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#include "internal/util/errors.hpp"

namespace taskvault::storage {

using util::FileOperationError;

namespace {

[[noreturn]] void ThrowErrno(const std::string& op, const std::filesystem::path& path, int error_number) {
  throw FileOperationError(op + " " + path.string() + ": " + std::strerror(error_number), path.string(), error_number);
}

class FileDescriptor {
 public:
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    if (fd_ >= 0) ::close(fd_);
  }
  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  // close(2) errors surface delayed write failures on some filesystems
  int Close() {
    const int rc = ::close(fd_);
    fd_          = -1;
    return rc;
  }

 private:
  int fd_;
};

void WriteAll(int fd, std::string_view data, const std::filesystem::path& path) {
  size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      ThrowErrno("write", path, errno);
    }
    written += static_cast<size_t>(n);
  }
}

} // namespace

std::string PosixFileSystem::Read(const std::filesystem::path& path) {
  FileDescriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.Get() < 0) {
    ThrowErrno("open", path, errno);
  }

  std::string contents;
  char        buf[8192];
  while (true) {
    const ssize_t n = ::read(fd.Get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      ThrowErrno("read", path, errno);
    }
    if (n == 0) break;
    contents.append(buf, static_cast<size_t>(n));
  }
  return contents;
}

void PosixFileSystem::WriteNew(const std::filesystem::path& path, std::string_view contents) {
  FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    ThrowErrno("create", path, errno);
  }

  WriteAll(fd.Get(), contents, path);

  if (::fsync(fd.Get()) != 0) {
    ThrowErrno("fsync", path, errno);
  }
  if (fd.Close() != 0) {
    ThrowErrno("close", path, errno);
  }
}

void PosixFileSystem::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (::rename(from.c_str(), to.c_str()) != 0) {
    ThrowErrno("rename", from, errno);
  }
}

void PosixFileSystem::RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) {
  if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
    return;
  }
  if (errno != EINVAL && errno != ENOSYS) {
    ThrowErrno("rename", errno == EEXIST ? to : from, errno);
  }

  // filesystem without RENAME_NOREPLACE: link(2) refuses an existing target
  if (::link(from.c_str(), to.c_str()) != 0) {
    ThrowErrno("link", errno == EEXIST ? to : from, errno);
  }
  if (::unlink(from.c_str()) != 0) {
    const int saved = errno;
    ::unlink(to.c_str());
    ThrowErrno("unlink", from, saved);
  }
}

void PosixFileSystem::Remove(const std::filesystem::path& path) {
  if (::unlink(path.c_str()) != 0) {
    ThrowErrno("unlink", path, errno);
  }
}

bool PosixFileSystem::Exists(const std::filesystem::path& path) {
  struct stat st {};
  return ::lstat(path.c_str(), &st) == 0;
}

std::vector<std::string> PosixFileSystem::List(const std::filesystem::path& dir) {
  std::vector<std::string> names;
  std::error_code          ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    throw FileOperationError("list " + dir.string() + ": " + ec.message(), dir.string(), ec.value());
  }

  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw FileOperationError("list " + dir.string() + ": " + ec.message(), dir.string(), ec.value());
    }
    // a file may vanish between readdir and stat; that is a normal race
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      names.push_back(it->path().filename().string());
    }
  }

  std::sort(names.begin(), names.end());
  return names;
}

void PosixFileSystem::AppendLine(const std::filesystem::path& path, std::string_view line) {
  FileDescriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    ThrowErrno("open", path, errno);
  }

  std::string record;
  record.reserve(line.size() + 1);
  record.append(line).push_back('\n');

  // one write(2) per line: a short write is reported, never continued
  ssize_t n;
  do {
    n = ::write(fd.Get(), record.data(), record.size());
  } while (n < 0 && errno == EINTR);

  if (n < 0) {
    ThrowErrno("append", path, errno);
  }
  if (static_cast<size_t>(n) != record.size()) {
    ThrowErrno("append", path, EIO);
  }
  if (fd.Close() != 0) {
    ThrowErrno("close", path, errno);
  }
}

void PosixFileSystem::CreateDirectories(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw FileOperationError("mkdir " + dir.string() + ": " + ec.message(), dir.string(), ec.value());
  }
}

} // namespace taskvault::storage
