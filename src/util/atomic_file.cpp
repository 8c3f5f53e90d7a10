#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace veil::util {

namespace {

std::atomic<std::uint64_t> g_write_sequence{0};

bool Fail(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
  return false;
}

std::filesystem::path SiblingTempPath(const std::filesystem::path& target) {
  const auto seq = g_write_sequence.fetch_add(1, std::memory_order_relaxed);
#ifdef _WIN32
  const auto owner = std::uint64_t{0};
#else
  const auto owner = static_cast<std::uint64_t>(::getpid());
#endif
  auto name = target.filename().string();
  name += ".partial-" + std::to_string(owner) + "-" + std::to_string(seq);
  return target.parent_path() / name;
}

#ifndef _WIN32

std::string ErrnoText(const char* what, const std::filesystem::path& path) {
  return std::string(what) + " " + path.string() + ": " + std::strerror(errno);
}

// Writes everything, retrying short writes and EINTR.
bool WriteAll(int fd, std::span<const std::uint8_t> data) {
  std::size_t done = 0;
  while (done < data.size()) {
    const auto n = ::write(fd, data.data() + done, data.size() - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    done += static_cast<std::size_t>(n);
  }
  return true;
}

bool WriteSynced(const std::filesystem::path& tmp, std::span<const std::uint8_t> data,
                 std::string* error) {
  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    return Fail(error, ErrnoText("open", tmp));
  }
  bool ok = WriteAll(fd, data);
  std::string failure = ok ? std::string{} : ErrnoText("write", tmp);
  if (ok && ::fsync(fd) != 0) {
    ok = false;
    failure = ErrnoText("fsync", tmp);
  }
  if (::close(fd) != 0 && ok) {
    ok = false;
    failure = ErrnoText("close", tmp);
  }
  return ok ? true : Fail(error, std::move(failure));
}

// Best effort: some filesystems refuse fsync on directories.
void SyncDirectory(const std::filesystem::path& dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  const int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return;
  (void)::fsync(fd);
  ::close(fd);
}

#else

bool WriteSynced(const std::filesystem::path& tmp, std::span<const std::uint8_t> data,
                 std::string* error) {
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Fail(error, "open " + tmp.string() + " failed");
  }
  out.write(reinterpret_cast<const char*>(data.data()),
            static_cast<std::streamsize>(data.size()));
  out.flush();
  if (!out) {
    return Fail(error, "write " + tmp.string() + " failed");
  }
  return true;
}

void SyncDirectory(const std::filesystem::path&) {}

#endif

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  std::error_code ec;
  const auto dir = path.parent_path();
  if (!dir.empty()) {
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      return Fail(error, "create " + dir.string() + ": " + ec.message());
    }
  }
  const auto tmp = SiblingTempPath(path);
  if (!WriteSynced(tmp, data, error)) {
    std::filesystem::remove(tmp, ec);
    return false;
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    const auto message = "rename " + tmp.string() + " -> " + path.string() + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return Fail(error, message);
  }
  SyncDirectory(dir);
  return true;
}

bool SyncFile(const std::filesystem::path& path, std::string* error) {
#ifndef _WIN32
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return Fail(error, ErrnoText("open", path));
  }
  bool ok = true;
  std::string failure;
  while (::fsync(fd) != 0) {
    if (errno == EINTR) continue;
    ok = false;
    failure = ErrnoText("fsync", path);
    break;
  }
  if (::close(fd) != 0 && ok) {
    ok = false;
    failure = ErrnoText("close", path);
  }
  return ok ? true : Fail(error, std::move(failure));
#else
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return Fail(error, "sync " + path.string() + ": no such file");
  }
  return true;
#endif
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return Fail(error, "stat " + path.string() + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return Fail(error, "failed to open " + path.string());
  }
  std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
  if (!data.empty() &&
      !in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    return Fail(error, "short read from " + path.string());
  }
  if (out) {
    *out = std::move(data);
  }
  return true;
}

}  // namespace veil::util
