#include <ferry/storage/file/storage.hpp>

#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace ferry::storage {

namespace {

struct unique_fd final {
  explicit unique_fd(int value) : fd{value} {}
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;
  ~unique_fd() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  int fd{-1};
};

[[noreturn]] void throw_errno(const std::string& what) {
  throw std::system_error{errno, std::generic_category(), what};
}

void write_all(int fd, const std::string_view& document,
               const std::filesystem::path& path) {
  auto remaining = document;
  while (!remaining.empty()) {
    auto written = ::write(fd, remaining.data(), remaining.size());
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("write '" + path.string() + "'");
    }
    remaining.remove_prefix(static_cast<std::size_t>(written));
  }
}

void sync_directory(const std::filesystem::path& directory) {
  auto dir = unique_fd{::open(directory.empty() ? "." : directory.c_str(),
                              O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
  if (dir.fd >= 0) {
    static_cast<void>(::fsync(dir.fd));
  }
}

}  // namespace

std::optional<std::string> storage<file_storage_tag>::load() const {
  auto error = std::error_code{};
  if (!std::filesystem::exists(path, error)) {
    if (error) {
      throw std::system_error{error, "stat '" + path.string() + "'"};
    }
    return std::nullopt;
  }

  auto input = std::ifstream{path, std::ios::binary};
  if (!input.good()) {
    throw std::system_error{std::make_error_code(std::errc::io_error),
                            "open '" + path.string() + "'"};
  }
  auto document = std::string{std::istreambuf_iterator<char>{input},
                              std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    throw std::system_error{std::make_error_code(std::errc::io_error),
                            "read '" + path.string() + "'"};
  }
  return document;
}

void storage<file_storage_tag>::stage(const std::string_view& document) const {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(parent, error);
    if (error) {
      throw std::system_error{error, "create '" + parent.string() + "'"};
    }
  }

  auto staged = staging_path();
  auto file = unique_fd{
      ::open(staged.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode)};
  if (file.fd < 0) {
    throw_errno("open '" + staged.string() + "'");
  }
  if (::fchmod(file.fd, mode) != 0) {
    throw_errno("chmod '" + staged.string() + "'");
  }
  write_all(file.fd, document, staged);
  if (::fsync(file.fd) != 0) {
    throw_errno("fsync '" + staged.string() + "'");
  }
}

void storage<file_storage_tag>::commit_staged() const {
  auto staged = staging_path();
  if (::rename(staged.c_str(), path.c_str()) != 0) {
    throw_errno("rename '" + staged.string() + "' -> '" + path.string() + "'");
  }
  sync_directory(path.parent_path());
}

void storage<file_storage_tag>::replace(
    const std::string_view& document) const {
  stage(document);
  commit_staged();
}

std::filesystem::path storage<file_storage_tag>::staging_path() const {
  auto staged = path;
  staged += ".tmp";
  return staged;
}

template <>
storage<file_storage_tag> make_storage<file_storage_tag>(
    const std::filesystem::path& path) {
  auto store = storage<file_storage_tag>{};
  store.path = path;
  return store;
}

}  // namespace ferry::storage
