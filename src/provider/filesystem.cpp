#include <ferry/crypto/checksum.hpp>
#include <ferry/provider/filesystem.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

using namespace ferry::schema;

namespace ferry::provider {

namespace {

constexpr auto kReadBufferSize = std::size_t{64 * 1024};

std::filesystem::path resolve(const std::filesystem::path& root,
                              std::string_view name) {
  auto relative = std::filesystem::path{std::string{name}}.lexically_normal();
  if (name.empty() || relative.is_absolute() || relative.empty() ||
      *relative.begin() == "..") {
    throw transport_error{"invalid object name '" + std::string{name} + "'"};
  }
  return root / relative;
}

timestamp_t to_timestamp(std::filesystem::file_time_type value) {
  return to_stored_precision(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(
          std::chrono::file_clock::to_sys(value)));
}

std::string md5_of_file(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    throw transport_error{"cannot open '" + path.string() + "' for reading"};
  }
  auto hasher = ferry::crypto::md5{};
  auto buffer = std::array<char, kReadBufferSize>{};
  while (in) {
    in.read(buffer.data(), buffer.size());
    auto count = in.gcount();
    if (count > 0) {
      hasher.update(bytes_view_t{reinterpret_cast<const uint8_t*>(buffer.data()),
                                 static_cast<std::size_t>(count)});
    }
  }
  if (in.bad()) {
    throw transport_error{"read failed on '" + path.string() + "'"};
  }
  return hasher.finalize_hex();
}

bool is_internal_name(std::string_view name) {
  return name.ends_with(kPartialSuffix) || name.ends_with(kProbeName);
}

class file_read_stream final : public read_stream {
 public:
  explicit file_read_stream(std::filesystem::path path)
      : path_{std::move(path)}, in_{path_, std::ios::binary} {
    if (!in_) {
      throw transport_error{"cannot open '" + path_.string() + "'"};
    }
  }

  std::size_t read(mutable_bytes_view_t buffer) override {
    if (buffer.empty() || in_.eof()) {
      return 0;
    }
    in_.read(reinterpret_cast<char*>(buffer.data()),
             static_cast<std::streamsize>(buffer.size()));
    if (in_.bad()) {
      throw transport_error{"read failed on '" + path_.string() + "'"};
    }
    return static_cast<std::size_t>(in_.gcount());
  }

 private:
  std::filesystem::path path_;
  std::ifstream in_;
};

class file_write_stream final : public write_stream {
 public:
  explicit file_write_stream(std::filesystem::path target)
      : target_{std::move(target)},
        partial_{target_.string() + std::string{kPartialSuffix}} {
    auto error = std::error_code{};
    std::filesystem::create_directories(target_.parent_path(), error);
    if (error) {
      throw transport_error{"cannot create '" +
                            target_.parent_path().string() +
                            "': " + error.message()};
    }
    out_.open(partial_, std::ios::binary | std::ios::trunc);
    if (!out_) {
      throw transport_error{"cannot open '" + partial_.string() +
                            "' for writing"};
    }
  }

  ~file_write_stream() override {
    if (!committed_) {
      abort();
    }
  }

  void write(const bytes_view_t& bytes) override {
    out_.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
      throw transport_error{"write failed on '" + partial_.string() + "'"};
    }
  }

  std::optional<std::string> commit() override {
    out_.close();
    if (out_.fail()) {
      throw transport_error{"close failed on '" + partial_.string() + "'"};
    }
    // Digest what actually reached the disk, not what was handed to write().
    auto checksum = md5_of_file(partial_);
    auto error = std::error_code{};
    std::filesystem::rename(partial_, target_, error);
    if (error) {
      throw transport_error{"cannot publish '" + target_.string() +
                            "': " + error.message()};
    }
    committed_ = true;
    return checksum;
  }

  void abort() noexcept override {
    if (out_.is_open()) {
      out_.close();
    }
    auto error = std::error_code{};
    std::filesystem::remove(partial_, error);
  }

 private:
  std::filesystem::path target_;
  std::filesystem::path partial_;
  std::ofstream out_;
  bool committed_{false};
};

}  // namespace

filesystem_catalog::filesystem_catalog(std::filesystem::path root)
    : root_{std::move(root)} {}

std::vector<object_descriptor_t> filesystem_catalog::list(
    std::string_view prefix) {
  auto out = std::vector<object_descriptor_t>{};
  auto error = std::error_code{};
  if (!std::filesystem::is_directory(root_, error)) {
    throw transport_error{"source root '" + root_.string() +
                          "' is not a directory"};
  }

  try {
    for (const auto& entry :
         std::filesystem::recursive_directory_iterator{root_}) {
      if (!entry.is_regular_file()) {
        continue;
      }
      auto name = entry.path().lexically_relative(root_).generic_string();
      if (!name.starts_with(prefix) || is_internal_name(name)) {
        continue;
      }
      out.push_back(object_descriptor_t{
          .name = std::move(name),
          .size = static_cast<byte_count_t>(entry.file_size()),
          .created_at = to_timestamp(entry.last_write_time())});
    }
  } catch (const std::filesystem::filesystem_error& e) {
    throw transport_error{std::string{"listing failed: "} + e.what()};
  }

  std::ranges::sort(out, {}, &object_descriptor_t::name);
  return out;
}

std::unique_ptr<read_stream> filesystem_catalog::open_read(
    std::string_view name) {
  return std::make_unique<file_read_stream>(resolve(root_, name));
}

void filesystem_catalog::test_connectivity() {
  auto error = std::error_code{};
  if (!std::filesystem::is_directory(root_, error)) {
    throw transport_error{"source root '" + root_.string() +
                          "' is not a readable directory"};
  }
  std::filesystem::directory_iterator{root_, error};
  if (error) {
    throw transport_error{"cannot read '" + root_.string() +
                          "': " + error.message()};
  }
}

std::string filesystem_catalog::describe() const {
  return "file://" + root_.string();
}

filesystem_destination::filesystem_destination(std::filesystem::path root)
    : root_{std::move(root)} {}

std::unique_ptr<write_stream> filesystem_destination::open_write(
    std::string_view key,
    byte_count_t size) {
  static_cast<void>(size);
  return std::make_unique<file_write_stream>(resolve(root_, key));
}

bool filesystem_destination::exists(std::string_view key) {
  auto error = std::error_code{};
  return std::filesystem::is_regular_file(resolve(root_, key), error);
}

std::optional<object_metadata_t> filesystem_destination::head(
    std::string_view key) {
  auto path = resolve(root_, key);
  auto error = std::error_code{};
  if (!std::filesystem::is_regular_file(path, error)) {
    return std::nullopt;
  }
  auto size = std::filesystem::file_size(path, error);
  if (error) {
    throw transport_error{"stat failed on '" + path.string() +
                          "': " + error.message()};
  }
  auto modified = std::filesystem::last_write_time(path, error);
  if (error) {
    throw transport_error{"stat failed on '" + path.string() +
                          "': " + error.message()};
  }
  return object_metadata_t{.size = static_cast<byte_count_t>(size),
                           .checksum = md5_of_file(path),
                           .last_modified = to_timestamp(modified)};
}

void filesystem_destination::test_connectivity() {
  auto stream = open_write(kProbeName, 0);
  stream->write(make_bytes_view(std::string_view{"ferry connectivity probe"}));
  static_cast<void>(stream->commit());
  auto error = std::error_code{};
  std::filesystem::remove(root_ / kProbeName, error);
  if (error) {
    throw transport_error{"cannot remove probe in '" + root_.string() +
                          "': " + error.message()};
  }
}

std::string filesystem_destination::describe() const {
  return "file://" + root_.string();
}

}  // namespace ferry::provider
