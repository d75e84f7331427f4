#pragma once

#include <ferry/schema/object_descriptor.hpp>
#include <ferry/schema/object_metadata.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::provider {

/// Any failure talking to a storage backend. Always retryable.
class transport_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// The backend accepted the bytes but disagrees about what it stored.
class integrity_error : public transport_error {
 public:
  using transport_error::transport_error;
};

class read_stream {
 public:
  virtual ~read_stream() = default;

  /// Read up to `buffer.size()` bytes. Returns 0 only at end of stream.
  virtual std::size_t read(ferry::schema::mutable_bytes_view_t buffer) = 0;
};

/// Upload in progress. Nothing is visible at the destination until commit()
/// returns; destroying an uncommitted stream aborts it.
class write_stream {
 public:
  virtual ~write_stream() = default;

  virtual void write(const ferry::schema::bytes_view_t& bytes) = 0;

  /// Publish the object. Returns the MD5 hex the destination vouches for,
  /// or std::nullopt when it cannot report one.
  virtual std::optional<std::string> commit() = 0;

  virtual void abort() noexcept = 0;
};

class source_catalog {
 public:
  virtual ~source_catalog() = default;

  /// Every object whose name starts with `prefix`.
  virtual std::vector<ferry::schema::object_descriptor_t> list(
      std::string_view prefix) = 0;

  virtual std::unique_ptr<read_stream> open_read(std::string_view name) = 0;

  /// Throws transport_error when the source is unreachable.
  virtual void test_connectivity() = 0;

  virtual std::string describe() const = 0;
};

class destination_store {
 public:
  virtual ~destination_store() = default;

  /// `size` is the expected payload length; backends use it to choose an
  /// upload strategy.
  virtual std::unique_ptr<write_stream> open_write(
      std::string_view key,
      ferry::schema::byte_count_t size) = 0;

  virtual bool exists(std::string_view key) = 0;

  virtual std::optional<ferry::schema::object_metadata_t> head(
      std::string_view key) = 0;

  /// Throws transport_error when the destination is unreachable or not
  /// writable.
  virtual void test_connectivity() = 0;

  virtual std::string describe() const = 0;
};

}  // namespace ferry::provider
