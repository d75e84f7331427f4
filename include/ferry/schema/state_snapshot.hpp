#pragma once

#include <ferry/schema/primitives.hpp>
#include <ferry/schema/transfer_record.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

// Schema type: state snapshot.
// The complete persisted state document, keyed by destination key.
namespace ferry::schema {

inline constexpr auto kStateDocumentVersion = std::string_view{"1.0"};

template <uint16_t Version>
struct state_snapshot;

template <>
struct state_snapshot<1> final {
  std::string version{kStateDocumentVersion};
  std::optional<timestamp_t> last_sync_at;
  std::map<std::string, transfer_record_t> records;
};

using state_snapshot_t = state_snapshot<1>;

}  // namespace ferry::schema
