#include <ferry/schema/encoding/json/state_snapshot.hpp>
#include <ferry/schema/encoding/json/transfer_record.hpp>

#include <stdexcept>
#include <string>

using namespace ferry::schema;

namespace ferry::schema::encoding::json {

void encode(const state_snapshot<1>& o, nlohmann::json& document) {
  document["version"] = o.version;
  if (o.last_sync_at) {
    document["last_sync_at"] = to_iso8601(*o.last_sync_at);
  }

  auto files = nlohmann::json::object();
  for (const auto& [key, record] : o.records) {
    auto child = nlohmann::json::object();
    encode(record, child);
    files[key] = std::move(child);
  }
  document["files"] = std::move(files);
}

void decode(state_snapshot<1>& o, const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error{"state document is not a JSON object"};
  }
  o.version =
      document.value("version", std::string{kStateDocumentVersion});
  o.last_sync_at.reset();
  if (auto it = document.find("last_sync_at"); it != std::end(document)) {
    o.last_sync_at = try_parse_iso8601(it->get<std::string>());
  }

  o.records.clear();
  auto files = document.find("files");
  if (files == std::end(document)) {
    return;
  }
  if (!files->is_object()) {
    throw std::runtime_error{"state document 'files' is not an object"};
  }
  for (const auto& [key, child] : files->items()) {
    auto record = transfer_record<1>{};
    decode(record, child);
    if (record.destination_key.empty()) {
      record.destination_key = key;
    }
    o.records.insert_or_assign(key, std::move(record));
  }
}

}  // namespace ferry::schema::encoding::json
