#include <ferry/schema/encoding/json/transfer_record.hpp>

#include <stdexcept>
#include <string>

using namespace ferry::schema;

namespace ferry::schema::encoding::json {

void encode(const transfer_record<1>& o, nlohmann::json& document) {
  document["source_name"] = o.source_name;
  document["destination_key"] = o.destination_key;
  document["size"] = o.size;
  if (o.created_at) {
    document["created_at"] = to_iso8601(*o.created_at);
  }
  document["transferred_at"] = to_iso8601(o.transferred_at);
  if (o.checksum) {
    document["checksum"] = *o.checksum;
  }
  document["duration_seconds"] = o.duration_seconds;
}

void decode(transfer_record<1>& o, const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error{"transfer record is not a JSON object"};
  }
  o.source_name = document.at("source_name").get<std::string>();
  o.destination_key = document.value("destination_key", std::string{});

  const auto& size = document.at("size");
  if (!size.is_number_unsigned()) {
    throw std::runtime_error{"transfer record size is not an unsigned integer"};
  }
  o.size = size.get<byte_count_t>();

  o.created_at.reset();
  if (auto it = document.find("created_at"); it != std::end(document)) {
    o.created_at = try_parse_iso8601(it->get<std::string>());
  }

  auto transferred =
      try_parse_iso8601(document.at("transferred_at").get<std::string>());
  if (!transferred) {
    throw std::runtime_error{"transfer record has an invalid transferred_at"};
  }
  o.transferred_at = *transferred;

  o.checksum.reset();
  if (auto it = document.find("checksum"); it != std::end(document)) {
    auto checksum = it->get<std::string>();
    if (!checksum.empty()) {
      o.checksum = std::move(checksum);
    }
  }
  o.duration_seconds = document.value("duration_seconds", 0.0);
}

}  // namespace ferry::schema::encoding::json
