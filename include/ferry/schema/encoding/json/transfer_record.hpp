#pragma once

#include <ferry/schema/transfer_record.hpp>
#include <nlohmann/json.hpp>

namespace ferry::schema::encoding::json {

void encode(const ferry::schema::transfer_record<1>& o,
            nlohmann::json& document);
void decode(ferry::schema::transfer_record<1>& o,
            const nlohmann::json& document);

}  // namespace ferry::schema::encoding::json
