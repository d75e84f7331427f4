#pragma once

#include <ferry/schema/state_snapshot.hpp>
#include <nlohmann/json.hpp>

namespace ferry::schema::encoding::json {

void encode(const ferry::schema::state_snapshot<1>& o,
            nlohmann::json& document);
void decode(ferry::schema::state_snapshot<1>& o,
            const nlohmann::json& document);

}  // namespace ferry::schema::encoding::json
