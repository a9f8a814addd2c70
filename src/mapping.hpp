#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace wfmk {

/// Unwrap a warframe.market response body: `{"payload": {...}}`.
/// Throws std::runtime_error if the body carries an "error" field or has no
/// payload object.
nlohmann::json extractPayload(const nlohmann::json& responseBody);

/// Map a single catalog entry into an Item.
Item parseItemNode(const nlohmann::json& node);

/// Map a single order entry into an Order.
Order parseOrderNode(const nlohmann::json& node);

/// Decode `payload.items`. Throws std::runtime_error if the shape is wrong.
ItemList parseItems(const nlohmann::json& payload);

/// Decode `payload.orders`. Throws std::runtime_error if the shape is wrong.
OrderList parseOrders(const nlohmann::json& payload);

} // namespace wfmk
