#include "mapping.hpp"

#include <cmath>
#include <stdexcept>

namespace wfmk {

namespace {

// Catalog ids are hex strings, but tolerate numeric ids too.
std::string stringField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

int numberField(const nlohmann::json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || !it->is_number()) {
        return 0;
    }
    return static_cast<int>(std::lround(it->get<double>()));
}

} // namespace

nlohmann::json extractPayload(const nlohmann::json& responseBody) {
    if (!responseBody.is_object()) {
        throw std::runtime_error("Response body is not a JSON object");
    }
    if (responseBody.contains("error")) {
        throw std::runtime_error("API error: " + responseBody["error"].dump());
    }
    if (!responseBody.contains("payload") || !responseBody["payload"].is_object()) {
        throw std::runtime_error("Response missing 'payload' object");
    }
    return responseBody["payload"];
}

Item parseItemNode(const nlohmann::json& node) {
    Item item;
    item.id      = stringField(node, "id");
    item.name    = stringField(node, "item_name");
    item.urlName = stringField(node, "url_name");
    return item;
}

Order parseOrderNode(const nlohmann::json& node) {
    Order order;
    if (auto user = node.find("user"); user != node.end() && user->is_object()) {
        order.userName   = stringField(*user, "ingame_name");
        order.userStatus = stringField(*user, "status");
    }
    order.platform  = stringField(node, "platform");
    order.region    = stringField(node, "region");
    order.orderType = stringField(node, "order_type");
    order.price     = numberField(node, "platinum");
    order.quantity  = numberField(node, "quantity");
    return order;
}

ItemList parseItems(const nlohmann::json& payload) {
    if (!payload.is_object() || !payload.contains("items") ||
        !payload["items"].is_array()) {
        throw std::runtime_error("Payload missing 'items' array");
    }

    ItemList items;
    items.reserve(payload["items"].size());
    for (const auto& node : payload["items"]) {
        if (!node.is_object()) {
            throw std::runtime_error("Catalog entry is not an object");
        }
        items.push_back(parseItemNode(node));
    }
    return items;
}

OrderList parseOrders(const nlohmann::json& payload) {
    if (!payload.is_object() || !payload.contains("orders") ||
        !payload["orders"].is_array()) {
        throw std::runtime_error("Payload missing 'orders' array");
    }

    OrderList orders;
    orders.reserve(payload["orders"].size());
    for (const auto& node : payload["orders"]) {
        if (!node.is_object()) {
            throw std::runtime_error("Order entry is not an object");
        }
        orders.push_back(parseOrderNode(node));
    }
    return orders;
}

} // namespace wfmk
