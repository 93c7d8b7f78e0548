#pragma once
#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>

// Upstream APIs renamed several fields over time; each alias list is tried in order.
// Entries are JSON-pointer style paths ("/order/id").
using FieldAliases = std::initializer_list<const char*>;

constexpr FieldAliases kTransactionIdFields = {"/transactionID", "/transactionId", "/id"};
constexpr FieldAliases kProxyAddressFields  = {"/proxyAddress", "/address", "/proxyWallet"};
constexpr FieldAliases kTxHashFields        = {"/transactionHash", "/txHash", "/hash"};
constexpr FieldAliases kTxStateFields       = {"/state", "/status"};
constexpr FieldAliases kErrorMessageFields  = {"/errorMsg", "/error/message", "/error", "/message"};
constexpr FieldAliases kOrderIdFields       = {"/orderID", "/orderId", "/order_id", "/id", "/order/order_id", "/order/id"};

// First alias present as a non-empty string or a number, rendered as text.
// Returns "" when none match.
std::string first_text(const nlohmann::json& j, FieldAliases paths);
