#include "EventBody.h"
#include "ActiveTransaction.h"

#include <cstdlib>
#include <stdexcept>

namespace
{
  // One handler per alternative; a missing one fails to compile
  template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
  template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

  json_t* baseToJson(const EventBase& base)
  {
    json_t* obj = json_object();
    json_object_set_new(obj, "transaction_id", json_string(base.transaction_id.c_str()));
    json_object_set_new(obj, "transaction_type", json_string(base.transaction_type.c_str()));
    json_object_set_new(obj, "timestamp", json_integer(base.timestamp));
    json_object_set_new(obj, "server_timestamp", json_integer(base.server_timestamp));
    return obj;
  }

  void setString(json_t* obj, const char* key, const std::string& value)
  {
    json_object_set_new(obj, key, json_string(value.c_str()));
  }
}

EventBody buildEventBody(EventKind kind, const EventBase& base)
{
  switch (kind) {
  case EventKind::WEIGHING_MISMATCH: {
    WeighingMismatchBody body;
    body.base = base;
    return body;
  }
  case EventKind::STATE_CHANGE: {
    StateChangeBody body;
    body.base = base;
    return body;
  }
  case EventKind::ITEM_REMOVED: {
    ItemRemovedBody body;
    body.base = base;
    body.item_id = generateUuid();
    return body;
  }
  case EventKind::ITEM_ADDED: {
    ItemAddedBody body;
    body.base = base;
    body.item_id = generateUuid();
    return body;
  }
  case EventKind::TRANSACTION_COMPLETED: {
    TransactionCompletedBody body;
    body.base = base;
    return body;
  }
  case EventKind::TRANSACTION_STARTED: {
    TransactionStartedBody body;
    body.base = base;
    return body;
  }
  case EventKind::SCAN_STARTED: {
    ScanStartedBody body;
    body.base = base;
    return body;
  }
  case EventKind::SCAN_COMPLETED: {
    ScanCompletedBody body;
    body.base = base;
    return body;
  }
  }
  throw std::invalid_argument("no event body for kind " +
                              std::to_string(static_cast<int>(kind)));
}

EventKind eventKindOf(const EventBody& body)
{
  return std::visit(Overloaded{
      [](const WeighingMismatchBody&) { return EventKind::WEIGHING_MISMATCH; },
      [](const StateChangeBody&) { return EventKind::STATE_CHANGE; },
      [](const ItemRemovedBody&) { return EventKind::ITEM_REMOVED; },
      [](const ItemAddedBody&) { return EventKind::ITEM_ADDED; },
      [](const TransactionCompletedBody&) { return EventKind::TRANSACTION_COMPLETED; },
      [](const TransactionStartedBody&) { return EventKind::TRANSACTION_STARTED; },
      [](const ScanStartedBody&) { return EventKind::SCAN_STARTED; },
      [](const ScanCompletedBody&) { return EventKind::SCAN_COMPLETED; },
    }, body);
}

json_t* eventBodyToJson(const EventBody& body)
{
  return std::visit(Overloaded{
      [](const WeighingMismatchBody& b) {
        json_t* obj = baseToJson(b.base);
        setString(obj, "item_id", b.item_id);
        setString(obj, "name", b.name);
        setString(obj, "barcode", b.barcode);
        json_object_set_new(obj, "detected_weight", json_real(b.detected_weight));
        json_object_set_new(obj, "expected_weight", json_real(b.expected_weight));
        return obj;
      },
      [](const StateChangeBody& b) {
        json_t* obj = baseToJson(b.base);
        setString(obj, "ui_state", b.ui_state);
        setString(obj, "reason", b.reason);
        return obj;
      },
      [](const ItemRemovedBody& b) {
        json_t* obj = baseToJson(b.base);
        setString(obj, "item_id", b.item_id);
        setString(obj, "barcode", b.barcode);
        setString(obj, "name", b.name);
        json_object_set_new(obj, "quantity", json_integer(b.quantity));
        setString(obj, "removed_user", b.removed_user);
        json_object_set_new(obj, "is_kitchen_item", json_boolean(b.is_kitchen_item));
        return obj;
      },
      [](const ItemAddedBody& b) {
        json_t* obj = baseToJson(b.base);
        setString(obj, "item_id", b.item_id);
        setString(obj, "barcode", b.barcode);
        setString(obj, "name", b.name);
        json_object_set_new(obj, "quantity", json_integer(b.quantity));
        setString(obj, "added_method", b.added_method);
        json_object_set_new(obj, "is_kitchen_item", json_boolean(b.is_kitchen_item));
        json_object_set_new(obj, "price", b.price ? json_real(*b.price) : json_null());
        json_object_set_new(obj, "currency",
                            b.currency ? json_string(b.currency->c_str()) : json_null());
        return obj;
      },
      [](const TransactionCompletedBody& b) {
        json_t* obj = baseToJson(b.base);
        json_object_set_new(obj, "total_items", json_integer(b.total_items));
        setString(obj, "status", b.status);
        return obj;
      },
      [](const TransactionStartedBody& b) {
        json_t* obj = baseToJson(b.base);
        setString(obj, "status", b.status);
        return obj;
      },
      [](const ScanStartedBody& b) {
        return baseToJson(b.base);
      },
      [](const ScanCompletedBody& b) {
        json_t* obj = baseToJson(b.base);
        json_object_set_new(obj, "total_items", json_integer(b.total_items));
        return obj;
      },
    }, body);
}

std::string serializeEventBody(const EventBody& body)
{
  json_t* obj = eventBodyToJson(body);
  char* text = json_dumps(obj, JSON_COMPACT);
  std::string result = text ? text : "{}";
  free(text);
  json_decref(obj);
  return result;
}
