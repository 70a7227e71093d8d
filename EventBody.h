#ifndef EVENT_BODY_H
#define EVENT_BODY_H

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <jansson.h>

#include "EventKind.h"

// Fields present in every event body
struct EventBase {
    std::string transaction_id;
    std::string transaction_type = "pending";
    int64_t timestamp = 0;            // simulated time of the marker
    int64_t server_timestamp = 0;     // time of the frame the marker was read from
};

struct TransactionStartedBody {
    EventBase base;
    std::string status = "started";
};

struct TransactionCompletedBody {
    EventBase base;
    int total_items = 0;
    std::string status = "ended";
};

struct ItemAddedBody {
    EventBase base;
    std::string item_id;
    std::string barcode = "1234567890123";
    std::string name = "Apple";
    int quantity = 1;
    std::string added_method = "scanner";
    bool is_kitchen_item = false;
    std::optional<double> price;
    std::optional<std::string> currency;
};

struct ItemRemovedBody {
    EventBase base;
    std::string item_id;
    std::string barcode = "1234567890123";
    std::string name = "Apple";
    int quantity = 1;
    std::string removed_user = "staff";
    bool is_kitchen_item = false;
};

struct StateChangeBody {
    EventBase base;
    std::string ui_state = "staff_mode_on";
    std::string reason = "simulation";
};

struct ScanStartedBody {
    EventBase base;
};

struct ScanCompletedBody {
    EventBase base;
    int total_items = 0;
};

struct WeighingMismatchBody {
    EventBase base;
    std::string item_id = "aabb513";
    std::string name = "default";
    std::string barcode = "aabbabc";
    double detected_weight = 50.0;
    double expected_weight = 100.0;
};

using EventBody = std::variant<
    WeighingMismatchBody,
    StateChangeBody,
    ItemRemovedBody,
    ItemAddedBody,
    TransactionCompletedBody,
    TransactionStartedBody,
    ScanStartedBody,
    ScanCompletedBody>;

// Body for `kind` around `base`. Item events get a fresh item id.
EventBody buildEventBody(EventKind kind, const EventBase& base);

EventKind eventKindOf(const EventBody& body);

// New reference; caller owns it
json_t* eventBodyToJson(const EventBody& body);

std::string serializeEventBody(const EventBody& body);

#endif // EVENT_BODY_H
