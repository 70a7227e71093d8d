#ifndef EVENT_KIND_H
#define EVENT_KIND_H

#include <optional>
#include <string>

// Numeric values are the codes carried in the optical marker
enum class EventKind {
    WEIGHING_MISMATCH = 0,
    STATE_CHANGE = 1,
    ITEM_REMOVED = 2,
    ITEM_ADDED = 3,
    TRANSACTION_COMPLETED = 4,
    TRANSACTION_STARTED = 5,
    SCAN_STARTED = 6,
    SCAN_COMPLETED = 7
};

constexpr int kEventKindCount = 8;

// Total over 0..7, empty for anything else
std::optional<EventKind> eventKindFromCode(long long code);

const char* eventKindName(EventKind kind);

// Last path segment of the event endpoint, e.g. "transaction-started"
const char* eventPath(EventKind kind);

// The four fields of a marker, "timestamp|frame|scan_frame|kind"
struct EventMarker {
    std::string timestamp;
    std::string global_frame_index;
    std::string scan_frame_index;
    std::string kind_code;
};

// Empty unless `raw` has exactly four fields
std::optional<EventMarker> splitMarker(const std::string& raw, char separator = '|');

// Whole-string integer parse, surrounding whitespace allowed
bool parseInteger(const std::string& text, long long& value);

#endif // EVENT_KIND_H
