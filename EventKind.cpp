#include "EventKind.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <vector>

std::optional<EventKind> eventKindFromCode(long long code)
{
    switch (code) {
        case 0: return EventKind::WEIGHING_MISMATCH;
        case 1: return EventKind::STATE_CHANGE;
        case 2: return EventKind::ITEM_REMOVED;
        case 3: return EventKind::ITEM_ADDED;
        case 4: return EventKind::TRANSACTION_COMPLETED;
        case 5: return EventKind::TRANSACTION_STARTED;
        case 6: return EventKind::SCAN_STARTED;
        case 7: return EventKind::SCAN_COMPLETED;
        default: return std::nullopt;
    }
}

const char* eventKindName(EventKind kind)
{
    switch (kind) {
        case EventKind::WEIGHING_MISMATCH: return "WEIGHING_MISMATCH";
        case EventKind::STATE_CHANGE: return "STATE_CHANGE";
        case EventKind::ITEM_REMOVED: return "ITEM_REMOVED";
        case EventKind::ITEM_ADDED: return "ITEM_ADDED";
        case EventKind::TRANSACTION_COMPLETED: return "TRANSACTION_COMPLETED";
        case EventKind::TRANSACTION_STARTED: return "TRANSACTION_STARTED";
        case EventKind::SCAN_STARTED: return "SCAN_STARTED";
        case EventKind::SCAN_COMPLETED: return "SCAN_COMPLETED";
    }
    return "UNKNOWN";
}

const char* eventPath(EventKind kind)
{
    switch (kind) {
        case EventKind::WEIGHING_MISMATCH: return "weighting-scale-not-matched";
        case EventKind::STATE_CHANGE: return "states";
        case EventKind::ITEM_REMOVED: return "item-removed";
        case EventKind::ITEM_ADDED: return "item-added";
        case EventKind::TRANSACTION_COMPLETED: return "transaction-completed";
        case EventKind::TRANSACTION_STARTED: return "transaction-started";
        case EventKind::SCAN_STARTED: return "scan-started";
        case EventKind::SCAN_COMPLETED: return "scan-completed";
    }
    return "";
}

std::optional<EventMarker> splitMarker(const std::string& raw, char separator)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = raw.find(separator, start);
        if (pos == std::string::npos) {
            fields.push_back(raw.substr(start));
            break;
        }
        fields.push_back(raw.substr(start, pos - start));
        start = pos + 1;
    }

    if (fields.size() != 4) {
        return std::nullopt;
    }

    EventMarker marker;
    marker.timestamp = fields[0];
    marker.global_frame_index = fields[1];
    marker.scan_frame_index = fields[2];
    marker.kind_code = fields[3];
    return marker;
}

bool parseInteger(const std::string& text, long long& value)
{
    const char* begin = text.c_str();
    while (*begin && std::isspace(static_cast<unsigned char>(*begin))) begin++;
    if (*begin == '\0') return false;

    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(begin, &end, 10);
    if (errno == ERANGE || end == begin) return false;

    while (*end && std::isspace(static_cast<unsigned char>(*end))) end++;
    if (*end != '\0') return false;

    value = parsed;
    return true;
}
