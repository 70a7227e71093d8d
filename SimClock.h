#ifndef SIM_CLOCK_H
#define SIM_CLOCK_H

#include <cstdint>
#include <string>

// Wall clock in epoch milliseconds. This is the simulated timestamp carried
// by every frame and event.
int64_t currentTimestampMs();

// Select the zone used when rendering timestamps as text. Unknown names fall
// back to UTC and return false.
bool setDisplayTimezone(const std::string& name);
std::string displayTimezone();
bool isKnownTimezone(const std::string& name);

// "YYYY-MM-DD HH:MM:SS" in the display timezone
std::string formatTimestamp(int64_t timestamp_ms);

#endif // SIM_CLOCK_H
