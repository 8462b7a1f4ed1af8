#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace filecron::tasks {

// Offset applied to the compact "YYYY-MM-DD-HH:mm" shorthand and to values
// that carry no offset token at all.
constexpr int kDefaultOffsetMinutes = 8 * 60;
constexpr const char* kDefaultOffsetToken = "+08:00";

struct Timestamp {
    std::chrono::system_clock::time_point instant;
    int offset_minutes = kDefaultOffsetMinutes;
    // Offset exactly as written in the source ("Z", "+08:00", "-0530"); empty if absent.
    std::string offset_token;
};

struct CivilTime {
    long long year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
};

long long DaysFromCivil(long long year, unsigned month, unsigned day);
CivilTime CivilFromLocalSeconds(long long local_seconds);
unsigned DaysInMonth(long long year, unsigned month);

// Returns the ISO form for the compact shorthand, the trimmed input for
// anything already ISO-like, and nullopt for unrecognized input.
std::optional<std::string> NormalizeScheduledTime(const std::string& raw);

std::optional<Timestamp> ParseTimestamp(const std::string& value);

std::string FormatIso(std::chrono::system_clock::time_point instant,
                      int offset_minutes,
                      const std::string& offset_token);

// "YYYY-MM-DD HH:MM:SS" in the timestamp's own offset.
std::string FormatLocal(const Timestamp& timestamp);

// Next trigger string for a recurring task: prior + interval_s seconds,
// rendered in the prior value's offset with its token preserved verbatim.
std::optional<std::string> AdvanceTimestamp(const std::string& prior, long long interval_s);

}  // namespace filecron::tasks
