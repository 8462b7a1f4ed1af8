#include "tasks/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace filecron::tasks {
namespace {

constexpr long long kSecondsPerDay = 86400;

// Whole seconds representable by system_clock, one second short of each end to leave room for millis.
constexpr long long kMaxUtcSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::max()).count() - 1;
constexpr long long kMinUtcSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::duration::min()).count() + 1;

std::string Trim(const std::string& value) {
    auto begin = std::find_if(value.begin(), value.end(), [](unsigned char c) {
        return !std::isspace(c);
    });
    auto end = std::find_if(value.rbegin(), value.rend(), [](unsigned char c) {
        return !std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool ReadDigits(const std::string& value, std::size_t& pos, std::size_t count, int& out) {
    if (pos + count > value.size()) {
        return false;
    }
    int result = 0;
    for (std::size_t i = 0; i < count; ++i) {
        const auto c = static_cast<unsigned char>(value[pos + i]);
        if (!std::isdigit(c)) {
            return false;
        }
        result = result * 10 + (c - '0');
    }
    pos += count;
    out = result;
    return true;
}

bool Expect(const std::string& value, std::size_t& pos, char expected) {
    if (pos >= value.size() || value[pos] != expected) {
        return false;
    }
    ++pos;
    return true;
}

bool IsCompactShorthand(const std::string& value) {
    // YYYY-MM-DD-HH:mm
    static const char* kPattern = "dddd-dd-dd-dd:dd";
    if (value.size() != 16) {
        return false;
    }
    for (std::size_t i = 0; i < value.size(); ++i) {
        const auto c = static_cast<unsigned char>(value[i]);
        if (kPattern[i] == 'd') {
            if (!std::isdigit(c)) {
                return false;
            }
        } else if (value[i] != kPattern[i]) {
            return false;
        }
    }
    return true;
}

bool ParseOffset(const std::string& value, std::size_t& pos, Timestamp& out) {
    if (pos == value.size()) {
        out.offset_minutes = kDefaultOffsetMinutes;
        out.offset_token.clear();
        return true;
    }
    const std::size_t start = pos;
    if (value[pos] == 'Z' || value[pos] == 'z') {
        ++pos;
        out.offset_minutes = 0;
        out.offset_token = value.substr(start, 1);
        return true;
    }
    if (value[pos] != '+' && value[pos] != '-') {
        return false;
    }
    const int sign = value[pos] == '+' ? 1 : -1;
    ++pos;
    int hours = 0;
    int minutes = 0;
    if (!ReadDigits(value, pos, 2, hours)) {
        return false;
    }
    if (pos < value.size() && value[pos] == ':') {
        ++pos;
    }
    if (!ReadDigits(value, pos, 2, minutes)) {
        return false;
    }
    if (hours > 23 || minutes > 59) {
        return false;
    }
    out.offset_minutes = sign * (hours * 60 + minutes);
    out.offset_token = value.substr(start, pos - start);
    return true;
}

long long FloorDiv(long long value, long long divisor) {
    long long q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --q;
    }
    return q;
}

}  // namespace

long long DaysFromCivil(long long year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

CivilTime CivilFromLocalSeconds(long long local_seconds) {
    const long long days = FloorDiv(local_seconds, kSecondsPerDay);
    const long long secs = local_seconds - days * kSecondsPerDay;

    const long long z = days + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;

    CivilTime civil{};
    civil.day = doy - (153 * mp + 2) / 5 + 1;
    civil.month = mp < 10 ? mp + 3 : mp - 9;
    civil.year = static_cast<long long>(yoe) + era * 400 + (civil.month <= 2 ? 1 : 0);
    civil.hour = static_cast<unsigned>(secs / 3600);
    civil.minute = static_cast<unsigned>((secs % 3600) / 60);
    civil.second = static_cast<unsigned>(secs % 60);
    return civil;
}

unsigned DaysInMonth(long long year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

std::optional<std::string> NormalizeScheduledTime(const std::string& raw) {
    const auto value = Trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    if (value.find('T') != std::string::npos) {
        return value;
    }
    if (IsCompactShorthand(value)) {
        return value.substr(0, 10) + "T" + value.substr(11, 5) + ":00" + kDefaultOffsetToken;
    }
    return std::nullopt;
}

std::optional<Timestamp> ParseTimestamp(const std::string& raw) {
    const auto normalized = NormalizeScheduledTime(raw);
    if (!normalized.has_value()) {
        return std::nullopt;
    }
    const std::string& value = normalized.value();

    std::size_t pos = 0;
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    if (!ReadDigits(value, pos, 4, year) || !Expect(value, pos, '-') ||
        !ReadDigits(value, pos, 2, month) || !Expect(value, pos, '-') ||
        !ReadDigits(value, pos, 2, day) || !Expect(value, pos, 'T') ||
        !ReadDigits(value, pos, 2, hour) || !Expect(value, pos, ':') ||
        !ReadDigits(value, pos, 2, minute)) {
        return std::nullopt;
    }
    if (pos < value.size() && value[pos] == ':') {
        ++pos;
        if (!ReadDigits(value, pos, 2, second)) {
            return std::nullopt;
        }
        if (pos < value.size() && value[pos] == '.') {
            ++pos;
            std::size_t digits = 0;
            while (pos < value.size() && std::isdigit(static_cast<unsigned char>(value[pos]))) {
                if (digits < 3) {
                    millis = millis * 10 + (value[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                return std::nullopt;
            }
            for (std::size_t i = digits; i < 3; ++i) {
                millis *= 10;
            }
        }
    }

    Timestamp timestamp{};
    if (!ParseOffset(value, pos, timestamp) || pos != value.size()) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > DaysInMonth(year, static_cast<unsigned>(month)) ||
        hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    const long long local_seconds =
        DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kSecondsPerDay +
        hour * 3600LL + minute * 60LL + second;
    const long long utc_seconds = local_seconds - timestamp.offset_minutes * 60LL;
    if (utc_seconds > kMaxUtcSeconds || utc_seconds < kMinUtcSeconds) {
        return std::nullopt;
    }
    timestamp.instant = std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(utc_seconds) + std::chrono::milliseconds(millis)));
    return timestamp;
}

std::string FormatIso(std::chrono::system_clock::time_point instant,
                      int offset_minutes,
                      const std::string& offset_token) {
    const auto utc_seconds =
        std::chrono::floor<std::chrono::seconds>(instant.time_since_epoch()).count();
    const auto civil = CivilFromLocalSeconds(utc_seconds + offset_minutes * 60LL);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02uT%02u:%02u:%02u",
                  civil.year, civil.month, civil.day, civil.hour, civil.minute, civil.second);
    return std::string(buffer) + offset_token;
}

std::string FormatLocal(const Timestamp& timestamp) {
    const auto utc_seconds =
        std::chrono::floor<std::chrono::seconds>(timestamp.instant.time_since_epoch()).count();
    const auto civil = CivilFromLocalSeconds(utc_seconds + timestamp.offset_minutes * 60LL);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u %02u:%02u:%02u",
                  civil.year, civil.month, civil.day, civil.hour, civil.minute, civil.second);
    return buffer;
}

std::optional<std::string> AdvanceTimestamp(const std::string& prior, long long interval_s) {
    if (interval_s <= 0) {
        return std::nullopt;
    }
    const auto parsed = ParseTimestamp(prior);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    const auto prior_seconds =
        std::chrono::floor<std::chrono::seconds>(parsed->instant.time_since_epoch()).count();
    if (interval_s > kMaxUtcSeconds - prior_seconds) {
        return std::nullopt;
    }
    const auto next = parsed->instant + std::chrono::seconds(interval_s);
    const std::string token = parsed->offset_token.empty() ? std::string(kDefaultOffsetToken)
                                                           : parsed->offset_token;
    return FormatIso(next, parsed->offset_minutes, token);
}

}  // namespace filecron::tasks
