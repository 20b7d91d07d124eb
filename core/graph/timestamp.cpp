#include "graph/timestamp.hpp"
#include "graph/errors.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace weave {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

int readDigits(const std::string& s, size_t& pos, size_t count, const std::string& text) {
    if (pos + count > s.size()) {
        throw WeaveError("Invalid ISO-8601 timestamp: " + text);
    }
    int value = 0;
    for (size_t i = 0; i < count; i++) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw WeaveError("Invalid ISO-8601 timestamp: " + text);
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return value;
}

void expect(const std::string& s, size_t& pos, char c, const std::string& text) {
    if (pos >= s.size() || s[pos] != c) {
        throw WeaveError("Invalid ISO-8601 timestamp: " + text);
    }
    pos++;
}

} // namespace

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
}

std::string toIso8601(Timestamp t) {
    using namespace std::chrono;
    int64_t ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
    int64_t days = ms / 86400000;
    int64_t rem = ms % 86400000;
    if (rem < 0) {
        rem += 86400000;
        days -= 1;
    }

    int64_t year;
    unsigned month, day;
    civilFromDays(days, year, month, day);

    int hours = static_cast<int>(rem / 3600000);
    int minutes = static_cast<int>((rem / 60000) % 60);
    int seconds = static_cast<int>((rem / 1000) % 60);
    int millis = static_cast<int>(rem % 1000);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(year), month, day,
                  hours, minutes, seconds, millis);
    return buf;
}

Timestamp fromIso8601(const std::string& text) {
    size_t pos = 0;
    int year = readDigits(text, pos, 4, text);
    expect(text, pos, '-', text);
    int month = readDigits(text, pos, 2, text);
    expect(text, pos, '-', text);
    int day = readDigits(text, pos, 2, text);
    expect(text, pos, 'T', text);
    int hour = readDigits(text, pos, 2, text);
    expect(text, pos, ':', text);
    int minute = readDigits(text, pos, 2, text);
    expect(text, pos, ':', text);
    int second = readDigits(text, pos, 2, text);

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw WeaveError("Invalid ISO-8601 timestamp: " + text);
    }

    // Fractional seconds: keep millisecond precision, ignore the rest.
    int64_t millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            digits++;
            pos++;
        }
        if (digits == 0) throw WeaveError("Invalid ISO-8601 timestamp: " + text);
        for (size_t i = digits; i < 3; i++) millis *= 10;
    }

    int64_t offset_minutes = 0;
    if (pos < text.size() && text[pos] == 'Z') {
        pos++;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        pos++;
        int oh = readDigits(text, pos, 2, text);
        expect(text, pos, ':', text);
        int om = readDigits(text, pos, 2, text);
        offset_minutes = sign * (oh * 60 + om);
    } else {
        throw WeaveError("Invalid ISO-8601 timestamp (missing zone): " + text);
    }
    if (pos != text.size()) {
        throw WeaveError("Invalid ISO-8601 timestamp: " + text);
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t total_ms = ((days * 24 + hour) * 60 + minute - offset_minutes) * 60000
                     + static_cast<int64_t>(second) * 1000 + millis;
    return Timestamp(std::chrono::milliseconds(total_ms));
}

double hoursBetween(Timestamp then, Timestamp reference) {
    using namespace std::chrono;
    return duration_cast<duration<double, std::ratio<3600>>>(reference - then).count();
}

} // namespace weave
