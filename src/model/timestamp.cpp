/**
 * @file timestamp.cpp
 * @brief OCMF timestamp parsing and formatting
 */

#include "ocmf/model/timestamp.h"
#include <cstdio>
#include <regex>

namespace ocmf::model {

namespace {

const std::regex& timestampPattern() {
    static const std::regex pattern(
        R"(^(\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2}),(\d{3})([+-])(\d{2})(\d{2}) ([UISR])$)");
    return pattern;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return days[month - 1];
}

// Howard Hinnant's days_from_civil
int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace

Result<Timestamp> Timestamp::parse(const std::string& text) {
    std::smatch m;
    if (!std::regex_match(text, m, timestampPattern())) {
        return Error(ErrorKind::VALIDATION, "TM",
                     "TM '" + text + "' does not match format YYYY-MM-DDThh:mm:ss,fff+hhmm S");
    }

    Timestamp ts;
    ts.year = std::stoi(m[1].str());
    ts.month = std::stoi(m[2].str());
    ts.day = std::stoi(m[3].str());
    ts.hour = std::stoi(m[4].str());
    ts.minute = std::stoi(m[5].str());
    ts.second = std::stoi(m[6].str());
    ts.millisecond = std::stoi(m[7].str());

    int offsetHours = std::stoi(m[9].str());
    int offsetMinutes = std::stoi(m[10].str());

    if (ts.month < 1 || ts.month > 12 ||
        ts.day < 1 || ts.day > daysInMonth(ts.year, ts.month) ||
        ts.hour > 23 || ts.minute > 59 || ts.second > 59 ||
        offsetHours > 23 || offsetMinutes > 59) {
        return Error(ErrorKind::VALIDATION, "TM",
                     "TM '" + text + "' is not a valid date and time");
    }

    ts.utcOffsetMinutes = offsetHours * 60 + offsetMinutes;
    if (m[8].str() == "-") {
        ts.utcOffsetMinutes = -ts.utcOffsetMinutes;
    }

    // Regex guarantees one of U, I, S, R
    ts.status = *timeStatusFromChar(m[11].str()[0]);

    return ts;
}

std::string Timestamp::toString() const {
    int absOffset = utcOffsetMinutes < 0 ? -utcOffsetMinutes : utcOffsetMinutes;
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d,%03d%c%02d%02d %c",
                  year, month, day, hour, minute, second, millisecond,
                  utcOffsetMinutes < 0 ? '-' : '+', absOffset / 60, absOffset % 60,
                  toChar(status));
    return buffer;
}

int64_t Timestamp::epochMillis() const {
    int64_t days = daysFromCivil(year, month, day);
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second
                      - static_cast<int64_t>(utcOffsetMinutes) * 60;
    return seconds * 1000 + millisecond;
}

int Timestamp::compareInstant(const Timestamp& other) const {
    int64_t a = epochMillis();
    int64_t b = other.epochMillis();
    if (a < b) return -1;
    if (a > b) return 1;
    return 0;
}

bool Timestamp::operator==(const Timestamp& other) const {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second &&
           millisecond == other.millisecond &&
           utcOffsetMinutes == other.utcOffsetMinutes && status == other.status;
}

} // namespace ocmf::model
