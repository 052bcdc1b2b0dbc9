#include <main/control/day_clock.hpp>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {
    constexpr time_t kSecondsPerDay = 86400;

    bool toLocalMidnight(const PlantingDate& date, time_t& out_time) {
        struct tm tm_sow {};
        tm_sow.tm_year = date.year - 1900;
        tm_sow.tm_mon = date.month - 1;
        tm_sow.tm_mday = date.day;
        tm_sow.tm_isdst = -1;
        time_t t = mktime(&tm_sow);
        if (t == static_cast<time_t>(-1)) {
            return false;
        }
        // mktime normalises Feb 30 into March; reject anything it had to move
        if (tm_sow.tm_year != date.year - 1900 || tm_sow.tm_mon != date.month - 1 || tm_sow.tm_mday != date.day) {
            return false;
        }
        out_time = t;
        return true;
    }

    bool parseInt(const char*& cursor, int& out_value) {
        char* end = nullptr;
        long v = std::strtol(cursor, &end, 10);
        if (end == cursor) {
            return false;
        }
        cursor = end;
        out_value = static_cast<int>(v);
        return true;
    }
}

namespace DayClock {
    ErrorCode validateDate(const PlantingDate& date) {
        if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
            return ErrorCode::INVALID_DATE;
        }
        time_t t = 0;
        if (!toLocalMidnight(date, t)) {
            return ErrorCode::INVALID_DATE;
        }
        return ErrorCode::OK;
    }

    ErrorCode daysAfterPlanting(const PlantingDate& date, time_t now, int& out_days) {
        if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
            return ErrorCode::INVALID_DATE;
        }
        time_t sow = 0;
        if (!toLocalMidnight(date, sow)) {
            return ErrorCode::INVALID_DATE;
        }
        if (now <= sow) {
            out_days = 0;
            return ErrorCode::OK;
        }
        out_days = static_cast<int>((now - sow) / kSecondsPerDay);
        return ErrorCode::OK;
    }

    ErrorCode parseDate(const char* text, PlantingDate& out_date) {
        if (text == nullptr) {
            return ErrorCode::INVALID_DATE;
        }
        const char* cursor = text;
        while (*cursor == ' ') {
            ++cursor;
        }
        PlantingDate parsed{};
        if (!parseInt(cursor, parsed.year)) {
            return ErrorCode::INVALID_DATE;
        }
        if (*cursor != '-' && *cursor != ' ') {
            return ErrorCode::INVALID_DATE;
        }
        const char separator = *cursor++;
        if (!parseInt(cursor, parsed.month) || *cursor != separator) {
            return ErrorCode::INVALID_DATE;
        }
        ++cursor;
        if (!parseInt(cursor, parsed.day)) {
            return ErrorCode::INVALID_DATE;
        }
        while (*cursor == ' ' || *cursor == '\r' || *cursor == '\n') {
            ++cursor;
        }
        if (*cursor != '\0') {
            return ErrorCode::INVALID_DATE;
        }
        ErrorCode err = validateDate(parsed);
        if (err != ErrorCode::OK) {
            return err;
        }
        out_date = parsed;
        return ErrorCode::OK;
    }

    void formatDate(time_t now, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return;
        }
        struct tm tm_local;
        localtime_r(&now, &tm_local);
        if (strftime(out, out_size, "%Y-%m-%d", &tm_local) == 0) {
            out[0] = '\0';
        }
    }

    void formatDateTime(time_t now, char* out, std::size_t out_size) {
        if (out_size == 0) {
            return;
        }
        struct tm tm_local;
        localtime_r(&now, &tm_local);
        if (strftime(out, out_size, "%Y-%m-%d %H:%M:%S", &tm_local) == 0) {
            out[0] = '\0';
        }
    }
}
