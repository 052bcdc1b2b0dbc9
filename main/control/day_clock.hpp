#ifndef DAY_CLOCK_HPP
#define DAY_CLOCK_HPP

#include <cstddef>
#include <ctime>
#include <main/models/error_code.hpp>
#include <main/models/planting_config.hpp>

namespace DayClock {
    // Checks ranges and that the date exists in the calendar (no Feb 30).
    ErrorCode validateDate(const PlantingDate& date);

    // Whole days from local midnight of the planting date to `now`, floored,
    // never negative. INVALID_DATE leaves out_days untouched.
    ErrorCode daysAfterPlanting(const PlantingDate& date, time_t now, int& out_days);

    // Accepts "YYYY-MM-DD" (also "YYYY MM DD"); validates like validateDate().
    ErrorCode parseDate(const char* text, PlantingDate& out_date);

    // Local calendar date of `now` as YYYY-MM-DD (out_size >= 11)
    void formatDate(time_t now, char* out, std::size_t out_size);

    // Local time as "YYYY-MM-DD HH:MM:SS" (out_size >= 20)
    void formatDateTime(time_t now, char* out, std::size_t out_size);
}

#endif // DAY_CLOCK_HPP
