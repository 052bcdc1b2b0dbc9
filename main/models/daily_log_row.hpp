#ifndef DAILY_LOG_ROW_HPP
#define DAILY_LOG_ROW_HPP

// One CSV row per processed day
struct DailyLogRow {
    char   date[11]; // YYYY-MM-DD
    double mean_vwc_pct;
    double et0_mm;
    double etc_mm;
    double pump_time_s;
    double available_water_mm;
    double root_zone_mm;
    double kc;
};

#endif // DAILY_LOG_ROW_HPP
