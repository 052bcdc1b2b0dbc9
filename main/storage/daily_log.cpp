#include <main/storage/daily_log.hpp>
#include <main/utils/logger.hpp>
#include <cstdio>
#include <sys/stat.h>

static const char* TAG = "DailyLog";

namespace DailyLog {
    int formatRow(const DailyLogRow& row, char* out, std::size_t out_size) {
        return std::snprintf(out, out_size, "%s,%.1f,%.2f,%.2f,%.1f,%.1f,%.1f,%.3f\n",
                             row.date, row.mean_vwc_pct, row.et0_mm, row.etc_mm, row.pump_time_s,
                             row.available_water_mm, row.root_zone_mm, row.kc);
    }
}

DailyLogFile::DailyLogFile(const char* path)
    : file_path(path) {}

bool DailyLogFile::append(const DailyLogRow& row) {
    char line[160];
    int n = DailyLog::formatRow(row, line, sizeof(line));
    if (n <= 0 || static_cast<std::size_t>(n) >= sizeof(line)) {
        LOG_ERROR(TAG, "Row for %s does not fit (%d bytes)", row.date, n);
        return false;
    }

    struct stat st;
    const bool header_needed = (stat(file_path, &st) != 0);

    FILE* f = std::fopen(file_path, "a");
    if (f == nullptr) {
        LOG_ERROR(TAG, "Cannot open %s for append", file_path);
        return false;
    }
    bool ok = true;
    if (header_needed) {
        ok = std::fprintf(f, "%s\n", DailyLog::HEADER) > 0;
        if (ok) {
            LOG_INFO(TAG, "Created %s with header", file_path);
        }
    }
    ok = ok && (std::fputs(line, f) >= 0);
    if (std::fclose(f) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_ERROR(TAG, "Write to %s failed", file_path);
        return false;
    }
    LOG_INFO(TAG, "Logged: %.*s", n - 1, line);
    return true;
}
