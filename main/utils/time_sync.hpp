// SNTP time sync helper. Day rollover and days-after-planting depend on a
// valid local clock, so the control task waits for the first sync.
#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

namespace TimeSync {
    // Sets TZ from a POSIX string (e.g. "IST-5:30") for localtime_r/mktime
    void applyTimezone(const char* posix_tz);

    // Initialize SNTP once (idempotent). Safe to call repeatedly.
    void init();

    // Returns true if system time is considered valid (SNTP synced or RTC set).
    bool isSynced();

    // Block until time is synced or timeout_ms elapses. Returns true if synced.
    bool waitForSync(unsigned int timeout_ms);
}

#endif // TIME_SYNC_HPP
