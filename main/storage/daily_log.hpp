#ifndef DAILY_LOG_HPP
#define DAILY_LOG_HPP

#include <cstddef>
#include <main/control/collaborators.hpp>

namespace DailyLog {
    static constexpr const char* HEADER = "Date,MeanVWC,ET0,ETc,PumpTimeS,AvailWaterMM,RootZoneMM,Kc";

    // One CSV line including the trailing newline. Returns snprintf's result.
    int formatRow(const DailyLogRow& row, char* out, std::size_t out_size);
}

// Append-only CSV on a mounted filesystem (SPIFFS on the device).
// The header is written when the file does not exist yet.
class DailyLogFile : public DailyLogStore {
public:
    explicit DailyLogFile(const char* path);

    bool append(const DailyLogRow& row) override;
    const char* path() const { return file_path; }

private:
    const char* file_path;
};

#endif // DAILY_LOG_HPP
