#ifndef SOIL_SAMPLER_HPP
#define SOIL_SAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <main/models/error_code.hpp>
#include <main/utils/circular_buffer.hpp>

#ifndef SOIL_SAMPLER_CAPACITY
#define SOIL_SAMPLER_CAPACITY 512
#endif

struct SoilSampleSummary {
    std::size_t count;
    double      mean_vwc_pct; // valid only when count > 0
};

// Time-boxed collection of VWC readings: Idle -> Sampling -> Idle.
// Readings offered while idle are ignored.
class SoilSampler {
public:
    SoilSampler(uint32_t window_ms, double min_valid_pct, double max_valid_pct);

    void begin(uint64_t now_ms);
    bool isActive() const { return active; }
    bool isWindowOpen(uint64_t now_ms) const;

    // Parses one ASCII reading. PARSE_ERROR for non-numeric or out-of-range
    // payloads; OK otherwise (including readings ignored while idle).
    ErrorCode offer(const char* payload);

    // Ends the window and reports what was collected
    SoilSampleSummary finish();

    std::size_t sampleCount() const { return samples.getCount(); }

private:
    uint32_t window_ms;
    double min_valid_pct;
    double max_valid_pct;
    bool active;
    uint64_t deadline_ms;
    CircularBuffer<double, SOIL_SAMPLER_CAPACITY> samples;
};

#endif // SOIL_SAMPLER_HPP
