#include <main/control/soil_sampler.hpp>
#include <main/utils/logger.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>

static const char* TAG = "SoilSampler";

SoilSampler::SoilSampler(uint32_t window_ms, double min_valid_pct, double max_valid_pct)
    : window_ms(window_ms),
      min_valid_pct(min_valid_pct),
      max_valid_pct(max_valid_pct),
      active(false),
      deadline_ms(0) {}

void SoilSampler::begin(uint64_t now_ms) {
    samples.clear();
    deadline_ms = now_ms + window_ms;
    active = true;
    LOG_INFO(TAG, "Sampling soil moisture for %u s", static_cast<unsigned>(window_ms / 1000U));
}

bool SoilSampler::isWindowOpen(uint64_t now_ms) const {
    return active && now_ms < deadline_ms;
}

ErrorCode SoilSampler::offer(const char* payload) {
    if (!active) {
        return ErrorCode::OK;
    }
    if (payload == nullptr) {
        LOG_WARN(TAG, "Empty soil moisture payload dropped");
        return ErrorCode::PARSE_ERROR;
    }
    char* end = nullptr;
    double value = std::strtod(payload, &end);
    while (end != nullptr && *end != '\0' && std::isspace(static_cast<unsigned char>(*end))) {
        ++end;
    }
    if (end == payload || end == nullptr || *end != '\0' || !std::isfinite(value)) {
        LOG_WARN(TAG, "Non-numeric soil moisture payload dropped: '%s'", payload);
        return ErrorCode::PARSE_ERROR;
    }
    if (value < min_valid_pct || value > max_valid_pct) {
        LOG_WARN(TAG, "Soil moisture %.2f%% outside %.0f..%.0f%%, dropped", value, min_valid_pct, max_valid_pct);
        return ErrorCode::PARSE_ERROR;
    }
    if (!samples.push(value)) {
        LOG_WARN(TAG, "Sample buffer full, reading %.2f%% dropped", value);
        return ErrorCode::OK;
    }
    LOG_DEBUG(TAG, "Soil moisture sample %.2f%% (%u buffered)", value, static_cast<unsigned>(samples.getCount()));
    return ErrorCode::OK;
}

SoilSampleSummary SoilSampler::finish() {
    active = false;
    SoilSampleSummary summary{samples.getCount(), 0.0};
    if (summary.count == 0) {
        return summary;
    }
    double sum = 0.0;
    samples.forEach([&sum](double v) { sum += v; });
    summary.mean_vwc_pct = sum / static_cast<double>(summary.count);
    return summary;
}
