#include <main/control/status_report.hpp>
#include <main/config/config_json.hpp>
#include <main/control/crop_catalog.hpp>
#include <main/control/irrigation_calculator.hpp>
#include <main/utils/logger.hpp>
#include <mjson.h>

static const char* TAG = "STATUS";

namespace StatusReport {
    const char* phaseName(LoopPhase phase) {
        switch (phase) {
            case LoopPhase::CONNECTING:     return "connecting";
            case LoopPhase::CONFIG_PENDING: return "config_pending";
            case LoopPhase::RUNNING:        return "running";
            case LoopPhase::HALTED:         return "halted";
        }
        return "unknown";
    }

    int toJson(const ControllerStatus& status, const char* device_id, char* out, std::size_t out_size) {
        using Irrigation::roundTo;
        const DailyState& d = status.daily;

        char config_json[192] = "null";
        if (status.has_config) {
            (void)ConfigJson::format(status.config, config_json, sizeof(config_json));
        }

        return mjson_snprintf(out, out_size,
            "{%Q:%Q,%Q:%Q,%Q:%g,%Q:%s,"
            "%Q:%d,%Q:%g,%Q:%g,%Q:%g,"
            "%Q:%g,%Q:%g,%Q:%g,%Q:%g,"
            "%Q:%g,%Q:%g,%Q:%g,%Q:%g,"
            "%Q:%B,%Q:%g,%Q:%g,%Q:%Q,"
            "%Q:%B,%Q:%B}",
            "device", device_id,
            "phase", phaseName(status.phase),
            "uptime_s", static_cast<double>(status.uptime_ms / 1000U),
            "config", config_json,
            "day", static_cast<int>(d.day_index),
            "kc", roundTo(d.kc_today, 3),
            "rz_mm", roundTo(d.root_zone_mm, 1),
            "area_m2", roundTo(status.total_area_m2, 3),
            "vwc", d.has_mean_vwc ? roundTo(d.mean_vwc, 1) : 0.0,
            "tmax", roundTo(d.last_weather.tmax_c, 1),
            "rh", roundTo(d.last_weather.relative_humidity_pct, 1),
            "energy", roundTo(d.last_weather.solar_energy_mj_m2_day, 2),
            "et0", roundTo(d.last_et0, 2),
            "etc", roundTo(d.etc_mm, 2),
            "avail_mm", roundTo(d.available_water_mm, 1),
            "pump_time_s", roundTo(d.pump_duration_s, 1),
            "pump_on", status.pump_running ? 1 : 0,
            "pump_target_s", roundTo(status.pump_target_s, 1),
            "pump_remaining_s", roundTo(status.pump_remaining_s, 1),
            "last_date", d.last_date_processed,
            "wifi", status.network_connected ? 1 : 0,
            "mqtt", status.bus_connected ? 1 : 0);
    }

    void log(const ControllerStatus& status) {
        const DailyState& d = status.daily;
        LOG_INFO(TAG, "--- Status (%s) ---", phaseName(status.phase));
        if (d.has_weather) {
            LOG_INFO(TAG, "Weather: Tmax=%.1fC RH=%.0f%% E=%.2fMJ ET0=%.2fmm",
                     d.last_weather.tmax_c, d.last_weather.relative_humidity_pct,
                     d.last_weather.solar_energy_mj_m2_day, d.last_et0);
        } else {
            LOG_INFO(TAG, "Weather: N/A ET0=%.2fmm", d.last_et0);
        }
        if (d.has_mean_vwc) {
            LOG_INFO(TAG, "Soil: mean VWC=%.1f%% avail=%.1fmm (RZ=%.1fmm)",
                     d.mean_vwc, d.available_water_mm, d.root_zone_mm);
        } else {
            LOG_INFO(TAG, "Soil: mean VWC=N/A (waiting for daily sample) RZ=%.1fmm", d.root_zone_mm);
        }
        if (status.has_config) {
            LOG_INFO(TAG, "Crop: %s day %d Kc=%.3f ETc=%.2fmm area=%.2fm2",
                     CropCatalog::name(status.config.crop), static_cast<int>(d.day_index),
                     d.kc_today, d.etc_mm, status.total_area_m2);
        }
        if (status.pump_running) {
            LOG_INFO(TAG, "Pump: ON (target %.1fs, remaining %.0fs)", status.pump_target_s, status.pump_remaining_s);
        } else {
            LOG_INFO(TAG, "Pump: OFF (today %.1fs)", d.pump_duration_s);
        }
        LOG_INFO(TAG, "WiFi: %s, MQTT: %s",
                 status.network_connected ? "connected" : "disconnected",
                 status.bus_connected ? "connected" : "disconnected");
    }
}
