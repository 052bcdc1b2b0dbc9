#include <main/control/irrigation_calculator.hpp>
#include <main/utils/logger.hpp>
#include <algorithm>
#include <cmath>

static const char* TAG = "Irrigation";

namespace Irrigation {
    double roundTo(double value, int decimals) {
        const double factor = std::pow(10.0, decimals);
        return std::round(value * factor) / factor;
    }

    double availableWaterMm(bool has_vwc, double vwc_pct, double root_zone_mm,
                            double field_capacity_pct, double wilting_point_pct) {
        if (!has_vwc || root_zone_mm <= 0.0) {
            return 0.0;
        }
        if (field_capacity_pct <= wilting_point_pct) {
            LOG_WARN(TAG, "Field capacity %.1f%% <= wilting point %.1f%%, treating available water as 0",
                     field_capacity_pct, wilting_point_pct);
            return 0.0;
        }
        const double taw_mm = (field_capacity_pct - wilting_point_pct) / 100.0 * root_zone_mm;
        const double above_pwp_mm = std::max(0.0, vwc_pct / 100.0 - wilting_point_pct / 100.0) * root_zone_mm;
        return roundTo(std::min(above_pwp_mm, taw_mm), 2);
    }

    ErrorCode irrigationTime(double kc, double et0_mm, double available_mm,
                             double area_m2, double flow_lph, PumpPlan& out_plan) {
        (void)available_mm;
        kc = std::max(0.0, kc);
        et0_mm = std::max(0.0, et0_mm);
        const double etc_mm = et0_mm * kc;
        // 1 mm over 1 m2 is 1 litre
        const double required_liters = etc_mm * area_m2;

        if (flow_lph <= 0.0) {
            LOG_ERROR(TAG, "Pump flow rate must be positive (got %.2f L/h)", flow_lph);
            out_plan.seconds = 0.0;
            out_plan.etc_mm = etc_mm;
            return ErrorCode::INVALID_PUMP_RATE;
        }
        out_plan.seconds = required_liters > 0.0 ? (required_liters / flow_lph) * 3600.0 : 0.0;
        out_plan.etc_mm = etc_mm;
        return ErrorCode::OK;
    }
}
