#ifndef IRRIGATION_CALCULATOR_HPP
#define IRRIGATION_CALCULATOR_HPP

#include <main/config/config.hpp>
#include <main/models/error_code.hpp>

namespace Irrigation {
    struct PumpPlan {
        double seconds;
        double etc_mm;
    };

    // Plant-available water held in the root zone (mm), rounded to 2 decimals.
    // 0 when vwc is unknown, the root zone is empty or the soil limits are inverted.
    double availableWaterMm(bool has_vwc, double vwc_pct, double root_zone_mm,
                            double field_capacity_pct = Config::Soil::field_capacity_pct,
                            double wilting_point_pct = Config::Soil::wilting_point_pct);

    // Pump run time replacing the full daily ETc over `area_m2`.
    // available_mm is reported by callers but does not reduce the demand.
    // INVALID_PUMP_RATE when flow_lph <= 0; out_plan is then {0, etc}.
    ErrorCode irrigationTime(double kc, double et0_mm, double available_mm,
                             double area_m2, double flow_lph, PumpPlan& out_plan);

    double roundTo(double value, int decimals);
}

#endif // IRRIGATION_CALCULATOR_HPP
