#include "../include/curve_analysis.hpp"
#include "../include/logger.hpp"
#include <cmath>
#include <limits>

float CurveAnalysis::calculateResistance(float voltage, float current) {
    if (current == 0.0f) return std::numeric_limits<float>::infinity();
    return voltage / current;
}

float CurveAnalysis::calculatePower(float voltage, float current) {
    return voltage * current;
}

float CurveAnalysis::currentFromShunt(float voltage, int channel, const std::vector<float>& shunt_resistors) {
    if (channel < 0 || (size_t)channel >= shunt_resistors.size()) return 0.0f;
    float shunt = shunt_resistors[channel];
    if (!(shunt > 0.0f)) return 0.0f;
    return voltage / shunt;
}

bool CurveAnalysis::analyzeIvCurve(const std::vector<float>& voltages, const std::vector<float>& currents,
                                   IvAnalysis& analysis) {
    if (voltages.size() != currents.size()) {
        Logger::error("[IV] Voltage and current arrays differ in length (%u vs %u)",
                      (unsigned)voltages.size(), (unsigned)currents.size());
        return false;
    }
    if (voltages.empty()) {
        Logger::warn("[IV] Nothing to analyze");
        return false;
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    IvAnalysis result;
    result.max_power = nan;
    result.max_power_voltage = nan;
    result.max_power_current = nan;
    result.open_circuit_voltage = nan;
    result.short_circuit_current = nan;

    int min_current_index = -1;
    int min_voltage_index = -1;

    for (size_t i = 0; i < voltages.size(); ++i) {
        float v = voltages[i];
        float c = currents[i];
        float p = calculatePower(v, c);
        result.resistances.push_back(calculateResistance(v, c));
        result.powers.push_back(p);

        if (!std::isnan(p) && (result.max_power_index < 0 || p > result.max_power)) {
            result.max_power = p;
            result.max_power_voltage = v;
            result.max_power_current = c;
            result.max_power_index = (int)i;
        }
        if (!std::isnan(c) && (min_current_index < 0 || std::fabs(c) < std::fabs(currents[min_current_index]))) {
            min_current_index = (int)i;
        }
        if (!std::isnan(v) && (min_voltage_index < 0 || std::fabs(v) < std::fabs(voltages[min_voltage_index]))) {
            min_voltage_index = (int)i;
        }
    }

    if (min_current_index >= 0) result.open_circuit_voltage = voltages[min_current_index];
    if (min_voltage_index >= 0) result.short_circuit_current = currents[min_voltage_index];

    analysis = result;
    return true;
}

bool CurveAnalysis::analyzeIvCurve(const std::vector<MeasurementSample>& samples, IvAnalysis& analysis) {
    std::vector<float> voltages;
    std::vector<float> currents;
    for (const MeasurementSample& s : samples) {
        voltages.push_back(s.voltage);
        currents.push_back(s.current);
    }
    return analyzeIvCurve(voltages, currents, analysis);
}
