#pragma once
#include "types.hpp"
#include <vector>

/**
 * @brief Electrical figures derived from a finished IV sweep
 *
 * Index fields are -1 and value fields NaN when no sample qualifies
 * (for example every power is NaN).
 */
struct IvAnalysis {
    std::vector<float> resistances;
    std::vector<float> powers;
    float max_power = 0.0f;
    float max_power_voltage = 0.0f;
    float max_power_current = 0.0f;
    int max_power_index = -1;
    float open_circuit_voltage = 0.0f;    // voltage where |current| is smallest
    float short_circuit_current = 0.0f;   // current where |voltage| is smallest
};

// Pure functions over the {voltage, current} projection of a sweep
class CurveAnalysis {
public:
    // +inf when current == 0
    static float calculateResistance(float voltage, float current);
    static float calculatePower(float voltage, float current);

    // 0.0 for an unknown channel or a non-positive shunt
    static float currentFromShunt(float voltage, int channel, const std::vector<float>& shunt_resistors);

    /**
     * @brief Resistance/power per point, maximum power point, Voc and Isc
     * @return false for empty input or mismatched lengths
     *
     * Ties resolve to the first occurrence; NaN points never win.
     */
    static bool analyzeIvCurve(const std::vector<float>& voltages, const std::vector<float>& currents,
                               IvAnalysis& analysis);
    static bool analyzeIvCurve(const std::vector<MeasurementSample>& samples, IvAnalysis& analysis);
};
