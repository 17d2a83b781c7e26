/**
 * IV analysis over finished sample sequences.
 */

#include "../include/curve_analysis.hpp"
#include "../include/logger.hpp"
#include "test_harness.hpp"
#include <cmath>
#include <limits>

bool test_resistance() {
    printTestHeader("TEST 1: Resistance is +inf exactly at zero current");
    float inf = std::numeric_limits<float>::infinity();
    bool ok = check(CurveAnalysis::calculateResistance(1.0f, 0.0f) == inf, "1 V / 0 A");
    ok &= check(CurveAnalysis::calculateResistance(-1.0f, 0.0f) == inf, "negative voltage still +inf");
    ok &= check(CurveAnalysis::calculateResistance(0.0f, 0.0f) == inf, "0 V / 0 A");
    ok &= check(nearlyEqual(CurveAnalysis::calculateResistance(2.0f, 0.5f), 4.0f), "2 V / 0.5 A");
    ok &= check(std::isfinite(CurveAnalysis::calculateResistance(1.0f, 1e-9f)), "tiny current is finite");
    ok &= check(nearlyEqual(CurveAnalysis::calculatePower(2.0f, 0.5f), 1.0f), "power");
    return ok;
}

bool test_current_from_shunt() {
    printTestHeader("TEST 2: Current from shunt");
    std::vector<float> shunts = {1.0f, 0.5f, 0.0f, 10.0f};
    bool ok = check(nearlyEqual(CurveAnalysis::currentFromShunt(1.0f, 1, shunts), 2.0f), "1 V / 0.5 ohm");
    ok &= check(CurveAnalysis::currentFromShunt(1.0f, 2, shunts) == 0.0f, "zero shunt -> 0");
    ok &= check(CurveAnalysis::currentFromShunt(1.0f, 4, shunts) == 0.0f, "channel past the table -> 0");
    ok &= check(CurveAnalysis::currentFromShunt(1.0f, -1, shunts) == 0.0f, "negative channel -> 0");
    return ok;
}

bool test_analyze_curve() {
    printTestHeader("TEST 3: Maximum power point, Voc and Isc");
    std::vector<float> voltages = {0.0f, 1.0f, 2.0f, 3.0f};
    std::vector<float> currents = {3.0f, 2.0f, 1.0f, 0.0f};
    IvAnalysis a;
    bool ok = check(CurveAnalysis::analyzeIvCurve(voltages, currents, a), "analyzed");
    ok &= check(a.powers.size() == 4 && a.resistances.size() == 4, "per-point arrays");
    ok &= check(nearlyEqual(a.max_power, 2.0f), "max power");
    ok &= check(a.max_power_index == 1, "tie resolved to first occurrence");
    ok &= check(nearlyEqual(a.max_power_voltage, 1.0f) && nearlyEqual(a.max_power_current, 2.0f), "MPP coordinates");
    ok &= check(nearlyEqual(a.open_circuit_voltage, 3.0f), "Voc at smallest |I|");
    ok &= check(nearlyEqual(a.short_circuit_current, 3.0f), "Isc at smallest |V|");
    ok &= check(std::isinf(a.resistances[3]), "zero-current point has infinite resistance");
    return ok;
}

bool test_negative_branch() {
    printTestHeader("TEST 4: Magnitudes decide Voc and Isc");
    std::vector<float> voltages = {-0.5f, 0.1f, 0.6f};
    std::vector<float> currents = {-0.2f, 0.05f, -0.01f};
    IvAnalysis a;
    bool ok = check(CurveAnalysis::analyzeIvCurve(voltages, currents, a), "analyzed");
    ok &= check(nearlyEqual(a.open_circuit_voltage, 0.6f), "|-0.01| is the smallest current");
    ok &= check(nearlyEqual(a.short_circuit_current, 0.05f), "|0.1| is the smallest voltage");
    ok &= check(a.max_power_index == 0, "0.1 W at the first point");
    return ok;
}

bool test_bad_input() {
    printTestHeader("TEST 5: Mismatched or empty input");
    IvAnalysis a;
    a.max_power_index = 42;
    bool ok = check(!CurveAnalysis::analyzeIvCurve(std::vector<float>{1.0f, 2.0f}, std::vector<float>{1.0f}, a),
                    "length mismatch");
    ok &= check(!CurveAnalysis::analyzeIvCurve(std::vector<float>(), std::vector<float>(), a), "empty");
    ok &= check(a.max_power_index == 42, "output untouched");
    return ok;
}

bool test_nan_points_skipped() {
    printTestHeader("TEST 6: NaN points never win");
    float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<float> voltages = {nan, 1.0f, 2.0f};
    std::vector<float> currents = {5.0f, 0.5f, nan};
    IvAnalysis a;
    bool ok = check(CurveAnalysis::analyzeIvCurve(voltages, currents, a), "analyzed");
    ok &= check(a.max_power_index == 1 && nearlyEqual(a.max_power, 0.5f), "only finite power considered");
    ok &= check(nearlyEqual(a.open_circuit_voltage, 1.0f), "Voc from a finite current");
    ok &= check(nearlyEqual(a.short_circuit_current, 0.5f), "Isc from a finite voltage");

    std::vector<float> all_nan = {nan, nan};
    ok &= check(CurveAnalysis::analyzeIvCurve(all_nan, all_nan, a), "all-NaN input still analyzed");
    ok &= check(a.max_power_index == -1 && std::isnan(a.max_power), "no maximum");
    return ok;
}

bool test_from_samples() {
    printTestHeader("TEST 7: Analysis over MeasurementSample sequences");
    float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<MeasurementSample> samples;
    samples.push_back(MeasurementSample{0, 0.2f, 0.9f, 0.18f, nan, nan});
    samples.push_back(MeasurementSample{2048, 0.8f, 0.7f, 0.56f, nan, nan});
    samples.push_back(MeasurementSample{4095, 1.0f, 0.0f, 0.0f, nan, nan});

    IvAnalysis a;
    bool ok = check(CurveAnalysis::analyzeIvCurve(samples, a), "analyzed");
    ok &= check(a.max_power_index == 1 && nearlyEqual(a.max_power, 0.56f), "MPP");
    ok &= check(nearlyEqual(a.open_circuit_voltage, 1.0f), "Voc");
    ok &= check(nearlyEqual(a.short_circuit_current, 0.9f), "Isc");
    return ok;
}

int main() {
    Logger::setLevel(Logger::ERROR);

    printTestResult("Resistance", test_resistance());
    printTestResult("Current From Shunt", test_current_from_shunt());
    printTestResult("Analyze Curve", test_analyze_curve());
    printTestResult("Negative Branch", test_negative_branch());
    printTestResult("Bad Input", test_bad_input());
    printTestResult("NaN Points Skipped", test_nan_points_skipped());
    printTestResult("From Samples", test_from_samples());

    return printSummary("CurveAnalysis");
}
