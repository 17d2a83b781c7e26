#pragma once
#include <atomic>
#include <functional>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "config_manager.hpp"
#include "types.hpp"
class DacController;
class AdcController;
class PowerMeter;
class FaultHandler;

enum class SweepStatus {
    COMPLETED,   // every step was emitted
    STOPPED,     // requestStop() between steps; partial result is still ordered
    REJECTED     // a schedule failed validation; nothing was written
};

const char* sweepStatusToString(SweepStatus status);

// Codes written at one global step, in schedule order
struct StepRecord {
    int step = 0;
    std::vector<int> channels;
    std::vector<int> codes;
};

/**
 * @brief Ordered outcome of one sweep
 *
 * Samples are only appended by SweepEngine. Move it around; MeasurementSample
 * is immutable, so the result cannot be copy-assigned.
 */
class SweepResult {
public:
    const std::vector<MeasurementSample>& samples() const { return samples_; }
    const std::vector<StepRecord>& steps() const { return steps_; }
    size_t size() const { return samples_.size(); }

    SweepStatus status() const { return status_; }
    bool isComplete() const { return status_ == SweepStatus::COMPLETED; }

    uint32_t failedWrites() const { return failed_writes_; }
    uint32_t missingVoltages() const { return missing_voltages_; }
    uint32_t missingOptical() const { return missing_optical_; }

    // (field name, values) pairs in export order:
    // dac_values, voltages, currents, powers_electrical, powers_optical_mw, powers_optical_dbm
    std::vector<std::pair<std::string, std::vector<float>>> columns() const;

private:
    friend class SweepEngine;

    std::vector<MeasurementSample> samples_;
    std::vector<StepRecord> steps_;
    SweepStatus status_ = SweepStatus::REJECTED;
    uint32_t failed_writes_ = 0;
    uint32_t missing_voltages_ = 0;
    uint32_t missing_optical_ = 0;
};

/**
 * @brief Drives DAC writes and ADC/OPM reads in lock-step
 *
 * Every step: write the setpoint(s), wait settle_ms, read, append. Reads
 * that fail degrade to sentinels (0.0 V, NaN optical) and the sweep
 * carries on. The ADC and power meter are optional.
 */
class SweepEngine {
public:
    typedef std::function<void(int step, int total)> StepCallback;
    typedef std::function<void(const MeasurementSample& sample)> SampleCallback;

    SweepEngine(DacController* dac, AdcController* adc, PowerMeter* opm, const SweepConfig& config,
                FaultHandler* faults = nullptr);
    ~SweepEngine() = default;

    // start + p * (end - start), p = step / (steps - 1) clamped to [0, 1], truncated; steps <= 1 gives end
    static int interpolate(int start, int end, int steps, int step);

    // Channel 0-3, both codes 0-4095, steps >= 1
    static bool validateSchedule(const SweepSchedule& schedule, std::string& reason);

    // One channel, ack awaited on every write, no reads
    SweepResult sweepChannel(int channel, int start, int end, int steps);

    // All four channels move together; starts/ends indexed by channel
    SweepResult sweepAllChannels(const std::vector<int>& starts, const std::vector<int>& ends, int steps);

    // Each schedule progresses at its own rate and holds its end value once done
    SweepResult sweepIndependent(const std::vector<SweepSchedule>& schedules);

    /**
     * @brief Set one code, settle, then read voltage, current and optical power
     *
     * opm_channel <= 0 (or no power meter) skips the optical reads.
     */
    MeasurementSample measurePoint(int dac_channel, int code, int adc_channel, int opm_channel);

    SweepResult sweepIvCurve(int dac_channel, int adc_channel, int start, int end, int steps, int opm_channel);
    // Electrical only; optical fields are NaN
    SweepResult sweepIvQuick(int dac_channel, int adc_channel, int start, int end, int steps);

    // Safe to call from a signal handler
    void requestStop() { stop_requested_.store(true); }
    bool isStopRequested() const { return stop_requested_.load(); }

    void setStepCallback(StepCallback cb) { on_step_ = cb; }
    void setSampleCallback(SampleCallback cb) { on_sample_ = cb; }

    const SweepConfig& config() const { return config_; }

private:
    DacController* dac_;
    AdcController* adc_;
    PowerMeter* opm_;
    SweepConfig config_;
    FaultHandler* faults_;
    std::atomic<bool> stop_requested_;
    StepCallback on_step_;
    SampleCallback on_sample_;

    bool beginSweep(const char* name);
    bool stopBetweenSteps(SweepResult& result, int step, int total);
    void reject(SweepResult& result, const std::string& reason);
    void finish(SweepResult& result, const char* name);
    MeasurementSample measure(int dac_channel, int code, int adc_channel, int opm_channel, SweepResult* result);
    SweepResult runIvSweep(const char* name, int dac_channel, int adc_channel, int start, int end, int steps,
                           int opm_channel);
};
