#include "../include/sweep_engine.hpp"
#include "../include/adc_controller.hpp"
#include "../include/clock.hpp"
#include "../include/curve_analysis.hpp"
#include "../include/dac_controller.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include "../include/power_meter.hpp"
#include <cmath>
#include <cstdio>
#include <limits>
#include <set>

const char* sweepStatusToString(SweepStatus status) {
    switch (status) {
        case SweepStatus::COMPLETED: return "completed";
        case SweepStatus::STOPPED: return "stopped";
        case SweepStatus::REJECTED: return "rejected";
        default: return "unknown";
    }
}

std::vector<std::pair<std::string, std::vector<float>>> SweepResult::columns() const {
    std::vector<float> dac_values, voltages, currents, powers_electrical, powers_optical_mw, powers_optical_dbm;
    for (const MeasurementSample& s : samples_) {
        dac_values.push_back((float)s.setpoint);
        voltages.push_back(s.voltage);
        currents.push_back(s.current);
        powers_electrical.push_back(s.power_electrical);
        powers_optical_mw.push_back(s.power_optical_mw);
        powers_optical_dbm.push_back(s.power_optical_dbm);
    }

    std::vector<std::pair<std::string, std::vector<float>>> cols;
    cols.push_back(std::make_pair(std::string("dac_values"), dac_values));
    cols.push_back(std::make_pair(std::string("voltages"), voltages));
    cols.push_back(std::make_pair(std::string("currents"), currents));
    cols.push_back(std::make_pair(std::string("powers_electrical"), powers_electrical));
    cols.push_back(std::make_pair(std::string("powers_optical_mw"), powers_optical_mw));
    cols.push_back(std::make_pair(std::string("powers_optical_dbm"), powers_optical_dbm));
    return cols;
}

SweepEngine::SweepEngine(DacController* dac, AdcController* adc, PowerMeter* opm, const SweepConfig& config,
                         FaultHandler* faults)
    : dac_(dac), adc_(adc), opm_(opm), config_(config), faults_(faults), stop_requested_(false) {
}

int SweepEngine::interpolate(int start, int end, int steps, int step) {
    if (steps <= 1) return end;
    double p = (double)step / (double)(steps - 1);
    if (p < 0.0) p = 0.0;
    if (p > 1.0) p = 1.0;
    return (int)(start + p * (end - start));
}

bool SweepEngine::validateSchedule(const SweepSchedule& schedule, std::string& reason) {
    char buf[96];
    if (!DacController::isValidChannel(schedule.channel)) {
        snprintf(buf, sizeof(buf), "channel %d out of range 0-%d", schedule.channel, DAC_CHANNEL_COUNT - 1);
        reason = buf;
        return false;
    }
    if (!DacController::isValidCode(schedule.start) || !DacController::isValidCode(schedule.end)) {
        snprintf(buf, sizeof(buf), "channel %d: codes %d..%d outside %d-%d", schedule.channel, schedule.start,
                 schedule.end, DAC_MIN_CODE, DAC_MAX_CODE);
        reason = buf;
        return false;
    }
    if (schedule.steps < 1) {
        snprintf(buf, sizeof(buf), "channel %d: steps must be >= 1, got %d", schedule.channel, schedule.steps);
        reason = buf;
        return false;
    }
    return true;
}

bool SweepEngine::beginSweep(const char* name) {
    if (!dac_) {
        Logger::error("[SWEEP] %s: no DAC attached", name);
        return false;
    }
    stop_requested_.store(false);
    return true;
}

bool SweepEngine::stopBetweenSteps(SweepResult& result, int step, int total) {
    if (!stop_requested_.load()) return false;
    Logger::warn("[SWEEP] Stop requested, ending after %d of %d steps", step, total);
    result.status_ = SweepStatus::STOPPED;
    return true;
}

void SweepEngine::reject(SweepResult& result, const std::string& reason) {
    Logger::error("[SWEEP] Rejected: %s", reason.c_str());
    if (faults_) faults_->recordFault(FaultType::VALIDATION, "SWEEP", reason);
    result.status_ = SweepStatus::REJECTED;
}

void SweepEngine::finish(SweepResult& result, const char* name) {
    if (result.status_ != SweepStatus::STOPPED) result.status_ = SweepStatus::COMPLETED;

    uint32_t missing = result.failed_writes_ + result.missing_voltages_ + result.missing_optical_;
    if (missing > 0 && faults_) faults_->setDegradedMode();

    Logger::info("[SWEEP] %s %s: %u steps, %u samples, %u failed writes, %u missing voltages, %u missing optical",
                 name, sweepStatusToString(result.status_), (unsigned)result.steps_.size(),
                 (unsigned)result.samples_.size(), (unsigned)result.failed_writes_,
                 (unsigned)result.missing_voltages_, (unsigned)result.missing_optical_);
}

SweepResult SweepEngine::sweepChannel(int channel, int start, int end, int steps) {
    SweepResult result;
    if (!beginSweep("Channel sweep")) return result;

    SweepSchedule schedule;
    schedule.channel = channel;
    schedule.start = start;
    schedule.end = end;
    schedule.steps = steps;
    std::string reason;
    if (!validateSchedule(schedule, reason)) {
        reject(result, reason);
        return result;
    }

    Logger::info("[SWEEP] Channel %d: %d -> %d in %d steps", channel, start, end, steps);
    for (int step = 0; step < steps; ++step) {
        if (stopBetweenSteps(result, step, steps)) break;

        int code = interpolate(start, end, steps, step);
        CommandAck ack = dac_->setCode(channel, code);
        if (!ack.accepted) result.failed_writes_++;

        StepRecord record;
        record.step = step;
        record.channels.push_back(channel);
        record.codes.push_back(code);
        result.steps_.push_back(record);

        sleep_ms(config_.settle_ms);
        if (on_step_) on_step_(step + 1, steps);
    }

    finish(result, "Channel sweep");
    return result;
}

SweepResult SweepEngine::sweepAllChannels(const std::vector<int>& starts, const std::vector<int>& ends, int steps) {
    SweepResult result;
    if (!beginSweep("All-channel sweep")) return result;

    if (starts.size() != (size_t)DAC_CHANNEL_COUNT || ends.size() != (size_t)DAC_CHANNEL_COUNT) {
        reject(result, "all-channel sweep needs one start and one end per channel");
        return result;
    }

    std::vector<SweepSchedule> schedules;
    for (int ch = 0; ch < DAC_CHANNEL_COUNT; ++ch) {
        SweepSchedule s;
        s.channel = ch;
        s.start = starts[ch];
        s.end = ends[ch];
        s.steps = steps;
        std::string reason;
        if (!validateSchedule(s, reason)) {
            reject(result, reason);
            return result;
        }
        schedules.push_back(s);
    }

    Logger::info("[SWEEP] All channels in %d steps", steps);
    for (int step = 0; step < steps; ++step) {
        if (stopBetweenSteps(result, step, steps)) break;

        StepRecord record;
        record.step = step;
        for (const SweepSchedule& s : schedules) {
            int code = interpolate(s.start, s.end, s.steps, step);
            CommandAck ack = dac_->setCode(s.channel, code, false, 0);
            if (!ack.accepted) result.failed_writes_++;
            record.channels.push_back(s.channel);
            record.codes.push_back(code);
        }
        result.steps_.push_back(record);

        sleep_ms(config_.settle_ms);
        if (on_step_) on_step_(step + 1, steps);
    }

    finish(result, "All-channel sweep");
    return result;
}

SweepResult SweepEngine::sweepIndependent(const std::vector<SweepSchedule>& schedules) {
    SweepResult result;
    if (!beginSweep("Independent sweep")) return result;

    if (schedules.empty()) {
        reject(result, "no schedules given");
        return result;
    }

    // Everything is checked before the first write
    std::set<int> seen;
    int max_steps = 0;
    for (const SweepSchedule& s : schedules) {
        std::string reason;
        if (!validateSchedule(s, reason)) {
            reject(result, reason);
            return result;
        }
        if (!seen.insert(s.channel).second) {
            reject(result, "channel " + std::to_string(s.channel) + " scheduled twice");
            return result;
        }
        if (s.steps > max_steps) max_steps = s.steps;
    }

    Logger::info("[SWEEP] Independent sweep over %u channels, %d global steps", (unsigned)schedules.size(),
                 max_steps);
    for (int step = 0; step < max_steps; ++step) {
        if (stopBetweenSteps(result, step, max_steps)) break;

        StepRecord record;
        record.step = step;
        for (const SweepSchedule& s : schedules) {
            int code = interpolate(s.start, s.end, s.steps, step);
            CommandAck ack = dac_->setCode(s.channel, code, false, 0);
            if (!ack.accepted) result.failed_writes_++;
            record.channels.push_back(s.channel);
            record.codes.push_back(code);
        }
        result.steps_.push_back(record);

        sleep_ms(config_.settle_ms);
        if (on_step_) on_step_(step + 1, max_steps);
    }

    finish(result, "Independent sweep");
    return result;
}

MeasurementSample SweepEngine::measurePoint(int dac_channel, int code, int adc_channel, int opm_channel) {
    return measure(dac_channel, code, adc_channel, opm_channel, nullptr);
}

MeasurementSample SweepEngine::measure(int dac_channel, int code, int adc_channel, int opm_channel,
                                       SweepResult* result) {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    if (dac_) {
        CommandAck ack = dac_->setCode(dac_channel, code);
        if (!ack.accepted && result) result->failed_writes_++;
    }
    sleep_ms(config_.settle_ms);

    float voltage = 0.0f;
    float current = 0.0f;
    if (adc_) {
        float v = 0.0f;
        if (adc_->readVoltage(adc_channel, v)) {
            voltage = v;
            current = adc_->currentFromVoltage(adc_channel, v);
        } else {
            Logger::warn("[SWEEP] No voltage at code %d, recording 0.0", code);
            if (result) result->missing_voltages_++;
        }
    }

    float optical_mw = nan;
    float optical_dbm = nan;
    if (opm_ && opm_channel > 0) {
        float mw = 0.0f;
        float dbm = 0.0f;
        bool mw_ok = opm_->getPowerMilliwatt(opm_channel, mw);
        bool dbm_ok = opm_->getPowerDbm(opm_channel, dbm);
        if (mw_ok) optical_mw = mw;
        if (dbm_ok) optical_dbm = dbm;
        if ((!mw_ok || !dbm_ok) && result) result->missing_optical_++;
    }

    MeasurementSample sample = {code, voltage, current, CurveAnalysis::calculatePower(voltage, current),
                                optical_mw, optical_dbm};
    Logger::debug("[SWEEP] code=%d V=%.4f I=%.6f P=%.6f opt=%.6f mW / %.2f dBm", code, voltage, current,
                  sample.power_electrical, optical_mw, optical_dbm);
    return sample;
}

SweepResult SweepEngine::sweepIvCurve(int dac_channel, int adc_channel, int start, int end, int steps,
                                      int opm_channel) {
    return runIvSweep("IV sweep", dac_channel, adc_channel, start, end, steps, opm_channel);
}

SweepResult SweepEngine::sweepIvQuick(int dac_channel, int adc_channel, int start, int end, int steps) {
    return runIvSweep("Quick IV sweep", dac_channel, adc_channel, start, end, steps, 0);
}

SweepResult SweepEngine::runIvSweep(const char* name, int dac_channel, int adc_channel, int start, int end,
                                    int steps, int opm_channel) {
    SweepResult result;
    if (!beginSweep(name)) return result;

    SweepSchedule schedule;
    schedule.channel = dac_channel;
    schedule.start = start;
    schedule.end = end;
    schedule.steps = steps;
    std::string reason;
    if (!validateSchedule(schedule, reason)) {
        reject(result, reason);
        return result;
    }
    if (adc_ && !AdcController::isValidChannel(adc_channel)) {
        reject(result, "ADC channel " + std::to_string(adc_channel) + " out of range");
        return result;
    }
    if (opm_ && opm_channel > 0 && !opm_->isValidChannel(opm_channel)) {
        reject(result, "power meter channel " + std::to_string(opm_channel) + " out of range");
        return result;
    }

    Logger::info("[SWEEP] %s: DAC %d, ADC %d, OPM %d, codes %d -> %d in %d steps", name, dac_channel, adc_channel,
                 opm_channel, start, end, steps);
    for (int step = 0; step < steps; ++step) {
        if (stopBetweenSteps(result, step, steps)) break;

        int code = interpolate(start, end, steps, step);
        MeasurementSample sample = measure(dac_channel, code, adc_channel, opm_channel, &result);
        result.samples_.push_back(sample);

        StepRecord record;
        record.step = step;
        record.channels.push_back(dac_channel);
        record.codes.push_back(code);
        result.steps_.push_back(record);

        if (on_sample_) on_sample_(sample);
        if (on_step_) on_step_(step + 1, steps);
    }

    finish(result, name);
    return result;
}
