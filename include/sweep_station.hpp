#pragma once
#include "adc_controller.hpp"
#include "command_protocol.hpp"
#include "config_manager.hpp"
#include "dac_controller.hpp"
#include "fault_handler.hpp"
#include "power_meter.hpp"
#include "sweep_engine.hpp"
#include "transport.hpp"
#include <stdint.h>

/**
 * @brief Owns the whole bench: config, links, instruments and the sweep engine
 *
 * Nothing is opened in setup(). The MCU link and the power meter are
 * connected on first use so commands that need only one of them still run
 * when the other is absent.
 */
class SweepStation {
public:
    SweepStation();
    ~SweepStation();

    // Load config (nullptr = defaults), start logging, build every component.
    // Throws ConfigException on a malformed config file.
    void setup(const char* config_path);
    void shutdown();

    // Throws PortUnavailableException if the MCU port cannot be acquired
    void connectSerial();
    bool isSerialConnected() const;

    // false (and logged) if the power meter is unreachable; never throws
    bool connectPowerMeter();
    bool isPowerMeterConnected() const;

    DacController* dac() { return dac_; }
    AdcController* adc() { return adc_; }
    PowerMeter* powerMeter() { return power_meter_; }
    SweepEngine* engine() { return engine_; }
    FaultHandler* faults() { return fault_handler_; }
    const ConfigManager* config() const { return config_; }

    void getStatistics(char* outBuf, size_t outBufSize) const;

private:
    ConfigManager* config_ = nullptr;
    FaultHandler* fault_handler_ = nullptr;
    Transport* serial_transport_ = nullptr;
    Transport* opm_transport_ = nullptr;
    CommandProtocol* serial_protocol_ = nullptr;
    DacController* dac_ = nullptr;
    AdcController* adc_ = nullptr;
    PowerMeter* power_meter_ = nullptr;
    SweepEngine* engine_ = nullptr;
    bool opm_attempted_ = false;

    void destroy();
};
