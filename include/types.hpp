#pragma once
#include <cstdint>
#include <string>

// MCP4728 quad DAC behind the MCU
constexpr int DAC_CHANNEL_COUNT = 4;
constexpr int DAC_MIN_CODE = 0;
constexpr int DAC_MAX_CODE = 4095;

// ADS1115 quad ADC behind the MCU
constexpr int ADC_CHANNEL_COUNT = 4;

enum class UnitMode {
    DBM = 0,
    WATT = 1
};

inline const char* unitModeToString(UnitMode unit) {
    return unit == UnitMode::WATT ? "Watt" : "dBm";
}

// One channel of a DAC sweep. Values are DAC codes.
struct SweepSchedule {
    int channel = 0;
    int start = 0;
    int end = 0;
    int steps = 1;
};

// One sweep step. Immutable once appended to a result.
struct MeasurementSample {
    const int setpoint;
    const float voltage;
    const float current;
    const float power_electrical;
    const float power_optical_mw;
    const float power_optical_dbm;
};

// Positional reading used by the read-all helpers; invalid entries keep their slot.
struct ChannelReading {
    int channel = 0;
    bool valid = false;
    float value = 0.0f;
};

// Result of an actuator write.
struct CommandAck {
    bool accepted = false;      // passed validation and was transmitted
    bool has_response = false;  // an ack line arrived before the timeout
    bool device_ok = false;     // firmware acked with "1"
    std::string response;
};
