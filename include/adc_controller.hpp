#pragma once
#include "command_protocol.hpp"
#include "config_manager.hpp"
#include "types.hpp"
#include <stdint.h>
#include <string>
#include <vector>

class FaultHandler;

/**
 * @brief ADS1115 ADC behind the MCU serial link
 *
 * Reads never throw: a timeout or an unparsable reply returns false and
 * leaves the output untouched. Current is derived from the voltage across
 * a per-channel shunt resistor.
 */
class AdcController : public LineDevice {
public:
    AdcController(CommandProtocol& protocol,
                  const std::vector<float>& shunt_resistors = ConfigManager::defaultShuntResistors(),
                  FaultHandler* faults = nullptr);
    ~AdcController() = default;

    // LineDevice
    bool connect() override;
    void close() override;
    bool sendCommand(const std::string& command) override;
    bool waitResponse(std::string& response, uint32_t timeout_ms) override;
    bool checkCommunication(uint32_t timeout_ms) override;

    bool readVoltage(int channel, float& voltage);
    bool readVoltage(int channel, float& voltage, uint32_t timeout_ms);

    // voltage / shunt[channel]; false whenever the voltage read fails
    bool readCurrent(int channel, float& current);
    bool readCurrent(int channel, float& current, uint32_t timeout_ms);

    // Signed 16-bit conversion result (read_adc_raw)
    bool readRaw(int channel, int& raw, uint32_t timeout_ms);

    // One entry per channel, in channel order; failed reads stay in place as invalid
    std::vector<ChannelReading> readAllVoltages(uint32_t timeout_ms);
    std::vector<ChannelReading> readAllCurrents(uint32_t timeout_ms);

    // I2C bus check; on success config_out holds the reported config register
    bool testAdc(std::string& config_out, uint32_t timeout_ms);

    bool setShuntResistors(const std::vector<float>& shunt_resistors);
    bool setShuntResistor(int channel, float ohms);
    std::vector<float> getShuntResistors() const { return shunt_resistors_; }
    float getShuntResistor(int channel) const;

    float currentFromVoltage(int channel, float voltage) const;

    static bool isValidChannel(int channel) { return channel >= 0 && channel < ADC_CHANNEL_COUNT; }

    // "<voltage>" or "<voltage>,<raw_code>"
    static bool parseVoltageResponse(const std::string& line, float& voltage);

    int channelCount() const { return ADC_CHANNEL_COUNT; }

private:
    CommandProtocol& protocol_;
    std::vector<float> shunt_resistors_;
    FaultHandler* faults_;

    bool rejectChannel(int channel);
};
