#pragma once
#include "command_protocol.hpp"
#include "types.hpp"
#include <stdint.h>
#include <string>

class FaultHandler;

/**
 * @brief MCP4728 DAC behind the MCU serial link
 *
 * Wire format: "<ch>,<code>" and "set_all,<code>"; the firmware acks
 * with "1" (written) or "0" (I2C failure). Out-of-range arguments are
 * rejected before anything is written.
 */
class DacController : public LineDevice {
public:
    explicit DacController(CommandProtocol& protocol, FaultHandler* faults = nullptr);
    ~DacController() = default;

    // LineDevice
    bool connect() override;
    void close() override;
    bool sendCommand(const std::string& command) override;
    bool waitResponse(std::string& response, uint32_t timeout_ms) override;
    bool checkCommunication(uint32_t timeout_ms) override;

    // Set one channel; waits for the ack using the protocol timeout
    CommandAck setCode(int channel, int code);
    CommandAck setCode(int channel, int code, bool wait_ack, uint32_t timeout_ms);

    // Convert to a code and set it; rejects voltage outside [0, vref] or vref <= 0
    CommandAck setVoltage(int channel, float voltage, float vref);
    CommandAck setVoltage(int channel, float voltage, float vref, bool wait_ack, uint32_t timeout_ms);

    // Broadcast to every channel in one command
    CommandAck setAll(int code);
    CommandAck setAll(int code, bool wait_ack, uint32_t timeout_ms);

    static bool isValidChannel(int channel) { return channel >= 0 && channel < DAC_CHANNEL_COUNT; }
    static bool isValidCode(int code) { return code >= DAC_MIN_CODE && code <= DAC_MAX_CODE; }

    // round(voltage / vref * 4095), clamped to [0, 4095]
    static int voltageToCode(float voltage, float vref);
    static float codeToVoltage(int code, float vref);

    int channelCount() const { return DAC_CHANNEL_COUNT; }

private:
    CommandProtocol& protocol_;
    FaultHandler* faults_;

    CommandAck transmit(const std::string& command, bool wait_ack, uint32_t timeout_ms);
    CommandAck reject(const char* fmt, int value);
};
