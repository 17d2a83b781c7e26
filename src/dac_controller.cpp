#include "../include/dac_controller.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include <cmath>
#include <cstdio>

DacController::DacController(CommandProtocol& protocol, FaultHandler* faults)
    : protocol_(protocol), faults_(faults) {}

bool DacController::connect() {
    protocol_.open();
    return protocol_.isOpen();
}

void DacController::close() {
    protocol_.close();
}

bool DacController::sendCommand(const std::string& command) {
    return protocol_.send(command, true);
}

bool DacController::waitResponse(std::string& response, uint32_t timeout_ms) {
    return protocol_.waitResponse(response, timeout_ms);
}

bool DacController::checkCommunication(uint32_t timeout_ms) {
    return protocol_.checkCommunication(timeout_ms);
}

int DacController::voltageToCode(float voltage, float vref) {
    if (!(vref > 0.0f)) return DAC_MIN_CODE;
    long code = std::lround((double)voltage / vref * DAC_MAX_CODE);
    if (code < DAC_MIN_CODE) code = DAC_MIN_CODE;
    if (code > DAC_MAX_CODE) code = DAC_MAX_CODE;
    return (int)code;
}

float DacController::codeToVoltage(int code, float vref) {
    return (float)((double)code / DAC_MAX_CODE * vref);
}

CommandAck DacController::reject(const char* fmt, int value) {
    char msg[96];
    snprintf(msg, sizeof(msg), fmt, value);
    Logger::error("[DAC] %s", msg);
    if (faults_) faults_->recordFault(FaultType::VALIDATION, "DAC", msg);
    return CommandAck();
}

CommandAck DacController::transmit(const std::string& command, bool wait_ack, uint32_t timeout_ms) {
    CommandAck ack;
    if (!protocol_.send(command, wait_ack)) {
        return ack;
    }
    ack.accepted = true;
    if (!wait_ack) return ack;

    std::string response;
    if (protocol_.waitResponse(response, timeout_ms)) {
        ack.has_response = true;
        ack.response = response;
        ack.device_ok = (response == "1");
        if (!ack.device_ok) {
            Logger::warn("[DAC] Device reported failure for '%s': %s", command.c_str(), response.c_str());
        }
    } else {
        // Transmitted; the missing ack does not undo that
        Logger::warn("[DAC] No response from MCU within %u ms for '%s'", (unsigned)timeout_ms, command.c_str());
        if (faults_) faults_->recordFault(FaultType::TIMEOUT, "DAC", command);
    }
    return ack;
}

CommandAck DacController::setCode(int channel, int code) {
    return setCode(channel, code, true, protocol_.config().timeout_ms);
}

CommandAck DacController::setCode(int channel, int code, bool wait_ack, uint32_t timeout_ms) {
    if (!isValidChannel(channel)) {
        return reject("Channel must be 0-3, got %d", channel);
    }
    if (!isValidCode(code)) {
        return reject("DAC value must be 0-4095, got %d", code);
    }
    char cmd[32];
    snprintf(cmd, sizeof(cmd), "%d,%d", channel, code);
    CommandAck ack = transmit(cmd, wait_ack, timeout_ms);
    if (ack.accepted) {
        Logger::log(protocol_.config().verbose ? Logger::INFO : Logger::DEBUG,
                    "[DAC] Channel %d = %d%s%s", channel, code,
                    ack.has_response ? " - MCU: " : "", ack.response.c_str());
    }
    return ack;
}

CommandAck DacController::setVoltage(int channel, float voltage, float vref) {
    return setVoltage(channel, voltage, vref, true, protocol_.config().timeout_ms);
}

CommandAck DacController::setVoltage(int channel, float voltage, float vref, bool wait_ack, uint32_t timeout_ms) {
    if (!(vref > 0.0f)) {
        Logger::error("[DAC] Reference voltage must be > 0, got %.4f", vref);
        if (faults_) faults_->recordFault(FaultType::VALIDATION, "DAC", "vref <= 0");
        return CommandAck();
    }
    if (!(voltage >= 0.0f && voltage <= vref)) {
        Logger::error("[DAC] Voltage must be 0-%.4f V, got %.4f", vref, voltage);
        if (faults_) faults_->recordFault(FaultType::VALIDATION, "DAC", "voltage out of range");
        return CommandAck();
    }
    return setCode(channel, voltageToCode(voltage, vref), wait_ack, timeout_ms);
}

CommandAck DacController::setAll(int code) {
    return setAll(code, true, protocol_.config().timeout_ms);
}

CommandAck DacController::setAll(int code, bool wait_ack, uint32_t timeout_ms) {
    if (!isValidCode(code)) {
        return reject("DAC value must be 0-4095, got %d", code);
    }
    char cmd[32];
    snprintf(cmd, sizeof(cmd), "set_all,%d", code);
    CommandAck ack = transmit(cmd, wait_ack, timeout_ms);
    if (ack.accepted) {
        Logger::log(protocol_.config().verbose ? Logger::INFO : Logger::DEBUG,
                    "[DAC] All channels = %d", code);
    }
    return ack;
}
