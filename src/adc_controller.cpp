#include "../include/adc_controller.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <cctype>
#include <cmath>
#include <cerrno>

AdcController::AdcController(CommandProtocol& protocol, const std::vector<float>& shunt_resistors,
                             FaultHandler* faults)
    : protocol_(protocol), shunt_resistors_(ConfigManager::defaultShuntResistors()), faults_(faults) {
    if (!setShuntResistors(shunt_resistors)) {
        Logger::warn("[ADC] Invalid shunt table, keeping 1.0 ohm defaults");
    }
}

bool AdcController::connect() {
    protocol_.open();
    return protocol_.isOpen();
}

void AdcController::close() {
    protocol_.close();
}

bool AdcController::sendCommand(const std::string& command) {
    return protocol_.send(command, true);
}

bool AdcController::waitResponse(std::string& response, uint32_t timeout_ms) {
    return protocol_.waitResponse(response, timeout_ms);
}

bool AdcController::checkCommunication(uint32_t timeout_ms) {
    return protocol_.checkCommunication(timeout_ms);
}

bool AdcController::rejectChannel(int channel) {
    if (isValidChannel(channel)) return false;
    Logger::error("[ADC] Channel must be 0-3, got %d", channel);
    if (faults_) faults_->recordFault(FaultType::VALIDATION, "ADC", "channel " + std::to_string(channel));
    return true;
}

bool AdcController::parseVoltageResponse(const std::string& line, float& voltage) {
    const char* s = line.c_str();
    char* end = nullptr;
    errno = 0;
    float v = strtof(s, &end);
    if (end == s || errno == ERANGE || !std::isfinite(v)) return false;
    while (*end && isspace((unsigned char)*end)) end++;
    if (*end == ',') {
        // Optional raw code after the voltage
        const char* raw = end + 1;
        char* raw_end = nullptr;
        (void)strtol(raw, &raw_end, 10);
        if (raw_end == raw) return false;
        end = raw_end;
        while (*end && isspace((unsigned char)*end)) end++;
    }
    if (*end != '\0') return false;
    voltage = v;
    return true;
}

bool AdcController::readVoltage(int channel, float& voltage) {
    return readVoltage(channel, voltage, protocol_.config().timeout_ms);
}

bool AdcController::readVoltage(int channel, float& voltage, uint32_t timeout_ms) {
    if (rejectChannel(channel)) return false;

    char cmd[32];
    snprintf(cmd, sizeof(cmd), "read_adc,%d", channel);
    std::string response;
    if (!protocol_.sendAndWait(cmd, response, timeout_ms, protocol_.config().max_retries)) {
        return false;
    }
    float v = 0.0f;
    if (!parseVoltageResponse(response, v)) {
        Logger::warn("[ADC] Could not parse voltage from '%s'", response.c_str());
        if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "ADC", response);
        return false;
    }
    voltage = v;
    Logger::log(protocol_.config().verbose ? Logger::INFO : Logger::DEBUG,
                "[ADC] Channel %d voltage: %.4f V", channel, voltage);
    return true;
}

bool AdcController::readCurrent(int channel, float& current) {
    return readCurrent(channel, current, protocol_.config().timeout_ms);
}

bool AdcController::readCurrent(int channel, float& current, uint32_t timeout_ms) {
    float voltage = 0.0f;
    if (!readVoltage(channel, voltage, timeout_ms)) return false;
    current = currentFromVoltage(channel, voltage);
    Logger::log(protocol_.config().verbose ? Logger::INFO : Logger::DEBUG,
                "[ADC] Channel %d current: %.6f A (shunt %.3f ohm)", channel, current, shunt_resistors_[channel]);
    return true;
}

bool AdcController::readRaw(int channel, int& raw, uint32_t timeout_ms) {
    if (rejectChannel(channel)) return false;

    char cmd[32];
    snprintf(cmd, sizeof(cmd), "read_adc_raw,%d", channel);
    std::string response;
    if (!protocol_.sendAndWait(cmd, response, timeout_ms, protocol_.config().max_retries)) {
        return false;
    }
    const char* s = response.c_str();
    char* end = nullptr;
    long v = strtol(s, &end, 10);
    if (end == s || *end != '\0' || v < -32768 || v > 32767) {
        Logger::warn("[ADC] Could not parse raw code from '%s'", response.c_str());
        if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "ADC", response);
        return false;
    }
    raw = (int)v;
    return true;
}

std::vector<ChannelReading> AdcController::readAllVoltages(uint32_t timeout_ms) {
    std::vector<ChannelReading> readings;
    for (int ch = 0; ch < ADC_CHANNEL_COUNT; ++ch) {
        ChannelReading r;
        r.channel = ch;
        r.valid = readVoltage(ch, r.value, timeout_ms);
        readings.push_back(r);
    }
    return readings;
}

std::vector<ChannelReading> AdcController::readAllCurrents(uint32_t timeout_ms) {
    std::vector<ChannelReading> readings;
    for (int ch = 0; ch < ADC_CHANNEL_COUNT; ++ch) {
        ChannelReading r;
        r.channel = ch;
        r.valid = readCurrent(ch, r.value, timeout_ms);
        readings.push_back(r);
    }
    return readings;
}

bool AdcController::testAdc(std::string& config_out, uint32_t timeout_ms) {
    std::string response;
    if (!protocol_.sendAndWait("test_adc", response, timeout_ms, 0)) {
        return false;
    }
    if (response.compare(0, 3, "OK:") == 0) {
        config_out = response.substr(3);
        Logger::info("[ADC] Bus OK, config register %s", config_out.c_str());
        return true;
    }
    Logger::warn("[ADC] Bus test failed: %s", response.c_str());
    return false;
}

bool AdcController::setShuntResistors(const std::vector<float>& shunt_resistors) {
    if (shunt_resistors.size() != (size_t)ADC_CHANNEL_COUNT) {
        Logger::error("[ADC] Expected %d shunt resistors, got %u", ADC_CHANNEL_COUNT, (unsigned)shunt_resistors.size());
        return false;
    }
    for (float r : shunt_resistors) {
        if (!(r > 0.0f)) {
            Logger::error("[ADC] Shunt resistance must be > 0, got %f", r);
            return false;
        }
    }
    shunt_resistors_ = shunt_resistors;
    return true;
}

bool AdcController::setShuntResistor(int channel, float ohms) {
    if (rejectChannel(channel)) return false;
    if (!(ohms > 0.0f)) {
        Logger::error("[ADC] Shunt resistance must be > 0, got %f", ohms);
        return false;
    }
    shunt_resistors_[channel] = ohms;
    return true;
}

float AdcController::getShuntResistor(int channel) const {
    if (!isValidChannel(channel)) return 0.0f;
    return shunt_resistors_[channel];
}

float AdcController::currentFromVoltage(int channel, float voltage) const {
    if (!isValidChannel(channel)) return 0.0f;
    return voltage / shunt_resistors_[channel];
}
