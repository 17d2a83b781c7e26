#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"

FaultHandler::FaultHandler() {
    resetCounters();
}

void FaultHandler::recordFault(FaultType type, const char* module, const std::string& details) {
    total_faults_++;
    if ((int)type < FAULT_TYPE_COUNT) {
        fault_counts_[(int)type]++;
    }

    if (details.empty()) {
        Logger::warn("[FaultHandler] %s fault in %s", faultTypeToString(type), module);
    } else {
        Logger::warn("[FaultHandler] %s fault in %s: %s", faultTypeToString(type), module, details.c_str());
    }

    if (type == FaultType::PORT_UNAVAILABLE) {
        degraded_mode_ = true;
    }
}

void FaultHandler::recordRecovery(FaultType type, const char* module) {
    recovered_faults_++;
    Logger::info("[FaultHandler] %s in %s recovered on retry", faultTypeToString(type), module);
}

void FaultHandler::getFaultStats(uint16_t& totalFaults, uint16_t& recoveredFaults, float& recoveryRate) const {
    totalFaults = total_faults_;
    recoveredFaults = recovered_faults_;
    recoveryRate = (total_faults_ > 0) ? ((float)recovered_faults_ / total_faults_ * 100.0f) : 100.0f;
}

uint16_t FaultHandler::getFaultCount(FaultType type) const {
    if ((int)type < FAULT_TYPE_COUNT) {
        return fault_counts_[(int)type];
    }
    return 0;
}

void FaultHandler::resetCounters() {
    degraded_mode_ = false;
    total_faults_ = 0;
    recovered_faults_ = 0;
    for (int i = 0; i < FAULT_TYPE_COUNT; i++) {
        fault_counts_[i] = 0;
    }
}

const char* FaultHandler::faultTypeToString(FaultType type) {
    switch (type) {
        case FaultType::VALIDATION: return "VALIDATION";
        case FaultType::TIMEOUT: return "TIMEOUT";
        case FaultType::PARSE_ERROR: return "PARSE_ERROR";
        case FaultType::PORT_UNAVAILABLE: return "PORT_UNAVAILABLE";
        case FaultType::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}
