#ifndef FAULT_HANDLER_HPP
#define FAULT_HANDLER_HPP

#include <stdint.h>
#include <string>

/**
 * @brief Fault types that can occur during acquisition
 */
enum class FaultType {
    VALIDATION,            // Out-of-range channel, code or step count
    TIMEOUT,               // No response within the timeout
    PARSE_ERROR,           // Response arrived but could not be decoded
    PORT_UNAVAILABLE,      // Transport could not be acquired
    UNKNOWN                // Uncategorized fault
};

/**
 * @brief Fault Handler - counts and logs acquisition faults
 *
 * Validation, timeout and parse faults never abort a sweep: the reading
 * degrades to a sentinel and the fault is recorded here. A retry that
 * succeeds after a timeout counts as a recovery.
 */
class FaultHandler {
public:
    FaultHandler();

    /**
     * @brief Record a fault
     * @param type Fault type
     * @param module Short tag of the reporting module ("DAC", "ADC", "OPM", ...)
     * @param details Human-readable details
     */
    void recordFault(FaultType type, const char* module, const std::string& details = "");

    /**
     * @brief Record that a previously faulted operation succeeded on retry
     */
    void recordRecovery(FaultType type, const char* module);

    /**
     * @brief Get fault statistics
     */
    void getFaultStats(uint16_t& totalFaults, uint16_t& recoveredFaults, float& recoveryRate) const;

    uint16_t getFaultCount(FaultType type) const;
    uint16_t getTotalFaults() const { return total_faults_; }

    bool isDegradedMode() const { return degraded_mode_; }
    void setDegradedMode() { degraded_mode_ = true; }
    void clearDegradedMode() { degraded_mode_ = false; }

    void resetCounters();

    static const char* faultTypeToString(FaultType type);

private:
    static const int FAULT_TYPE_COUNT = 5;

    bool degraded_mode_;
    uint16_t total_faults_;
    uint16_t recovered_faults_;
    uint16_t fault_counts_[FAULT_TYPE_COUNT];
};

#endif // FAULT_HANDLER_HPP
