#pragma once
#include "command_protocol.hpp"
#include "config_manager.hpp"
#include "transport.hpp"
#include "types.hpp"
#include <stdint.h>
#include <string>
#include <vector>

class FaultHandler;

/**
 * @brief Keysight optical power meter over a SCPI query link
 *
 * Channels are numbered 1..channelCount() as on the instrument. The
 * channel count comes from the *IDN? reply at begin().
 *
 * Unit/range setters are write-only; getters fall back to a conservative
 * value (dBm, auto range off, wavelength 0) when the query fails.
 */
class PowerMeter {
public:
    PowerMeter(Transport& transport, const OpmConfig& config, FaultHandler* faults = nullptr);
    ~PowerMeter() = default;

    /**
     * @brief Open the link and identify the instrument
     * @return false if the identity query fails (channel count stays 2)
     * @throws PortUnavailableException if the link cannot be opened
     */
    bool begin();
    void end();
    bool isOpen() const { return protocol_.isOpen(); }

    const std::string& identity() const { return identity_; }
    int channelCount() const { return channel_count_; }
    bool isValidChannel(int channel) const { return channel >= 1 && channel <= channel_count_; }

    // 8 for N7744/N7745, 4 for MY61C00155, otherwise 2
    static int channelCountForIdentity(const std::string& idn);

    bool write(const std::string& command);
    bool query(const std::string& command, std::string& response);

    bool setUnit(int channel, UnitMode unit);
    UnitMode getUnit(int channel);

    bool setWavelength(int channel, float nm);
    float getWavelength(int channel);

    bool setAutoRange(int channel, bool enabled);
    bool isAutoRange(int channel);
    // Turns auto range off and sets a fixed range in dBm
    bool setRange(int channel, float dbm);
    // "Auto", "<value> dBm" or "Error"
    std::string getRange(int channel);

    // Power in the unit the channel currently reports
    bool getPower(int channel, float& power);
    bool getPower(int channel, float& power, uint8_t retries);

    // Power in dBm whatever unit the channel reports; a Watt reading is converted
    bool getPowerDbm(int channel, float& dbm);

    // Power in mW; switches a dBm channel to Watt for the read and always switches it back
    bool getPowerMilliwatt(int channel, float& milliwatt);

    // One value per channel, NaN where the read failed
    std::vector<float> getAllPowers();

    // read:pow:all? with an IEEE 488.2 binary block reply
    bool getAllPowersBatched(std::vector<float>& powers);

    // Little-endian float32 values from a block payload
    static bool decodeFloatPayload(const std::string& payload, std::vector<float>& values);

private:
    CommandProtocol protocol_;
    OpmConfig config_;
    FaultHandler* faults_;
    std::string identity_;
    int channel_count_ = 2;

    bool rejectChannel(int channel, const char* op);

    friend class UnitRestoreGuard;
};
