#include "../include/power_meter.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include "../include/clock.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

static ProtocolConfig makeProtocolConfig(const OpmConfig& opm) {
    ProtocolConfig pc;
    pc.timeout_ms = opm.timeout_ms;
    pc.max_retries = 0;  // PowerMeter retries reads itself, with a delay
    pc.poll_interval_ms = 10;
    pc.verbose = false;
    return pc;
}

// Whole reply must be one finite number
static bool parseNumber(const std::string& text, double& value) {
    const char* s = text.c_str();
    char* end = nullptr;
    errno = 0;
    double v = strtod(s, &end);
    if (end == s || errno == ERANGE || !std::isfinite(v)) return false;
    while (*end == ' ' || *end == '\t') end++;
    if (*end != '\0') return false;
    value = v;
    return true;
}

// SCPI NR1 integer reply such as "1", "+1" or " 0 "
static bool parseInteger(const std::string& text, long& value) {
    const char* s = text.c_str();
    char* end = nullptr;
    errno = 0;
    long v = strtol(s, &end, 10);
    if (end == s || errno == ERANGE) return false;
    while (*end == ' ' || *end == '\t') end++;
    if (*end != '\0') return false;
    value = v;
    return true;
}

/**
 * Switches a dBm channel to Watt for the lifetime of the guard and
 * switches it back on every exit path.
 */
class UnitRestoreGuard {
public:
    UnitRestoreGuard(PowerMeter& meter, int channel, UnitMode reported)
        : meter_(meter), channel_(channel), needed_(reported == UnitMode::DBM), switched_(false) {
        if (needed_) {
            switched_ = meter_.setUnit(channel_, UnitMode::WATT);
            if (switched_) sleep_ms(meter_.config_.unit_switch_settle_ms);
        }
    }

    // False when the channel is still reporting dBm
    bool ok() const { return !needed_ || switched_; }

    ~UnitRestoreGuard() {
        if (!switched_) return;
        if (!meter_.setUnit(channel_, UnitMode::DBM)) {
            Logger::error("[OPM] Channel %d may have been left in Watt", channel_);
        }
    }

    UnitRestoreGuard(const UnitRestoreGuard&) = delete;
    UnitRestoreGuard& operator=(const UnitRestoreGuard&) = delete;

private:
    PowerMeter& meter_;
    int channel_;
    bool needed_;
    bool switched_;
};

PowerMeter::PowerMeter(Transport& transport, const OpmConfig& config, FaultHandler* faults)
    : protocol_(transport, makeProtocolConfig(config), faults, "OPM"), config_(config), faults_(faults) {
}

int PowerMeter::channelCountForIdentity(const std::string& idn) {
    if (idn.find("N7745") != std::string::npos || idn.find("N7744") != std::string::npos) return 8;
    if (idn.find("MY61C00155") != std::string::npos) return 4;
    return 2;
}

bool PowerMeter::begin() {
    protocol_.open();
    Logger::info("[OPM] Connected via %s", protocol_.transport().description().c_str());

    std::string idn;
    if (!query("*IDN?", idn)) {
        Logger::warn("[OPM] Identity query failed, assuming %d channels", channel_count_);
        return false;
    }
    identity_ = idn;
    channel_count_ = channelCountForIdentity(idn);
    Logger::info("[OPM] %s (%d channels)", identity_.c_str(), channel_count_);
    return true;
}

void PowerMeter::end() {
    if (protocol_.isOpen()) {
        protocol_.close();
        Logger::info("[OPM] Disconnected");
    }
}

bool PowerMeter::write(const std::string& command) {
    return protocol_.send(command, false);
}

bool PowerMeter::query(const std::string& command, std::string& response) {
    return protocol_.sendAndWait(command, response, config_.timeout_ms, 0);
}

bool PowerMeter::rejectChannel(int channel, const char* op) {
    if (isValidChannel(channel)) return false;
    Logger::error("[OPM] %s: channel must be 1-%d, got %d", op, channel_count_, channel);
    if (faults_) faults_->recordFault(FaultType::VALIDATION, "OPM", "channel " + std::to_string(channel));
    return true;
}

bool PowerMeter::setUnit(int channel, UnitMode unit) {
    if (rejectChannel(channel, "setUnit")) return false;
    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:unit %d", channel, unit == UnitMode::WATT ? 1 : 0);
    return write(cmd);
}

UnitMode PowerMeter::getUnit(int channel) {
    if (rejectChannel(channel, "getUnit")) return UnitMode::DBM;
    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:unit?", channel);
    std::string response;
    if (!query(cmd, response)) {
        Logger::warn("[OPM] Unit query failed on channel %d, assuming dBm", channel);
        return UnitMode::DBM;
    }
    long code = -1;
    if (parseInteger(response, code) && code == 1) return UnitMode::WATT;
    if (code != 0) {
        Logger::warn("[OPM] Unexpected unit reply '%s', assuming dBm", response.c_str());
        if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "OPM", response);
    }
    return UnitMode::DBM;
}

bool PowerMeter::setWavelength(int channel, float nm) {
    if (rejectChannel(channel, "setWavelength")) return false;
    if (!(nm > 0.0f)) {
        Logger::error("[OPM] Wavelength must be > 0 nm, got %f", nm);
        if (faults_) faults_->recordFault(FaultType::VALIDATION, "OPM", "wavelength");
        return false;
    }
    char cmd[64];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:wav %gnm", channel, nm);
    return write(cmd);
}

float PowerMeter::getWavelength(int channel) {
    if (rejectChannel(channel, "getWavelength")) return 0.0f;
    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:wav?", channel);
    std::string response;
    double metres = 0.0;
    if (!query(cmd, response)) return 0.0f;
    if (!parseNumber(response, metres)) {
        Logger::warn("[OPM] Could not parse wavelength from '%s'", response.c_str());
        if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "OPM", response);
        return 0.0f;
    }
    return (float)(metres * 1e9);
}

bool PowerMeter::setAutoRange(int channel, bool enabled) {
    if (rejectChannel(channel, "setAutoRange")) return false;
    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:rang:auto %d", channel, enabled ? 1 : 0);
    return write(cmd);
}

bool PowerMeter::isAutoRange(int channel) {
    if (rejectChannel(channel, "isAutoRange")) return false;
    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:rang:auto?", channel);
    std::string response;
    long code = 0;
    if (!query(cmd, response)) return false;
    return parseInteger(response, code) && code == 1;
}

bool PowerMeter::setRange(int channel, float dbm) {
    if (rejectChannel(channel, "setRange")) return false;
    if (!setAutoRange(channel, false)) return false;
    char cmd[64];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:rang %.1fdbm", channel, dbm);
    return write(cmd);
}

std::string PowerMeter::getRange(int channel) {
    if (rejectChannel(channel, "getRange")) return "Error";
    if (isAutoRange(channel)) return "Auto";

    char cmd[48];
    snprintf(cmd, sizeof(cmd), "sens%d:pow:rang?", channel);
    std::string response;
    double value = 0.0;
    if (!query(cmd, response) || !parseNumber(response, value)) {
        Logger::warn("[OPM] Range query failed on channel %d", channel);
        return "Error";
    }
    char text[32];
    snprintf(text, sizeof(text), "%.1f dBm", value);
    return text;
}

bool PowerMeter::getPower(int channel, float& power) {
    return getPower(channel, power, config_.max_retries);
}

bool PowerMeter::getPower(int channel, float& power, uint8_t retries) {
    if (rejectChannel(channel, "getPower")) return false;

    char cmd[32];
    snprintf(cmd, sizeof(cmd), "read%d:pow?", channel);

    for (int attempt = 0; attempt <= retries; ++attempt) {
        std::string response;
        double value = 0.0;
        if (query(cmd, response)) {
            if (parseNumber(response, value)) {
                power = (float)value;
                if (attempt > 0 && faults_) faults_->recordRecovery(FaultType::TIMEOUT, "OPM");
                return true;
            }
            Logger::warn("[OPM] Could not parse power from '%s'", response.c_str());
            if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "OPM", response);
        }
        if (attempt < retries) {
            Logger::debug("[OPM] Power read on channel %d failed, retry %d/%d", channel, attempt + 1, (int)retries);
            sleep_ms(config_.retry_delay_ms);
        }
    }
    Logger::warn("[OPM] Power read on channel %d failed after %d attempts", channel, (int)retries + 1);
    return false;
}

bool PowerMeter::getPowerMilliwatt(int channel, float& milliwatt) {
    if (rejectChannel(channel, "getPowerMilliwatt")) return false;

    UnitMode reported = getUnit(channel);
    float watts = 0.0f;
    bool ok = false;
    {
        UnitRestoreGuard guard(*this, channel, reported);
        if (!guard.ok()) {
            Logger::warn("[OPM] Could not switch channel %d to Watt, no mW reading", channel);
            if (faults_) faults_->recordFault(FaultType::UNKNOWN, "OPM", "unit switch");
        } else {
            ok = getPower(channel, watts);
        }
    }
    if (ok) milliwatt = watts * 1000.0f;
    return ok;
}

bool PowerMeter::getPowerDbm(int channel, float& dbm) {
    if (rejectChannel(channel, "getPowerDbm")) return false;

    UnitMode unit = getUnit(channel);
    float value = 0.0f;
    if (!getPower(channel, value)) return false;
    if (unit == UnitMode::DBM) {
        dbm = value;
        return true;
    }
    if (!(value > 0.0f)) {
        Logger::warn("[OPM] Channel %d reads %g W, no dBm equivalent", channel, value);
        return false;
    }
    dbm = (float)(10.0 * std::log10((double)value * 1000.0));
    return true;
}

std::vector<float> PowerMeter::getAllPowers() {
    std::vector<float> powers;
    if (config_.use_batched_read && getAllPowersBatched(powers)) {
        return powers;
    }

    powers.clear();
    for (int ch = 1; ch <= channel_count_; ++ch) {
        float p = 0.0f;
        powers.push_back(getPower(ch, p) ? p : std::numeric_limits<float>::quiet_NaN());
        if (ch < channel_count_) sleep_ms(config_.inter_channel_delay_ms);
    }
    return powers;
}

bool PowerMeter::getAllPowersBatched(std::vector<float>& powers) {
    std::string payload;
    if (!protocol_.send("read:pow:all?", true) || !protocol_.waitBlock(payload, config_.timeout_ms)) {
        Logger::warn("[OPM] Batched read failed, falling back to per-channel reads");
        if (faults_) faults_->recordFault(FaultType::TIMEOUT, "OPM", "read:pow:all?");
        return false;
    }
    std::vector<float> values;
    if (!decodeFloatPayload(payload, values) || values.size() != (size_t)channel_count_) {
        Logger::warn("[OPM] Malformed batched reply (%u bytes)", (unsigned)payload.size());
        if (faults_) faults_->recordFault(FaultType::PARSE_ERROR, "OPM", "read:pow:all?");
        return false;
    }
    powers = values;
    return true;
}

bool PowerMeter::decodeFloatPayload(const std::string& payload, std::vector<float>& values) {
    if (payload.size() % 4 != 0) return false;
    values.clear();
    for (size_t i = 0; i < payload.size(); i += 4) {
        uint32_t bits = (uint32_t)(uint8_t)payload[i] |
                        ((uint32_t)(uint8_t)payload[i + 1] << 8) |
                        ((uint32_t)(uint8_t)payload[i + 2] << 16) |
                        ((uint32_t)(uint8_t)payload[i + 3] << 24);
        float v;
        memcpy(&v, &bits, sizeof(v));
        values.push_back(v);
    }
    return true;
}
