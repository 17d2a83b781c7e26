#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <fstream>
#include <sstream>

static const float kDefaultShunts[4] = {1.0f, 1.0f, 1.0f, 1.0f};

std::vector<float> ConfigManager::defaultShuntResistors() {
    return std::vector<float>(kDefaultShunts, kDefaultShunts + 4);
}

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager::ConfigManager(const char* config_file) {
    initializeDefaults();
    if (config_file && config_file[0] != '\0') {
        loadConfig(config_file);
    }
}

void ConfigManager::initializeDefaults() {
    logging_config_.log_level = "INFO";
    logging_config_.log_file = "";
    logging_config_.flush_on_write = true;

    serial_config_.port = "/dev/ttyACM0";
    serial_config_.baud = 115200;
    serial_config_.open_settle_ms = 2000;
    serial_config_.release_retry_delay_ms = 1000;

    protocol_config_.timeout_ms = 2000;
    protocol_config_.max_retries = 0;
    protocol_config_.poll_interval_ms = 10;
    protocol_config_.verbose = false;

    opm_config_.transport = "tcp";
    opm_config_.host = "129.82.224.199";
    opm_config_.tcp_port = 5025;
    opm_config_.serial_port = "/dev/ttyUSB0";
    opm_config_.serial_baud = 9600;
    opm_config_.timeout_ms = 10000;   // slow channels
    opm_config_.max_retries = 2;
    opm_config_.retry_delay_ms = 100;
    opm_config_.inter_channel_delay_ms = 50;
    opm_config_.unit_switch_settle_ms = 50;
    opm_config_.use_batched_read = false;

    sweep_config_.settle_ms = 100;
    sweep_config_.vref = 3.3f;
    sweep_config_.shunt_resistors = defaultShuntResistors();
    sweep_config_.dac_channel = 0;
    sweep_config_.adc_channel = 0;
    sweep_config_.opm_channel = 1;
}

ConfigManager::~ConfigManager() {}

LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
SerialConfig ConfigManager::getSerialConfig() const { return serial_config_; }
ProtocolConfig ConfigManager::getProtocolConfig() const { return protocol_config_; }
OpmConfig ConfigManager::getOpmConfig() const { return opm_config_; }
SweepConfig ConfigManager::getSweepConfig() const { return sweep_config_; }

void ConfigManager::loadConfig(const char* config_file) {
    std::ifstream in(config_file);
    if (!in) {
        Logger::info("[ConfigMgr] No config file at %s, using defaults", config_file);
        return;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    loadFromString(ss.str());
    loaded_from_file_ = true;
    source_path_ = config_file;
    Logger::info("[ConfigMgr] Loaded config from %s", config_file);
}

void ConfigManager::loadFromString(const std::string& json) {
    DynamicJsonDocument doc(4096);
    DeserializationError err = deserializeJson(doc, json);
    if (err) {
        throw ConfigException(std::string("Config parse failed: ") + err.c_str());
    }
    JsonObject root = doc.as<JsonObject>();
    if (root.isNull()) {
        throw ConfigException("Config root must be a JSON object");
    }

    JsonObject logging = root["logging"];
    if (!logging.isNull()) {
        logging_config_.log_level = logging["log_level"] | logging_config_.log_level.c_str();
        logging_config_.log_file = logging["log_file"] | logging_config_.log_file.c_str();
        logging_config_.flush_on_write = logging["flush_on_write"] | logging_config_.flush_on_write;
    }

    JsonObject serial = root["serial"];
    if (!serial.isNull()) {
        serial_config_.port = serial["port"] | serial_config_.port.c_str();
        serial_config_.baud = serial["baud"] | serial_config_.baud;
        serial_config_.open_settle_ms = serial["open_settle_ms"] | serial_config_.open_settle_ms;
        serial_config_.release_retry_delay_ms = serial["release_retry_delay_ms"] | serial_config_.release_retry_delay_ms;
    }

    JsonObject protocol = root["protocol"];
    if (!protocol.isNull()) {
        protocol_config_.timeout_ms = protocol["timeout_ms"] | protocol_config_.timeout_ms;
        protocol_config_.max_retries = protocol["max_retries"] | protocol_config_.max_retries;
        protocol_config_.poll_interval_ms = protocol["poll_interval_ms"] | protocol_config_.poll_interval_ms;
        protocol_config_.verbose = protocol["verbose"] | protocol_config_.verbose;
    }

    JsonObject opm = root["opm"];
    if (!opm.isNull()) {
        opm_config_.transport = opm["transport"] | opm_config_.transport.c_str();
        opm_config_.host = opm["host"] | opm_config_.host.c_str();
        opm_config_.tcp_port = opm["tcp_port"] | opm_config_.tcp_port;
        opm_config_.serial_port = opm["serial_port"] | opm_config_.serial_port.c_str();
        opm_config_.serial_baud = opm["serial_baud"] | opm_config_.serial_baud;
        opm_config_.timeout_ms = opm["timeout_ms"] | opm_config_.timeout_ms;
        opm_config_.max_retries = opm["max_retries"] | opm_config_.max_retries;
        opm_config_.retry_delay_ms = opm["retry_delay_ms"] | opm_config_.retry_delay_ms;
        opm_config_.inter_channel_delay_ms = opm["inter_channel_delay_ms"] | opm_config_.inter_channel_delay_ms;
        opm_config_.unit_switch_settle_ms = opm["unit_switch_settle_ms"] | opm_config_.unit_switch_settle_ms;
        opm_config_.use_batched_read = opm["use_batched_read"] | opm_config_.use_batched_read;
    }

    JsonObject sweep = root["sweep"];
    if (!sweep.isNull()) {
        sweep_config_.settle_ms = sweep["settle_ms"] | sweep_config_.settle_ms;
        sweep_config_.vref = sweep["vref"] | sweep_config_.vref;
        sweep_config_.dac_channel = sweep["dac_channel"] | sweep_config_.dac_channel;
        sweep_config_.adc_channel = sweep["adc_channel"] | sweep_config_.adc_channel;
        sweep_config_.opm_channel = sweep["opm_channel"] | sweep_config_.opm_channel;
        JsonArray shunts = sweep["shunt_resistors"];
        if (!shunts.isNull()) {
            std::vector<float> values;
            for (JsonVariant v : shunts) {
                values.push_back(v.as<float>());
            }
            sweep_config_.shunt_resistors = values;
        }
    }

    validate();
}

void ConfigManager::validate() const {
    if (serial_config_.baud == 0) {
        throw ConfigException("serial.baud must be > 0");
    }
    if (protocol_config_.timeout_ms == 0) {
        throw ConfigException("protocol.timeout_ms must be > 0");
    }
    if (opm_config_.timeout_ms == 0) {
        throw ConfigException("opm.timeout_ms must be > 0");
    }
    if (opm_config_.transport != "tcp" && opm_config_.transport != "serial") {
        throw ConfigException("opm.transport must be \"tcp\" or \"serial\"");
    }
    if (!(sweep_config_.vref > 0.0f)) {
        throw ConfigException("sweep.vref must be > 0");
    }
    if (sweep_config_.shunt_resistors.size() != 4) {
        throw ConfigException("sweep.shunt_resistors must have 4 entries, got " +
                              std::to_string(sweep_config_.shunt_resistors.size()));
    }
    for (size_t i = 0; i < sweep_config_.shunt_resistors.size(); ++i) {
        if (!(sweep_config_.shunt_resistors[i] > 0.0f)) {
            throw ConfigException("sweep.shunt_resistors[" + std::to_string(i) + "] must be > 0");
        }
    }
}
