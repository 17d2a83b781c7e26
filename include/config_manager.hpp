#pragma once
#include <stdint.h>
#include <vector>
#include <string>

struct LoggingConfig {
    std::string log_level;
    std::string log_file;
    bool flush_on_write;
};

// Serial link to the DAC/ADC microcontroller
struct SerialConfig {
    std::string port;
    uint32_t baud;
    uint32_t open_settle_ms;          // MCU resets when the port opens
    uint32_t release_retry_delay_ms;
};

// Request/response discipline shared by the serial controllers
struct ProtocolConfig {
    uint32_t timeout_ms;
    uint8_t max_retries;
    uint32_t poll_interval_ms;
    bool verbose;
};

// Optical power meter link
struct OpmConfig {
    std::string transport;            // "tcp" or "serial"
    std::string host;
    uint16_t tcp_port;
    std::string serial_port;
    uint32_t serial_baud;
    uint32_t timeout_ms;
    uint8_t max_retries;
    uint32_t retry_delay_ms;
    uint32_t inter_channel_delay_ms;
    uint32_t unit_switch_settle_ms;
    bool use_batched_read;
};

struct SweepConfig {
    uint32_t settle_ms;
    float vref;
    std::vector<float> shunt_resistors;
    int dac_channel;
    int adc_channel;
    int opm_channel;
};

class ConfigManager {
public:
    // Defaults only
    ConfigManager();
    // Defaults overlaid with the JSON file; throws ConfigException on a malformed file
    explicit ConfigManager(const char* config_file);
    ~ConfigManager();

    LoggingConfig getLoggingConfig() const;
    SerialConfig getSerialConfig() const;
    ProtocolConfig getProtocolConfig() const;
    OpmConfig getOpmConfig() const;
    SweepConfig getSweepConfig() const;

    // Parse a JSON document held in memory; same rules as the file loader
    void loadFromString(const std::string& json);

    bool isLoadedFromFile() const { return loaded_from_file_; }
    const std::string& getSourcePath() const { return source_path_; }

    static std::vector<float> defaultShuntResistors();

private:
    LoggingConfig logging_config_;
    SerialConfig serial_config_;
    ProtocolConfig protocol_config_;
    OpmConfig opm_config_;
    SweepConfig sweep_config_;
    bool loaded_from_file_ = false;
    std::string source_path_;

    void initializeDefaults();
    void loadConfig(const char* config_file);
    void validate() const;
};
