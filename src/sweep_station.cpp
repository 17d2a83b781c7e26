#include "../include/sweep_station.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/serial_transport.hpp"
#include "../include/tcp_transport.hpp"
#include <cstdio>

SweepStation::SweepStation() {}

SweepStation::~SweepStation() {
    shutdown();
    destroy();
}

void SweepStation::destroy() {
    delete engine_;
    delete power_meter_;
    delete adc_;
    delete dac_;
    delete serial_protocol_;
    delete opm_transport_;
    delete serial_transport_;
    delete fault_handler_;
    delete config_;
    engine_ = nullptr;
    power_meter_ = nullptr;
    adc_ = nullptr;
    dac_ = nullptr;
    serial_protocol_ = nullptr;
    opm_transport_ = nullptr;
    serial_transport_ = nullptr;
    fault_handler_ = nullptr;
    config_ = nullptr;
}

void SweepStation::setup(const char* config_path) {
    destroy();
    opm_attempted_ = false;

    config_ = config_path ? new ConfigManager(config_path) : new ConfigManager();
    Logger::begin(config_->getLoggingConfig());
    if (config_->isLoadedFromFile()) {
        Logger::info("[STATION] Configuration loaded from %s", config_->getSourcePath().c_str());
    } else {
        Logger::info("[STATION] Using default configuration");
    }

    fault_handler_ = new FaultHandler();

    SerialConfig serial_cfg = config_->getSerialConfig();
    ProtocolConfig protocol_cfg = config_->getProtocolConfig();
    SweepConfig sweep_cfg = config_->getSweepConfig();
    OpmConfig opm_cfg = config_->getOpmConfig();

    // DAC and ADC sit behind the same MCU port and share one protocol instance
    serial_transport_ = new SerialTransport(serial_cfg);
    serial_protocol_ = new CommandProtocol(*serial_transport_, protocol_cfg, fault_handler_, "MCU");
    dac_ = new DacController(*serial_protocol_, fault_handler_);
    adc_ = new AdcController(*serial_protocol_, sweep_cfg.shunt_resistors, fault_handler_);

    if (opm_cfg.transport == "serial") {
        SerialConfig opm_serial;
        opm_serial.port = opm_cfg.serial_port;
        opm_serial.baud = opm_cfg.serial_baud;
        opm_serial.open_settle_ms = 0;
        opm_serial.release_retry_delay_ms = serial_cfg.release_retry_delay_ms;
        opm_transport_ = new SerialTransport(opm_serial);
    } else {
        opm_transport_ = new TcpTransport(opm_cfg.host, opm_cfg.tcp_port);
    }
    power_meter_ = new PowerMeter(*opm_transport_, opm_cfg, fault_handler_);

    engine_ = new SweepEngine(dac_, adc_, power_meter_, sweep_cfg, fault_handler_);

    Logger::info("[STATION] MCU on %s, power meter via %s", serial_transport_->description().c_str(),
                 opm_transport_->description().c_str());
}

void SweepStation::shutdown() {
    if (power_meter_ && power_meter_->isOpen()) power_meter_->end();
    if (serial_protocol_ && serial_protocol_->isOpen()) {
        serial_protocol_->close();
        Logger::info("[STATION] MCU link closed");
    }
}

void SweepStation::connectSerial() {
    if (!serial_protocol_) throw PortUnavailableException("station not set up");
    if (serial_protocol_->isOpen()) return;
    try {
        dac_->connect();
    } catch (const PortUnavailableException& e) {
        fault_handler_->recordFault(FaultType::PORT_UNAVAILABLE, "MCU", e.what());
        throw;
    }
    Logger::info("[STATION] MCU link open on %s", serial_transport_->description().c_str());
}

bool SweepStation::isSerialConnected() const {
    return serial_protocol_ && serial_protocol_->isOpen();
}

bool SweepStation::connectPowerMeter() {
    if (!power_meter_) return false;
    if (power_meter_->isOpen()) return true;
    // One attempt per session; an unreachable meter would otherwise stall every command
    if (opm_attempted_) return false;
    opm_attempted_ = true;

    try {
        if (!power_meter_->begin()) {
            Logger::warn("[STATION] Power meter did not identify itself");
        }
    } catch (const PortUnavailableException& e) {
        Logger::warn("[STATION] Power meter unavailable: %s", e.what());
        fault_handler_->recordFault(FaultType::PORT_UNAVAILABLE, "OPM", e.what());
        return false;
    }
    return power_meter_->isOpen();
}

bool SweepStation::isPowerMeterConnected() const {
    return power_meter_ && power_meter_->isOpen();
}

void SweepStation::getStatistics(char* outBuf, size_t outBufSize) const {
    if (!outBuf || outBufSize == 0) return;
    uint16_t total = 0;
    uint16_t recovered = 0;
    float rate = 0.0f;
    if (fault_handler_) fault_handler_->getFaultStats(total, recovered, rate);
    snprintf(outBuf, outBufSize,
             "MCU: %s (sent=%u, received=%u, timeouts=%u) | OPM: %s | Faults: %u (recovered %u, %.1f%%)%s",
             isSerialConnected() ? "open" : "closed",
             serial_protocol_ ? (unsigned)serial_protocol_->requestsSent() : 0u,
             serial_protocol_ ? (unsigned)serial_protocol_->responsesReceived() : 0u,
             serial_protocol_ ? (unsigned)serial_protocol_->timeouts() : 0u,
             isPowerMeterConnected() ? power_meter_->identity().c_str() : "not connected",
             (unsigned)total, (unsigned)recovered, rate,
             (fault_handler_ && fault_handler_->isDegradedMode()) ? " | DEGRADED" : "");
}
