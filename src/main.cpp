#include <ArduinoJson.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "../include/command_parser.hpp"
#include "../include/curve_analysis.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/sweep_station.hpp"

static SweepStation station;
static SweepEngine* volatile sigint_engine = nullptr;

static void onSigint(int) {
    SweepEngine* engine = sigint_engine;
    if (engine) engine->requestStop();
}

static void printJson(const JsonDocument& doc) {
    std::string out;
    serializeJsonPretty(doc, out);
    printf("%s\n", out.c_str());
    fflush(stdout);
}

static void printHelp() {
    printf("\n========== AVAILABLE COMMANDS ==========\n");
    printf("CHECK                          - COMM_OK round trip to the MCU\n");
    printf("SET <ch> <code>                - Set DAC channel to a code (0-4095)\n");
    printf("SETV <ch> <volts>              - Set DAC channel to a voltage (0-vref)\n");
    printf("SETALL <code>                  - Set every DAC channel\n");
    printf("READ <ch>                      - ADC voltage\n");
    printf("CURRENT <ch>                   - ADC current through the shunt\n");
    printf("RAW <ch>                       - ADC raw conversion code\n");
    printf("TESTADC                        - ADC bus check\n");
    printf("POWER <ch>                     - Optical power in the current unit\n");
    printf("POWERMW <ch>                   - Optical power in mW\n");
    printf("POWERALL                       - Optical power on every channel\n");
    printf("UNIT <ch> [DBM|WATT]           - Show or set the power unit\n");
    printf("WAV <ch> [nm]                  - Show or set the wavelength\n");
    printf("RANGE <ch> [AUTO|<dbm>]        - Show or set the power range\n");
    printf("SWEEP <ch> <start> <end> <n>   - Single-channel DAC sweep\n");
    printf("SWEEPALL <s0..s3> <e0..e3> <n> - All DAC channels together\n");
    printf("INDEP <ch:start:end:n> ...     - Independent per-channel schedules\n");
    printf("IV <start> <end> <n>           - IV curve with optical power\n");
    printf("IVQUICK <start> <end> <n>      - IV curve, electrical only\n");
    printf("STATS                          - Link and fault statistics\n");
    printf("HELP or ?                      - Show this help menu\n");
    printf("=========================================\n\n");
}

static bool requirePowerMeter() {
    if (station.connectPowerMeter()) return true;
    Logger::error("[CMD] Power meter not reachable");
    return false;
}

static bool requireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() >= count + 1) return true;
    Logger::error("[CMD] Usage: %s", usage);
    return false;
}

static void printAck(const char* what, const CommandAck& ack) {
    StaticJsonDocument<256> doc;
    doc["command"] = what;
    doc["accepted"] = ack.accepted;
    if (ack.has_response) {
        doc["response"] = ack.response.c_str();
        doc["device_ok"] = ack.device_ok;
    } else {
        doc["response"] = (const char*)nullptr;
    }
    printJson(doc);
}

static void printSteps(const SweepResult& result) {
    size_t capacity = JSON_OBJECT_SIZE(4) + JSON_ARRAY_SIZE(result.steps().size()) + 256;
    for (const StepRecord& r : result.steps()) capacity += JSON_ARRAY_SIZE(r.codes.size());
    DynamicJsonDocument doc(capacity);
    doc["status"] = sweepStatusToString(result.status());
    doc["failed_writes"] = result.failedWrites();
    JsonArray steps = doc.createNestedArray("codes");
    for (const StepRecord& r : result.steps()) {
        JsonArray row = steps.createNestedArray();
        for (int code : r.codes) row.add(code);
    }
    printJson(doc);
}

static void printIvResult(const SweepResult& result) {
    std::vector<std::pair<std::string, std::vector<float>>> cols = result.columns();
    size_t capacity = JSON_OBJECT_SIZE(8) + JSON_OBJECT_SIZE(cols.size()) + JSON_OBJECT_SIZE(8) + 1024;
    for (const auto& col : cols) capacity += JSON_ARRAY_SIZE(col.second.size());

    DynamicJsonDocument doc(capacity);
    doc["status"] = sweepStatusToString(result.status());
    doc["missing_voltages"] = result.missingVoltages();
    doc["missing_optical"] = result.missingOptical();

    JsonObject data = doc.createNestedObject("data");
    for (const auto& col : cols) {
        JsonArray values = data.createNestedArray(col.first);
        for (float v : col.second) values.add(v);
    }

    IvAnalysis analysis;
    if (CurveAnalysis::analyzeIvCurve(result.samples(), analysis)) {
        JsonObject a = doc.createNestedObject("analysis");
        a["max_power"] = analysis.max_power;
        a["max_power_voltage"] = analysis.max_power_voltage;
        a["max_power_current"] = analysis.max_power_current;
        a["max_power_index"] = analysis.max_power_index;
        a["open_circuit_voltage"] = analysis.open_circuit_voltage;
        a["short_circuit_current"] = analysis.short_circuit_current;
    }
    printJson(doc);
}

static void printReadings(const char* what, const char* unit, const std::vector<ChannelReading>& readings) {
    StaticJsonDocument<512> doc;
    doc["command"] = what;
    doc["unit"] = unit;
    JsonArray values = doc.createNestedArray("values");
    for (const ChannelReading& r : readings) {
        if (r.valid) values.add(r.value);
        else values.add((const char*)nullptr);
    }
    printJson(doc);
}

static bool processCommand(const std::vector<std::string>& words) {
    if (words.empty()) return true;
    const std::string cmd = CommandParser::toUpper(words[0]);
    const SweepConfig sweep_cfg = station.config()->getSweepConfig();
    int ch = 0;
    int code = 0;
    float value = 0.0f;

    if (cmd == "HELP" || cmd == "?") {
        printHelp();
        return true;
    }
    if (cmd == "STATS") {
        char buf[256];
        station.getStatistics(buf, sizeof(buf));
        printf("%s\n", buf);
        return true;
    }

    // MCU commands
    if (cmd == "CHECK") {
        station.connectSerial();
        bool ok = station.dac()->checkCommunication(station.config()->getProtocolConfig().timeout_ms);
        printf("%s\n", ok ? "COMM_OK" : "NO RESPONSE");
        return ok;
    }
    if (cmd == "SET") {
        if (!requireArgs(words, 2, "SET <ch> <code>")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !CommandParser::parseInt(words[2], code)) return false;
        station.connectSerial();
        CommandAck ack = station.dac()->setCode(ch, code);
        printAck("SET", ack);
        return ack.accepted;
    }
    if (cmd == "SETV") {
        if (!requireArgs(words, 2, "SETV <ch> <volts>")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !CommandParser::parseFloat(words[2], value)) return false;
        station.connectSerial();
        CommandAck ack = station.dac()->setVoltage(ch, value, sweep_cfg.vref);
        printAck("SETV", ack);
        return ack.accepted;
    }
    if (cmd == "SETALL") {
        if (!requireArgs(words, 1, "SETALL <code>")) return false;
        if (!CommandParser::parseInt(words[1], code)) return false;
        station.connectSerial();
        CommandAck ack = station.dac()->setAll(code);
        printAck("SETALL", ack);
        return ack.accepted;
    }
    if (cmd == "READ" || cmd == "CURRENT") {
        if (!requireArgs(words, 1, "READ|CURRENT <ch|ALL>")) return false;
        station.connectSerial();
        uint32_t timeout = station.config()->getProtocolConfig().timeout_ms;
        if (CommandParser::toUpper(words[1]) == "ALL") {
            if (cmd == "READ") printReadings("READ", "V", station.adc()->readAllVoltages(timeout));
            else printReadings("CURRENT", "A", station.adc()->readAllCurrents(timeout));
            return true;
        }
        if (!CommandParser::parseInt(words[1], ch)) return false;
        bool ok = (cmd == "READ") ? station.adc()->readVoltage(ch, value) : station.adc()->readCurrent(ch, value);
        if (ok) printf("%s %d: %.6f %s\n", cmd.c_str(), ch, value, cmd == "READ" ? "V" : "A");
        else printf("%s %d: no reading\n", cmd.c_str(), ch);
        return ok;
    }
    if (cmd == "RAW") {
        if (!requireArgs(words, 1, "RAW <ch>")) return false;
        if (!CommandParser::parseInt(words[1], ch)) return false;
        station.connectSerial();
        int raw = 0;
        bool ok = station.adc()->readRaw(ch, raw, station.config()->getProtocolConfig().timeout_ms);
        if (ok) printf("RAW %d: %d\n", ch, raw);
        else printf("RAW %d: no reading\n", ch);
        return ok;
    }
    if (cmd == "TESTADC") {
        station.connectSerial();
        std::string config_reg;
        bool ok = station.adc()->testAdc(config_reg, station.config()->getProtocolConfig().timeout_ms);
        printf("ADC bus: %s%s\n", ok ? "OK, config " : "FAILED", ok ? config_reg.c_str() : "");
        return ok;
    }

    // Power meter commands
    if (cmd == "POWER" || cmd == "POWERMW") {
        if (!requireArgs(words, 1, "POWER|POWERMW <ch>")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !requirePowerMeter()) return false;
        PowerMeter* opm = station.powerMeter();
        bool ok = (cmd == "POWER") ? opm->getPower(ch, value) : opm->getPowerMilliwatt(ch, value);
        if (ok && cmd == "POWER") printf("POWER %d: %g %s\n", ch, value, unitModeToString(opm->getUnit(ch)));
        else if (ok) printf("POWERMW %d: %g mW\n", ch, value);
        else printf("%s %d: no reading\n", cmd.c_str(), ch);
        return ok;
    }
    if (cmd == "POWERALL") {
        if (!requirePowerMeter()) return false;
        std::vector<float> powers = station.powerMeter()->getAllPowers();
        StaticJsonDocument<512> doc;
        doc["command"] = "POWERALL";
        doc["identity"] = station.powerMeter()->identity().c_str();
        JsonArray values = doc.createNestedArray("values");
        for (float p : powers) values.add(p);
        printJson(doc);
        return true;
    }
    if (cmd == "UNIT") {
        if (!requireArgs(words, 1, "UNIT <ch> [DBM|WATT]")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !requirePowerMeter()) return false;
        PowerMeter* opm = station.powerMeter();
        if (words.size() > 2) {
            std::string unit = CommandParser::toUpper(words[2]);
            if (unit != "DBM" && unit != "WATT") {
                Logger::error("[CMD] Unit must be DBM or WATT");
                return false;
            }
            if (!opm->setUnit(ch, unit == "WATT" ? UnitMode::WATT : UnitMode::DBM)) return false;
        }
        printf("UNIT %d: %s\n", ch, unitModeToString(opm->getUnit(ch)));
        return true;
    }
    if (cmd == "WAV") {
        if (!requireArgs(words, 1, "WAV <ch> [nm]")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !requirePowerMeter()) return false;
        PowerMeter* opm = station.powerMeter();
        if (words.size() > 2) {
            if (!CommandParser::parseFloat(words[2], value) || !opm->setWavelength(ch, value)) return false;
        }
        printf("WAV %d: %.3f nm\n", ch, opm->getWavelength(ch));
        return true;
    }
    if (cmd == "RANGE") {
        if (!requireArgs(words, 1, "RANGE <ch> [AUTO|<dbm>]")) return false;
        if (!CommandParser::parseInt(words[1], ch) || !requirePowerMeter()) return false;
        PowerMeter* opm = station.powerMeter();
        if (words.size() > 2) {
            bool ok;
            if (CommandParser::toUpper(words[2]) == "AUTO") ok = opm->setAutoRange(ch, true);
            else ok = CommandParser::parseFloat(words[2], value) && opm->setRange(ch, value);
            if (!ok) return false;
        }
        printf("RANGE %d: %s\n", ch, opm->getRange(ch).c_str());
        return true;
    }

    // Sweeps
    SweepEngine* engine = station.engine();
    if (cmd == "SWEEP") {
        if (!requireArgs(words, 4, "SWEEP <ch> <start> <end> <steps>")) return false;
        int start = 0, end = 0, steps = 0;
        if (!CommandParser::parseInt(words[1], ch) || !CommandParser::parseInt(words[2], start) ||
            !CommandParser::parseInt(words[3], end) || !CommandParser::parseInt(words[4], steps)) return false;
        station.connectSerial();
        SweepResult result = engine->sweepChannel(ch, start, end, steps);
        printSteps(result);
        return result.status() != SweepStatus::REJECTED;
    }
    if (cmd == "SWEEPALL") {
        if (!requireArgs(words, 9, "SWEEPALL <s0> <s1> <s2> <s3> <e0> <e1> <e2> <e3> <steps>")) return false;
        std::vector<int> starts(4), ends(4);
        int steps = 0;
        for (int i = 0; i < 4; ++i) {
            if (!CommandParser::parseInt(words[1 + i], starts[i]) ||
                !CommandParser::parseInt(words[5 + i], ends[i])) return false;
        }
        if (!CommandParser::parseInt(words[9], steps)) return false;
        station.connectSerial();
        SweepResult result = engine->sweepAllChannels(starts, ends, steps);
        printSteps(result);
        return result.status() != SweepStatus::REJECTED;
    }
    if (cmd == "INDEP") {
        if (!requireArgs(words, 1, "INDEP <ch>:<start>:<end>:<steps> ...")) return false;
        std::vector<SweepSchedule> schedules;
        for (size_t i = 1; i < words.size(); ++i) {
            SweepSchedule s;
            if (!CommandParser::parseSchedule(words[i], s)) {
                Logger::error("[CMD] Bad schedule '%s', expected ch:start:end:steps", words[i].c_str());
                return false;
            }
            schedules.push_back(s);
        }
        station.connectSerial();
        SweepResult result = engine->sweepIndependent(schedules);
        printSteps(result);
        return result.status() != SweepStatus::REJECTED;
    }
    if (cmd == "IV" || cmd == "IVQUICK") {
        if (!requireArgs(words, 3, "IV|IVQUICK <start> <end> <steps>")) return false;
        int start = 0, end = 0, steps = 0;
        if (!CommandParser::parseInt(words[1], start) || !CommandParser::parseInt(words[2], end) ||
            !CommandParser::parseInt(words[3], steps)) return false;
        station.connectSerial();
        bool with_optical = (cmd == "IV");
        if (with_optical && !requirePowerMeter()) return false;
        engine->setStepCallback([](int step, int total) {
            Logger::info("[IV] Step %d/%d", step, total);
        });
        SweepResult result = with_optical
            ? engine->sweepIvCurve(sweep_cfg.dac_channel, sweep_cfg.adc_channel, start, end, steps,
                                   sweep_cfg.opm_channel)
            : engine->sweepIvQuick(sweep_cfg.dac_channel, sweep_cfg.adc_channel, start, end, steps);
        engine->setStepCallback(nullptr);
        printIvResult(result);
        return result.status() != SweepStatus::REJECTED;
    }

    printf("[CMD] Unknown command: %s (type HELP for commands)\n", cmd.c_str());
    return false;
}

static void usage(const char* argv0) {
    printf("Usage: %s [-c config.json] [COMMAND args...]\n", argv0);
    printf("Without a command, commands are read from stdin one per line.\n");
}

int main(int argc, char** argv) {
    const char* config_path = nullptr;
    int first = 1;
    while (first < argc && argv[first][0] == '-') {
        std::string opt = argv[first];
        if ((opt == "-c" || opt == "--config") && first + 1 < argc) {
            config_path = argv[first + 1];
            first += 2;
        } else if (opt == "-h" || opt == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    try {
        station.setup(config_path);
    } catch (const ConfigException& e) {
        fprintf(stderr, "Configuration error: %s\n", e.what());
        return 1;
    }

    sigint_engine = station.engine();
    std::signal(SIGINT, onSigint);

    int rc = 0;
    try {
        if (first < argc) {
            std::vector<std::string> words(argv + first, argv + argc);
            rc = processCommand(words) ? 0 : 1;
        } else {
            printf("OptoSweep ready. Type HELP for commands.\n");
            std::string line;
            while (std::getline(std::cin, line)) {
                std::vector<std::string> words = CommandParser::splitWords(line);
                std::string first_word = words.empty() ? "" : CommandParser::toUpper(words[0]);
                if (first_word == "QUIT" || first_word == "EXIT") break;
                if (!processCommand(words) && !words.empty()) {
                    Logger::warn("[CMD] '%s' failed", line.c_str());
                }
            }
        }
    } catch (const PortUnavailableException& e) {
        Logger::error("[MAIN] %s", e.what());
        rc = 2;
    }

    std::signal(SIGINT, SIG_DFL);
    sigint_engine = nullptr;
    station.shutdown();
    Logger::shutdown();
    return rc;
}
