/**
 * Power meter queries: identity table, retries, unit switching and restore.
 */

#include "../include/exceptions.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include "../include/power_meter.hpp"
#include "fake_transport.hpp"
#include "test_harness.hpp"
#include <cmath>
#include <cstring>

static OpmConfig testConfig() {
    OpmConfig cfg;
    cfg.transport = "tcp";
    cfg.host = "127.0.0.1";
    cfg.tcp_port = 5025;
    cfg.serial_port = "";
    cfg.serial_baud = 9600;
    cfg.timeout_ms = 20;
    cfg.max_retries = 2;
    cfg.retry_delay_ms = 0;
    cfg.inter_channel_delay_ms = 0;
    cfg.unit_switch_settle_ms = 0;
    cfg.use_batched_read = false;
    return cfg;
}

static std::string floatBlock(const std::vector<float>& values) {
    std::string payload;
    for (float v : values) {
        uint32_t bits = 0;
        memcpy(&bits, &v, sizeof(bits));
        for (int i = 0; i < 4; ++i) payload += (char)((bits >> (8 * i)) & 0xFF);
    }
    std::string len = std::to_string(payload.size());
    return "#" + std::to_string(len.size()) + len + payload + "\n";
}

bool test_identity_table() {
    printTestHeader("TEST 1: Channel count from *IDN?");
    bool ok = check(PowerMeter::channelCountForIdentity("Keysight Technologies,N7745C,MY123,1.0") == 8, "N7745");
    ok &= check(PowerMeter::channelCountForIdentity("Keysight Technologies,N7744C,MY123,1.0") == 8, "N7744");
    ok &= check(PowerMeter::channelCountForIdentity("Keysight,8164B,MY61C00155,2.0") == 4, "MY61C00155");
    ok &= check(PowerMeter::channelCountForIdentity("Agilent,8163B,DE123,1.0") == 2, "unknown model");
    ok &= check(PowerMeter::channelCountForIdentity("") == 2, "empty identity");

    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Keysight Technologies,N7745C,MY123,1.0");
    ok &= check(opm.begin(), "begin identifies");
    ok &= check(opm.channelCount() == 8, "8 channels");
    ok &= check(opm.isValidChannel(1) && opm.isValidChannel(8), "1..8 valid");
    ok &= check(!opm.isValidChannel(0) && !opm.isValidChannel(9), "0 and 9 invalid");

    FakeTransport silent;
    PowerMeter unknown(silent, testConfig());
    ok &= check(!unknown.begin(), "silent meter fails identification");
    ok &= check(unknown.channelCount() == 2 && unknown.isOpen(), "open with 2 channels");
    return ok;
}

bool test_open_failure_throws() {
    printTestHeader("TEST 2: Unreachable meter raises PortUnavailableException");
    FakeTransport transport;
    transport.setOpenFails(true);
    PowerMeter opm(transport, testConfig());
    bool thrown = false;
    try {
        opm.begin();
    } catch (const PortUnavailableException& e) {
        thrown = (e.code() == ERR_PORT_UNAVAILABLE);
    }
    return check(thrown, "exception raised");
}

bool test_get_power_retry() {
    printTestHeader("TEST 3: getPower retries on silence and garbage");
    FakeTransport transport;
    FaultHandler faults;
    PowerMeter opm(transport, testConfig(), &faults);
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    transport.respond("read1:pow?", FakeTransport::SILENT);
    transport.respond("read1:pow?", "-1.25E+01");
    float p = 0.0f;
    bool ok = check(opm.getPower(1, p) && nearlyEqual(p, -12.5f), "value on second attempt");
    ok &= check(transport.writes().size() == 2, "two attempts");

    transport.clearWrites();
    transport.respond("read2:pow?", "garbage");
    transport.respond("read2:pow?", "garbage");
    transport.respond("read2:pow?", "garbage");
    p = 99.0f;
    ok &= check(!opm.getPower(2, p), "fails after 1 + 2 retries");
    ok &= check(transport.writes().size() == 3, "three attempts");
    ok &= check(p == 99.0f, "output untouched");
    ok &= check(faults.getFaultCount(FaultType::PARSE_ERROR) == 3, "parse faults recorded");

    transport.clearWrites();
    ok &= check(!opm.getPower(0, p) && !opm.getPower(3, p), "channels outside 1..2 rejected");
    ok &= check(transport.writes().empty(), "no I/O for rejected channels");
    return ok;
}

bool test_milliwatt_switches_and_restores() {
    printTestHeader("TEST 4: getPowerMilliwatt switches to Watt and back");
    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    transport.respond("sens1:pow:unit?", "0");
    transport.respond("read1:pow?", "0.00125");
    float mw = 0.0f;
    bool ok = check(opm.getPowerMilliwatt(1, mw) && nearlyEqual(mw, 1.25f), "1.25 mW");

    const std::vector<std::string>& w = transport.writes();
    ok &= check(w.size() == 4, "query, switch, read, restore");
    ok &= check(w.size() == 4 && w[1] == "sens1:pow:unit 1", "switched to Watt");
    ok &= check(w.size() == 4 && w[3] == "sens1:pow:unit 0", "restored to dBm");
    return ok;
}

bool test_milliwatt_restores_on_failure() {
    printTestHeader("TEST 5: dBm is restored even when the Watt read fails");
    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    transport.respond("sens2:pow:unit?", "0");
    float mw = -5.0f;
    bool ok = check(!opm.getPowerMilliwatt(2, mw), "read failed");
    ok &= check(mw == -5.0f, "output untouched");
    const std::vector<std::string>& w = transport.writes();
    ok &= check(!w.empty() && w.back() == "sens2:pow:unit 0", "last command restores dBm");

    int switches = 0;
    for (const std::string& cmd : w) {
        if (cmd == "sens2:pow:unit 1") switches++;
    }
    ok &= check(switches == 1, "switched exactly once");
    return ok;
}

bool test_milliwatt_already_watt() {
    printTestHeader("TEST 6: A channel already in Watt is left alone");
    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    transport.respond("sens1:pow:unit?", "1");
    transport.respond("read1:pow?", "2E-3");
    float mw = 0.0f;
    bool ok = check(opm.getPowerMilliwatt(1, mw) && nearlyEqual(mw, 2.0f), "2 mW");
    for (const std::string& cmd : transport.writes()) {
        ok &= check(cmd.find("pow:unit ") == std::string::npos, "no unit write");
    }
    return ok;
}

bool test_unit_fallback_and_dbm() {
    printTestHeader("TEST 7: Unit query falls back to dBm; getPowerDbm converts Watt");
    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();

    transport.respond("sens1:pow:unit?", "what");
    bool ok = check(opm.getUnit(1) == UnitMode::DBM, "garbage -> dBm");
    ok &= check(opm.getUnit(2) == UnitMode::DBM, "silence -> dBm");
    transport.respond("sens1:pow:unit?", "1");
    ok &= check(opm.getUnit(1) == UnitMode::WATT, "1 -> Watt");

    transport.respond("sens1:pow:unit?", "1");
    transport.respond("read1:pow?", "0.001");
    float dbm = 0.0f;
    ok &= check(opm.getPowerDbm(1, dbm) && nearlyEqual(dbm, 0.0f, 1e-4f), "1 mW is 0 dBm");

    transport.respond("sens2:pow:unit?", "0");
    transport.respond("read2:pow?", "-30.5");
    ok &= check(opm.getPowerDbm(2, dbm) && nearlyEqual(dbm, -30.5f), "dBm passed through");
    return ok;
}

bool test_wavelength_and_range() {
    printTestHeader("TEST 8: Wavelength and range commands");
    FakeTransport transport;
    PowerMeter opm(transport, testConfig());
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    bool ok = check(opm.setWavelength(1, 1550.0f), "wavelength set");
    ok &= check(transport.writes().back() == "sens1:pow:wav 1550nm", "wavelength wire format");
    ok &= check(!opm.setWavelength(1, 0.0f), "zero wavelength refused");

    transport.respond("sens1:pow:wav?", "1.55000000E-006");
    ok &= check(nearlyEqual(opm.getWavelength(1), 1550.0f, 0.01f), "metres reported in nm");
    ok &= check(opm.getWavelength(2) == 0.0f, "silence -> 0");

    transport.clearWrites();
    ok &= check(opm.setRange(1, -10.0f), "range set");
    ok &= check(transport.writes().size() == 2, "two writes");
    ok &= check(transport.writes().size() == 2 && transport.writes()[0] == "sens1:pow:rang:auto 0",
                "auto range turned off first");
    ok &= check(transport.writes().size() == 2 && transport.writes()[1] == "sens1:pow:rang -10.0dbm",
                "range wire format");

    transport.respond("sens1:pow:rang:auto?", "1");
    ok &= check(opm.getRange(1) == "Auto", "auto range");
    transport.respond("sens1:pow:rang:auto?", "0");
    transport.respond("sens1:pow:rang?", "-20");
    ok &= check(opm.getRange(1) == "-20.0 dBm", "fixed range");
    transport.respond("sens2:pow:rang:auto?", "0");
    ok &= check(opm.getRange(2) == "Error", "failed range query");
    ok &= check(opm.getRange(5) == "Error", "invalid channel");
    return ok;
}

bool test_get_all_sequential() {
    printTestHeader("TEST 9: getAllPowers is positional with NaN for failures");
    FakeTransport transport;
    OpmConfig cfg = testConfig();
    cfg.max_retries = 0;
    PowerMeter opm(transport, cfg);
    transport.respond("*IDN?", "Keysight,8164B,MY61C00155,2.0");
    opm.begin();

    transport.respond("read1:pow?", "-10");
    transport.respond("read2:pow?", "-11");
    transport.respond("read4:pow?", "-13");
    std::vector<float> powers = opm.getAllPowers();
    bool ok = check(powers.size() == 4, "one value per channel");
    ok &= check(powers.size() == 4 && nearlyEqual(powers[0], -10.0f) && nearlyEqual(powers[1], -11.0f),
                "channels 1 and 2");
    ok &= check(powers.size() == 4 && std::isnan(powers[2]), "channel 3 NaN");
    ok &= check(powers.size() == 4 && nearlyEqual(powers[3], -13.0f), "channel 4");
    return ok;
}

bool test_get_all_batched() {
    printTestHeader("TEST 10: Batched read and its fallback");
    FakeTransport transport;
    OpmConfig cfg = testConfig();
    cfg.use_batched_read = true;
    cfg.max_retries = 0;
    PowerMeter opm(transport, cfg);
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();

    transport.respond("read:pow:all?", floatBlock(std::vector<float>{-7.5f, -8.25f}), true);
    std::vector<float> powers = opm.getAllPowers();
    bool ok = check(powers.size() == 2 && powers[0] == -7.5f && powers[1] == -8.25f, "decoded block");

    transport.clearWrites();
    transport.respond("read:pow:all?", "#13AB\n", true);
    transport.respond("read1:pow?", "-1");
    transport.respond("read2:pow?", "-2");
    powers = opm.getAllPowers();
    ok &= check(powers.size() == 2 && nearlyEqual(powers[0], -1.0f) && nearlyEqual(powers[1], -2.0f),
                "fell back to per-channel reads");

    transport.clearWrites();
    transport.respond("read:pow:all?", floatBlock(std::vector<float>{-7.5f, -8.25f, -9.0f}), true);
    transport.respond("read1:pow?", "-3");
    transport.respond("read2:pow?", "-4");
    powers = opm.getAllPowers();
    ok &= check(powers.size() == 2 && nearlyEqual(powers[0], -3.0f) && nearlyEqual(powers[1], -4.0f),
                "three values for two channels falls back");
    ok &= check(transport.writes().size() == 3, "batched query then two channel reads");

    std::vector<float> values;
    ok &= check(!PowerMeter::decodeFloatPayload("12345", values), "payload not a multiple of 4");
    return ok;
}

bool test_milliwatt_switch_refused() {
    printTestHeader("TEST 11: No mW reading when the switch to Watt fails");
    FakeTransport transport;
    FaultHandler faults;
    PowerMeter opm(transport, testConfig(), &faults);
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();
    transport.clearWrites();

    transport.refuseWrite("sens1:pow:unit 1");
    transport.respond("sens1:pow:unit?", "0");
    transport.respondAlways("read1:pow?", "-10.0");
    float mw = 42.0f;
    bool ok = check(!opm.getPowerMilliwatt(1, mw), "read reported as failed");
    ok &= check(mw == 42.0f, "dBm value not passed off as mW");
    for (const std::string& cmd : transport.writes()) {
        ok &= check(cmd != "read1:pow?", "no power read while still in dBm");
        ok &= check(cmd != "sens1:pow:unit 0", "nothing to restore");
    }
    ok &= check(faults.getTotalFaults() >= 1, "fault recorded");
    return ok;
}

bool test_signed_integer_replies() {
    printTestHeader("TEST 12: Unit and auto-range replies in +1 / +0 form");
    FakeTransport transport;
    FaultHandler faults;
    PowerMeter opm(transport, testConfig(), &faults);
    transport.respond("*IDN?", "Agilent,8163B,DE123,1.0");
    opm.begin();

    transport.respond("sens1:pow:unit?", "+1");
    bool ok = check(opm.getUnit(1) == UnitMode::WATT, "+1 -> Watt");
    transport.respond("sens1:pow:unit?", "+0");
    ok &= check(opm.getUnit(1) == UnitMode::DBM, "+0 -> dBm");
    transport.respond("sens1:pow:unit?", " 1 ");
    ok &= check(opm.getUnit(1) == UnitMode::WATT, "padded 1 -> Watt");
    ok &= check(faults.getFaultCount(FaultType::PARSE_ERROR) == 0, "no parse faults");
    transport.respond("sens1:pow:unit?", "1.5");
    ok &= check(opm.getUnit(1) == UnitMode::DBM, "1.5 -> dBm");
    ok &= check(faults.getFaultCount(FaultType::PARSE_ERROR) == 1, "1.5 is a parse fault");

    transport.respond("sens2:pow:rang:auto?", "+1");
    ok &= check(opm.isAutoRange(2), "+1 -> auto range");
    transport.respond("sens2:pow:rang:auto?", "+0");
    ok &= check(!opm.isAutoRange(2), "+0 -> fixed range");

    transport.clearWrites();
    transport.respond("sens1:pow:unit?", "+1");
    transport.respond("read1:pow?", "5E-4");
    float mw = 0.0f;
    ok &= check(opm.getPowerMilliwatt(1, mw) && nearlyEqual(mw, 0.5f), "0.5 mW");
    for (const std::string& cmd : transport.writes()) {
        ok &= check(cmd.find("pow:unit ") == std::string::npos, "Watt channel left alone");
    }
    return ok;
}

int main() {
    Logger::setLevel(Logger::ERROR);

    printTestResult("Identity Table", test_identity_table());
    printTestResult("Open Failure Throws", test_open_failure_throws());
    printTestResult("Get Power Retry", test_get_power_retry());
    printTestResult("Milliwatt Switches And Restores", test_milliwatt_switches_and_restores());
    printTestResult("Milliwatt Restores On Failure", test_milliwatt_restores_on_failure());
    printTestResult("Milliwatt Already Watt", test_milliwatt_already_watt());
    printTestResult("Unit Fallback And dBm", test_unit_fallback_and_dbm());
    printTestResult("Wavelength And Range", test_wavelength_and_range());
    printTestResult("Get All Sequential", test_get_all_sequential());
    printTestResult("Get All Batched", test_get_all_batched());
    printTestResult("Milliwatt Switch Refused", test_milliwatt_switch_refused());
    printTestResult("Signed Integer Replies", test_signed_integer_replies());

    return printSummary("PowerMeter");
}
