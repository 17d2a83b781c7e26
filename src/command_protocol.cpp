#include "../include/command_protocol.hpp"
#include "../include/fault_handler.hpp"
#include "../include/logger.hpp"
#include "../include/clock.hpp"
#include <algorithm>
#include <cctype>
#include <exception>

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace((unsigned char)s[b])) b++;
    while (e > b && isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

static std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)toupper(c); });
    return s;
}

CommandProtocol::CommandProtocol(Transport& transport, const ProtocolConfig& config, FaultHandler* faults,
                                 const char* tag)
    : transport_(transport), config_(config), faults_(faults), tag_(tag) {
    if (config_.poll_interval_ms == 0) config_.poll_interval_ms = 1;
}

void CommandProtocol::open() {
    transport_.open();
    awaiting_response_ = false;
}

void CommandProtocol::close() {
    transport_.close();
    awaiting_response_ = false;
}

bool CommandProtocol::isOpen() const {
    return transport_.isOpen();
}

bool CommandProtocol::send(const std::string& request, bool expect_response) {
    if (awaiting_response_) {
        Logger::error("[%s] Refusing '%s': previous request still awaiting its response", tag_, request.c_str());
        return false;
    }
    if (request.empty() || request.find_first_of("\r\n") != std::string::npos) {
        Logger::error("[%s] Request must be a single non-empty line", tag_);
        return false;
    }

    bool ok = false;
    try {
        // A late reply to an earlier request must not be read as this one's answer
        transport_.discardInput();
        ok = transport_.write(request + "\n");
    } catch (const std::exception& e) {
        Logger::warn("[%s] Transport error while sending '%s': %s", tag_, request.c_str(), e.what());
        ok = false;
    }
    if (!ok) {
        Logger::warn("[%s] Failed to send '%s'", tag_, request.c_str());
        return false;
    }

    requests_sent_++;
    awaiting_response_ = expect_response;
    Logger::log(config_.verbose ? Logger::INFO : Logger::DEBUG, "[%s] Sent: %s", tag_, request.c_str());
    return true;
}

bool CommandProtocol::waitResponse(std::string& response, uint32_t timeout_ms) {
    uint32_t start = clock_ms();
    bool got = false;

    while (!got) {
        uint32_t elapsed = clock_ms() - start;
        if (elapsed >= timeout_ms) break;
        uint32_t remaining = timeout_ms - elapsed;

        std::string line;
        bool read_ok = false;
        try {
            read_ok = transport_.readLine(line, remaining);
        } catch (const std::exception& e) {
            Logger::debug("[%s] Transport error while waiting: %s", tag_, e.what());
            read_ok = false;
        }

        if (read_ok) {
            line = trim(line);
            if (!line.empty()) {
                response = line;
                got = true;
            }
            continue;
        }
        // Link error returned early; back off before polling again
        if (clock_ms() - start < timeout_ms) {
            sleep_ms(std::min(config_.poll_interval_ms, timeout_ms - (clock_ms() - start)));
        }
    }

    awaiting_response_ = false;
    if (got) {
        responses_received_++;
        Logger::log(config_.verbose ? Logger::INFO : Logger::DEBUG, "[%s] Received: %s", tag_, response.c_str());
    }
    return got;
}

bool CommandProtocol::sendAndWait(const std::string& request, std::string& response, uint32_t timeout_ms,
                                  uint8_t retries) {
    for (int attempt = 0; attempt <= retries; ++attempt) {
        if (send(request, true) && waitResponse(response, timeout_ms)) {
            if (attempt > 0 && faults_) {
                faults_->recordRecovery(FaultType::TIMEOUT, tag_);
            }
            return true;
        }
        if (attempt < retries) {
            Logger::debug("[%s] No response to '%s', retry %d/%d", tag_, request.c_str(), attempt + 1, (int)retries);
        }
    }

    timeouts_++;
    Logger::warn("[%s] No response to '%s' within %u ms", tag_, request.c_str(), (unsigned)timeout_ms);
    if (faults_) {
        faults_->recordFault(FaultType::TIMEOUT, tag_, request);
    }
    return false;
}

bool CommandProtocol::sendAndWait(const std::string& request, std::string& response) {
    return sendAndWait(request, response, config_.timeout_ms, config_.max_retries);
}

bool CommandProtocol::checkCommunication(uint32_t timeout_ms) {
    Logger::info("[%s] Checking communication...", tag_);
    std::string response;
    if (!sendAndWait("COMM_OK", response, timeout_ms, 0)) {
        Logger::warn("[%s] No response within %u ms", tag_, (unsigned)timeout_ms);
        return false;
    }
    std::string upper = toUpper(response);
    if (upper.find("COMM_OK") != std::string::npos || upper == "OK") {
        Logger::info("[%s] Communication OK: %s", tag_, response.c_str());
        return true;
    }
    Logger::warn("[%s] Unexpected response: %s", tag_, response.c_str());
    return false;
}

bool CommandProtocol::waitBlock(std::string& payload, uint32_t timeout_ms) {
    uint32_t start = clock_ms();
    auto remaining = [&]() -> uint32_t {
        uint32_t elapsed = clock_ms() - start;
        return elapsed >= timeout_ms ? 0 : timeout_ms - elapsed;
    };

    bool ok = false;
    try {
        std::string header;
        std::string len_digits;
        if (transport_.readExact(2, header, remaining()) && header[0] == '#' &&
            isdigit((unsigned char)header[1]) && header[1] != '0') {
            size_t n = (size_t)(header[1] - '0');
            if (transport_.readExact(n, len_digits, remaining())) {
                size_t len = 0;
                bool digits_ok = true;
                for (char c : len_digits) {
                    if (!isdigit((unsigned char)c)) { digits_ok = false; break; }
                    len = len * 10 + (size_t)(c - '0');
                }
                if (digits_ok) {
                    ok = (len == 0) || transport_.readExact(len, payload, remaining());
                    if (ok && len == 0) payload.clear();
                }
            }
        }
    } catch (const std::exception& e) {
        Logger::debug("[%s] Transport error while reading block: %s", tag_, e.what());
        ok = false;
    }

    awaiting_response_ = false;
    if (ok) {
        responses_received_++;
        Logger::debug("[%s] Received block of %u bytes", tag_, (unsigned)payload.size());
    } else {
        timeouts_++;
        Logger::warn("[%s] No valid block reply within %u ms", tag_, (unsigned)timeout_ms);
    }
    return ok;
}
