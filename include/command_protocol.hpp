#pragma once
#include "transport.hpp"
#include "config_manager.hpp"
#include <stdint.h>
#include <string>

class FaultHandler;

/**
 * Request/response discipline over a line transport.
 *
 *   - one request line out, one response line back
 *   - unconsumed input is discarded before every request
 *   - every wait is bounded by a timeout
 *   - strictly half-duplex: send() is refused while a response is pending
 *
 * Transport failures during a wait are reported as "no response".
 */
class CommandProtocol {
public:
    CommandProtocol(Transport& transport, const ProtocolConfig& config, FaultHandler* faults = nullptr,
                    const char* tag = "PROTO");

    // Open/close the underlying transport. open() may throw PortUnavailableException.
    void open();
    void close();
    bool isOpen() const;

    /**
     * Write one request line ('\n' appended).
     * With expect_response the protocol stays busy until waitResponse()
     * consumes the reply or times out.
     * Returns false if a response is still pending, the request is not a
     * single line, or the write failed.
     */
    bool send(const std::string& request, bool expect_response = true);

    // First non-empty line within timeout_ms, trimmed. Clears the pending flag.
    bool waitResponse(std::string& response, uint32_t timeout_ms);

    // IEEE 488.2 definite-length block reply "#<n><len><payload>"; payload only. Clears the pending flag.
    bool waitBlock(std::string& payload, uint32_t timeout_ms);

    // send + waitResponse, re-sending the same request up to `retries` more times on silence.
    bool sendAndWait(const std::string& request, std::string& response, uint32_t timeout_ms, uint8_t retries);
    bool sendAndWait(const std::string& request, std::string& response);

    // Liveness probe: COMM_OK -> response contains COMM_OK or equals OK
    bool checkCommunication(uint32_t timeout_ms);

    bool isAwaitingResponse() const { return awaiting_response_; }

    const ProtocolConfig& config() const { return config_; }
    Transport& transport() { return transport_; }
    FaultHandler* faults() const { return faults_; }
    const char* tag() const { return tag_; }

    uint32_t requestsSent() const { return requests_sent_; }
    uint32_t responsesReceived() const { return responses_received_; }
    uint32_t timeouts() const { return timeouts_; }

private:
    Transport& transport_;
    ProtocolConfig config_;
    FaultHandler* faults_;
    const char* tag_;
    bool awaiting_response_ = false;

    uint32_t requests_sent_ = 0;
    uint32_t responses_received_ = 0;
    uint32_t timeouts_ = 0;
};

/**
 * Capability shared by the instruments behind the MCU serial link.
 * Implemented by each controller; controllers do not share a base class.
 */
class LineDevice {
public:
    virtual ~LineDevice() {}
    virtual bool connect() = 0;
    virtual void close() = 0;
    virtual bool sendCommand(const std::string& command) = 0;
    virtual bool waitResponse(std::string& response, uint32_t timeout_ms) = 0;
    virtual bool checkCommunication(uint32_t timeout_ms) = 0;
};
