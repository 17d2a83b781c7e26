#pragma once
#include <stdint.h>
#include <string>

/**
 * @brief Byte-stream link to an instrument
 *
 * Line-oriented: readLine() returns one '\n'-terminated line with '\r'
 * stripped. Every read takes a deadline; nothing blocks without one.
 */
class Transport {
public:
    virtual ~Transport() {}

    /**
     * @brief Acquire the underlying device
     * @throws PortUnavailableException if the device cannot be acquired
     */
    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @brief Write raw bytes
     * @return false if the link is closed or the write failed
     */
    virtual bool write(const std::string& data) = 0;

    /**
     * @brief Read one line within timeout_ms
     * @return false on timeout or link failure
     */
    virtual bool readLine(std::string& line, uint32_t timeout_ms) = 0;

    /**
     * @brief Read exactly n bytes within timeout_ms (binary block replies)
     */
    virtual bool readExact(size_t n, std::string& out, uint32_t timeout_ms) = 0;

    /**
     * @brief Drop any input received but not yet consumed
     */
    virtual void discardInput() = 0;

    virtual std::string description() const = 0;
};
