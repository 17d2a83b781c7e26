#pragma once
#include "transport.hpp"
#include "config_manager.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <mutex>
#include <set>

/**
 * @brief Serial port transport (8N1) with exclusive ownership
 *
 * A device path can be held by one SerialTransport at a time. The hold is
 * tracked in a process-wide registry and backed by an advisory flock() so
 * other processes are refused as well. close() releases both.
 */
class SerialTransport : public Transport {
public:
    explicit SerialTransport(const SerialConfig& config);
    ~SerialTransport();

    void open() override;
    void close() override;
    bool isOpen() const override;
    bool write(const std::string& data) override;
    bool readLine(std::string& line, uint32_t timeout_ms) override;
    bool readExact(size_t n, std::string& out, uint32_t timeout_ms) override;
    void discardInput() override;
    std::string description() const override;

    // True if any SerialTransport in this process currently holds the path
    static bool isHeld(const std::string& port);

private:
    SerialConfig config_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::serial_port> port_;
    boost::asio::streambuf rx_buf_;
    bool registered_ = false;

    bool tryOpen(std::string& error);
    void releaseHold();
    bool runWithDeadline(uint32_t timeout_ms, bool& done);

    static std::mutex registry_mutex_;
    static std::set<std::string> held_ports_;
};
