#pragma once
#include "transport.hpp"
#include <boost/asio.hpp>
#include <memory>

// SCPI raw-socket link to a LAN instrument (port 5025 on Keysight meters)
class TcpTransport : public Transport {
public:
    TcpTransport(const std::string& host, uint16_t port, uint32_t connect_timeout_ms = 5000);
    ~TcpTransport();

    void open() override;
    void close() override;
    bool isOpen() const override;
    bool write(const std::string& data) override;
    bool readLine(std::string& line, uint32_t timeout_ms) override;
    bool readExact(size_t n, std::string& out, uint32_t timeout_ms) override;
    void discardInput() override;
    std::string description() const override;

private:
    std::string host_;
    uint16_t port_;
    uint32_t connect_timeout_ms_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::asio::ip::tcp::socket> socket_;
    boost::asio::streambuf rx_buf_;

    bool runWithDeadline(uint32_t timeout_ms, bool& done);
};
