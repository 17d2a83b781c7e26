#include "../include/serial_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include "../include/clock.hpp"
#include <sys/file.h>
#include <termios.h>
#include <errno.h>
#include <string.h>
#include <algorithm>
#include <istream>

std::mutex SerialTransport::registry_mutex_;
std::set<std::string> SerialTransport::held_ports_;

// Pull one complete line out of the receive buffer, if there is one.
static bool extractLine(boost::asio::streambuf& buf, std::string& line) {
    auto begin = boost::asio::buffers_begin(buf.data());
    auto end = boost::asio::buffers_end(buf.data());
    auto nl = std::find(begin, end, '\n');
    if (nl == end) return false;
    std::istream is(&buf);
    std::getline(is, line);
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    return true;
}

SerialTransport::SerialTransport(const SerialConfig& config) : config_(config) {}

SerialTransport::~SerialTransport() {
    close();
}

bool SerialTransport::isHeld(const std::string& port) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return held_ports_.count(port) > 0;
}

bool SerialTransport::tryOpen(std::string& error) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (held_ports_.count(config_.port) > 0) {
        error = "already held in this process";
        return false;
    }

    std::unique_ptr<boost::asio::serial_port> p(new boost::asio::serial_port(io_));
    boost::system::error_code ec;
    p->open(config_.port, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    if (::flock(p->native_handle(), LOCK_EX | LOCK_NB) != 0) {
        error = std::string("locked by another process (") + strerror(errno) + ")";
        boost::system::error_code ignored;
        p->close(ignored);
        return false;
    }

    using boost::asio::serial_port_base;
    p->set_option(serial_port_base::baud_rate(config_.baud), ec);
    if (!ec) p->set_option(serial_port_base::character_size(8), ec);
    if (!ec) p->set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
    if (!ec) p->set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
    if (!ec) p->set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
    if (ec) {
        error = "configure failed: " + ec.message();
        boost::system::error_code ignored;
        p->close(ignored);
        return false;
    }

    held_ports_.insert(config_.port);
    registered_ = true;
    port_ = std::move(p);
    rx_buf_.consume(rx_buf_.size());
    return true;
}

void SerialTransport::releaseHold() {
    if (!registered_) return;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    held_ports_.erase(config_.port);
    registered_ = false;
}

void SerialTransport::open() {
    if (isOpen()) return;

    std::string error;
    if (!tryOpen(error)) {
        Logger::warn("[Serial] %s appears to be in use (%s), trying to release it", config_.port.c_str(), error.c_str());
        releaseHold();
        sleep_ms(config_.release_retry_delay_ms);
        if (!tryOpen(error)) {
            Logger::error("[Serial] Could not open %s: %s", config_.port.c_str(), error.c_str());
            throw PortUnavailableException("Port " + config_.port + " is unavailable: " + error);
        }
        Logger::info("[Serial] Port released, retry succeeded");
    }

    Logger::info("[Serial] Opened %s at %u baud", config_.port.c_str(), (unsigned)config_.baud);
    // Opening the port resets the MCU
    sleep_ms(config_.open_settle_ms);
}

void SerialTransport::close() {
    if (port_) {
        boost::system::error_code ec;
        (void)::flock(port_->native_handle(), LOCK_UN);
        port_->close(ec);
        port_.reset();
        Logger::info("[Serial] Closed %s", config_.port.c_str());
    }
    rx_buf_.consume(rx_buf_.size());
    releaseHold();
}

bool SerialTransport::isOpen() const {
    return port_ && port_->is_open();
}

bool SerialTransport::write(const std::string& data) {
    if (!isOpen()) return false;
    boost::system::error_code ec;
    boost::asio::write(*port_, boost::asio::buffer(data), ec);
    if (ec) {
        Logger::warn("[Serial] Write to %s failed: %s", config_.port.c_str(), ec.message().c_str());
        return false;
    }
    (void)::tcdrain(port_->native_handle());
    return true;
}

bool SerialTransport::runWithDeadline(uint32_t timeout_ms, bool& done) {
    io_.restart();
    io_.run_for(std::chrono::milliseconds(timeout_ms));
    if (done) return true;
    // Deadline passed: abort the pending read and let its handler run
    boost::system::error_code ignored;
    port_->cancel(ignored);
    io_.restart();
    io_.run();
    return false;
}

bool SerialTransport::readLine(std::string& line, uint32_t timeout_ms) {
    if (!isOpen()) return false;
    if (extractLine(rx_buf_, line)) return true;

    bool done = false;
    boost::system::error_code result;
    boost::asio::async_read_until(*port_, rx_buf_, '\n',
        [&](const boost::system::error_code& ec, std::size_t) {
            result = ec;
            done = true;
        });
    if (!runWithDeadline(timeout_ms, done)) return false;
    if (result) {
        Logger::debug("[Serial] Read on %s failed: %s", config_.port.c_str(), result.message().c_str());
        return false;
    }
    return extractLine(rx_buf_, line);
}

bool SerialTransport::readExact(size_t n, std::string& out, uint32_t timeout_ms) {
    if (!isOpen()) return false;
    if (rx_buf_.size() < n) {
        bool done = false;
        boost::system::error_code result;
        boost::asio::async_read(*port_, rx_buf_, boost::asio::transfer_exactly(n - rx_buf_.size()),
            [&](const boost::system::error_code& ec, std::size_t) {
                result = ec;
                done = true;
            });
        if (!runWithDeadline(timeout_ms, done) || result) return false;
    }
    auto begin = boost::asio::buffers_begin(rx_buf_.data());
    out.assign(begin, begin + n);
    rx_buf_.consume(n);
    return true;
}

void SerialTransport::discardInput() {
    rx_buf_.consume(rx_buf_.size());
    if (isOpen()) {
        (void)::tcflush(port_->native_handle(), TCIFLUSH);
    }
}

std::string SerialTransport::description() const {
    return config_.port + "@" + std::to_string(config_.baud);
}
