#include "../include/tcp_transport.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <algorithm>
#include <istream>

static bool extractLine(boost::asio::streambuf& buf, std::string& line) {
    auto begin = boost::asio::buffers_begin(buf.data());
    auto end = boost::asio::buffers_end(buf.data());
    if (std::find(begin, end, '\n') == end) return false;
    std::istream is(&buf);
    std::getline(is, line);
    line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
    return true;
}

TcpTransport::TcpTransport(const std::string& host, uint16_t port, uint32_t connect_timeout_ms)
    : host_(host), port_(port), connect_timeout_ms_(connect_timeout_ms) {}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::open() {
    if (isOpen()) return;

    using boost::asio::ip::tcp;
    boost::system::error_code ec;
    tcp::resolver resolver(io_);
    tcp::resolver::results_type endpoints = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec) {
        Logger::error("[TCP] Cannot resolve %s: %s", host_.c_str(), ec.message().c_str());
        throw PortUnavailableException("Cannot resolve " + host_ + ": " + ec.message());
    }

    std::unique_ptr<tcp::socket> sock(new tcp::socket(io_));
    bool done = false;
    boost::system::error_code result;
    boost::asio::async_connect(*sock, endpoints,
        [&](const boost::system::error_code& e, const tcp::endpoint&) {
            result = e;
            done = true;
        });
    io_.restart();
    io_.run_for(std::chrono::milliseconds(connect_timeout_ms_));
    if (!done) {
        boost::system::error_code ignored;
        sock->close(ignored);
        io_.restart();
        io_.run();
        Logger::error("[TCP] Connect to %s timed out", description().c_str());
        throw PortUnavailableException("Connect to " + description() + " timed out");
    }
    if (result) {
        Logger::error("[TCP] Connect to %s failed: %s", description().c_str(), result.message().c_str());
        throw PortUnavailableException("Connect to " + description() + " failed: " + result.message());
    }

    sock->set_option(tcp::no_delay(true), ec);
    socket_ = std::move(sock);
    rx_buf_.consume(rx_buf_.size());
    Logger::info("[TCP] Connected to %s", description().c_str());
}

void TcpTransport::close() {
    if (socket_) {
        boost::system::error_code ec;
        socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket_->close(ec);
        socket_.reset();
        Logger::info("[TCP] Closed %s", description().c_str());
    }
    rx_buf_.consume(rx_buf_.size());
}

bool TcpTransport::isOpen() const {
    return socket_ && socket_->is_open();
}

bool TcpTransport::write(const std::string& data) {
    if (!isOpen()) return false;
    boost::system::error_code ec;
    boost::asio::write(*socket_, boost::asio::buffer(data), ec);
    if (ec) {
        Logger::warn("[TCP] Write to %s failed: %s", description().c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool TcpTransport::runWithDeadline(uint32_t timeout_ms, bool& done) {
    io_.restart();
    io_.run_for(std::chrono::milliseconds(timeout_ms));
    if (done) return true;
    boost::system::error_code ignored;
    socket_->cancel(ignored);
    io_.restart();
    io_.run();
    return false;
}

bool TcpTransport::readLine(std::string& line, uint32_t timeout_ms) {
    if (!isOpen()) return false;
    if (extractLine(rx_buf_, line)) return true;

    bool done = false;
    boost::system::error_code result;
    boost::asio::async_read_until(*socket_, rx_buf_, '\n',
        [&](const boost::system::error_code& ec, std::size_t) {
            result = ec;
            done = true;
        });
    if (!runWithDeadline(timeout_ms, done)) return false;
    if (result) {
        Logger::debug("[TCP] Read on %s failed: %s", description().c_str(), result.message().c_str());
        return false;
    }
    return extractLine(rx_buf_, line);
}

bool TcpTransport::readExact(size_t n, std::string& out, uint32_t timeout_ms) {
    if (!isOpen()) return false;
    if (rx_buf_.size() < n) {
        bool done = false;
        boost::system::error_code result;
        boost::asio::async_read(*socket_, rx_buf_, boost::asio::transfer_exactly(n - rx_buf_.size()),
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

void TcpTransport::discardInput() {
    rx_buf_.consume(rx_buf_.size());
    if (!isOpen()) return;
    boost::system::error_code ec;
    char scratch[512];
    while (socket_->available(ec) > 0 && !ec) {
        size_t n = socket_->read_some(boost::asio::buffer(scratch), ec);
        if (ec || n == 0) break;
    }
}

std::string TcpTransport::description() const {
    return host_ + ":" + std::to_string(port_);
}
