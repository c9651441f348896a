#include <rmbench/database/Transport.h>
#include <rmbench/common/common.h>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

using boost::asio::ip::tcp;

/// @brief create an unconnected tcp transport
/// @param host server host name or address
/// @param port server port
TcpTransport::TcpTransport(std::string host, unsigned short port):
    host(std::move(host)),
    port(port),
    socket(io)
{}

TcpTransport::~TcpTransport() {
    Close();
}

/// @brief resolve and connect, throws TransportError on failure
void TcpTransport::Connect() {
    boost::system::error_code ec;
    tcp::resolver resolver(io);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        throw TransportError(fmt::format("cannot resolve {}:{} ({})", host, port, ec.message()));
    }
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        // 连接失败后不保留半打开的 socket
        boost::system::error_code ignored;
        socket.close(ignored);
        throw TransportError(fmt::format("cannot connect to {}:{} ({})", host, port, ec.message()));
    }
    socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG(WARNING) << "cannot set TCP_NODELAY: " << ec.message();
    }
    DLOG(INFO) << "connected to " << host << ":" << port;
}

/// @brief send one request and block for its response
/// @param request statement text, the NUL terminator is appended here
/// @return response text without the terminator
std::string TcpTransport::SendCommand(const std::string& request) {
    if (!socket.is_open()) {
        throw TransportError("send on closed connection");
    }
    boost::system::error_code ec;
    // the server expects the terminating NUL as part of the frame
    boost::asio::write(socket, boost::asio::buffer(request.c_str(), request.size() + 1), ec);
    if (ec) {
        throw TransportError(fmt::format("send failed ({})", ec.message()));
    }
    auto n = boost::asio::read_until(socket, buffer, '\0', ec);
    if (ec && !(ec == boost::asio::error::eof && buffer.size() > 0)) {
        throw TransportError(fmt::format("receive failed ({})", ec.message()));
    }
    auto begin = boost::asio::buffers_begin(buffer.data());
    std::string response;
    if (n > 0) {
        response.assign(begin, begin + (n - 1));
        buffer.consume(n);
    } else {
        // peer closed without a terminator, take what arrived
        response.assign(begin, begin + buffer.size());
        buffer.consume(buffer.size());
    }
    return response;
}

void TcpTransport::Close() {
    if (socket.is_open()) {
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
        if (ec) {
            LOG(WARNING) << "error while closing connection: " << ec.message();
        }
    }
}

bool TcpTransport::IsOpen() const {
    return socket.is_open();
}

TransportFactory TcpTransport::Factory(const std::string& host, unsigned short port) {
    return [host, port]() -> Transport::Ptr {
        return std::make_unique<TcpTransport>(host, port);
    };
}

}
