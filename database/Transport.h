#pragma once

#include <memory>
#include <string>
#include <stdexcept>
#include <functional>
#include <utility>
#include <boost/asio.hpp>

namespace rmbench {

/// @brief raised by transports on connect, send or receive failures
class TransportError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
};

/// @brief one blocking request/response channel to the server
class Transport {
    public:
        typedef std::unique_ptr<Transport> Ptr;

        virtual ~Transport() = default;
        virtual void Connect() = 0;
        virtual std::string SendCommand(const std::string& request) = 0;
        virtual void Close() = 0;
        virtual bool IsOpen() const = 0;
};

using TransportFactory = std::function<Transport::Ptr()>;

/// @brief RMDB text protocol over TCP, both directions NUL terminated
class TcpTransport : public Transport {
    public:
        TcpTransport(std::string host, unsigned short port);
        ~TcpTransport() override;

        void Connect() override;
        std::string SendCommand(const std::string& request) override;
        void Close() override;
        bool IsOpen() const override;

        static TransportFactory Factory(const std::string& host, unsigned short port);

    private:
        std::string                     host;
        unsigned short                  port;
        boost::asio::io_context         io;
        boost::asio::ip::tcp::socket    socket;
        boost::asio::streambuf          buffer;
};

}
