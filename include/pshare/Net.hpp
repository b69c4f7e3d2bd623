#ifndef PSHARE_NET_HPP
#define PSHARE_NET_HPP

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "Logger.hpp"
#include "WorkerPool.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
using socket_t = int;

namespace pshare {

    struct Endpoint {
        std::string host;
        uint16_t port = 0;

        std::string str() const { return host + ":" + std::to_string(port); }
        bool isLoopback() const { return host == "127.0.0.1"; }

        bool operator==(const Endpoint& o) const { return host == o.host && port == o.port; }
        bool operator!=(const Endpoint& o) const { return !(*this == o); }
        bool operator<(const Endpoint& o) const {
            return host != o.host ? host < o.host : port < o.port;
        }
    };

    // Transport fault: reset, short read, timeout, malformed response.
    // The system error is appended to the message.
    class NetError : public std::runtime_error {
    public:
        explicit NetError(const std::string& msg, int err = errno)
        : std::runtime_error(compose(msg, err)), errno_(err) {}

        int code() const { return errno_; }

    private:
        int errno_;
        static std::string compose(const std::string& msg, int err);
    };

    // The remote end actively refused the connection (nobody listening).
    class ConnectionRefused : public NetError {
    public:
        explicit ConnectionRefused(const std::string& msg) : NetError(msg, ECONNREFUSED) {}
    };

    // A request the receiving side cannot serve. The connection is closed.
    class ProtocolFault : public std::runtime_error {
    public:
        explicit ProtocolFault(const std::string& msg) : std::runtime_error(msg) {}
    };

    // Blocking TCP connection with big-endian typed reads and writes.
    // Owns the socket and closes it on destruction.
    class Connection {
    public:
        explicit Connection(socket_t sock, Endpoint remote = {});
        ~Connection();

        Connection(Connection&& o) noexcept;
        Connection& operator=(Connection&& o) noexcept;
        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        // Throws ConnectionRefused when nobody listens at ep, NetError on any other failure.
        static Connection connect(const Endpoint& ep, int timeoutSec = 0);

        // Applies to every later send and receive. 0 disables the timeout.
        void setTimeout(int timeoutSec);

        void sendAll(const uint8_t* data, size_t n);
        void send(const std::vector<uint8_t>& bytes) { sendAll(bytes.data(), bytes.size()); }

        // Reads exactly n bytes or throws NetError.
        void recvAll(uint8_t* data, size_t n);

        // Reads up to n bytes, returns 0 at end of stream.
        size_t recvSome(uint8_t* data, size_t n);

        // Reads the next request tag; returns false if the peer closed the connection cleanly.
        bool tryReadU8(uint8_t& out);

        uint8_t readU8();
        uint16_t readU16();
        int32_t readI32();
        int64_t readI64();
        bool readBool();
        std::string readText();

        void close();
        const Endpoint& remote() const { return remote_; }

    private:
        socket_t sock_ = -1;
        Endpoint remote_;
    };

    // Accepts connections on its own thread and hands each one to the worker pool.
    class TcpServer {
    public:
        using Handler = std::function<void(Connection&)>;

        TcpServer(Logger& logger, uint16_t listenPort, WorkerPool& pool, Handler handler, int ioTimeoutSec = 0);
        ~TcpServer();

        // Binds and listens, then starts accepting. Throws NetError if the port cannot be bound.
        void start();
        void stop();

        // The bound port; differs from the requested one when 0 was requested.
        uint16_t port() const { return port_; }

        TcpServer(const TcpServer&) = delete;
        TcpServer& operator=(const TcpServer&) = delete;

    private:
        Logger& logger_;
        uint16_t port_;
        WorkerPool& pool_;
        Handler handler_;
        int ioTimeoutSec_;
        std::thread thr_;
        std::atomic<bool> running_{false};
        socket_t srv_ = -1;

        void acceptLoop_();
        void dispatch_(socket_t s, Endpoint remote);
    };

} // namespace pshare

#endif // PSHARE_NET_HPP
