#include "pshare/Net.hpp"

#include <cstring>
#include <memory>

#include <poll.h>
#include <sys/time.h>

#include "pshare/Protocol.hpp"

namespace pshare {

    static void closesock(socket_t s){ ::close(s); }

    static void applyTimeout(socket_t s, int timeoutSec){
        timeval tv{}; tv.tv_sec = timeoutSec; tv.tv_usec = 0;
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    std::string NetError::compose(const std::string& msg, int err){
        if (err == 0) return msg;
        return msg + ": " + std::strerror(err);
    }

    Connection::Connection(socket_t sock, Endpoint remote)
    : sock_(sock), remote_(std::move(remote)) {}

    Connection::~Connection(){ close(); }

    Connection::Connection(Connection&& o) noexcept
    : sock_(o.sock_), remote_(std::move(o.remote_)) { o.sock_ = -1; }

    Connection& Connection::operator=(Connection&& o) noexcept {
        if (this != &o) {
            close();
            sock_ = o.sock_; remote_ = std::move(o.remote_);
            o.sock_ = -1;
        }
        return *this;
    }

    void Connection::close(){
        if (sock_ >= 0) { closesock(sock_); sock_ = -1; }
    }

    Connection Connection::connect(const Endpoint& ep, int timeoutSec){
        addrinfo hints{}; hints.ai_family=AF_INET; hints.ai_socktype=SOCK_STREAM;
        addrinfo* res=nullptr;
        std::string port = std::to_string(ep.port);
        int rc = getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
        if (rc != 0) throw NetError("Cannot resolve " + ep.str() + ": " + gai_strerror(rc), 0);

        socket_t s=-1; int lastErr=0;
        for (addrinfo* rp=res; rp; rp=rp->ai_next){
            s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
            if (s<0) { lastErr = errno; continue; }
            if (timeoutSec > 0) applyTimeout(s, timeoutSec);
            if (::connect(s, rp->ai_addr, rp->ai_addrlen)==0) break;
            lastErr = errno;
            closesock(s); s=-1;
        }
        freeaddrinfo(res);
        if (s<0) {
            if (lastErr == ECONNREFUSED) throw ConnectionRefused("Connection to " + ep.str() + " refused");
            throw NetError("Cannot connect to " + ep.str(), lastErr);
        }
        return Connection(s, ep);
    }

    void Connection::setTimeout(int timeoutSec){
        if (sock_ >= 0) applyTimeout(sock_, timeoutSec);
    }

    void Connection::sendAll(const uint8_t* data, size_t n){
        if (sock_ < 0) throw NetError("Send on closed connection", 0);
        size_t sent=0;
        while (sent<n){
            ssize_t r = ::send(sock_, data+sent, n-sent, MSG_NOSIGNAL);
            if (r<0 && errno==EINTR) continue;
            if (r<0 && (errno==EAGAIN || errno==EWOULDBLOCK)) throw NetError("Send to " + remote_.str() + " timed out", 0);
            if (r<=0) throw NetError("Send to " + remote_.str() + " failed");
            sent += size_t(r);
        }
    }

    size_t Connection::recvSome(uint8_t* data, size_t n){
        if (sock_ < 0) throw NetError("Receive on closed connection", 0);
        for (;;) {
            ssize_t r = ::recv(sock_, data, n, 0);
            if (r >= 0) return size_t(r);
            if (errno==EINTR) continue;
            if (errno==EAGAIN || errno==EWOULDBLOCK) throw NetError("Receive from " + remote_.str() + " timed out", 0);
            throw NetError("Receive from " + remote_.str() + " failed");
        }
    }

    void Connection::recvAll(uint8_t* data, size_t n){
        size_t got=0;
        while (got<n){
            size_t r = recvSome(data+got, n-got);
            if (r==0) throw NetError("Connection closed by " + remote_.str() + " after " +
                                     std::to_string(got) + " of " + std::to_string(n) + " bytes", 0);
            got += r;
        }
    }

    bool Connection::tryReadU8(uint8_t& out){
        return recvSome(&out, 1) == 1;
    }

    uint8_t Connection::readU8(){ uint8_t b; recvAll(&b, 1); return b; }
    uint16_t Connection::readU16(){ uint8_t b[2]; recvAll(b, 2); return get16(b); }
    int32_t Connection::readI32(){ uint8_t b[4]; recvAll(b, 4); return static_cast<int32_t>(get32(b)); }
    int64_t Connection::readI64(){ uint8_t b[8]; recvAll(b, 8); return static_cast<int64_t>(get64(b)); }
    bool Connection::readBool(){ return readU8() != 0; }

    std::string Connection::readText(){
        uint16_t len = readU16();
        std::string s(len, '\0');
        if (len > 0) recvAll(reinterpret_cast<uint8_t*>(&s[0]), len);
        return s;
    }

    TcpServer::TcpServer(Logger& logger, uint16_t listenPort, WorkerPool& pool,
                         Handler handler, int ioTimeoutSec)
    : logger_(logger),
      port_(listenPort),
      pool_(pool),
      handler_(std::move(handler)),
      ioTimeoutSec_(ioTimeoutSec) {}

    TcpServer::~TcpServer(){ stop(); }

    void TcpServer::start(){
        srv_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (srv_ < 0) throw NetError("Cannot create listening socket");
        int opt=1; setsockopt(srv_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_addr.s_addr = INADDR_ANY; addr.sin_port = htons(port_);
        if (::bind(srv_, (sockaddr*)&addr, sizeof(addr))<0) {
            int err = errno; closesock(srv_); srv_=-1;
            throw NetError("Cannot bind port " + std::to_string(port_), err);
        }
        if (::listen(srv_, 64)<0) {
            int err = errno; closesock(srv_); srv_=-1;
            throw NetError("Cannot listen on port " + std::to_string(port_), err);
        }
        sockaddr_in bound{}; socklen_t bl = sizeof(bound);
        if (::getsockname(srv_, (sockaddr*)&bound, &bl)==0) port_ = ntohs(bound.sin_port);

        running_.store(true);
        thr_ = std::thread(&TcpServer::acceptLoop_, this);
        logger_.info("Listening on port " + std::to_string(port_) + ".");
    }

    void TcpServer::stop(){
        running_.store(false);
        if (thr_.joinable()) thr_.join();
        if (srv_>=0) { closesock(srv_); srv_=-1; }
    }

    void TcpServer::acceptLoop_(){
        while (running_.load()){
            // Poll with a short timeout so stop() is noticed.
            pollfd pfd{}; pfd.fd = srv_; pfd.events = POLLIN;
            int ready = ::poll(&pfd, 1, 200);
            if (ready <= 0) continue;

            sockaddr_in cli{}; socklen_t cl = sizeof(cli);
            socket_t s = ::accept(srv_, (sockaddr*)&cli, &cl);
            if (s<0) continue;

            char host[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &cli.sin_addr, host, sizeof(host));
            dispatch_(s, Endpoint{host, ntohs(cli.sin_port)});
        }
    }

    void TcpServer::dispatch_(socket_t s, Endpoint remote){
        auto conn = std::make_shared<Connection>(s, std::move(remote));
        if (ioTimeoutSec_ > 0) conn->setTimeout(ioTimeoutSec_);
        try {
            pool_.submit([this, conn]{
                try {
                    handler_(*conn);
                } catch (const ProtocolFault& e) {
                    logger_.onProtocolFault(conn->remote().str(), e.what());
                } catch (const NetError& e) {
                    logger_.warn("Connection from " + conn->remote().str() + " dropped: " + e.what());
                } catch (const std::exception& e) {
                    logger_.error("Handler failed for " + conn->remote().str() + ": " + e.what());
                }
                conn->close();
            });
        } catch (const PoolRejected& e) {
            logger_.warn("Rejected connection from " + conn->remote().str() + ": " + e.what());
        }
    }

} // namespace pshare
