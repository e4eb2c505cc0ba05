/**
 * @file ParkGateHAL_TCP.cpp
 * @brief BSD socket link to a relay board (implementation)
 */

#include "drivers/ParkGateHAL_TCP.h"

#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netdb.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <string.h>
#include <arpa/inet.h>

#ifdef MSG_NOSIGNAL
    #define PARKGATE_SEND_FLAGS MSG_NOSIGNAL
#else
    #define PARKGATE_SEND_FLAGS 0
#endif

namespace ParkGateHAL {

TCP::TCP(const char* host, uint16_t port)
    : _host(host ? host : ""), _port(port) {}

TCP::~TCP() {
    close();
}

/* @brief Resolve the configured host (dotted IPv4 first, then DNS)
 * @param ipAddr Output address in network byte order
 */
bool TCP::resolve(uint32_t& ipAddr) const {
    struct in_addr addr;
    if (inet_pton(AF_INET, _host.c_str(), &addr) == 1) {
        ipAddr = addr.s_addr;
        return true;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (getaddrinfo(_host.c_str(), nullptr, &hints, &res) != 0 || !res) {
        ParkGate::Debug::LOG_MSGF("Cannot resolve host %s", _host.c_str());
        return false;
    }
    ipAddr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr.s_addr;
    freeaddrinfo(res);
    return true;
}

bool TCP::waitReady(bool forWrite, uint32_t timeoutMs) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(_socket, &fds);

    struct timeval tv;
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;

    int ret = forWrite ? ::select(_socket + 1, nullptr, &fds, nullptr, &tv)
                       : ::select(_socket + 1, &fds, nullptr, nullptr, &tv);
    if (ret < 0) {
        ParkGate::Debug::LOG_MSGF("select() failed on socket %d, errno: %d", _socket, errno);
    }
    return ret > 0;
}

ILink::Result TCP::open(uint32_t timeoutMs) {
    if (isOpen()) return SUCCESS;

    uint32_t ipAddr = 0;
    if (!resolve(ipAddr)) return ERR_CONNECT;

    _socket = ::socket(AF_INET, SOCK_STREAM, 0);
    if (_socket < 0) {
        ParkGate::Debug::LOG_MSGF("Failed to create socket, errno: %d", errno);
        return ERR_CONNECT;
    }

    // Non-blocking connect, bounded by select()
    int flags = fcntl(_socket, F_GETFL, 0);
    if (flags == -1 || fcntl(_socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        ParkGate::Debug::LOG_MSGF("fcntl(O_NONBLOCK) failed on socket %d, errno: %d", _socket, errno);
        close();
        return ERR_CONNECT;
    }

    sockaddr_in remote;
    memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(_port);
    remote.sin_addr.s_addr = ipAddr;

    ParkGate::Debug::LOG_MSGF("Connecting to %s:%u (socket %d)...", _host.c_str(), _port, _socket);
    int ret = ::connect(_socket, (struct sockaddr*)&remote, sizeof(remote));
    if (ret < 0) {
        if (errno != EINPROGRESS) {
            ParkGate::Debug::LOG_MSGF("Connect to %s:%u failed immediately, errno: %d", _host.c_str(), _port, errno);
            close();
            return ERR_CONNECT;
        }
        if (!waitReady(true, timeoutMs)) {
            ParkGate::Debug::LOG_MSGF("Connect timeout to %s:%u", _host.c_str(), _port);
            close();
            return ERR_CONNECT;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(_socket, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
            ParkGate::Debug::LOG_MSGF("Connect to %s:%u failed, SO_ERROR: %d", _host.c_str(), _port, soError);
            close();
            return ERR_CONNECT;
        }
    }

    ParkGate::Debug::LOG_MSGF("Connected to %s:%u", _host.c_str(), _port);
    return SUCCESS;
}

void TCP::close() {
    if (_socket < 0) return;
    ::shutdown(_socket, SHUT_RDWR);
    ::close(_socket);
    ParkGate::Debug::LOG_MSGF("Socket %d closed (%s:%u)", _socket, _host.c_str(), _port);
    _socket = -1;
}

ILink::Result TCP::send(const ByteBuffer& bytes, uint32_t timeoutMs) {
    if (!isOpen()) return ERR_NOT_CONNECTED;

    size_t sent = 0;
    while (sent < bytes.size()) {
        ssize_t n = ::send(_socket, bytes.data() + sent, bytes.size() - sent, PARKGATE_SEND_FLAGS);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (waitReady(true, timeoutMs)) continue;
        }
        ParkGate::Debug::LOG_MSGF("send() on socket %d failed, errno: %d", _socket, errno);
        close();
        return ERR_SEND;
    }
    return SUCCESS;
}

ILink::Result TCP::receive(ByteBuffer& dst, uint32_t timeoutMs) {
    if (!isOpen()) return ERR_NOT_CONNECTED;
    if (dst.free_space() == 0) return ERR_OVERFLOW;
    if (!waitReady(false, timeoutMs)) return NODATA;

    size_t offset = dst.size();
    dst.resize(dst.capacity());
    ssize_t r = ::recv(_socket, dst.begin() + offset, dst.capacity() - offset, 0);

    if (r > 0) {
        dst.trim(offset + static_cast<size_t>(r));
        return SUCCESS;
    }
    dst.trim(offset);

    if (r == 0) {
        ParkGate::Debug::LOG_MSGF("Socket %d closed by peer", _socket);
        close();
        return ERR_CLOSED;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) return NODATA;

    ParkGate::Debug::LOG_MSGF("recv() on socket %d failed, errno: %d", _socket, errno);
    close();
    return ERR_RECV;
}

} // namespace ParkGateHAL
