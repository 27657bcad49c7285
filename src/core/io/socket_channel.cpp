/**
 * @file   socket_channel.cpp
 * @brief  Implements SocketChannel and SocketListener: address parsing,
 *         socket setup, frame encoding on send() and frame reassembly on
 *         poll()/waitFor().
 *
 * @date   2026-10-19
 */

#include "socket_channel.hpp"
#include "../logging.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace provider_bridge::io {

namespace {

constexpr std::uint32_t MAX_BUFFERS_PER_FRAME = 1u << 20;

/// Resolved socket address.
struct Endpoint {
    sockaddr_storage addr{};
    socklen_t        len{0};
    int              family{AF_UNSPEC};
    std::string      unixPath;
};

// Helper: parse "unix:/path" or "tcp:host:port" → Endpoint; false if invalid.
bool parseEndpoint(const std::string &str, Endpoint &out, std::string &err) noexcept {
    static const std::string unixPrefix = "unix:";
    static const std::string tcpPrefix  = "tcp:";

    if (str.compare(0, unixPrefix.size(), unixPrefix) == 0) {
        std::string path = str.substr(unixPrefix.size());
        sockaddr_un un{};
        if (path.empty() || path.size() >= sizeof(un.sun_path)) {
            err = "invalid unix socket path: " + path;
            return false;
        }
        un.sun_family = AF_UNIX;
        std::memcpy(un.sun_path, path.c_str(), path.size() + 1);
        std::memcpy(&out.addr, &un, sizeof(un));
        out.len      = sizeof(un);
        out.family   = AF_UNIX;
        out.unixPath = std::move(path);
        return true;
    }

    if (str.compare(0, tcpPrefix.size(), tcpPrefix) == 0) {
        std::string rest = str.substr(tcpPrefix.size());
        auto pos = rest.rfind(':');
        if (pos == std::string::npos) {
            err = "missing port in address: " + str;
            return false;
        }
        std::string host = rest.substr(0, pos);
        std::string port = rest.substr(pos + 1);
        char* end = nullptr;
        long p = std::strtol(port.c_str(), &end, 10);
        if (port.empty() || *end != '\0' || p < 0 || p > 65535) {
            err = "invalid port in address: " + str;
            return false;
        }

        addrinfo hints{};
        hints.ai_family   = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags    = host.empty() ? AI_PASSIVE : 0;
        addrinfo* res = nullptr;
        int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(), port.c_str(), &hints, &res);
        if (rc != 0 || !res) {
            err = "cannot resolve " + host + ": " + ::gai_strerror(rc);
            return false;
        }
        std::memcpy(&out.addr, res->ai_addr, res->ai_addrlen);
        out.len    = static_cast<socklen_t>(res->ai_addrlen);
        out.family = res->ai_family;
        ::freeaddrinfo(res);
        return true;
    }

    err = "unsupported address (expected unix:... or tcp:...): " + str;
    return false;
}

void putLE(std::uint8_t* out, std::uint64_t v, std::size_t bytes) noexcept {
    for (std::size_t i = 0; i < bytes; ++i)
        out[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

std::uint64_t getLE(const std::uint8_t* in, std::size_t bytes) noexcept {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < bytes; ++i)
        v |= static_cast<std::uint64_t>(in[i]) << (8 * i);
    return v;
}

void setNoDelay(int fd) noexcept {
    int opt = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
}

} // namespace

// ----------------------------------------------------------------------------
// SocketChannel
// ----------------------------------------------------------------------------

SocketChannel::SocketChannel(int fd) noexcept
  : m_fd(fd)
  , m_open(fd >= 0)
{}

SocketChannel::~SocketChannel() noexcept {
    close();
    if (m_fd >= 0)
        ::close(m_fd);
}

std::shared_ptr<SocketChannel> SocketChannel::connect(const std::string& address,
                                                      std::string* err) {
    Endpoint ep;
    std::string why;
    if (!parseEndpoint(address, ep, why)) {
        if (err) *err = why;
        return nullptr;
    }

    int fd = ::socket(ep.family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        if (err) *err = std::string("socket: ") + std::strerror(errno);
        return nullptr;
    }
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&ep.addr), ep.len) < 0) {
        if (err) *err = "connect " + address + ": " + std::strerror(errno);
        ::close(fd);
        return nullptr;
    }
    if (ep.family != AF_UNIX)
        setNoDelay(fd);

    qCInfo(lcIo) << "connected to" << address.c_str();
    return std::make_shared<SocketChannel>(fd);
}

void SocketChannel::markBroken(const char* why) noexcept {
    if (m_open.exchange(false)) {
        qCWarning(lcIo) << "socket channel closed:" << why;
        ::shutdown(m_fd, SHUT_RDWR);
    }
}

bool SocketChannel::writeAll(const void* data, std::size_t len) noexcept {
    auto p = static_cast<const std::uint8_t*>(data);
    while (len > 0) {
        ssize_t n = ::send(m_fd, p, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            markBroken(std::strerror(errno));
            return false;
        }
        p   += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

bool SocketChannel::send(Packet &&pkt) noexcept {
    if (!m_open) return false;
    if (pkt.json.size() > MAX_FIELD_BYTES || pkt.transfers.size() > MAX_BUFFERS_PER_FRAME)
        return false;
    // The peer drops the channel on any field above the limit
    for (auto const& buf : pkt.transfers)
        if (buf && buf->size() > MAX_FIELD_BYTES) return false;

    // Take the buffers out of the packet; they are released after the write
    Packet out = std::move(pkt);

    std::lock_guard<std::mutex> lk(m_sendMtx);
    std::uint8_t hdr[8];
    putLE(hdr, out.json.size(), 4);
    if (!writeAll(hdr, 4) || !writeAll(out.json.data(), out.json.size()))
        return false;

    putLE(hdr, out.transfers.size(), 4);
    if (!writeAll(hdr, 4)) return false;

    for (auto const& buf : out.transfers) {
        const std::size_t len = buf ? buf->size() : 0;
        putLE(hdr, len, 8);
        if (!writeAll(hdr, 8)) return false;
        if (len > 0 && !writeAll(buf->data(), len)) return false;
    }
    return true;
}

bool SocketChannel::readAvailable() noexcept {
    std::uint8_t chunk[BUF_SIZE];
    ssize_t n = ::recv(m_fd, chunk, BUF_SIZE, MSG_DONTWAIT);
    if (n > 0) {
        try {
            m_rx.insert(m_rx.end(), chunk, chunk + n);
        }
        catch (const std::bad_alloc&) {
            markBroken("out of memory");
            return false;
        }
        return true;
    }
    if (n == 0) {
        if (m_open.exchange(false))
            qCInfo(lcIo) << "peer closed the socket";
        return false;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return true;
    markBroken(std::strerror(errno));
    return false;
}

bool SocketChannel::extractFrame(Packet &pkt) noexcept {
    // 1) Scan: make sure a whole frame is buffered
    const std::uint8_t* base = m_rx.data();
    const std::size_t   size = m_rx.size();
    std::size_t pos = 0;
    auto have = [&](std::uint64_t n) { return size - pos >= n; };

    if (!have(4)) return false;
    const std::uint64_t jsonLen = getLE(base + pos, 4);
    pos += 4;
    if (jsonLen > MAX_FIELD_BYTES) { markBroken("oversized frame"); m_rx.clear(); return false; }
    if (!have(jsonLen)) return false;
    const std::size_t jsonPos = pos;
    pos += jsonLen;

    if (!have(4)) return false;
    const std::uint64_t count = getLE(base + pos, 4);
    pos += 4;
    if (count > MAX_BUFFERS_PER_FRAME) { markBroken("too many buffers"); m_rx.clear(); return false; }

    std::vector<std::pair<std::size_t, std::size_t>> spans;
    try {
        spans.reserve(count);
        for (std::uint64_t i = 0; i < count; ++i) {
            if (!have(8)) return false;
            const std::uint64_t len = getLE(base + pos, 8);
            pos += 8;
            if (len > MAX_FIELD_BYTES) { markBroken("oversized buffer"); m_rx.clear(); return false; }
            if (!have(len)) return false;
            spans.emplace_back(pos, len);
            pos += len;
        }

        // 2) Build the packet and drop the consumed bytes
        Packet in;
        in.json.assign(reinterpret_cast<const char*>(base + jsonPos), jsonLen);
        in.transfers.reserve(spans.size());
        for (auto const& s : spans)
            in.transfers.push_back(std::make_shared<std::vector<std::uint8_t>>(
                base + s.first, base + s.first + s.second));
        m_rx.erase(m_rx.begin(), m_rx.begin() + static_cast<std::ptrdiff_t>(pos));
        pkt = std::move(in);
    }
    catch (const std::bad_alloc&) {
        markBroken("out of memory");
        m_rx.clear();
        return false;
    }
    return true;
}

bool SocketChannel::poll(Packet &pkt) noexcept {
    return waitFor(pkt, std::chrono::milliseconds(0));
}

bool SocketChannel::waitFor(Packet &pkt, std::chrono::milliseconds timeout) noexcept {
    std::lock_guard<std::mutex> lk(m_recvMtx);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (extractFrame(pkt)) return true;
        if (!m_open) return false;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

        pollfd pfd{m_fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            markBroken(std::strerror(errno));
            return false;
        }
        if (rc == 0) return false;  // timed out
        if (!readAvailable())
            return extractFrame(pkt);
    }
}

void SocketChannel::close() noexcept {
    if (m_open.exchange(false) && m_fd >= 0)
        ::shutdown(m_fd, SHUT_RDWR);
}

bool SocketChannel::isOpen() const noexcept {
    return m_open;
}

// ----------------------------------------------------------------------------
// SocketListener
// ----------------------------------------------------------------------------

SocketListener::SocketListener(const std::string& address) noexcept {
    Endpoint ep;
    if (!parseEndpoint(address, ep, m_error)) return;

    m_fd = ::socket(ep.family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_fd < 0) {
        m_error = std::string("socket: ") + std::strerror(errno);
        return;
    }

    // Allow reusing the address
    if (ep.family == AF_UNIX) {
        ::unlink(ep.unixPath.c_str());
    } else {
        int opt = 1;
        ::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    }

    if (::bind(m_fd, reinterpret_cast<const sockaddr*>(&ep.addr), ep.len) < 0 ||
        ::listen(m_fd, 1) < 0)
    {
        m_error = "bind " + address + ": " + std::strerror(errno);
        ::close(m_fd);
        m_fd = -1;
        return;
    }
    m_unixPath = ep.unixPath;
    qCInfo(lcIo) << "listening on" << address.c_str();
}

SocketListener::~SocketListener() noexcept {
    if (m_fd >= 0)
        ::close(m_fd);
    if (!m_unixPath.empty())
        ::unlink(m_unixPath.c_str());
}

std::shared_ptr<SocketChannel> SocketListener::accept(std::chrono::milliseconds timeout) noexcept {
    if (m_fd < 0) return nullptr;

    pollfd pfd{m_fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc <= 0) return nullptr;

    int fd = ::accept4(m_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (fd < 0) {
        m_error = std::string("accept: ") + std::strerror(errno);
        return nullptr;
    }
    if (m_unixPath.empty())
        setNoDelay(fd);
    try {
        return std::make_shared<SocketChannel>(fd);
    }
    catch (const std::bad_alloc&) {
        ::close(fd);
        return nullptr;
    }
}

} // namespace provider_bridge::io
