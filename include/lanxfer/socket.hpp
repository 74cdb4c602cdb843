/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file socket.hpp
 * @brief RAII socket types for lanxfer: SocketAddress, TcpSocket,
 *        TcpListener and a multicast-capable UdpSocket, all over IPv4.
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 * All errors are returned via lanxfer::expected<V,E>.
 */

#ifndef LANXFER_SOCKET_HPP_
#define LANXFER_SOCKET_HPP_

#include "lanxfer/platform.hpp"
#include "lanxfer/vocabulary.hpp"

#if LANXFER_HAS_NETWORK

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>

namespace lanxfer {

// ============================================================================
// Constants
// ============================================================================

constexpr int32_t kDefaultBacklog = 128;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kPeerClosed,   ///< Orderly shutdown by the remote end before len bytes.
  kSetOptFailed,
  kTimeout,
  kWouldBlock    ///< EAGAIN on a non-blocking call.
};

inline const char* ToString(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kListenFailed:   return "listen failed";
    case SocketError::kConnectFailed:  return "connect failed";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kAcceptFailed:   return "accept failed";
    case SocketError::kPeerClosed:     return "peer closed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kTimeout:        return "timeout";
    case SocketError::kWouldBlock:     return "would block";
  }
  return "unknown";
}

template <typename T>
using SocketResult = expected<T, SocketError>;

// ============================================================================
// SocketAddress
// ============================================================================

/**
 * @brief IPv4 socket address (sockaddr_in wrapper).
 *
 * Peers are addressed as "a.b.c.d:port" text in the registry; Parse() and
 * ToString() convert between the two forms.
 */
class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /** @return kInvalidAddress when ip is not dotted-decimal IPv4. */
  static SocketResult<SocketAddress> FromIpv4(const char* ip,
                                              uint16_t port) noexcept {
    SocketAddress sa = AnyIpv4(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return SocketResult<SocketAddress>::error(SocketError::kInvalidAddress);
    }
    return SocketResult<SocketAddress>::success(sa);
  }

  /** @brief 0.0.0.0:port. */
  static SocketAddress AnyIpv4(uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_addr.s_addr = htonl(INADDR_ANY);
    sa.addr_.sin_port = htons(port);
    return sa;
  }

  /**
   * @brief Parse "a.b.c.d:port".
   * @return kInvalidAddress on a missing colon, a port outside 1..65535 or
   *         bad IPv4 text.
   */
  static SocketResult<SocketAddress> Parse(const std::string& host_port) {
    const size_t colon = host_port.rfind(':');
    if (colon == std::string::npos || colon == 0 ||
        colon + 1 >= host_port.size()) {
      return SocketResult<SocketAddress>::error(SocketError::kInvalidAddress);
    }
    const char* digits = host_port.c_str() + colon + 1;
    char* end = nullptr;
    const long port = std::strtol(digits, &end, 10);
    if (end == digits || *end != '\0' || port <= 0 || port > 65535) {
      return SocketResult<SocketAddress>::error(SocketError::kInvalidAddress);
    }
    return FromIpv4(host_port.substr(0, colon).c_str(),
                    static_cast<uint16_t>(port));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

  std::string Host() const {
    char buf[INET_ADDRSTRLEN] = {};
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof(buf));
    return std::string(buf);
  }

  /** @brief "host:port", the registry address format. */
  std::string ToString() const {
    return Host() + ":" + std::to_string(Port());
  }

  const in_addr& InAddr() const noexcept { return addr_.sin_addr; }

 private:
  sockaddr_in addr_;
};

/**
 * @brief Wait until fd is readable (or hung up).
 * @return false on timeout, error or a negative fd.
 */
inline bool PollReadable(int32_t fd, int32_t timeout_ms) noexcept {
  if (fd < 0) return false;
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  const int rc = ::poll(&pfd, 1, timeout_ms);
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

namespace detail {

/**
 * @brief Move-only owner of one socket descriptor; closes it on
 *        destruction. Base of the concrete socket types below.
 */
class FdOwner {
 public:
  FdOwner(const FdOwner&) = delete;
  FdOwner& operator=(const FdOwner&) = delete;

  /** @brief Close the descriptor. Idempotent. */
  void Close() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int32_t Fd() const noexcept { return fd_; }
  bool IsValid() const noexcept { return fd_ >= 0; }

 protected:
  explicit FdOwner(int32_t fd = -1) noexcept : fd_(fd) {}
  ~FdOwner() { Close(); }

  FdOwner(FdOwner&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  FdOwner& operator=(FdOwner&& other) noexcept {
    if (this != &other) {
      Close();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  /** @brief kInvalidFd when closed, success otherwise. */
  SocketResult<void> CheckFd() const noexcept {
    return fd_ < 0 ? SocketResult<void>::error(SocketError::kInvalidFd)
                   : SocketResult<void>::success();
  }

  template <typename T>
  SocketResult<void> SetOpt(int level, int name, const T& value) noexcept {
    if (fd_ < 0) return SocketResult<void>::error(SocketError::kInvalidFd);
    if (::setsockopt(fd_, level, name, &value,
                     static_cast<socklen_t>(sizeof(value))) < 0) {
      return SocketResult<void>::error(SocketError::kSetOptFailed);
    }
    return SocketResult<void>::success();
  }

  SocketResult<void> BindTo(const SocketAddress& addr) noexcept {
    if (fd_ < 0) return SocketResult<void>::error(SocketError::kInvalidFd);
    if (::bind(fd_, addr.Raw(), addr.Size()) < 0) {
      return SocketResult<void>::error(SocketError::kBindFailed);
    }
    return SocketResult<void>::success();
  }

  int32_t fd_;
};

inline timeval ToTimeval(uint32_t ms) noexcept {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms / 1000U);
  tv.tv_usec = static_cast<suseconds_t>((ms % 1000U) * 1000U);
  return tv;
}

}  // namespace detail

// ============================================================================
// TcpSocket
// ============================================================================

/**
 * @brief RAII TCP stream socket used for one framed message per connection.
 */
class TcpSocket : public detail::FdOwner {
 public:
  TcpSocket() noexcept = default;
  TcpSocket(TcpSocket&&) noexcept = default;
  TcpSocket& operator=(TcpSocket&&) noexcept = default;

  static SocketResult<TcpSocket> Create() noexcept {
    const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return SocketResult<TcpSocket>::error(SocketError::kInvalidFd);
    return SocketResult<TcpSocket>::success(TcpSocket(fd));
  }

  SocketResult<void> Connect(const SocketAddress& addr) noexcept {
    auto ok = CheckFd();
    if (!ok.has_value()) return ok;
    int rc;
    do {
      rc = ::connect(fd_, addr.Raw(), addr.Size());
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return SocketResult<void>::error(SocketError::kConnectFailed);
    return SocketResult<void>::success();
  }

  /**
   * @brief Write exactly len bytes, retrying short writes and EINTR.
   *        With a send timeout set, EAGAIN is reported as kTimeout.
   */
  SocketResult<void> SendAll(const void* data, size_t len) noexcept {
    auto ok = CheckFd();
    if (!ok.has_value()) return ok;
    const auto* p = static_cast<const uint8_t*>(data);
    size_t done = 0;
    while (done < len) {
      const ssize_t n = ::send(fd_, p + done, len - done, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) continue;
        return SocketResult<void>::error(
            (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kTimeout
                                                      : SocketError::kSendFailed);
      }
      done += static_cast<size_t>(n);
    }
    return SocketResult<void>::success();
  }

  /**
   * @brief Read exactly len bytes.
   *
   * kPeerClosed when the remote end closes first; kTimeout when a receive
   * timeout expires.
   */
  SocketResult<void> RecvAll(void* buf, size_t len) noexcept {
    auto ok = CheckFd();
    if (!ok.has_value()) return ok;
    auto* p = static_cast<uint8_t*>(buf);
    size_t done = 0;
    while (done < len) {
      const ssize_t n = ::recv(fd_, p + done, len - done, 0);
      if (n == 0) return SocketResult<void>::error(SocketError::kPeerClosed);
      if (n < 0) {
        if (errno == EINTR) continue;
        return SocketResult<void>::error(
            (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kTimeout
                                                      : SocketError::kRecvFailed);
      }
      done += static_cast<size_t>(n);
    }
    return SocketResult<void>::success();
  }

  SocketResult<void> SetNoDelay(bool enable) noexcept {
    const int32_t opt = enable ? 1 : 0;
    return SetOpt(IPPROTO_TCP, TCP_NODELAY, opt);
  }

  /** @brief SO_RCVTIMEO and SO_SNDTIMEO; 0 blocks forever. */
  SocketResult<void> SetTimeouts(uint32_t timeout_ms) noexcept {
    const timeval tv = detail::ToTimeval(timeout_ms);
    auto r = SetOpt(SOL_SOCKET, SO_RCVTIMEO, tv);
    if (!r.has_value()) return r;
    return SetOpt(SOL_SOCKET, SO_SNDTIMEO, tv);
  }

 private:
  friend class TcpListener;
  explicit TcpSocket(int32_t fd) noexcept : FdOwner(fd) {}
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener : public detail::FdOwner {
 public:
  TcpListener() noexcept = default;
  TcpListener(TcpListener&&) noexcept = default;
  TcpListener& operator=(TcpListener&&) noexcept = default;

  static SocketResult<TcpListener> Create() noexcept {
    const int32_t fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      return SocketResult<TcpListener>::error(SocketError::kInvalidFd);
    }
    return SocketResult<TcpListener>::success(TcpListener(fd));
  }

  SocketResult<void> SetReuseAddr(bool enable) noexcept {
    const int32_t opt = enable ? 1 : 0;
    return SetOpt(SOL_SOCKET, SO_REUSEADDR, opt);
  }

  SocketResult<void> Bind(const SocketAddress& addr) noexcept {
    return BindTo(addr);
  }

  SocketResult<void> Listen(int32_t backlog = kDefaultBacklog) noexcept {
    auto ok = CheckFd();
    if (!ok.has_value()) return ok;
    if (::listen(fd_, backlog) < 0) {
      return SocketResult<void>::error(SocketError::kListenFailed);
    }
    return SocketResult<void>::success();
  }

  /** @brief Accept one connection; client_addr receives the remote end. */
  SocketResult<TcpSocket> Accept(SocketAddress& client_addr) noexcept {
    if (fd_ < 0) return SocketResult<TcpSocket>::error(SocketError::kInvalidFd);
    socklen_t len = client_addr.Size();
    const int32_t client = ::accept(fd_, client_addr.RawMut(), &len);
    if (client < 0) {
      return SocketResult<TcpSocket>::error(SocketError::kAcceptFailed);
    }
    return SocketResult<TcpSocket>::success(TcpSocket(client));
  }

  /** @brief Port actually bound; resolves a bind to port 0. */
  uint16_t LocalPort() const noexcept {
    if (fd_ < 0) return 0;
    SocketAddress local;
    socklen_t len = local.Size();
    if (::getsockname(fd_, local.RawMut(), &len) != 0) return 0;
    return local.Port();
  }

 private:
  explicit TcpListener(int32_t fd) noexcept : FdOwner(fd) {}
};

// ============================================================================
// UdpSocket
// ============================================================================

/**
 * @brief RAII UDP socket with the IPv4 multicast options discovery needs.
 */
class UdpSocket : public detail::FdOwner {
 public:
  UdpSocket() noexcept = default;
  UdpSocket(UdpSocket&&) noexcept = default;
  UdpSocket& operator=(UdpSocket&&) noexcept = default;

  static SocketResult<UdpSocket> Create() noexcept {
    const int32_t fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return SocketResult<UdpSocket>::error(SocketError::kInvalidFd);
    return SocketResult<UdpSocket>::success(UdpSocket(fd));
  }

  /** @brief SO_REUSEADDR, plus SO_REUSEPORT where the platform has it. */
  SocketResult<void> SetReuse(bool enable) noexcept {
    const int32_t opt = enable ? 1 : 0;
    auto r = SetOpt(SOL_SOCKET, SO_REUSEADDR, opt);
#ifdef SO_REUSEPORT
    if (r.has_value()) r = SetOpt(SOL_SOCKET, SO_REUSEPORT, opt);
#endif
    return r;
  }

  SocketResult<void> Bind(const SocketAddress& addr) noexcept {
    return BindTo(addr);
  }

  /** @brief IP_ADD_MEMBERSHIP for group on every interface. */
  SocketResult<void> JoinGroup(const SocketAddress& group) noexcept {
    ip_mreq mreq{};
    mreq.imr_multiaddr = group.InAddr();
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    return SetOpt(IPPROTO_IP, IP_ADD_MEMBERSHIP, mreq);
  }

  /** @brief IP_MULTICAST_LOOP; nodes on one host see each other with it on. */
  SocketResult<void> SetMulticastLoop(bool enable) noexcept {
    const uint8_t opt = enable ? 1 : 0;
    return SetOpt(IPPROTO_IP, IP_MULTICAST_LOOP, opt);
  }

  SocketResult<int32_t> SendTo(const void* data, size_t len,
                               const SocketAddress& dest) noexcept {
    if (fd_ < 0) return SocketResult<int32_t>::error(SocketError::kInvalidFd);
    const ssize_t n = ::sendto(fd_, data, len, 0, dest.Raw(), dest.Size());
    if (n < 0) return SocketResult<int32_t>::error(SocketError::kSendFailed);
    return SocketResult<int32_t>::success(static_cast<int32_t>(n));
  }

  SocketResult<int32_t> RecvFrom(void* buf, size_t len,
                                 SocketAddress& src) noexcept {
    if (fd_ < 0) return SocketResult<int32_t>::error(SocketError::kInvalidFd);
    socklen_t addr_len = src.Size();
    const ssize_t n = ::recvfrom(fd_, buf, len, 0, src.RawMut(), &addr_len);
    if (n < 0) {
      return SocketResult<int32_t>::error(
          (errno == EAGAIN || errno == EWOULDBLOCK) ? SocketError::kWouldBlock
                                                    : SocketError::kRecvFailed);
    }
    return SocketResult<int32_t>::success(static_cast<int32_t>(n));
  }

 private:
  explicit UdpSocket(int32_t fd) noexcept : FdOwner(fd) {}
};

}  // namespace lanxfer

#endif  // LANXFER_HAS_NETWORK

#endif  // LANXFER_SOCKET_HPP_
