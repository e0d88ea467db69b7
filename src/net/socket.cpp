#include "net/socket.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <WS2tcpip.h>
#include <winsock2.h>
#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib")
#endif
using socket_handle = SOCKET;
constexpr socket_handle kInvalidSocket = INVALID_SOCKET;
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
using socket_handle = int;
constexpr socket_handle kInvalidSocket = -1;
#endif

namespace dappvault::net {

namespace {

class WinsockInitializer {
 public:
  WinsockInitializer() {
#ifdef _WIN32
    WSADATA wsa_data{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
      throw std::runtime_error("WSAStartup failed");
    }
#endif
  }

  ~WinsockInitializer() {
#ifdef _WIN32
    WSACleanup();
#endif
  }
};

void CloseHandle(socket_handle handle) {
  if (handle == kInvalidSocket) {
    return;
  }
#ifdef _WIN32
  closesocket(handle);
#else
  close(handle);
#endif
}

int LastSocketError() {
#ifdef _WIN32
  return WSAGetLastError();
#else
  return errno;
#endif
}

void SetNonBlocking(socket_handle fd, bool enable) {
#ifdef _WIN32
  u_long mode = enable ? 1 : 0;
  (void)::ioctlsocket(fd, FIONBIO, &mode);
#else
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return;
  }
  (void)fcntl(fd, F_SETFL, enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK));
#endif
}

// Non-blocking connect bounded by select(); the socket is returned to
// blocking mode whatever the outcome.
bool ConnectWithTimeout(socket_handle fd, const sockaddr* addr, socklen_t addr_len,
                        int timeout_ms, int* error_code) {
  SetNonBlocking(fd, true);
  if (::connect(fd, addr, addr_len) == 0) {
    SetNonBlocking(fd, false);
    return true;
  }
  const int connect_err = LastSocketError();
#ifdef _WIN32
  const bool in_progress = connect_err == WSAEWOULDBLOCK || connect_err == WSAEINPROGRESS;
#else
  const bool in_progress = connect_err == EINPROGRESS;
#endif
  if (!in_progress) {
    SetNonBlocking(fd, false);
    *error_code = connect_err;
    return false;
  }

  fd_set write_fds;
  FD_ZERO(&write_fds);
  FD_SET(fd, &write_fds);
  timeval tv{timeout_ms / 1000, (timeout_ms % 1000) * 1000};
#ifdef _WIN32
  const int ready = ::select(0, nullptr, &write_fds, nullptr, &tv);
  int so_error_len = sizeof(int);
#else
  const int ready = ::select(fd + 1, nullptr, &write_fds, nullptr, &tv);
  socklen_t so_error_len = sizeof(int);
#endif
  int so_error = 0;
  const int so_rc = ::getsockopt(fd, SOL_SOCKET, SO_ERROR,
                                 reinterpret_cast<char*>(&so_error), &so_error_len);
  SetNonBlocking(fd, false);
  if (ready <= 0 || so_rc != 0 || so_error != 0) {
    *error_code = so_error != 0 ? so_error : (ready == 0 ? ETIMEDOUT : connect_err);
    return false;
  }
  return true;
}

}  // namespace

bool InitializeSockets() {
  try {
    static WinsockInitializer init{};
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

TcpSocket::TcpSocket() {
  InitializeSockets();
  handle_ = static_cast<std::intptr_t>(kInvalidSocket);
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept {
  handle_ = other.handle_;
  other.handle_ = static_cast<std::intptr_t>(kInvalidSocket);
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = static_cast<std::intptr_t>(kInvalidSocket);
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms,
                        std::string* error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  addrinfo* result = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result) != 0 || result == nullptr) {
    if (result) {
      freeaddrinfo(result);
    }
    if (error) {
      *error = "failed to resolve " + host;
    }
    return false;
  }

  int last_error = 0;
  for (auto* entry = result; entry != nullptr; entry = entry->ai_next) {
    const socket_handle sock = ::socket(entry->ai_family, SOCK_STREAM, IPPROTO_TCP);
    if (sock == kInvalidSocket) {
      last_error = LastSocketError();
      continue;
    }
    if (ConnectWithTimeout(sock, entry->ai_addr, static_cast<socklen_t>(entry->ai_addrlen),
                           timeout_ms, &last_error)) {
      Close();
      handle_ = static_cast<std::intptr_t>(sock);
      freeaddrinfo(result);
      return true;
    }
    CloseHandle(sock);
  }
  freeaddrinfo(result);
  if (error) {
    *error = "connect(" + host + ":" + port_str + ") failed: " + std::strerror(last_error);
  }
  return false;
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
#ifdef _WIN32
  return ::send(static_cast<socket_handle>(handle_), reinterpret_cast<const char*>(data),
                static_cast<int>(length), 0);
#else
  return ::send(handle_, data, length, MSG_NOSIGNAL);
#endif
}

bool TcpSocket::SendAll(std::string_view data) const {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = Send(reinterpret_cast<const std::uint8_t*>(data.data()) + sent,
                        data.size() - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
#ifdef _WIN32
  return ::recv(static_cast<socket_handle>(handle_), reinterpret_cast<char*>(data),
                static_cast<int>(length), 0);
#else
  return ::recv(handle_, data, length, 0);
#endif
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
#ifdef _WIN32
  DWORD timeout = static_cast<DWORD>(milliseconds);
  const auto fd = static_cast<socket_handle>(handle_);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, reinterpret_cast<const char*>(&timeout),
                      sizeof(timeout)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, reinterpret_cast<const char*>(&timeout),
                      sizeof(timeout)) == 0;
#else
  struct timeval tv {
    milliseconds / 1000, (milliseconds % 1000) * 1000
  };
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
#endif
}

void TcpSocket::Close() {
  const auto invalid = static_cast<std::intptr_t>(kInvalidSocket);
  if (handle_ != invalid) {
    CloseHandle(static_cast<socket_handle>(handle_));
    handle_ = invalid;
  }
}

bool TcpSocket::IsValid() const noexcept {
  return handle_ != static_cast<std::intptr_t>(kInvalidSocket);
}

bool WaitReadable(int fd, int timeout_ms, std::string* error) {
#ifdef _WIN32
  (void)fd;
  (void)timeout_ms;
  (void)error;
  return true;
#else
  pollfd entry{};
  entry.fd = fd;
  entry.events = POLLIN;
  const int rc = ::poll(&entry, 1, timeout_ms);
  if (rc > 0) {
    return true;
  }
  if (rc == 0 || errno == EINTR) {
    return false;
  }
  if (error) {
    *error = std::string("poll failed: ") + std::strerror(errno);
  }
  return true;
#endif
}

}  // namespace dappvault::net
