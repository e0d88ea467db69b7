#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dappvault::net {

// Blocking TCP client socket used to reach the external chain client.
class TcpSocket {
 public:
  TcpSocket();
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  // Tries every resolved address in turn, each bounded by `timeout_ms`.
  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms,
               std::string* error = nullptr);
  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);
  void Close();
  bool IsValid() const noexcept;

 private:
  std::intptr_t handle_{-1};
};

bool InitializeSockets();

// Polls a descriptor for input. A timeout or a signal-interrupted wait
// returns false. Any other poll failure is reported through `error` and
// returns true so the caller's next read surfaces it.
bool WaitReadable(int fd, int timeout_ms, std::string* error = nullptr);

}  // namespace dappvault::net
