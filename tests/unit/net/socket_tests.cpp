#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

#ifndef _WIN32
#include <pthread.h>
#include <signal.h>
#include <unistd.h>
#endif

#include "net/socket.hpp"

namespace {

#ifndef _WIN32

void IgnoreSignal(int) {}

class Pipe {
 public:
  Pipe() {
    if (::pipe(fds_) != 0) {
      fds_[0] = fds_[1] = -1;
    }
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;
  ~Pipe() {
    CloseWriter();
    if (fds_[0] >= 0) {
      ::close(fds_[0]);
    }
  }

  bool ok() const { return fds_[0] >= 0; }
  int reader() const { return fds_[0]; }
  bool WriteByte() { return ::write(fds_[1], "x", 1) == 1; }
  void CloseWriter() {
    if (fds_[1] >= 0) {
      ::close(fds_[1]);
      fds_[1] = -1;
    }
  }

 private:
  int fds_[2];
};

bool TestReadiness() {
  Pipe pipe;
  if (!pipe.ok()) {
    std::cerr << "socket_tests: pipe() failed\n";
    return false;
  }
  std::string error;
  if (dappvault::net::WaitReadable(pipe.reader(), 20, &error) || !error.empty()) {
    std::cerr << "socket_tests: empty pipe reported readable\n";
    return false;
  }
  if (!pipe.WriteByte() || !dappvault::net::WaitReadable(pipe.reader(), 20, &error)) {
    std::cerr << "socket_tests: pending byte not reported\n";
    return false;
  }
  Pipe closed;
  closed.CloseWriter();
  if (!dappvault::net::WaitReadable(closed.reader(), 20, &error) || !error.empty()) {
    std::cerr << "socket_tests: hang-up should wake the reader\n";
    return false;
  }
  return true;
}

bool TestInterruptedWaitIsNotInput() {
  struct sigaction action {};
  action.sa_handler = IgnoreSignal;
  sigemptyset(&action.sa_mask);
  struct sigaction previous {};
  if (::sigaction(SIGUSR1, &action, &previous) != 0) {
    std::cerr << "socket_tests: sigaction failed\n";
    return false;
  }

  Pipe pipe;
  const pthread_t waiter = ::pthread_self();
  std::thread interrupter([waiter] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ::pthread_kill(waiter, SIGUSR1);
  });
  std::string error;
  const auto started = std::chrono::steady_clock::now();
  const bool ready = dappvault::net::WaitReadable(pipe.reader(), 3000, &error);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  interrupter.join();
  ::sigaction(SIGUSR1, &previous, nullptr);

  if (ready || !error.empty()) {
    std::cerr << "socket_tests: interrupted wait reported input: " << error << "\n";
    return false;
  }
  if (elapsed > std::chrono::milliseconds(2000)) {
    std::cerr << "socket_tests: signal did not end the wait\n";
    return false;
  }
  return true;
}

#endif

}  // namespace

int main() {
  try {
#ifndef _WIN32
    if (!TestReadiness()) {
      return EXIT_FAILURE;
    }
    if (!TestInterruptedWaitIsNotInput()) {
      return EXIT_FAILURE;
    }
#endif
  } catch (const std::exception& ex) {
    std::cerr << "socket_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
