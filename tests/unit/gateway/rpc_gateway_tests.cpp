#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include "../support/fake_gateway.hpp"
#include "gateway/key_format.hpp"
#include "gateway/rpc_gateway.hpp"
#include "net/socket.hpp"
#include "util/base64.hpp"
#include "util/errors.hpp"

using dappvault::gateway::ExtractHttpBody;
using dappvault::gateway::RpcGateway;
using dappvault::gateway::RpcGatewayOptions;

namespace {

bool TestKeyFormats() {
  using namespace dappvault::gateway;
  using dappvault::test::kFakeAddress;
  using dappvault::test::kFakePrivateKey;
  using dappvault::test::kFakeViewKey;
  if (!IsValidPrivateKey(kFakePrivateKey) || !IsValidViewKey(kFakeViewKey) ||
      !IsValidAddress(kFakeAddress)) {
    std::cerr << "rpc_gateway_tests: well-formed keys rejected\n";
    return false;
  }
  std::string bad_char = kFakePrivateKey;
  bad_char[20] = '-';
  if (IsValidPrivateKey(bad_char) || IsValidPrivateKey(kFakePrivateKey.substr(0, 58)) ||
      IsValidPrivateKey(kFakeViewKey) || IsValidAddress("aleo1") ||
      IsValidAddress("ALEO1" + kFakeAddress.substr(5))) {
    std::cerr << "rpc_gateway_tests: malformed keys accepted\n";
    return false;
  }
  if (!IsValidSeedPhrase(dappvault::test::kFakePhrase) ||
      IsValidSeedPhrase("abandon  ability able about above absent absorb abstract absurd abuse "
                        "access accident") ||
      IsValidSeedPhrase("Abandon ability able about above absent absorb abstract absurd abuse "
                        "access accident") ||
      IsValidSeedPhrase("one two three")) {
    std::cerr << "rpc_gateway_tests: seed phrase shape check wrong\n";
    return false;
  }
  return true;
}

bool TestExtractHttpBody() {
  std::string body;
  int status = 0;
  const std::string ok =
      "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\ncontent-length: 11\r\n\r\n"
      "{\"a\":true}\ntrailing";
  if (!ExtractHttpBody(ok, &body, &status) || status != 200 || body != "{\"a\":true}\n") {
    std::cerr << "rpc_gateway_tests: content-length body not extracted\n";
    return false;
  }
  if (ExtractHttpBody("HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\n{}", &body, &status) ||
      ExtractHttpBody("HTTP/1.1 200 OK\r\nContent-Length: 2\r\n", &body, &status) ||
      ExtractHttpBody("SSH-2.0-OpenSSH\r\n\r\n", &body, &status)) {
    std::cerr << "rpc_gateway_tests: incomplete or foreign response accepted\n";
    return false;
  }
  if (!ExtractHttpBody("HTTP/1.0 401 Unauthorized\r\n\r\nnope", &body, &status) || status != 401 ||
      body != "nope") {
    std::cerr << "rpc_gateway_tests: body without length should run to the end\n";
    return false;
  }
  if (dappvault::util::Base64Encode("alice:s3cret") != "YWxpY2U6czNjcmV0") {
    std::cerr << "rpc_gateway_tests: base64 encoding wrong\n";
    return false;
  }
  return true;
}

#ifndef _WIN32

std::string HttpReply(const std::string& body, int status = 200) {
  return "HTTP/1.1 " + std::to_string(status) + " X\r\nContent-Type: application/json\r\n" +
         "Content-Length: " + std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body;
}

// Loopback stand-in for the chain client: answers one connection per scripted
// reply and records each raw request.
class ScriptedServer {
 public:
  ScriptedServer() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof(addr);
    if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 4) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      throw std::runtime_error("failed to bind loopback listener");
    }
    port_ = ntohs(addr.sin_port);
  }
  ~ScriptedServer() {
    if (thread_.joinable()) {
      thread_.join();
    }
    ::close(fd_);
  }

  std::uint16_t port() const { return port_; }

  void Serve(std::vector<std::string> replies) {
    thread_ = std::thread([this, replies = std::move(replies)] {
      for (const auto& reply : replies) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 3000) <= 0) {
          return;
        }
        const int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
          return;
        }
        std::string request = ReadRequest(client);
        {
          std::lock_guard<std::mutex> lock(mutex_);
          requests_.push_back(std::move(request));
        }
        ::send(client, reply.data(), reply.size(), 0);
        ::close(client);
      }
    });
  }

  std::vector<std::string> Requests() {
    if (thread_.joinable()) {
      thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  static std::string ReadRequest(int client) {
    std::string data;
    char buffer[2048];
    while (true) {
      pollfd pfd{client, POLLIN, 0};
      if (::poll(&pfd, 1, 3000) <= 0) {
        break;
      }
      const auto n = ::recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) {
        break;
      }
      data.append(buffer, static_cast<std::size_t>(n));
      const auto header_end = data.find("\r\n\r\n");
      const auto length_pos = data.find("Content-Length: ");
      if (header_end != std::string::npos && length_pos != std::string::npos &&
          length_pos < header_end) {
        const auto length = std::stoul(data.substr(length_pos + 16));
        if (data.size() >= header_end + 4 + length) {
          break;
        }
      }
    }
    return data;
  }

  int fd_{-1};
  std::uint16_t port_{0};
  std::thread thread_;
  std::mutex mutex_;
  std::vector<std::string> requests_;
};

nlohmann::json RequestJson(const std::string& raw) {
  return nlohmann::json::parse(raw.substr(raw.find("\r\n\r\n") + 4));
}

bool TestRpcExchange() {
  ScriptedServer server;
  server.Serve({
      HttpReply(R"({"jsonrpc":"2.0","id":1,"result":{"public":5000000,"private":250}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":2,"error":{"code":-32004,"message":"unknown tx"}})"),
      HttpReply(
          R"({"jsonrpc":"2.0","id":3,"result":{"status":"accepted","block_height":77,"fee":1500}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32000,"message":"no funds"}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":5,"result":"at1submitted"})"),
      HttpReply("denied", 401),
  });

  RpcGatewayOptions options;
  options.port = server.port();
  options.user = "alice";
  options.password = "s3cret";
  options.timeout_ms = 3000;
  RpcGateway gateway(options);

  const auto balance = gateway.GetBalance(dappvault::test::kFakeAddress);
  if (balance.public_balance != 5000000 || balance.private_balance != 250) {
    std::cerr << "rpc_gateway_tests: balance not decoded\n";
    return false;
  }
  const auto missing = gateway.GetTransactionStatus("at1missing");
  if (missing.found) {
    std::cerr << "rpc_gateway_tests: not-found code should map to found=false\n";
    return false;
  }
  const auto known = gateway.GetTransactionStatus("at1known");
  if (!known.found || known.status != "accepted" || known.block_height != 77u ||
      known.fee != 1500 || known.confirmations) {
    std::cerr << "rpc_gateway_tests: status not decoded\n";
    return false;
  }
  try {
    gateway.SubmitTransfer(dappvault::test::kFakePrivateKey, dappvault::test::kRecipient, 1, 1);
    std::cerr << "rpc_gateway_tests: JSON-RPC error should throw\n";
    return false;
  } catch (const dappvault::util::ValidationError& ex) {
    if (std::string(ex.what()).find("no funds") == std::string::npos) {
      std::cerr << "rpc_gateway_tests: client message lost: " << ex.what() << "\n";
      return false;
    }
  }
  if (gateway.SubmitProgramExecution(dappvault::test::kFakePrivateKey, "token.aleo", "mint",
                                     {"1u64"}, 10) != "at1submitted") {
    std::cerr << "rpc_gateway_tests: string result should be the txId\n";
    return false;
  }
  try {
    gateway.GetBalance(dappvault::test::kFakeAddress);
    std::cerr << "rpc_gateway_tests: HTTP 401 should throw\n";
    return false;
  } catch (const dappvault::util::NetworkError&) {
  }

  const auto requests = server.Requests();
  if (requests.size() != 6 ||
      requests[0].find("Authorization: Basic YWxpY2U6czNjcmV0\r\n") == std::string::npos) {
    std::cerr << "rpc_gateway_tests: requests missing or unauthenticated\n";
    return false;
  }
  const auto first = RequestJson(requests[0]);
  const auto exec = RequestJson(requests[4]);
  if (first.at("jsonrpc") != "2.0" || first.at("method") != "balance" ||
      first.at("params").at("address") != dappvault::test::kFakeAddress ||
      exec.at("method") != "execute" || exec.at("params").at("function") != "mint" ||
      exec.at("params").at("inputs").size() != 1 || exec.at("params").at("fee") != 10) {
    std::cerr << "rpc_gateway_tests: request payload wrong\n";
    return false;
  }
  return true;
}

template <typename Fn>
bool ThrowsNetworkError(Fn&& fn) {
  try {
    fn();
  } catch (const dappvault::util::NetworkError&) {
    return true;
  }
  return false;
}

bool TestMalformedRepliesAndChainQueries() {
  ScriptedServer server;
  server.Serve({
      HttpReply(R"({"jsonrpc":"2.0","id":1,"result":{"public":"abc"}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":2})"),
      HttpReply("[1,2]"),
      HttpReply(R"({"jsonrpc":"2.0","id":4,"result":{"private":7}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":5,"result":812})"),
      HttpReply(R"({"jsonrpc":"2.0","id":6,"result":-1})"),
      HttpReply(R"({"jsonrpc":"2.0","id":7,"result":true})"),
      HttpReply(R"({"jsonrpc":"2.0","id":8,"result":{"valid":false}})"),
      HttpReply(R"({"jsonrpc":"2.0","id":9,"result":"yes"})"),
  });

  RpcGatewayOptions options;
  options.port = server.port();
  options.timeout_ms = 3000;
  RpcGateway gateway(options);
  const auto& address = dappvault::test::kFakeAddress;

  if (!ThrowsNetworkError([&] { gateway.GetBalance(address); }) ||
      !ThrowsNetworkError([&] { gateway.GetTransactionStatus("at1x"); }) ||
      !ThrowsNetworkError([&] { gateway.GetBalance(address); })) {
    std::cerr << "rpc_gateway_tests: malformed replies should be network errors\n";
    return false;
  }
  const auto partial = gateway.GetBalance(address);
  if (partial.public_balance != 0 || partial.private_balance != 7) {
    std::cerr << "rpc_gateway_tests: absent balance field should read as zero\n";
    return false;
  }
  if (gateway.GetLatestBlockHeight() != 812 ||
      !ThrowsNetworkError([&] { gateway.GetLatestBlockHeight(); })) {
    std::cerr << "rpc_gateway_tests: latest_height not decoded\n";
    return false;
  }
  if (!gateway.VerifySignature(address, "hello", "sign1hello") ||
      gateway.VerifySignature(address, "hello", "sign1hello") ||
      !ThrowsNetworkError([&] { gateway.VerifySignature(address, "hello", "sign1hello"); })) {
    std::cerr << "rpc_gateway_tests: verify_signature not decoded\n";
    return false;
  }

  const auto requests = server.Requests();
  if (requests.size() != 9) {
    std::cerr << "rpc_gateway_tests: expected nine requests\n";
    return false;
  }
  const auto height = RequestJson(requests[4]);
  const auto verify = RequestJson(requests[6]);
  if (height.at("method") != "latest_height" || verify.at("method") != "verify_signature" ||
      verify.at("params").at("address") != address ||
      verify.at("params").at("message") != "hello" ||
      verify.at("params").at("signature") != "sign1hello") {
    std::cerr << "rpc_gateway_tests: chain query payload wrong\n";
    return false;
  }
  return true;
}

bool TestUnreachableClient() {
  std::uint16_t port = 0;
  {
    ScriptedServer closed;
    port = closed.port();
  }
  RpcGatewayOptions options;
  options.port = port;
  options.timeout_ms = 500;
  RpcGateway gateway(options);
  try {
    gateway.GetTransactionStatus("at1x");
    std::cerr << "rpc_gateway_tests: unreachable client should throw\n";
    return false;
  } catch (const dappvault::util::NetworkError&) {
  }
  return true;
}

#endif

}  // namespace

int main() {
  try {
    if (!dappvault::net::InitializeSockets()) {
      std::cerr << "rpc_gateway_tests: socket init failed\n";
      return EXIT_FAILURE;
    }
    if (!TestKeyFormats()) {
      return EXIT_FAILURE;
    }
    if (!TestExtractHttpBody()) {
      return EXIT_FAILURE;
    }
#ifndef _WIN32
    if (!TestRpcExchange()) {
      return EXIT_FAILURE;
    }
    if (!TestMalformedRepliesAndChainQueries()) {
      return EXIT_FAILURE;
    }
    if (!TestUnreachableClient()) {
      return EXIT_FAILURE;
    }
#endif
  } catch (const std::exception& ex) {
    std::cerr << "rpc_gateway_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
