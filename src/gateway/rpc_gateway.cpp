#include "gateway/rpc_gateway.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <utility>

#include "net/socket.hpp"
#include "util/base64.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"

namespace dappvault::gateway {

namespace {

std::string BuildHttpRequest(const std::string& host, std::uint16_t port,
                             const std::string& body, const std::string& basic_auth) {
  std::ostringstream oss;
  oss << "POST / HTTP/1.1\r\n";
  oss << "Host: " << host << ":" << port << "\r\n";
  if (!basic_auth.empty()) {
    oss << "Authorization: Basic " << basic_auth << "\r\n";
  }
  oss << "Content-Type: application/json\r\n";
  oss << "Content-Length: " << body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << body;
  return oss.str();
}

bool HeaderNameEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::optional<std::size_t> ParseContentLength(std::string_view headers) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    const auto line = headers.substr(offset, end - offset);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && HeaderNameEquals(line.substr(0, colon), "Content-Length")) {
      auto value = line.substr(colon + 1);
      while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
      }
      try {
        return static_cast<std::size_t>(std::stoull(std::string(value)));
      } catch (const std::exception&) {
        return std::nullopt;
      }
    }
    offset = end + 2;
  }
  return std::nullopt;
}

std::string TakeString(const nlohmann::json& object, const char* key) {
  if (!object.is_object() || !object.contains(key) || !object.at(key).is_string()) {
    throw util::NetworkError(std::string("malformed gateway response: missing ") + key);
  }
  return object.at(key).get<std::string>();
}

util::SecretBuffer TakeSecret(nlohmann::json& object, const char* key) {
  auto value = TakeString(object, key);
  util::SecretBuffer secret(value);
  util::SecureWipe(value);
  // Overwrite the DOM copy before the document is destroyed.
  auto& slot = object.at(key).get_ref<std::string&>();
  util::SecureWipe(slot);
  return secret;
}

KeyMaterial ParseKeyMaterial(nlohmann::json& result) {
  KeyMaterial material;
  material.address = TakeString(result, "address");
  material.private_key = TakeSecret(result, "private_key");
  material.view_key = TakeSecret(result, "view_key");
  if (result.contains("seed_phrase") && result.at("seed_phrase").is_string()) {
    material.seed_phrase = TakeSecret(result, "seed_phrase");
  }
  return material;
}

std::string TxIdFrom(const nlohmann::json& result) {
  if (result.is_string()) {
    return result.get<std::string>();
  }
  return TakeString(result, "tx_id");
}

template <typename T>
std::optional<T> OptionalNumber(const nlohmann::json& object, const char* key) {
  if (!object.contains(key) || !object.at(key).is_number()) {
    return std::nullopt;
  }
  return object.at(key).get<T>();
}

// Absent means zero; present but not an integer means the reply is malformed.
std::int64_t IntegerOrZero(const nlohmann::json& object, const char* key) {
  if (!object.contains(key) || object.at(key).is_null()) {
    return 0;
  }
  if (!object.at(key).is_number_integer()) {
    throw util::NetworkError(std::string("malformed gateway response: ") + key +
                             " is not an integer");
  }
  return object.at(key).get<std::int64_t>();
}

std::string ErrorMessage(const nlohmann::json& err, const char* fallback) {
  if (err.is_object() && err.contains("message") && err.at("message").is_string()) {
    return err.at("message").get<std::string>();
  }
  return err.is_object() ? std::string(fallback) : err.dump();
}

}  // namespace

bool ExtractHttpBody(const std::string& response, std::string* body, int* status_code) {
  const auto header_end = response.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return false;
  }
  const std::string_view headers(response.data(), header_end);
  if (headers.substr(0, 5) != "HTTP/") {
    return false;
  }
  if (status_code) {
    const auto space = headers.find(' ');
    *status_code = 0;
    if (space != std::string_view::npos && space + 4 <= headers.size()) {
      try {
        *status_code = std::stoi(std::string(headers.substr(space + 1, 3)));
      } catch (const std::exception&) {
        return false;
      }
    }
  }
  const auto body_offset = header_end + 4;
  const auto length = ParseContentLength(headers);
  if (length) {
    if (response.size() < body_offset + *length) {
      return false;
    }
    *body = response.substr(body_offset, *length);
  } else {
    *body = response.substr(body_offset);
  }
  return true;
}

RpcGateway::RpcGateway(RpcGatewayOptions options) : options_(std::move(options)) {
  if (!options_.user.empty() || !options_.password.empty()) {
    basic_auth_ = util::Base64Encode(options_.user + ":" + options_.password);
  }
}

nlohmann::json RpcGateway::Exchange(const std::string& method, nlohmann::json params) {
  nlohmann::json request = {
      {"jsonrpc", "2.0"},
      {"id", next_id_.fetch_add(1)},
      {"method", method},
      {"params", std::move(params)},
  };
  std::string payload = request.dump();
  std::string http = BuildHttpRequest(options_.host, options_.port, payload, basic_auth_);
  util::SecureWipe(payload);

  net::TcpSocket socket;
  std::string error;
  if (!socket.Connect(options_.host, options_.port, options_.timeout_ms, &error)) {
    util::SecureWipe(http);
    throw util::NetworkError(error);
  }
  if (!socket.SetTimeout(options_.timeout_ms)) {
    util::SecureWipe(http);
    throw util::NetworkError("failed to set socket timeout");
  }
  const bool sent = socket.SendAll(http);
  util::SecureWipe(http);
  if (!sent) {
    throw util::NetworkError("failed to send request to chain client");
  }

  std::string response;
  std::array<std::uint8_t, 4096> chunk{};
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes < 0) {
      throw util::NetworkError("read from chain client failed or timed out");
    }
    if (bytes == 0) {
      break;
    }
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (response.size() > options_.max_response_bytes) {
      throw util::NetworkError("chain client response too large");
    }
    std::string body;
    if (ExtractHttpBody(response, &body, nullptr) &&
        ParseContentLength(std::string_view(response).substr(0, response.find("\r\n\r\n")))) {
      break;
    }
  }
  socket.Close();

  std::string body;
  int status = 0;
  if (!ExtractHttpBody(response, &body, &status)) {
    throw util::NetworkError("malformed HTTP response from chain client");
  }
  if (status == 401 || status == 403) {
    throw util::NetworkError("chain client rejected credentials (HTTP " + std::to_string(status) + ")");
  }
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& ex) {
    throw util::NetworkError(std::string("invalid JSON from chain client: ") + ex.what());
  }
  if (!reply.is_object()) {
    throw util::NetworkError(method + ": response is not a JSON-RPC object");
  }
  return reply;
}

nlohmann::json RpcGateway::Call(const std::string& method, nlohmann::json params) {
  auto reply = Exchange(method, std::move(params));
  if (reply.contains("error") && !reply.at("error").is_null()) {
    throw util::ValidationError(method + ": " +
                                ErrorMessage(reply.at("error"), "request rejected"));
  }
  if (!reply.contains("result")) {
    throw util::NetworkError(method + ": response has neither result nor error");
  }
  return std::move(reply.at("result"));
}

KeyMaterial RpcGateway::GenerateKeyMaterial() {
  auto result = Call("account_new", nlohmann::json::object());
  return ParseKeyMaterial(result);
}

KeyMaterial RpcGateway::KeyMaterialFromSeed(std::string_view phrase) {
  nlohmann::json params = {{"phrase", std::string(phrase)}};
  auto result = Call("account_from_seed", std::move(params));
  auto material = ParseKeyMaterial(result);
  if (!material.seed_phrase) {
    material.seed_phrase = util::SecretBuffer(phrase);
  }
  return material;
}

ImportedKey RpcGateway::ImportKeyMaterial(std::string_view private_key) {
  nlohmann::json params = {{"private_key", std::string(private_key)}};
  auto result = Call("account_import", std::move(params));
  ImportedKey imported;
  imported.address = TakeString(result, "address");
  imported.view_key = TakeSecret(result, "view_key");
  return imported;
}

std::string RpcGateway::SubmitTransfer(std::string_view private_key, const std::string& to,
                                       std::int64_t amount, std::int64_t fee) {
  nlohmann::json params = {
      {"private_key", std::string(private_key)},
      {"to", to},
      {"amount", amount},
      {"fee", fee},
  };
  return TxIdFrom(Call("transfer", std::move(params)));
}

std::string RpcGateway::SubmitProgramExecution(std::string_view private_key,
                                               const std::string& program_id,
                                               const std::string& function_name,
                                               const std::vector<std::string>& inputs,
                                               std::int64_t fee) {
  nlohmann::json params = {
      {"private_key", std::string(private_key)},
      {"program_id", program_id},
      {"function", function_name},
      {"inputs", inputs},
      {"fee", fee},
  };
  return TxIdFrom(Call("execute", std::move(params)));
}

TransactionStatus RpcGateway::GetTransactionStatus(const std::string& tx_id) {
  auto reply = Exchange("transaction_status", {{"tx_id", tx_id}});
  TransactionStatus status;
  if (reply.contains("error") && !reply.at("error").is_null()) {
    const auto& err = reply.at("error");
    if (err.is_object() && OptionalNumber<int>(err, "code") == kNotFoundCode) {
      status.found = false;
      return status;
    }
    throw util::ValidationError("transaction_status: " + ErrorMessage(err, "rejected"));
  }
  if (!reply.contains("result")) {
    throw util::NetworkError("transaction_status: response has neither result nor error");
  }
  const auto& result = reply.at("result");
  if (result.is_null()) {
    return status;
  }
  status.found = true;
  status.status = TakeString(result, "status");
  status.block_height = OptionalNumber<std::uint64_t>(result, "block_height");
  status.confirmations = OptionalNumber<std::uint64_t>(result, "confirmations");
  status.fee = OptionalNumber<std::int64_t>(result, "fee");
  return status;
}

Balance RpcGateway::GetBalance(const std::string& address) {
  const auto result = Call("balance", {{"address", address}});
  if (!result.is_object()) {
    throw util::NetworkError("balance: expected an object");
  }
  Balance balance;
  balance.public_balance = IntegerOrZero(result, "public");
  balance.private_balance = IntegerOrZero(result, "private");
  return balance;
}

std::uint64_t RpcGateway::GetLatestBlockHeight() {
  const auto result = Call("latest_height", nlohmann::json::object());
  if (!result.is_number_unsigned()) {
    throw util::NetworkError("latest_height: expected a non-negative integer");
  }
  return result.get<std::uint64_t>();
}

bool RpcGateway::VerifySignature(const std::string& address, std::string_view message,
                                 std::string_view signature) {
  nlohmann::json params = {
      {"address", address},
      {"message", std::string(message)},
      {"signature", std::string(signature)},
  };
  const auto result = Call("verify_signature", std::move(params));
  if (result.is_boolean()) {
    return result.get<bool>();
  }
  if (result.is_object() && result.contains("valid") && result.at("valid").is_boolean()) {
    return result.at("valid").get<bool>();
  }
  throw util::NetworkError("verify_signature: expected a boolean");
}

std::string RpcGateway::SignMessage(std::string_view private_key, std::string_view message) {
  nlohmann::json params = {
      {"private_key", std::string(private_key)},
      {"message", std::string(message)},
  };
  return TakeString(Call("sign_message", std::move(params)), "signature");
}

std::string RpcGateway::DecryptRecord(std::string_view view_key, std::string_view ciphertext) {
  nlohmann::json params = {
      {"view_key", std::string(view_key)},
      {"ciphertext", std::string(ciphertext)},
  };
  return TakeString(Call("decrypt_record", std::move(params)), "plaintext");
}

nlohmann::json RpcGateway::ListRecords(std::string_view view_key,
                                       const std::optional<std::string>& program_id) {
  nlohmann::json params = {{"view_key", std::string(view_key)}};
  if (program_id) {
    params["program_id"] = *program_id;
  }
  auto result = Call("list_records", std::move(params));
  if (!result.is_array()) {
    throw util::NetworkError("list_records: expected an array");
  }
  return result;
}

}  // namespace dappvault::gateway
