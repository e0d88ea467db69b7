#pragma once

#include <stdexcept>
#include <string>

namespace dappvault::util {

// Stable numeric codes surfaced on the command channel.
enum class ErrorCode : int {
  kValidation = -1,
  kWalletExists = -2,
  kInvalidKeyFormat = -3,
  kAuthentication = -10,
  kInvalidPassword = -11,
  kNoWallet = -12,
  kWalletLocked = -13,
  kNotConnected = -20,
  kPermissionDenied = -21,
  kTimeout = -22,
  kNetwork = -30,
  kStorage = -40,
};

class Error : public std::runtime_error {
 public:
  Error(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& message)
      : Error(ErrorCode::kValidation, message) {}

 protected:
  ValidationError(ErrorCode code, const std::string& message) : Error(code, message) {}
};

class WalletExistsError : public ValidationError {
 public:
  WalletExistsError()
      : ValidationError(ErrorCode::kWalletExists, "a wallet already exists") {}
};

class InvalidKeyFormatError : public ValidationError {
 public:
  explicit InvalidKeyFormatError(const std::string& message)
      : ValidationError(ErrorCode::kInvalidKeyFormat, message) {}
};

class AuthenticationError : public Error {
 public:
  explicit AuthenticationError(const std::string& message)
      : Error(ErrorCode::kAuthentication, message) {}

 protected:
  AuthenticationError(ErrorCode code, const std::string& message) : Error(code, message) {}
};

class InvalidPasswordError : public AuthenticationError {
 public:
  InvalidPasswordError()
      : AuthenticationError(ErrorCode::kInvalidPassword, "invalid password") {}
};

class NoWalletError : public Error {
 public:
  NoWalletError() : Error(ErrorCode::kNoWallet, "no wallet found") {}
};

class WalletLockedError : public Error {
 public:
  WalletLockedError() : Error(ErrorCode::kWalletLocked, "wallet is locked") {}
};

class NotConnectedError : public Error {
 public:
  explicit NotConnectedError(const std::string& origin)
      : Error(ErrorCode::kNotConnected, "origin not connected: " + origin) {}
};

class PermissionDeniedError : public Error {
 public:
  explicit PermissionDeniedError(const std::string& message)
      : Error(ErrorCode::kPermissionDenied, message) {}
};

class TimeoutError : public Error {
 public:
  explicit TimeoutError(const std::string& message) : Error(ErrorCode::kTimeout, message) {}
};

class NetworkError : public Error {
 public:
  explicit NetworkError(const std::string& message) : Error(ErrorCode::kNetwork, message) {}
};

class StorageError : public Error {
 public:
  explicit StorageError(const std::string& message) : Error(ErrorCode::kStorage, message) {}
};

}  // namespace dappvault::util
