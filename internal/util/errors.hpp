#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace taskvault::util {

/*
  Central error types.

  Every engine failure derives from VaultError and carries a kind that the
  CLIs map to exit codes and the audit log records as error_kind. Only
  file-operation failures are safe to retry verbatim.
*/

enum class ErrorKind {
  kInvalidTransition,
  kFolderMismatch,
  kFileOperation,
  kApprovalSecurity,
  kApprovalRequired,
  kMalformedRecord,
  kNotFound,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidTransition:
      return "invalid_transition";
    case ErrorKind::kFolderMismatch:
      return "folder_mismatch";
    case ErrorKind::kFileOperation:
      return "file_operation";
    case ErrorKind::kApprovalSecurity:
      return "approval_security";
    case ErrorKind::kApprovalRequired:
      return "approval_required";
    case ErrorKind::kMalformedRecord:
      return "malformed_record";
    case ErrorKind::kNotFound:
      return "not_found";
  }
  return "unknown";
}

class VaultError : public std::runtime_error {
 public:
  VaultError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

  bool Retryable() const noexcept {
    return kind_ == ErrorKind::kFileOperation;
  }

 private:
  ErrorKind kind_;
};

class InvalidTransition : public VaultError {
 public:
  explicit InvalidTransition(const std::string& msg) : VaultError(ErrorKind::kInvalidTransition, msg) {
  }
};

class FolderMismatch : public VaultError {
 public:
  explicit FolderMismatch(const std::string& msg) : VaultError(ErrorKind::kFolderMismatch, msg) {
  }
};

class FileOperationError : public VaultError {
 public:
  FileOperationError(const std::string& msg, std::string path, int error_number = 0)
      : VaultError(ErrorKind::kFileOperation, msg), path_(std::move(path)), errno_(error_number) {
  }

  const std::string& Path() const noexcept {
    return path_;
  }

  int Errno() const noexcept {
    return errno_;
  }

 private:
  std::string path_;
  int         errno_;
};

class ApprovalSecurityError : public VaultError {
 public:
  enum class Reason {
    kExpired,
    kMalformedNonce,
    kNonceReplayed,
    kIntegrityMismatch,
  };

  ApprovalSecurityError(Reason reason, const std::string& msg) : VaultError(ErrorKind::kApprovalSecurity, msg), reason_(reason) {
  }

  Reason SecurityReason() const noexcept {
    return reason_;
  }

 private:
  Reason reason_;
};

constexpr std::string_view ToString(ApprovalSecurityError::Reason reason) {
  switch (reason) {
    case ApprovalSecurityError::Reason::kExpired:
      return "expired";
    case ApprovalSecurityError::Reason::kMalformedNonce:
      return "malformed_nonce";
    case ApprovalSecurityError::Reason::kNonceReplayed:
      return "nonce_replayed";
    case ApprovalSecurityError::Reason::kIntegrityMismatch:
      return "integrity_mismatch";
  }
  return "unknown";
}

class ApprovalRequired : public VaultError {
 public:
  explicit ApprovalRequired(const std::string& msg) : VaultError(ErrorKind::kApprovalRequired, msg) {
  }
};

class MalformedRecord : public VaultError {
 public:
  explicit MalformedRecord(const std::string& msg) : VaultError(ErrorKind::kMalformedRecord, msg) {
  }
};

class NotFound : public VaultError {
 public:
  explicit NotFound(const std::string& msg) : VaultError(ErrorKind::kNotFound, msg) {
  }
};

} // namespace taskvault::util
