#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pw {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Process = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Process:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace validation {
      inline constexpr int kUnsupportedTaskPlugin = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kUnsupportedCommand = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kEmptyArgument = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    namespace config {
      inline constexpr int kInvalidDescriptor = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kTypeNotFound = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kInstantiationFailed = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kCapabilityMismatch = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kModuleNotFound = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kMalformedTypeReference = Make(ErrorDomain::Config, 0x06);
      inline constexpr int kInvalidLayout = Make(ErrorDomain::Config, 0x07);
    } // namespace config

    namespace dependency {
      inline constexpr int kHelperMissing = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kWorkDirectoryMissing = Make(ErrorDomain::Dependency, 0x02);
    } // namespace dependency

    namespace security {
      inline constexpr int kHelperIntegrityMismatch = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace process {
      inline constexpr int kNonZeroExit = Make(ErrorDomain::Process, 0x01);
      inline constexpr int kLogicalFailure = Make(ErrorDomain::Process, 0x02);
    } // namespace process

    namespace state {
      inline constexpr int kCancelled = Make(ErrorDomain::State, 0x01);
      inline constexpr int kRegistrySealed = Make(ErrorDomain::State, 0x02);
      inline constexpr int kLedgerDrained = Make(ErrorDomain::State, 0x03);
      inline constexpr int kJobCompleted = Make(ErrorDomain::State, 0x04);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Requested task or command has no registry entry.
  struct UnsupportedPluginError : public Error {
    explicit UnsupportedPluginError(int c, std::string msg)
        : Error(ErrorDomain::Validation, c, std::move(msg)) {}
  };

  // Malformed descriptor or resolver failure during startup population.
  struct RegistrationFailure : public Error {
    explicit RegistrationFailure(int c, std::string msg)
        : Error(ErrorDomain::Config, c, std::move(msg)) {}
  };

  struct HelperMissingError : public Error {
    explicit HelperMissingError(ErrorDomain d, int c, std::string msg)
        : Error(d, c, std::move(msg)) {}
  };

  struct ProcessFaultError : public Error {
    int exit_code;
    std::string executable;
    std::string arguments;
    std::string error_text;
    ProcessFaultError(int exit, std::string file, std::string args, std::string stderr_text,
                      std::string msg)
        : Error(ErrorDomain::Process, errors::process::kNonZeroExit, std::move(msg), exit),
          exit_code(exit),
          executable(std::move(file)),
          arguments(std::move(args)),
          error_text(std::move(stderr_text)) {}
  };

  // Zero exit code but the plugin reported errors on its error stream.
  struct LogicalFailureError : public Error {
    std::string error_text;
    explicit LogicalFailureError(std::string text)
        : Error(ErrorDomain::Process, errors::process::kLogicalFailure, text),
          error_text(std::move(text)) {}
  };

  struct CancelledError : public Error {
    explicit CancelledError(std::string msg)
        : Error(ErrorDomain::State, errors::state::kCancelled, std::move(msg)) {}
  };
} // namespace pw
