#pragma once

#include "publish_stage.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hoist {

enum class error_kind {
  CREDENTIAL_MISSING,
  CREDENTIAL_INVALID,
  CONFIG_INVALID,
  UNKNOWN_VARIANT,
  AUTH_FAILED,
  BUILD_FAILED,
  PUSH_FAILED,
  DIGEST_MISMATCH,
  TIMEOUT,
  CANCELLED,
};

// Process exit contract for scripting integration
enum class exit_status : int {
  SUCCESS = 0,
  FAILURE = 1,
  USAGE = 2,
  CREDENTIALS = 10,
  AUTH = 20,
  BUILD = 30,
  PUSH = 40,
  TIMEOUT = 50,
  CANCELLED = 130,
};

constexpr int exit_status_value(exit_status code) { return static_cast<int>(code); }

std::string_view error_kind_name(error_kind kind);  // "CredentialMissing", ...
exit_status error_kind_exit_status(error_kind kind);

// Push-stage transient errors. Everything else is terminal for its stage.
bool error_kind_is_transient(error_kind kind);

class publish_error : public std::runtime_error {
 public:
  struct details {
    std::optional<publish_stage> stage;
    std::string variant;
    std::string target;
    std::string server;
    std::optional<int> exit_code;
    std::optional<long> status_code;
    std::string expected_digest;
    std::string actual_digest;
    std::string stderr_tail;
  };

  publish_error(error_kind kind, std::string const &message, details info = {});

  error_kind kind() const { return kind_; }
  details const &info() const { return info_; }

  static publish_error credential_missing(std::string_view field);
  static publish_error credential_invalid(std::string_view field, std::string_view reason);
  static publish_error config_invalid(std::string const &reason);
  static publish_error unknown_variant(std::string const &variant);
  static publish_error auth_failed(std::string const &server,
                                   long status_code,
                                   std::string_view reason = {});
  static publish_error build_failed(std::string const &variant,
                                    int exit_code,
                                    std::string stderr_tail);
  static publish_error push_failed(std::string const &target, std::string_view reason);
  static publish_error digest_mismatch(std::string const &target,
                                       std::string const &expected,
                                       std::string const &actual);
  static publish_error timeout(publish_stage stage, std::string const &subject);
  static publish_error cancelled(publish_stage stage, std::string const &subject);

 private:
  error_kind kind_;
  details info_;
};

}  // namespace hoist
