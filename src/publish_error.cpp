#include "publish_error.h"

#include <utility>

namespace hoist {

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::CREDENTIAL_MISSING: return "CredentialMissing";
    case error_kind::CREDENTIAL_INVALID: return "CredentialInvalid";
    case error_kind::CONFIG_INVALID: return "ConfigInvalid";
    case error_kind::UNKNOWN_VARIANT: return "UnknownVariant";
    case error_kind::AUTH_FAILED: return "AuthFailed";
    case error_kind::BUILD_FAILED: return "BuildFailed";
    case error_kind::PUSH_FAILED: return "PushFailed";
    case error_kind::DIGEST_MISMATCH: return "DigestMismatch";
    case error_kind::TIMEOUT: return "Timeout";
    case error_kind::CANCELLED: return "Cancelled";
  }
  return "Unknown";
}

exit_status error_kind_exit_status(error_kind kind) {
  switch (kind) {
    case error_kind::CREDENTIAL_MISSING:
    case error_kind::CREDENTIAL_INVALID: return exit_status::CREDENTIALS;
    case error_kind::CONFIG_INVALID:
    case error_kind::UNKNOWN_VARIANT: return exit_status::USAGE;
    case error_kind::AUTH_FAILED: return exit_status::AUTH;
    case error_kind::BUILD_FAILED: return exit_status::BUILD;
    case error_kind::PUSH_FAILED:
    case error_kind::DIGEST_MISMATCH: return exit_status::PUSH;
    case error_kind::TIMEOUT: return exit_status::TIMEOUT;
    case error_kind::CANCELLED: return exit_status::CANCELLED;
  }
  return exit_status::FAILURE;
}

bool error_kind_is_transient(error_kind kind) {
  return kind == error_kind::PUSH_FAILED || kind == error_kind::TIMEOUT;
}

publish_error::publish_error(error_kind kind, std::string const &message, details info)
    : std::runtime_error{ message }, kind_{ kind }, info_{ std::move(info) } {}

publish_error publish_error::credential_missing(std::string_view field) {
  return publish_error{ error_kind::CREDENTIAL_MISSING,
                        "CredentialMissing: required field '" + std::string{ field } +
                            "' is absent or empty",
                        details{ .stage = publish_stage::CREDENTIALS } };
}

publish_error publish_error::credential_invalid(std::string_view field,
                                                std::string_view reason) {
  return publish_error{ error_kind::CREDENTIAL_INVALID,
                        "CredentialInvalid: " + std::string{ field } + ": " +
                            std::string{ reason },
                        details{ .stage = publish_stage::CREDENTIALS } };
}

publish_error publish_error::config_invalid(std::string const &reason) {
  return publish_error{ error_kind::CONFIG_INVALID,
                        "ConfigInvalid: " + reason,
                        details{ .stage = publish_stage::CONFIGURE } };
}

publish_error publish_error::unknown_variant(std::string const &variant) {
  return publish_error{ error_kind::UNKNOWN_VARIANT,
                        "UnknownVariant: '" + variant +
                            "' matches no configured tag convention",
                        details{ .stage = publish_stage::CONFIGURE, .variant = variant } };
}

publish_error publish_error::auth_failed(std::string const &server,
                                         long status_code,
                                         std::string_view reason) {
  std::string message{ "AuthFailed: " + server + " rejected login (status " +
                       std::to_string(status_code) + ")" };
  if (!reason.empty()) {
    message += ": ";
    message += reason;
  }
  return publish_error{ error_kind::AUTH_FAILED,
                        message,
                        details{ .stage = publish_stage::LOGIN,
                                 .server = server,
                                 .status_code = status_code } };
}

publish_error publish_error::build_failed(std::string const &variant,
                                          int exit_code,
                                          std::string stderr_tail) {
  std::string message{ "BuildFailed: variant '" + variant + "' exited with code " +
                       std::to_string(exit_code) };
  if (!stderr_tail.empty()) { message += "\n" + stderr_tail; }
  return publish_error{ error_kind::BUILD_FAILED,
                        message,
                        details{ .stage = publish_stage::BUILD,
                                 .variant = variant,
                                 .exit_code = exit_code,
                                 .stderr_tail = std::move(stderr_tail) } };
}

publish_error publish_error::push_failed(std::string const &target,
                                         std::string_view reason) {
  return publish_error{ error_kind::PUSH_FAILED,
                        "PushFailed: " + target + ": " + std::string{ reason },
                        details{ .stage = publish_stage::PUSH, .target = target } };
}

publish_error publish_error::digest_mismatch(std::string const &target,
                                             std::string const &expected,
                                             std::string const &actual) {
  return publish_error{ error_kind::DIGEST_MISMATCH,
                        "DigestMismatch: " + target + ": expected " + expected +
                            " but registry reports " + actual,
                        details{ .stage = publish_stage::PUSH,
                                 .target = target,
                                 .expected_digest = expected,
                                 .actual_digest = actual } };
}

publish_error publish_error::timeout(publish_stage stage, std::string const &subject) {
  return publish_error{ error_kind::TIMEOUT,
                        "Timeout: " + std::string{ publish_stage_name(stage) } +
                            " of " + subject + " exceeded its deadline",
                        details{ .stage = stage, .target = subject } };
}

publish_error publish_error::cancelled(publish_stage stage, std::string const &subject) {
  return publish_error{ error_kind::CANCELLED,
                        "Cancelled: " + std::string{ publish_stage_name(stage) } +
                            " of " + subject + " was aborted",
                        details{ .stage = stage, .target = subject } };
}

}  // namespace hoist
