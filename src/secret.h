#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace hoist {

// Credential material. Not streamable or convertible; read it with reveal().
// Storage is zeroed on destruction and after a move.
class secret {
 public:
  secret() = default;
  explicit secret(std::string value) : value_{ std::move(value) } {}

  secret(secret const &) = default;
  secret &operator=(secret const &) = default;
  secret(secret &&other) noexcept : value_{ std::move(other.value_) } { other.wipe(); }
  secret &operator=(secret &&other) noexcept {
    if (this != &other) {
      wipe();
      value_ = std::move(other.value_);
      other.wipe();
    }
    return *this;
  }
  ~secret() { wipe(); }

  std::string_view reveal() const { return value_; }
  bool empty() const { return value_.empty(); }

 private:
  void wipe() noexcept {
    for (auto &c : value_) { static_cast<volatile char &>(c) = '\0'; }
    value_.clear();
  }

  std::string value_;
};

}  // namespace hoist
