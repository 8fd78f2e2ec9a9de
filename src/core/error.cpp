#include "msgpk/core/error.hpp"

#include <string>

namespace msgpk::core {
namespace {

// 缓冲区层的错误域；编解码错误见 codec/errc.cpp。
class core_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "msgpk.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::buffer_overflow:
        return "buffer would exceed its capacity limit";
      case errc::invalid_argument:
        return "invalid argument (malformed hex, empty handler or bad size)";
      default:
        return "unknown msgpk.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static core_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 msgpk::core
