#include "msgpk/codec/errc.hpp"

#include <string>

namespace msgpk {
namespace {

class msgpk_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "msgpk"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::insufficient_data:
        return "insufficient data";
      case errc::invalid_header:
        return "unrecognized header byte";
      case errc::invalid_map_key:
        return "map key must be string or integer";
      case errc::forbidden_key:
        return "map key __proto__ is not allowed";
      case errc::length_exceeded:
        return "declared length exceeds configured maximum";
      case errc::unsupported_extension:
        return "unregistered extension type";
      case errc::invalid_extension:
        return "malformed extension payload";
      case errc::extra_bytes:
        return "extra bytes after value";
      case errc::end_of_data:
        return "end of data";
      case errc::depth_exceeded:
        return "maximum nesting depth exceeded";
      case errc::unsupported_value:
        return "value is not representable";
      case errc::length_overflow:
        return "length does not fit in 32 bits";
      default:
        return "unknown msgpk error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static msgpk_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

bool is_decode_error(const std::error_code& ec) noexcept {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<errc>(ec.value())) {
    case errc::invalid_header:
    case errc::invalid_map_key:
    case errc::forbidden_key:
    case errc::length_exceeded:
    case errc::unsupported_extension:
    case errc::invalid_extension:
    case errc::extra_bytes:
      return true;
    default:
      return false;
  }
}

}  // namespace msgpk
