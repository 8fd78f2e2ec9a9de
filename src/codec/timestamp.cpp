#include "msgpk/codec/timestamp.hpp"

#include "msgpk/codec/errc.hpp"

#include "codec/endian.hpp"

#include <sstream>

namespace msgpk {
namespace {

constexpr std::uint32_t kMaxNanoseconds = 999'999'999u;
constexpr std::int64_t kMaxSeconds32 = 0xFFFF'FFFFLL;           // 2^32 - 1
constexpr std::int64_t kMaxSeconds64 = 0x3'FFFF'FFFFLL;         // 2^34 - 1
constexpr std::uint64_t kSeconds64Mask = 0x3'FFFF'FFFFULL;

}  // namespace

bool Timestamp::equals(const Object& other) const noexcept {
  const auto* ts = dynamic_cast<const Timestamp*>(&other);
  return ts && ts->seconds_ == seconds_ && ts->nanoseconds_ == nanoseconds_;
}

std::string Timestamp::describe() const {
  std::ostringstream oss;
  oss << "Timestamp(" << seconds_ << "s";
  if (nanoseconds_ != 0) {
    oss << " " << nanoseconds_ << "ns";
  }
  oss << ")";
  return oss.str();
}

Value make_timestamp(std::int64_t seconds, std::uint32_t nanoseconds) {
  return Value::object(std::make_shared<Timestamp>(seconds, nanoseconds));
}

std::error_code encode_timestamp(const Timestamp& ts, std::vector<byte>& out) {
  if (ts.nanoseconds() > kMaxNanoseconds) {
    return make_error_code(errc::invalid_extension);
  }

  const auto sec = ts.seconds();
  if (sec >= 0 && sec <= kMaxSeconds64) {
    if (ts.nanoseconds() == 0 && sec <= kMaxSeconds32) {
      out.resize(4);
      detail::store_be<std::uint32_t>(out.data(), static_cast<std::uint32_t>(sec));
      return {};
    }
    const auto data64 =
      (static_cast<std::uint64_t>(ts.nanoseconds()) << 34) | static_cast<std::uint64_t>(sec);
    out.resize(8);
    detail::store_be<std::uint64_t>(out.data(), data64);
    return {};
  }

  out.resize(12);
  detail::store_be<std::uint32_t>(out.data(), ts.nanoseconds());
  detail::store_be<std::uint64_t>(out.data() + 4, static_cast<std::uint64_t>(sec));
  return {};
}

std::error_code decode_timestamp(bytes_view payload, std::int64_t& seconds, std::uint32_t& nanoseconds) noexcept {
  switch (payload.size()) {
    case 4: {
      seconds = static_cast<std::int64_t>(detail::load_be<std::uint32_t>(payload.data()));
      nanoseconds = 0;
      return {};
    }
    case 8: {
      const auto data64 = detail::load_be<std::uint64_t>(payload.data());
      const auto nsec = static_cast<std::uint32_t>(data64 >> 34);
      if (nsec > kMaxNanoseconds) {
        return make_error_code(errc::invalid_extension);
      }
      seconds = static_cast<std::int64_t>(data64 & kSeconds64Mask);
      nanoseconds = nsec;
      return {};
    }
    case 12: {
      const auto nsec = detail::load_be<std::uint32_t>(payload.data());
      if (nsec > kMaxNanoseconds) {
        return make_error_code(errc::invalid_extension);
      }
      seconds = static_cast<std::int64_t>(detail::load_be<std::uint64_t>(payload.data() + 4));
      nanoseconds = nsec;
      return {};
    }
    default:
      return make_error_code(errc::invalid_extension);
  }
}

std::error_code register_timestamp(ExtensionRegistry& registry) {
  return registry.register_type(
    kTimestampType,
    [](const Object& obj) -> std::optional<std::vector<byte>> {
      const auto* ts = dynamic_cast<const Timestamp*>(&obj);
      if (!ts) {
        return std::nullopt;
      }
      std::vector<byte> payload;
      if (encode_timestamp(*ts, payload)) {
        return std::nullopt;
      }
      return payload;
    },
    [](bytes_view payload, std::int8_t, Value& out) -> std::error_code {
      std::int64_t sec = 0;
      std::uint32_t nsec = 0;
      auto ec = decode_timestamp(payload, sec, nsec);
      if (ec) {
        return ec;
      }
      out = make_timestamp(sec, nsec);
      return {};
    });
}

}  // namespace msgpk
