#include "msgpk/codec/encoder.hpp"

#include "msgpk/codec/errc.hpp"

#include "codec/endian.hpp"
#include "core/logger.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <bit>
#include <cmath>
#include <limits>
#include <type_traits>

namespace msgpk {
namespace {

template <class UInt>
std::error_code write_head_and_uint(core::OutputBuffer& out, byte head, UInt v) {
  std::array<byte, 1 + sizeof(UInt)> raw{};
  raw[0] = head;
  detail::store_be<UInt>(raw.data() + 1, v);
  return out.append(bytes_view{raw.data(), raw.size()});
}

/*
 * 长度前缀头部：length < fix_limit 时用 fix 形式（fix_base | length），
 * 其余按 8 / 16 / 32 位选择；head8 为 0 表示该族没有 8 位形式（array/map）。
 */
struct LengthHeads final {
  std::uint32_t fix_limit;
  byte fix_base;
  byte head8;
  byte head16;
  byte head32;
};

constexpr LengthHeads kStrHeads{32, 0xa0, 0xd9, 0xda, 0xdb};
constexpr LengthHeads kBinHeads{0, 0x00, 0xc4, 0xc5, 0xc6};
constexpr LengthHeads kArrayHeads{16, 0x90, 0x00, 0xdc, 0xdd};
constexpr LengthHeads kMapHeads{16, 0x80, 0x00, 0xde, 0xdf};

std::error_code write_length_head(core::OutputBuffer& out, const LengthHeads& heads, std::size_t length) {
  if (length > core::kMaxWireLength) {
    core::logger().debug("length {} does not fit in 32 bits", length);
    return make_error_code(errc::length_overflow);
  }
  const auto n = static_cast<std::uint32_t>(length);
  if (n < heads.fix_limit) {
    return out.append_byte(static_cast<byte>(heads.fix_base | n));
  }
  if (heads.head8 != 0 && n <= 0xFFu) {
    return write_head_and_uint<std::uint8_t>(out, heads.head8, static_cast<std::uint8_t>(n));
  }
  if (n <= 0xFFFFu) {
    return write_head_and_uint<std::uint16_t>(out, heads.head16, static_cast<std::uint16_t>(n));
  }
  return write_head_and_uint<std::uint32_t>(out, heads.head32, n);
}

}  // namespace

Encoder::Encoder(const EncodeOptions& options)
  : extensions_(options.extensions ? options.extensions : ExtensionRegistry::builtins()),
    max_depth_(options.max_depth),
    force_float32_(options.force_float32) {}

std::error_code Encoder::encode(core::OutputBuffer& out, const Value& value, std::size_t depth) const {
  if (depth > max_depth_) {
    core::logger().debug("encode depth {} exceeds max_depth {}", depth, max_depth_);
    return make_error_code(errc::depth_exceeded);
  }

  return std::visit(
    [&](const auto& v) -> std::error_code {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Nil>) {
        return encode_nil(out);
      } else if constexpr (std::is_same_v<T, bool>) {
        return encode_boolean(out, v);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return encode_signed(out, v);
      } else if constexpr (std::is_same_v<T, std::uint64_t>) {
        return encode_unsigned(out, v);
      } else if constexpr (std::is_same_v<T, double>) {
        return encode_float(out, v);
      } else if constexpr (std::is_same_v<T, std::string>) {
        return encode_string(out, v);
      } else if constexpr (std::is_same_v<T, Binary>) {
        return encode_binary(out, bytes_view{v.value.data(), v.value.size()});
      } else if constexpr (std::is_same_v<T, Array>) {
        return encode_array(out, v, depth);
      } else if constexpr (std::is_same_v<T, Map>) {
        return encode_map(out, v, depth);
      } else if constexpr (std::is_same_v<T, Extension>) {
        return encode_extension(out, v);
      } else if constexpr (std::is_same_v<T, ObjectPtr>) {
        if (!v) {
          return make_error_code(errc::unsupported_value);
        }
        return encode_object(out, *v);
      } else {
        return make_error_code(errc::unsupported_value);
      }
    },
    value.storage());
}

std::error_code Encoder::encode_nil(core::OutputBuffer& out) const {
  return out.append_byte(0xc0);
}

std::error_code Encoder::encode_boolean(core::OutputBuffer& out, bool v) const {
  return out.append_byte(v ? 0xc3 : 0xc2);
}

std::error_code Encoder::encode_unsigned(core::OutputBuffer& out, std::uint64_t v) const {
  if (v < 0x80u) {
    // positive fixint
    return out.append_byte(static_cast<byte>(v));
  }
  if (v <= 0xFFu) {
    return write_head_and_uint<std::uint8_t>(out, 0xcc, static_cast<std::uint8_t>(v));
  }
  if (v <= 0xFFFFu) {
    return write_head_and_uint<std::uint16_t>(out, 0xcd, static_cast<std::uint16_t>(v));
  }
  if (v <= 0xFFFF'FFFFu) {
    return write_head_and_uint<std::uint32_t>(out, 0xce, static_cast<std::uint32_t>(v));
  }
  return write_head_and_uint<std::uint64_t>(out, 0xcf, v);
}

std::error_code Encoder::encode_signed(core::OutputBuffer& out, std::int64_t v) const {
  if (v >= 0) {
    return encode_unsigned(out, static_cast<std::uint64_t>(v));
  }
  if (v >= -0x20) {
    // negative fixint (111x xxxx)
    return out.append_byte(static_cast<byte>(static_cast<std::int8_t>(v)));
  }
  if (v >= std::numeric_limits<std::int8_t>::min()) {
    return write_head_and_uint<std::uint8_t>(out, 0xd0, std::bit_cast<std::uint8_t>(static_cast<std::int8_t>(v)));
  }
  if (v >= std::numeric_limits<std::int16_t>::min()) {
    return write_head_and_uint<std::uint16_t>(out, 0xd1,
                                              std::bit_cast<std::uint16_t>(static_cast<std::int16_t>(v)));
  }
  if (v >= std::numeric_limits<std::int32_t>::min()) {
    return write_head_and_uint<std::uint32_t>(out, 0xd2,
                                              std::bit_cast<std::uint32_t>(static_cast<std::int32_t>(v)));
  }
  return write_head_and_uint<std::uint64_t>(out, 0xd3, std::bit_cast<std::uint64_t>(v));
}

std::error_code Encoder::encode_float(core::OutputBuffer& out, double v) const {
  if (force_float32_) {
    const auto narrowed = static_cast<float>(v);
    if (static_cast<double>(narrowed) == v || std::isnan(v)) {
      return write_head_and_uint<std::uint32_t>(out, 0xca, std::bit_cast<std::uint32_t>(narrowed));
    }
  }
  return write_head_and_uint<std::uint64_t>(out, 0xcb, std::bit_cast<std::uint64_t>(v));
}

std::error_code Encoder::encode_string(core::OutputBuffer& out, std::string_view s) const {
  auto ec = write_length_head(out, kStrHeads, s.size());
  if (ec) {
    return ec;
  }
  return out.append(bytes_view{reinterpret_cast<const byte*>(s.data()), s.size()});
}

std::error_code Encoder::encode_binary(core::OutputBuffer& out, bytes_view data) const {
  auto ec = write_length_head(out, kBinHeads, data.size());
  if (ec) {
    return ec;
  }
  return out.append(data);
}

std::error_code Encoder::encode_array(core::OutputBuffer& out, const Array& array, std::size_t depth) const {
  auto ec = write_length_head(out, kArrayHeads, array.size());
  if (ec) {
    return ec;
  }
  for (const auto& item : array) {
    ec = encode(out, item, depth + 1);
    if (ec) {
      return ec;
    }
  }
  return {};
}

std::error_code Encoder::encode_map_key(core::OutputBuffer& out, const MapKey& key) const {
  return std::visit(
    [&](const auto& k) -> std::error_code {
      using T = std::decay_t<decltype(k)>;
      if constexpr (std::is_same_v<T, std::string>) {
        return encode_string(out, k);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return encode_signed(out, k);
      } else {
        return encode_unsigned(out, k);
      }
    },
    key.storage());
}

std::error_code Encoder::encode_map(core::OutputBuffer& out, const Map& map, std::size_t depth) const {
  auto ec = write_length_head(out, kMapHeads, map.size());
  if (ec) {
    return ec;
  }
  for (const auto& [key, value] : map) {
    ec = encode_map_key(out, key);
    if (ec) {
      return ec;
    }
    ec = encode(out, value, depth + 1);
    if (ec) {
      return ec;
    }
  }
  return {};
}

std::error_code Encoder::encode_extension(core::OutputBuffer& out, const Extension& ext) const {
  const auto size = ext.data.size();
  std::error_code ec;
  switch (size) {
    case 1:
      ec = out.append_byte(0xd4);
      break;
    case 2:
      ec = out.append_byte(0xd5);
      break;
    case 4:
      ec = out.append_byte(0xd6);
      break;
    case 8:
      ec = out.append_byte(0xd7);
      break;
    case 16:
      ec = out.append_byte(0xd8);
      break;
    default:
      if (size > core::kMaxWireLength) {
        return make_error_code(errc::length_overflow);
      }
      if (size <= 0xFFu) {
        ec = write_head_and_uint<std::uint8_t>(out, 0xc7, static_cast<std::uint8_t>(size));
      } else if (size <= 0xFFFFu) {
        ec = write_head_and_uint<std::uint16_t>(out, 0xc8, static_cast<std::uint16_t>(size));
      } else {
        ec = write_head_and_uint<std::uint32_t>(out, 0xc9, static_cast<std::uint32_t>(size));
      }
      break;
  }
  if (ec) {
    return ec;
  }
  ec = out.append_byte(std::bit_cast<byte>(ext.type));
  if (ec) {
    return ec;
  }
  return out.append(bytes_view{ext.data.data(), ext.data.size()});
}

std::error_code Encoder::encode_object(core::OutputBuffer& out, const Object& obj) const {
  auto ext = extensions_->encode(obj);
  if (!ext) {
    core::logger().debug("no extension encoder claims {}", obj.describe());
    return make_error_code(errc::unsupported_value);
  }
  return encode_extension(out, *ext);
}

}  // namespace msgpk
