#include "msgpk/codec/decode_machine.hpp"

#include "msgpk/codec/errc.hpp"
#include "msgpk/core/utf8.hpp"

#include "codec/endian.hpp"
#include "core/logger.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <string_view>

namespace msgpk {
namespace {

constexpr std::string_view kForbiddenKey = "__proto__";

std::error_code length_exceeded(const char* kind, std::uint32_t length, std::uint32_t limit) {
  core::logger().debug("{} length {} exceeds limit {}", kind, length, limit);
  return make_error_code(errc::length_exceeded);
}

}  // namespace

std::error_code InputCursor::read(std::size_t n, bytes_view& out) noexcept {
  if (remaining() < n) {
    shortfall_ = n - remaining();
    return make_error_code(errc::insufficient_data);
  }
  out = in_.subspan(pos_, n);
  pos_ += n;
  return {};
}

std::error_code InputCursor::read_u8(byte& out) noexcept {
  if (pos_ >= in_.size()) {
    shortfall_ = 1;
    return make_error_code(errc::insufficient_data);
  }
  out = in_[pos_++];
  return {};
}

DecodeMachine::DecodeMachine(const DecodeOptions& options)
  : extensions_(options.extensions ? options.extensions : ExtensionRegistry::builtins()),
    key_decoder_(options.key_decoder),
    max_str_length_(options.max_str_length),
    max_bin_length_(options.max_bin_length),
    max_array_length_(options.max_array_length),
    max_map_length_(options.max_map_length),
    max_ext_length_(options.max_ext_length) {
  if (!key_decoder_ && options.use_key_cache) {
    key_decoder_ = std::make_shared<KeyCache>();
  }
  if (!options.use_key_cache) {
    key_decoder_.reset();
  }
}

void DecodeMachine::reset() noexcept {
  stack_.clear();
  head_byte_.reset();
}

template <class UInt>
std::error_code DecodeMachine::read_uint(InputCursor& in, UInt& out) noexcept {
  bytes_view raw{};
  auto ec = in.read(sizeof(UInt), raw);
  if (ec) {
    return ec;
  }
  out = detail::load_be<UInt>(raw.data());
  return {};
}

std::error_code DecodeMachine::read_head(InputCursor& in, byte& head) {
  if (head_byte_) {
    head = *head_byte_;
    return {};
  }
  auto ec = in.read_u8(head);
  if (ec) {
    return ec;
  }
  // 头字节一旦读出即提交：之后即使 payload 不足而暂停，恢复时也不再重读它。
  head_byte_ = head;
  in.commit();
  return {};
}

bool DecodeMachine::reading_map_key() const noexcept {
  if (stack_.empty()) {
    return false;
  }
  const auto* map = std::get_if<MapFrame>(&stack_.back());
  return map && !map->awaiting_value;
}

std::error_code DecodeMachine::push_array(std::uint32_t size, InputCursor& in, Value& object, Step& step) {
  if (size > max_array_length_) {
    return length_exceeded("array", size, max_array_length_);
  }
  if (size == 0) {
    object = Value(Array{});
    step = Step::value;
    return {};
  }
  ArrayFrame frame;
  frame.size = size;
  // 每个元素至少占 1 字节：预分配不超过当前已缓冲的字节数，避免恶意长度触发巨量分配。
  frame.array.reserve(std::min<std::size_t>(size, in.remaining()));
  stack_.emplace_back(std::move(frame));
  step = Step::container;
  return {};
}

std::error_code DecodeMachine::push_map(std::uint32_t size, InputCursor& in, Value& object, Step& step) {
  if (size > max_map_length_) {
    return length_exceeded("map", size, max_map_length_);
  }
  if (size == 0) {
    object = Value(Map{});
    step = Step::value;
    return {};
  }
  MapFrame frame;
  frame.size = size;
  frame.map.reserve(std::min<std::size_t>(size, in.remaining() / 2));
  stack_.emplace_back(std::move(frame));
  step = Step::container;
  return {};
}

std::error_code DecodeMachine::read_string(std::uint32_t length, InputCursor& in, Value& object) {
  if (length > max_str_length_) {
    return length_exceeded("str", length, max_str_length_);
  }
  bytes_view raw{};
  auto ec = in.read(length, raw);
  if (ec) {
    return ec;
  }
  if (key_decoder_ && reading_map_key() && key_decoder_->can_be_cached(length)) {
    std::string key;
    key_decoder_->decode(raw, key);
    object = Value(std::move(key));
    return {};
  }
  object = Value(core::decode_utf8(raw));
  return {};
}

std::error_code DecodeMachine::read_binary(std::uint32_t length, InputCursor& in, Value& object) {
  if (length > max_bin_length_) {
    return length_exceeded("bin", length, max_bin_length_);
  }
  bytes_view raw{};
  auto ec = in.read(length, raw);
  if (ec) {
    return ec;
  }
  object = Value::binary(std::vector<byte>(raw.begin(), raw.end()));
  return {};
}

std::error_code DecodeMachine::read_extension(std::uint32_t length, InputCursor& in, Value& object) {
  if (length > max_ext_length_) {
    return length_exceeded("ext", length, max_ext_length_);
  }
  byte type_byte = 0;
  auto ec = in.read_u8(type_byte);
  if (ec) {
    return ec;
  }
  // payload 同时受 max_bin_length 约束。
  if (length > max_bin_length_) {
    return length_exceeded("ext payload", length, max_bin_length_);
  }
  bytes_view payload{};
  ec = in.read(length, payload);
  if (ec) {
    return ec;
  }
  const auto type = static_cast<std::int8_t>(type_byte);
  ec = extensions_->decode(payload, type, object);
  if (ec) {
    core::logger().debug("extension type {} ({} bytes) rejected: {}", static_cast<int>(type), length,
                         ec.message());
  }
  return ec;
}

/*
 * 头字节分类（MessagePack 头字节表）：
 * - 0x00..0x7f positive fixint / 0xe0..0xff negative fixint
 * - 0x80..0x8f fixmap / 0x90..0x9f fixarray / 0xa0..0xbf fixstr
 * - 0xc0 nil / 0xc2 false / 0xc3 true
 * - 0xc4..0xc6 bin / 0xc7..0xc9 ext / 0xca..0xcb float
 * - 0xcc..0xcf uint / 0xd0..0xd3 int / 0xd4..0xd8 fixext
 * - 0xd9..0xdb str / 0xdc..0xdd array / 0xde..0xdf map
 * - 0xc1 保留未用：非法
 */
std::error_code DecodeMachine::dispatch(byte head, InputCursor& in, Value& object, Step& step) {
  step = Step::value;

  if (head >= 0xe0) {
    object = Value::integer(static_cast<std::int64_t>(head) - 0x100);
    return {};
  }
  if (head < 0x80) {
    object = Value::integer(static_cast<std::int64_t>(head));
    return {};
  }
  if (head < 0x90) {
    return push_map(static_cast<std::uint32_t>(head - 0x80), in, object, step);
  }
  if (head < 0xa0) {
    return push_array(static_cast<std::uint32_t>(head - 0x90), in, object, step);
  }
  if (head < 0xc0) {
    return read_string(static_cast<std::uint32_t>(head - 0xa0), in, object);
  }

  std::error_code ec;
  switch (head) {
    case 0xc0:
      object = Value::nil();
      return {};
    case 0xc2:
      object = Value::boolean(false);
      return {};
    case 0xc3:
      object = Value::boolean(true);
      return {};

    case 0xca: {
      std::uint32_t bits = 0;
      ec = read_uint(in, bits);
      if (!ec) {
        object = Value::floating(static_cast<double>(std::bit_cast<float>(bits)));
      }
      return ec;
    }
    case 0xcb: {
      std::uint64_t bits = 0;
      ec = read_uint(in, bits);
      if (!ec) {
        object = Value::floating(std::bit_cast<double>(bits));
      }
      return ec;
    }

    case 0xcc: {
      std::uint8_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(v);
      }
      return ec;
    }
    case 0xcd: {
      std::uint16_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(v);
      }
      return ec;
    }
    case 0xce: {
      std::uint32_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(v);
      }
      return ec;
    }
    case 0xcf: {
      std::uint64_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(v);
      }
      return ec;
    }
    case 0xd0: {
      std::uint8_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(std::bit_cast<std::int8_t>(v));
      }
      return ec;
    }
    case 0xd1: {
      std::uint16_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(std::bit_cast<std::int16_t>(v));
      }
      return ec;
    }
    case 0xd2: {
      std::uint32_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(std::bit_cast<std::int32_t>(v));
      }
      return ec;
    }
    case 0xd3: {
      std::uint64_t v = 0;
      ec = read_uint(in, v);
      if (!ec) {
        object = Value::integer(std::bit_cast<std::int64_t>(v));
      }
      return ec;
    }

    case 0xd9: {
      std::uint8_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_string(length, in, object);
    }
    case 0xda: {
      std::uint16_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_string(length, in, object);
    }
    case 0xdb: {
      std::uint32_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_string(length, in, object);
    }

    case 0xdc: {
      std::uint16_t size = 0;
      ec = read_uint(in, size);
      return ec ? ec : push_array(size, in, object, step);
    }
    case 0xdd: {
      std::uint32_t size = 0;
      ec = read_uint(in, size);
      return ec ? ec : push_array(size, in, object, step);
    }
    case 0xde: {
      std::uint16_t size = 0;
      ec = read_uint(in, size);
      return ec ? ec : push_map(size, in, object, step);
    }
    case 0xdf: {
      std::uint32_t size = 0;
      ec = read_uint(in, size);
      return ec ? ec : push_map(size, in, object, step);
    }

    case 0xc4: {
      std::uint8_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_binary(length, in, object);
    }
    case 0xc5: {
      std::uint16_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_binary(length, in, object);
    }
    case 0xc6: {
      std::uint32_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_binary(length, in, object);
    }

    case 0xd4:
      return read_extension(1, in, object);
    case 0xd5:
      return read_extension(2, in, object);
    case 0xd6:
      return read_extension(4, in, object);
    case 0xd7:
      return read_extension(8, in, object);
    case 0xd8:
      return read_extension(16, in, object);
    case 0xc7: {
      std::uint8_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_extension(length, in, object);
    }
    case 0xc8: {
      std::uint16_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_extension(length, in, object);
    }
    case 0xc9: {
      std::uint32_t length = 0;
      ec = read_uint(in, length);
      return ec ? ec : read_extension(length, in, object);
    }

    default:
      core::logger().debug("unrecognized header byte {:#04x}", head);
      return make_error_code(errc::invalid_header);
  }
}

std::error_code DecodeMachine::propagate(Value& object, bool& done) {
  done = false;
  while (!stack_.empty()) {
    auto& top = stack_.back();

    if (auto* array = std::get_if<ArrayFrame>(&top)) {
      array->array.push_back(std::move(object));
      ++array->position;
      if (array->position < array->size) {
        return {};
      }
      object = Value(std::move(array->array));
      stack_.pop_back();
      continue;
    }

    auto& map = std::get<MapFrame>(top);
    if (!map.awaiting_value) {
      if (const auto* s = object.get_if<std::string>()) {
        if (*s == kForbiddenKey) {
          core::logger().debug("rejected map key {}", kForbiddenKey);
          return make_error_code(errc::forbidden_key);
        }
        map.key.emplace(std::move(*object.get_if<std::string>()));
      } else if (const auto* i = object.get_if<std::int64_t>()) {
        map.key.emplace(*i);
      } else if (const auto* u = object.get_if<std::uint64_t>()) {
        map.key.emplace(*u);
      } else {
        core::logger().debug("map key of variant index {} is not string or integer",
                             object.storage().index());
        return make_error_code(errc::invalid_map_key);
      }
      map.awaiting_value = true;
      return {};
    }

    map.map.insert_or_assign(std::move(*map.key), std::move(object));
    map.key.reset();
    ++map.read_count;
    if (map.read_count < map.size) {
      map.awaiting_value = false;
      return {};
    }
    object = Value(std::move(map.map));
    stack_.pop_back();
  }

  done = true;
  return {};
}

/*
 * 主循环：
 * 1) 头字节哨兵为空时读取一个头字节（读出即提交）；
 * 2) 按头字节分类：标量读完 payload；容器读出大小并压帧后回到 1)；
 * 3) 头字节解释完毕：清空哨兵并提交；
 * 4) 完成的值沿帧栈传播；帧栈清空即得到顶层结果。
 *
 * 任何一步遇到 insufficient_data 都回滚到最后提交点返回，状态（帧栈/哨兵）保持不变。
 */
std::error_code DecodeMachine::run(InputCursor& in, Value& out) {
  Value object;
  while (true) {
    byte head = 0;
    auto ec = read_head(in, head);
    if (ec) {
      in.rollback();
      return ec;
    }

    Step step = Step::value;
    ec = dispatch(head, in, object, step);
    if (ec) {
      in.rollback();
      return ec;
    }
    head_byte_.reset();
    in.commit();

    if (step == Step::container) {
      continue;
    }

    bool done = false;
    ec = propagate(object, done);
    if (ec) {
      return ec;
    }
    if (done) {
      out = std::move(object);
      return {};
    }
  }
}

}  // namespace msgpk
