#include "msgpk/core/utf8.hpp"

namespace msgpk::core {
namespace {

constexpr const char kReplacement[] = "\xEF\xBF\xBD";  // U+FFFD

// 返回从 bytes[pos] 开始的合法序列长度；0 表示非法。
std::size_t sequence_length(bytes_view bytes, std::size_t pos) noexcept {
  const auto b0 = bytes[pos];
  if (b0 < 0x80) {
    return 1;
  }

  std::size_t need = 0;
  byte lo = 0x80;
  byte hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    need = 1;
  } else if (b0 == 0xE0) {
    need = 2;
    lo = 0xA0;  // 排除过长编码
  } else if (b0 == 0xED) {
    need = 2;
    hi = 0x9F;  // 排除 UTF-16 代理区
  } else if (b0 >= 0xE1 && b0 <= 0xEF) {
    need = 2;
  } else if (b0 == 0xF0) {
    need = 3;
    lo = 0x90;
  } else if (b0 >= 0xF1 && b0 <= 0xF3) {
    need = 3;
  } else if (b0 == 0xF4) {
    need = 3;
    hi = 0x8F;  // 不超过 U+10FFFF
  } else {
    return 0;
  }

  if (bytes.size() - pos <= need) {
    return 0;
  }
  const auto b1 = bytes[pos + 1];
  if (b1 < lo || b1 > hi) {
    return 0;
  }
  for (std::size_t i = 2; i <= need; ++i) {
    const auto b = bytes[pos + i];
    if (b < 0x80 || b > 0xBF) {
      return 0;
    }
  }
  return need + 1;
}

}  // namespace

std::size_t utf8_valid_prefix(bytes_view bytes) noexcept {
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const auto n = sequence_length(bytes, pos);
    if (n == 0) {
      return pos;
    }
    pos += n;
  }
  return pos;
}

std::string decode_utf8(bytes_view bytes) {
  const auto valid = utf8_valid_prefix(bytes);
  if (valid == bytes.size()) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
  }

  std::string out;
  out.reserve(bytes.size() + 8);
  out.append(reinterpret_cast<const char*>(bytes.data()), valid);

  std::size_t pos = valid;
  while (pos < bytes.size()) {
    const auto n = sequence_length(bytes, pos);
    if (n == 0) {
      out.append(kReplacement, 3);
      ++pos;
      continue;
    }
    out.append(reinterpret_cast<const char*>(bytes.data() + pos), n);
    pos += n;
  }
  return out;
}

}  // namespace msgpk::core
