#include "msgpk/utils/hex.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace msgpk::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";

constexpr const char *kReset = "\033[0m";
constexpr const char *kDim = "\033[2m";
constexpr const char *kBytes = "\033[1;33m";
constexpr const char *kAscii = "\033[1;32m";
constexpr const char *kError = "\033[1;31m";

// 返回 -1 表示不是 hex 数字。
[[nodiscard]] int nibble_of(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const auto lower = static_cast<unsigned char>(std::tolower(c));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

[[nodiscard]] bool is_separator(unsigned char c) noexcept {
    constexpr std::string_view kSeparators = ",;:-_|[](){}<>";
    return std::isspace(c) != 0 || kSeparators.find(static_cast<char>(c)) != std::string_view::npos;
}

void put_byte(std::string &out, core::byte b) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0F]);
}

void put_offset(std::string &out, std::size_t offset) {
    std::array<char, 4> digits{};
    for (std::size_t i = digits.size(); i > 0; --i) {
        digits[i - 1] = kDigits[offset & 0x0F];
        offset >>= 4;
    }
    out.append(digits.data(), digits.size());
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const auto color = [&](const char *code) { return options.enable_color ? code : ""; };

    const std::size_t total = bytes.size();
    const std::size_t shown = options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line = options.bytes_per_line == 0 ? 16 : options.bytes_per_line;

    std::string out;
    out.reserve((shown / per_line + 1) * (per_line * 4 + 8));

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const auto line = bytes.subspan(offset, std::min(per_line, shown - offset));

        if (options.show_offset) {
            out += color(kDim);
            put_offset(out, offset);
            out += ": ";
            out += color(kReset);
        }

        out += color(kBytes);
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            put_byte(out, line[i]);
        }
        out += color(kReset);

        if (options.show_ascii) {
            // 短行补齐，保证 ASCII 列对齐。
            out.append((per_line - line.size()) * 3 + 2, ' ');
            out += color(kAscii);
            for (const auto b : line) {
                out.push_back((b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.');
            }
            out += color(kReset);
        }

        out.push_back('\n');
    }

    if (shown < total) {
        out += color(kError);
        out += "... (truncated, total=" + std::to_string(total) + " bytes)";
        out += color(kReset);
        out.push_back('\n');
    }
    return out;
}

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(' ');
        }
        put_byte(out, bytes[i]);
    }
    return out;
}

std::error_code parse_hex(std::string_view text, std::vector<core::byte> &out) noexcept {
    out.clear();

    int high = -1;
    bool group_start = true;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (is_separator(c)) {
            group_start = true;
            continue;
        }

        // 0x/0X 前缀只在一组数字开头、且不在半个字节中间时识别。
        if (group_start && high < 0 && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            ++i;
            group_start = false;
            continue;
        }
        group_start = false;

        const int v = nibble_of(c);
        if (v < 0) {
            return core::make_error_code(core::errc::invalid_argument);
        }
        if (high < 0) {
            high = v;
            continue;
        }
        out.push_back(static_cast<core::byte>((high << 4) | v));
        high = -1;
    }

    if (high >= 0) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    return {};
}

} // namespace msgpk::utils
