#include "msgpk/utils/value_dump.hpp"

#include "msgpk/utils/hex.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace msgpk::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

class Dumper final {
public:
    explicit Dumper(const ValueDumpOptions &options) : options_(options) {}

    void value(const Value &v, std::size_t depth);

    [[nodiscard]] std::string str() const { return oss_.str(); }

private:
    [[nodiscard]] const char *color(const char *code) const noexcept {
        return options_.enable_color ? code : "";
    }

    [[nodiscard]] std::size_t limit(std::size_t total, std::size_t max) const noexcept {
        return max == 0 ? total : std::min(total, max);
    }

    void quoted(const std::string &s);
    void payload(const char *tag, const std::vector<byte> &bytes);
    void key(const MapKey &k);

    // 容器的公共框架：open/close 括号，逐项调用 item(i)，处理截断与换行。
    template <class ItemFn>
    void container(char open, char close, std::size_t total, std::size_t depth, ItemFn &&item);

    void newline(std::size_t depth) {
        oss_ << '\n' << std::string(depth * options_.indent_spaces, ' ');
    }

    const ValueDumpOptions &options_;
    std::ostringstream oss_;
};

void Dumper::quoted(const std::string &s) {
    const std::size_t n = limit(s.size(), options_.max_payload_bytes);
    oss_ << color(Ansi::string) << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            oss_ << '\\' << static_cast<char>(c);
        } else if (c < 0x20 || c == 0x7F) {
            oss_ << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                 << std::dec;
        } else {
            // UTF-8 多字节序列原样输出。
            oss_ << static_cast<char>(c);
        }
    }
    if (n < s.size()) {
        oss_ << "...";
    }
    oss_ << '"' << color(Ansi::reset);
}

void Dumper::payload(const char *tag, const std::vector<byte> &bytes) {
    const std::size_t n = limit(bytes.size(), options_.max_payload_bytes);
    oss_ << color(Ansi::type) << tag << '[' << bytes.size() << ']' << color(Ansi::reset);
    if (bytes.empty()) {
        return;
    }
    oss_ << ' ' << color(Ansi::value) << to_hex(core::bytes_view{bytes.data(), n}) << color(Ansi::reset);
    if (n < bytes.size()) {
        oss_ << ' ' << color(Ansi::dim) << "..." << color(Ansi::reset);
    }
}

void Dumper::key(const MapKey &k) {
    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                quoted(v);
            } else {
                oss_ << color(Ansi::value) << v << color(Ansi::reset);
            }
        },
        k.storage());
}

template <class ItemFn>
void Dumper::container(char open, char close, std::size_t total, std::size_t depth, ItemFn &&item) {
    if (total == 0) {
        oss_ << open << close;
        return;
    }
    if (depth >= options_.max_depth) {
        oss_ << open << color(Ansi::dim) << "..." << total << " items" << color(Ansi::reset) << close;
        return;
    }

    const std::size_t n = limit(total, options_.max_items);
    oss_ << open;
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            oss_ << ',';
        }
        if (options_.multiline) {
            newline(depth + 1);
        } else if (i != 0) {
            oss_ << ' ';
        }
        item(i);
    }
    if (n < total) {
        oss_ << ',';
        if (options_.multiline) {
            newline(depth + 1);
        } else {
            oss_ << ' ';
        }
        oss_ << color(Ansi::dim) << "..." << color(Ansi::reset);
    }
    if (options_.multiline) {
        newline(depth);
    }
    oss_ << close;
}

void Dumper::value(const Value &v, std::size_t depth) {
    std::visit(
        [&](const auto &x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, Nil>) {
                oss_ << color(Ansi::value) << "nil" << color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, bool>) {
                oss_ << color(Ansi::value) << (x ? "true" : "false") << color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
                oss_ << color(Ansi::value) << x << color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, double>) {
                // 浮点用较高精度，便于定位差异。
                oss_ << color(Ansi::value) << std::setprecision(17) << x << color(Ansi::reset);
            } else if constexpr (std::is_same_v<T, std::string>) {
                quoted(x);
            } else if constexpr (std::is_same_v<T, Binary>) {
                payload("bin", x.value);
            } else if constexpr (std::is_same_v<T, Extension>) {
                oss_ << color(Ansi::type) << "ext(" << static_cast<int>(x.type) << ")" << color(Ansi::reset);
                payload("", x.data);
            } else if constexpr (std::is_same_v<T, Array>) {
                container('[', ']', x.size(), depth, [&](std::size_t i) { value(x[i], depth + 1); });
            } else if constexpr (std::is_same_v<T, Map>) {
                auto it = x.begin();
                container('{', '}', x.size(), depth, [&](std::size_t) {
                    key(it->first);
                    oss_ << ": ";
                    value(it->second, depth + 1);
                    ++it;
                });
            } else if constexpr (std::is_same_v<T, ObjectPtr>) {
                oss_ << color(Ansi::type) << (x ? x->describe() : std::string("object(null)"))
                     << color(Ansi::reset);
            }
        },
        v.storage());
}

} // namespace

std::string dump_value(const Value &value, ValueDumpOptions options) {
    Dumper dumper(options);
    dumper.value(value, 0);
    return dumper.str();
}

} // namespace msgpk::utils
