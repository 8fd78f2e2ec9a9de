#pragma once

#include "msgpk/value/value.hpp"

#include <cstddef>
#include <string>

namespace msgpk::utils {

/**
 * @brief Value 的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 输出形式接近 JSON，但保留 MessagePack 特有的类型标记（bin/ext/object）；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没。
 */
struct ValueDumpOptions final {
    // 最大展开深度（0 表示只输出根节点的类型与大小）。
    std::size_t max_depth{16};

    // Array/Map 最大输出元素数（0 表示不限制）。
    std::size_t max_items{128};

    // 字符串/二进制/扩展 payload 最大输出字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // Array/Map 是否使用多行缩进格式。
    bool multiline{false};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    bool enable_color{false};
};

[[nodiscard]] std::string dump_value(const Value &value, ValueDumpOptions options = {});

} // namespace msgpk::utils
