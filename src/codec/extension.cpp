#include "msgpk/codec/extension.hpp"

#include "msgpk/codec/errc.hpp"
#include "msgpk/codec/timestamp.hpp"
#include "msgpk/core/error.hpp"

#include "core/logger.hpp"

#include <spdlog/spdlog.h>

namespace msgpk {

ExtensionRegistry::ExtensionRegistry() { index_.fill(-1); }

std::error_code ExtensionRegistry::register_type(std::int8_t type, EncodeFn encode, DecodeFn decode) {
  if (!encode && !decode) {
    return core::make_error_code(core::errc::invalid_argument);
  }

  const auto existing = index_[slot(type)];
  if (existing >= 0) {
    auto& entry = entries_[static_cast<std::size_t>(existing)];
    entry.encode = std::move(encode);
    entry.decode = std::move(decode);
    core::logger().trace("extension type {} re-registered", static_cast<int>(type));
    return {};
  }

  index_[slot(type)] = static_cast<std::int16_t>(entries_.size());
  entries_.push_back(Entry{type, std::move(encode), std::move(decode)});
  core::logger().trace("extension type {} registered", static_cast<int>(type));
  return {};
}

bool ExtensionRegistry::contains(std::int8_t type) const noexcept {
  return index_[slot(type)] >= 0;
}

std::optional<Extension> ExtensionRegistry::encode(const Object& obj) const {
  for (const auto& entry : entries_) {
    if (!entry.encode) {
      continue;
    }
    auto payload = entry.encode(obj);
    if (payload) {
      return Extension{entry.type, std::move(*payload)};
    }
  }
  return std::nullopt;
}

std::error_code ExtensionRegistry::decode(bytes_view payload, std::int8_t type, Value& out) const {
  const auto idx = index_[slot(type)];
  if (idx < 0 || !entries_[static_cast<std::size_t>(idx)].decode) {
    return make_error_code(errc::unsupported_extension);
  }
  return entries_[static_cast<std::size_t>(idx)].decode(payload, type, out);
}

std::shared_ptr<ExtensionRegistry> ExtensionRegistry::with_builtins() {
  auto registry = std::make_shared<ExtensionRegistry>();
  auto ec = register_timestamp(*registry);
  if (ec) {
    core::logger().error("failed to register timestamp extension: {}", ec.message());
  }
  return registry;
}

const std::shared_ptr<const ExtensionRegistry>& ExtensionRegistry::builtins() {
  static const std::shared_ptr<const ExtensionRegistry> instance = with_builtins();
  return instance;
}

}  // namespace msgpk
