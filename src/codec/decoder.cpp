#include "msgpk/codec/decoder.hpp"

#include "msgpk/codec/errc.hpp"

#include "core/logger.hpp"

#include <spdlog/spdlog.h>

namespace msgpk {

Decoder::Decoder(const DecodeOptions& options) : machine_(options) {}

std::error_code Decoder::decode_one(bytes_view in, Value& out, std::size_t& consumed) {
  consumed = 0;
  machine_.reset();

  InputCursor cursor(in);
  Value result;
  auto ec = machine_.run(cursor, result);
  if (ec) {
    core::logger().debug("decode failed at offset {} of {} bytes: {}", cursor.committed(), in.size(),
                         ec.message());
    return ec;
  }
  consumed = cursor.committed();
  out = std::move(result);
  return {};
}

std::error_code Decoder::decode(bytes_view in, Value& out) {
  Value result;
  std::size_t consumed = 0;
  auto ec = decode_one(in, result, consumed);
  if (ec) {
    return ec;
  }
  if (consumed != in.size()) {
    core::logger().debug("{} extra bytes after value", in.size() - consumed);
    return make_error_code(errc::extra_bytes);
  }
  out = std::move(result);
  return {};
}

MultiDecoder::MultiDecoder(bytes_view in, const DecodeOptions& options)
  : in_(in), decoder_(options) {}

std::error_code MultiDecoder::next(Value& out) {
  if (error_) {
    return error_;
  }
  if (offset_ == in_.size()) {
    return make_error_code(errc::end_of_data);
  }
  std::size_t consumed = 0;
  auto ec = decoder_.decode_one(in_.subspan(offset_), out, consumed);
  if (ec) {
    error_ = ec;
    return ec;
  }
  offset_ += consumed;
  return {};
}

MultiDecoder::iterator& MultiDecoder::iterator::operator++() {
  if (!owner_) {
    return *this;
  }
  auto ec = owner_->next(current_);
  if (ec) {
    owner_ = nullptr;
  }
  return *this;
}

}  // namespace msgpk
