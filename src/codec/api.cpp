#include "msgpk/codec/api.hpp"

namespace msgpk {

std::error_code encode(const Value& value, std::vector<byte>& out, const EncodeOptions& options) {
  core::OutputBuffer buffer(options.initial_buffer_size);
  Encoder encoder(options);
  auto ec = encoder.encode(buffer, value);
  if (ec) {
    return ec;
  }
  const auto written = buffer.view();
  out.insert(out.end(), written.begin(), written.end());
  return {};
}

std::error_code decode(bytes_view in, Value& out, const DecodeOptions& options) {
  Decoder decoder(options);
  return decoder.decode(in, out);
}

MultiDecoder decode_multi(bytes_view in, const DecodeOptions& options) {
  return MultiDecoder(in, options);
}

std::error_code decode_stream(PullSource& source, Value& out, const DecodeOptions& options) {
  StreamDecoder decoder(options);
  return decoder.decode(source, out);
}

asio::awaitable<std::pair<std::error_code, Value>> async_decode_stream(AsyncPullSource& source,
                                                                       DecodeOptions options) {
  StreamDecoder decoder(options);
  co_return co_await decoder.async_decode(source);
}

}  // namespace msgpk
