#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "courier/http-constants.hpp"
#include "courier/http-headers.hpp"
#include "courier/stream-writer.hpp"
#include "courier/task.hpp"
#include "courier/url-encode.hpp"

namespace courier {

// Request body as seen by the request engine: an optional size, default headers, and a way to stream itself.
class Payload {
 public:
  Payload() = default;

  Payload(const Payload&) = delete;
  Payload(Payload&&) noexcept = delete;
  Payload& operator=(const Payload&) = delete;
  Payload& operator=(Payload&&) noexcept = delete;

  virtual ~Payload() = default;

  // Number of bytes write() will produce, nothing if unknown in advance.
  [[nodiscard]] virtual std::optional<std::size_t> size() const noexcept = 0;

  // Headers describing the payload (Content-Type). They never override caller headers.
  [[nodiscard]] const http::Headers& headers() const noexcept { return _headers; }

  virtual async::Task<void> write(StreamWriter& writer) = 0;

 protected:
  http::Headers _headers;
};

// In memory bytes, written as a single chunk.
class BytesPayload : public Payload {
 public:
  explicit BytesPayload(std::string data, std::string_view contentType = http::ContentTypeOctetStream);

  [[nodiscard]] std::optional<std::size_t> size() const noexcept override { return _data.size(); }

  [[nodiscard]] const std::string& data() const noexcept { return _data; }

  async::Task<void> write(StreamWriter& writer) override;

 private:
  std::string _data;
};

// UTF-8 text.
class TextPayload : public BytesPayload {
 public:
  explicit TextPayload(std::string text) : BytesPayload(std::move(text), http::ContentTypeTextPlainUtf8) {}
};

// Produces the next chunk, or nothing once exhausted.
using ChunkGenerator = std::function<std::optional<std::string>()>;

// Chunks produced on demand, of unknown total size. The writing task yields to the scheduler between chunks.
class IterablePayload : public Payload {
 public:
  explicit IterablePayload(ChunkGenerator generator);

  // Generator over a fixed list of chunks.
  explicit IterablePayload(std::vector<std::string> chunks);

  [[nodiscard]] std::optional<std::size_t> size() const noexcept override { return std::nullopt; }

  async::Task<void> write(StreamWriter& writer) override;

 private:
  ChunkGenerator _generator;
};

// application/x-www-form-urlencoded fields.
class FormPayload : public BytesPayload {
 public:
  explicit FormPayload(const url::Pairs& fields)
      : BytesPayload(url::EncodeForm(fields), http::ContentTypeFormUrlEncoded) {}
};

using ChunkList = std::vector<std::string>;
using FormFields = url::Pairs;

// Body given to a request, resolved once into a single Payload.
using RequestBody = std::variant<std::monostate, std::string, ChunkList, ChunkGenerator, FormFields,
                                 std::shared_ptr<Payload>>;

// Payload of 'body', nullptr for an empty variant or a null payload pointer.
[[nodiscard]] std::shared_ptr<Payload> MakePayload(RequestBody body);

}  // namespace courier
