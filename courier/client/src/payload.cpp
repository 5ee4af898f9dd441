#include "courier/payload.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "courier/http-constants.hpp"
#include "courier/scheduler.hpp"
#include "courier/stream-writer.hpp"
#include "courier/task.hpp"

namespace courier {

BytesPayload::BytesPayload(std::string data, std::string_view contentType) : _data(std::move(data)) {
  _headers.add(http::ContentType, contentType);
}

async::Task<void> BytesPayload::write(StreamWriter& writer) { co_await writer.write(_data); }

IterablePayload::IterablePayload(ChunkGenerator generator) : _generator(std::move(generator)) {
  _headers.add(http::ContentType, http::ContentTypeOctetStream);
}

IterablePayload::IterablePayload(std::vector<std::string> chunks)
    : IterablePayload(ChunkGenerator([chunks = std::move(chunks), pos = std::size_t{}]() mutable {
        std::optional<std::string> ret;
        if (pos < chunks.size()) {
          ret.emplace(std::move(chunks[pos++]));
        }
        return ret;
      })) {}

async::Task<void> IterablePayload::write(StreamWriter& writer) {
  if (!_generator) {
    co_return;
  }
  for (auto chunk = _generator(); chunk; chunk = _generator()) {
    co_await writer.write(*chunk);
    co_await async::Yield{};
  }
}

std::shared_ptr<Payload> MakePayload(RequestBody body) {
  return std::visit(
      [](auto&& val) -> std::shared_ptr<Payload> {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, std::string>) {
          return std::make_shared<BytesPayload>(std::move(val));
        } else if constexpr (std::is_same_v<T, ChunkList>) {
          return std::make_shared<IterablePayload>(std::move(val));
        } else if constexpr (std::is_same_v<T, ChunkGenerator>) {
          return std::make_shared<IterablePayload>(std::move(val));
        } else if constexpr (std::is_same_v<T, FormFields>) {
          return std::make_shared<FormPayload>(val);
        } else {
          return std::move(val);
        }
      },
      std::move(body));
}

}  // namespace courier
