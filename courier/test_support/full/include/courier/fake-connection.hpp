#pragma once

#include <cstddef>
#include <memory>
#include <utility>

#include "courier/connection.hpp"
#include "courier/fake-protocol.hpp"
#include "courier/protocol.hpp"

namespace courier::test {

// Connection reservation counting what its owner did with it.
class FakeConnection : public Connection {
 public:
  explicit FakeConnection(std::shared_ptr<FakeProtocol> protocol = std::make_shared<FakeProtocol>())
      : _protocol(std::move(protocol)) {}

  [[nodiscard]] Protocol* protocol() const noexcept override { return _protocol.get(); }

  void release() override { ++_nbReleases; }

  void close() override { ++_nbCloses; }

  [[nodiscard]] FakeProtocol& fake() const noexcept { return *_protocol; }

  [[nodiscard]] std::size_t nbReleases() const noexcept { return _nbReleases; }
  [[nodiscard]] std::size_t nbCloses() const noexcept { return _nbCloses; }

 private:
  std::shared_ptr<FakeProtocol> _protocol;
  std::size_t _nbReleases{};
  std::size_t _nbCloses{};
};

}  // namespace courier::test
