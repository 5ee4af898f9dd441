#pragma once

#include "courier/protocol.hpp"

namespace courier {

// Reservation of a pooled connection, owned by a single response.
class Connection {
 public:
  virtual ~Connection() = default;

  // nullptr once the connection is detached from its protocol.
  [[nodiscard]] virtual Protocol* protocol() const noexcept = 0;

  // Returns the connection to its pool, alive.
  virtual void release() = 0;

  // Closes the underlying transport. The connection will not be reused.
  virtual void close() = 0;
};

}  // namespace courier
