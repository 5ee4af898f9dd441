#include "courier/protocol.hpp"

#include <exception>
#include <utility>

namespace courier {

void Protocol::setException(std::exception_ptr ex) {
  _exception = std::move(ex);
  if (auto payload = _payload.lock(); payload && !payload->exception()) {
    payload->setException(_exception);
  }
  onException();
}

}  // namespace courier
