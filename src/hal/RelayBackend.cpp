#include "hal/RelayBackend.hpp"
#include "core/Errors.hpp"

namespace ivlab {
  namespace hal {

    const char* toString(RelayBoard b) { return b == RelayBoard::Pixel ? "pixel" : "led"; }

    void MockRelayBackend::setRelay(RelayBoard board, int relay, bool on) {
      if (!open_)
        throw core::ConnectionError("[MockRelay] not open");
      history_.push_back(Switch{ board, relay, on });
    }

  } // namespace hal
} // namespace ivlab
