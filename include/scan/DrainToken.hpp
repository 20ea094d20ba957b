#pragma once

// Standard
#include <atomic>

namespace autorun::scan {

// Set once to let the scan loop finish its current unit of work and stop
class DrainToken {
   public:
    void request() noexcept { requested.store(true); }

    [[nodiscard]] auto isRequested() const noexcept -> bool { return requested.load(); }

   private:
    std::atomic<bool> requested{false};
};

}  // namespace autorun::scan
