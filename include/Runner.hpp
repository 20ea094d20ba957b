#pragma once

// Internal
#include "DrainToken.hpp"

class Runner {
   public:
    Runner() = delete;
    Runner(const Runner&) = delete;
    Runner(Runner&&) = delete;
    auto operator=(const Runner&) -> Runner& = delete;
    auto operator=(Runner&&) -> Runner& = delete;
    ~Runner() = delete;

    // Parses the command line and runs the scan loop until it drains, returns the exit status
    static auto run(int argc, const char* const argv[]) -> int;  // NOLINT

   private:
    static auto drainToken() -> autorun::scan::DrainToken&;
    static void installSignalHandlers();
    static void requestDrain(int sig);
};
