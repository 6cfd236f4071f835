#pragma once

#include <cstdlib>
#include <string>

namespace cpamm {

// TRACE=1 enables key=value diagnostic lines on stdout.
inline bool trace_enabled() {
    static const bool enabled = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return enabled;
}

} // namespace cpamm
