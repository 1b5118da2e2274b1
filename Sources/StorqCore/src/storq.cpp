// storq.cpp - process-wide definitions shared by every translation unit

#include "storq/log.hpp"

namespace storq {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::off};

} // namespace storq
