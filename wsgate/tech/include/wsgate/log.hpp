#pragma once

// Logging goes through spdlog. Only the header part is needed by the library code,
// the sink setup is left to the embedding application.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace wsgate {

namespace log = spdlog;

}  // namespace wsgate
