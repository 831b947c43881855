#pragma once

#include <string>

namespace printmon {

// Installs the process-wide spdlog logger: stdout always, plus `file` when set.
// Unknown level names fall back to info.
void init_logging(const std::string& level, const std::string& file = {});

}  // namespace printmon
