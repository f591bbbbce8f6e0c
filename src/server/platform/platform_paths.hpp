#pragma once

#include <filesystem>

namespace platform {

// Directory holding config.json. Empty when no location can be determined.
std::filesystem::path config_dir();

} // namespace platform
