#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// Unset and empty variables both count as absent.
const char* env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value ? value : nullptr;
}

} // namespace

std::filesystem::path config_dir() {
    if (auto dir = env("CODEX_MOCK_CONFIG_DIR")) return dir;
    if (auto xdg = env("XDG_CONFIG_HOME")) return std::filesystem::path(xdg) / "codex-mock";
    if (auto home = env("HOME")) return std::filesystem::path(home) / ".config" / "codex-mock";
    return {};
}

} // namespace platform
