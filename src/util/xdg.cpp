#include "ulidkit/util/xdg.hpp"

#include <cstdlib>

namespace ulidkit::util {

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "ulidkit";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".ulidkit_config";
  }

  return std::filesystem::path(home) / ".config" / "ulidkit";
}

std::filesystem::path Xdg::stateHome() {
  std::string xdg_state_home = getEnvVar("XDG_STATE_HOME", "");
  if (!xdg_state_home.empty()) {
    return std::filesystem::path(xdg_state_home) / "ulidkit";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".ulidkit_state";
  }

  return std::filesystem::path(home) / ".local" / "state" / "ulidkit";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace ulidkit::util
