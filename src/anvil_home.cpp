#include "anvil_home.h"

#include "errors.h"

#include <utility>

namespace anvil {

void validate_component_name(std::string_view kind, std::string_view name) {
  if (name.empty() || name.front() == '.' ||
      name.find_first_of("/\\") != std::string_view::npos ||
      name.find('\0') != std::string_view::npos) {
    throw anvil_error("Invalid " + std::string{ kind } + " name: '" + std::string{ name } +
                      "'");
  }
}

anvil_home::anvil_home(anvil_config cfg) : cfg_{ std::move(cfg) } {
  cfg_.root = std::filesystem::absolute(cfg_.root).lexically_normal();
}

std::filesystem::path anvil_home::package_dir(std::string_view name) const {
  validate_component_name("package", name);
  return opt_dir() / name;
}

std::filesystem::path anvil_home::receipt_path(std::string_view name) const {
  return package_dir(name) / kReceiptFilename;
}

std::filesystem::path anvil_home::package_lock(std::string_view name) const {
  validate_component_name("package", name);
  return opt_dir() / ("." + std::string{ name } + ".lock");
}

std::filesystem::path anvil_home::hammer_dir(std::string_view name) const {
  validate_component_name("hammer", name);
  return hammers_dir() / name;
}

void anvil_home::ensure_layout() const {
  for (auto const &dir :
       { index_dir(), hammers_dir(), opt_dir(), bin_dir(), build_dir() }) {
    std::filesystem::create_directories(dir);
  }
}

}  // namespace anvil
