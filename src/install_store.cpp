#include "install_store.h"

#include "errors.h"
#include "platform.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <system_error>

namespace anvil {
namespace {

namespace fs = std::filesystem;

std::string utc_now_iso8601() {
  auto const now{ std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()) };
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

}  // namespace

nlohmann::json receipt_to_json(receipt const &r) {
  nlohmann::json libs = nlohmann::json::array();
  for (auto const &lib : r.library_artifacts) {
    libs.push_back({ { "path", lib.path.generic_string() },
                     { "kind", library_class_name(lib.kind) } });
  }

  return { { "name", r.name },
           { "version", r.version },
           { "install_path", r.install_path.string() },
           { "source", r.source },
           { "detector", r.detector },
           { "linked_binaries", r.linked_binaries },
           { "library_artifacts", libs },
           { "installed_at", r.installed_at } };
}

receipt receipt_from_json(nlohmann::json const &doc, std::string const &context) {
  if (!doc.is_object()) { throw anvil_error{ context + ": receipt is not an object" }; }

  try {
    receipt r{ .name = doc.at("name").get<std::string>(),
               .version = doc.value("version", ""),
               .install_path = doc.at("install_path").get<std::string>(),
               .source = doc.value("source", ""),
               .detector = doc.value("detector", ""),
               .linked_binaries =
                   doc.value("linked_binaries", std::vector<std::string>{}),
               .installed_at = doc.value("installed_at", "") };

    if (auto const it{ doc.find("library_artifacts") }; it != doc.end()) {
      for (auto const &lib : *it) {
        auto const kind_name{ lib.at("kind").get<std::string>() };
        auto const kind{ library_class_parse(kind_name) };
        if (!kind) { throw anvil_error{ context + ": unknown library kind " + kind_name }; }
        r.library_artifacts.push_back(
            { .path = lib.at("path").get<std::string>(), .kind = *kind });
      }
    }
    return r;
  } catch (nlohmann::json::exception const &e) {
    throw anvil_error{ context + ": malformed receipt: " + e.what() };
  }
}

void receipt_write(anvil_home const &home, receipt const &r) {
  auto stamped{ r };
  if (stamped.installed_at.empty()) { stamped.installed_at = utc_now_iso8601(); }
  auto const path{ home.receipt_path(r.name) };
  fs::create_directories(path.parent_path());
  util_write_file_atomic(path, receipt_to_json(stamped).dump(2) + "\n");
}

std::optional<receipt> receipt_read(anvil_home const &home, std::string_view name) {
  auto const path{ home.receipt_path(name) };
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) { return std::nullopt; }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(util_load_text(path));
  } catch (std::exception const &e) {
    throw anvil_error{ path.string() + ": " + e.what() };
  }
  return receipt_from_json(doc, path.string());
}

bool install_store_is_installed(anvil_home const &home, std::string_view name) {
  std::error_code ec;
  return fs::is_regular_file(home.receipt_path(name), ec);
}

std::vector<receipt> install_store_list(anvil_home const &home) {
  std::vector<receipt> result;
  std::error_code ec;
  if (!fs::is_directory(home.opt_dir(), ec)) { return result; }

  for (auto const &entry : fs::directory_iterator{ home.opt_dir() }) {
    auto const name{ entry.path().filename().string() };
    if (!entry.is_directory() || name.starts_with(".")) { continue; }
    try {
      if (auto r{ receipt_read(home, name) }) { result.push_back(std::move(*r)); }
    } catch (anvil_error const &e) {
      tui::warn("Skipping %s: %s", name.c_str(), e.what());
    }
  }

  std::sort(result.begin(), result.end(), [](auto const &a, auto const &b) {
    return a.name < b.name;
  });
  return result;
}

uninstall_result install_store_uninstall(anvil_home const &home, std::string_view name) {
  auto const package_dir{ home.package_dir(name) };
  std::error_code ec;
  if (!fs::exists(package_dir, ec)) {
    throw anvil_error{ "Package '" + std::string{ name } + "' is not installed" };
  }

  platform::file_lock lock{ home.package_lock(name), platform::lock_mode::try_once };
  if (!lock) {
    throw anvil_error{ "Package '" + std::string{ name } + "' is being forged; try again later" };
  }

  uninstall_result result;
  result.removed_links = artifacts_unlink(artifacts_links_into(home.bin_dir(), package_dir));

  fs::remove(home.receipt_path(name), ec);
  if (ec) {
    throw std::system_error{ ec, "cannot remove receipt of " + std::string{ name } };
  }

  result.removed_package_dir = util_safe_remove_all(package_dir, { home.root(), home.opt_dir() });
  if (!result.removed_package_dir) {
    throw anvil_error{ "Failed to remove " + package_dir.string() };
  }

  tui::info("Uninstalled %.*s (%zu links removed)",
            static_cast<int>(name.size()),
            name.data(),
            result.removed_links);
  return result;
}

}  // namespace anvil
