#include "cmd_common.h"

#include "tui.h"

#include <algorithm>

namespace anvil {

void print_index_entries(std::vector<index_entry> const &entries) {
  std::size_t width{ 0 };
  for (auto const &e : entries) { width = std::max(width, e.name.size()); }

  for (auto const &e : entries) {
    tui::print_stdout("%-*s  %-7s  %s%s%s\n",
                      static_cast<int>(width),
                      e.name.c_str(),
                      index_origin_name(e.origin),
                      e.url.c_str(),
                      e.description.empty() ? "" : "  ",
                      e.description.c_str());
  }
}

void print_receipt(receipt const &r) {
  tui::print_stdout("%s %s\n", r.name.c_str(), r.version.empty() ? "(unversioned)" : r.version.c_str());
  tui::print_stdout("  path:      %s\n", r.install_path.string().c_str());
  tui::print_stdout("  source:    %s\n", r.source.c_str());
  tui::print_stdout("  detector:  %s\n", r.detector.c_str());
  tui::print_stdout("  installed: %s\n", r.installed_at.c_str());
  for (auto const &bin : r.linked_binaries) {
    tui::print_stdout("  binary:    %s\n", bin.c_str());
  }
  for (auto const &lib : r.library_artifacts) {
    tui::print_stdout("  library:   %s (%s)\n",
                      lib.path.generic_string().c_str(),
                      library_class_name(lib.kind));
  }
}

}  // namespace anvil
