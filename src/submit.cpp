#include "submit.h"

#include "errors.h"
#include "formula.h"
#include "libcurl_util.h"
#include "tui.h"
#include "url.h"
#include "util.h"

#include <filesystem>

namespace anvil {
namespace {

void fill_name(submission &s) {
  if (util_trim(s.url).empty()) { throw anvil_error{ "Submission requires a URL" }; }
  if (s.name.empty()) { s.name = url_repo_name(s.url); }
  validate_component_name("package", s.name);
}

}  // namespace

nlohmann::json submit_payload(submission const &s) {
  nlohmann::json doc{ { "name", s.name }, { "url", s.url } };
  if (!s.description.empty()) { doc["description"] = s.description; }
  return doc;
}

std::string submit_link(submission const &s) {
  return std::string{ kSubmissionBase } + "?filename=" +
         libcurl_escape("submissions/" + s.name + ".json") +
         "&value=" + libcurl_escape(submit_payload(s).dump(2)) +
         "&message=" + libcurl_escape("Add " + s.name);
}

std::string submit_local(repo_index &index, submission s) {
  fill_name(s);
  if (index.insert({ .name = s.name, .url = s.url, .description = s.description }) ==
      insert_result::INSERTED) {
    tui::info("Added '%s' to the local index", s.name.c_str());
  } else {
    tui::info("'%s' is already indexed", s.url.c_str());
  }
  return submit_link(s);
}

std::string submit_to_hammer(anvil_home const &home,
                             repo_index &index,
                             std::string const &hammer,
                             submission s) {
  fill_name(s);
  auto const dir{ home.hammer_dir(hammer) / "formulas" };
  std::filesystem::create_directories(dir);

  formula f{ .name = s.name,
             .description = s.description,
             .source = formula_source{ formula_infer_source_kind(s.url, false), s.url } };
  auto const path{ dir / (s.name + ".json") };
  util_write_file_atomic(path, formula_to_json(f).dump(2) + "\n");
  tui::info("Wrote %s", path.string().c_str());

  index.insert({ .name = s.name, .url = s.url, .description = s.description, .hammer = hammer });
  return submit_link(s);
}

}  // namespace anvil
