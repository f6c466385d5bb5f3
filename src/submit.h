#pragma once

#include "anvil_home.h"
#include "repo_index.h"

#include "nlohmann/json.hpp"

#include <string>

namespace anvil {

inline constexpr char const kSubmissionBase[]{
  "https://github.com/sycomix/Anvil_Index/new/main"
};

struct submission {
  std::string name;  // defaults to the repository name of `url`
  std::string url;
  std::string description;
};

// {"name", "url"[, "description"]}, the document proposed to the central index.
nlohmann::json submit_payload(submission const &s);

// Central index link that opens a prefilled submissions/<name>.json.
std::string submit_link(submission const &s);

// Add `s` to the index as a local entry and return the submission link.
std::string submit_local(repo_index &index, submission s);

// Write hammers/<hammer>/formulas/<name>.json (creating the hammer when needed), add a
// local index entry attributed to the hammer, and return the submission link.
std::string submit_to_hammer(anvil_home const &home,
                             repo_index &index,
                             std::string const &hammer,
                             submission s);

}  // namespace anvil
