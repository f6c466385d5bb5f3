#pragma once

#include "anvil_home.h"
#include "auto_builder.h"
#include "build_plan.h"
#include "fetch.h"
#include "install_store.h"
#include "repo_index.h"
#include "shell.h"
#include "util.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace anvil {

struct forge_options {
  std::optional<std::string> msvc_runtime;  // "MD" or "MT", over formula and environment
  bool force_pic{ false };
  std::optional<std::chrono::seconds> timeout;  // over ANVIL_BUILD_TIMEOUT
  std::optional<unsigned> jobs;                 // over ANVIL_JOBS
  bool keep_workspace{ false };
  std::string platform;         // defaults to platform::platform_key()
  tool_probe_t probe;           // AutoBuilder tool probe; defaults to PATH lookup
  std::atomic_bool const *cancel{ nullptr };  // defaults to the termination flag
};

// What a successful forge hands to the post-forge hook.
struct forge_outcome {
  receipt installed;
  std::optional<std::string> remote;  // git remote or URL the source came from
  std::string description;
};

using post_forge_hook_t = std::function<void(forge_outcome const &)>;

// Default hook: submit the source remote to the local index (and print the central
// submission link) when auto-submit is on and the remote is not indexed yet.
post_forge_hook_t forge_auto_submit_hook(repo_index &index, bool enabled);

// Acquire, plan, build and install a package and its dependencies. Shared state under
// the anvil root is left as it was whenever a forge fails.
class forge_pipeline : unmovable {
 public:
  forge_pipeline(anvil_home const &home,
                 repo_index &index,
                 forge_options options,
                 post_forge_hook_t hook = {});

  // `locator` is an index name, a URL or a local directory. Returns the root package's
  // receipt. Hook failures are logged, never raised.
  receipt forge(std::string const &locator);

 private:
  struct target;

  target resolve_target(std::string const &locator) const;
  receipt forge_target(target const &t, bool with_dependencies);
  build_plan resolve_plan(target const &t, acquired_source const &acquired) const;
  void build_dependencies(build_plan const &plan);
  void run_steps(build_plan const &plan,
                 std::filesystem::path const &source_dir,
                 std::filesystem::path const &prefix,
                 std::filesystem::path const &workspace) const;
  void run_command(std::string const &command,
                   std::filesystem::path const &source_dir,
                   shell_env_t const &env,
                   std::filesystem::path const &workspace) const;
  void notify(forge_outcome const &outcome) const;

  std::string platform() const;
  unsigned jobs() const;
  std::atomic_bool const *cancel() const;

  anvil_home const &home_;
  repo_index &index_;
  forge_options options_;
  post_forge_hook_t hook_;
};

}  // namespace anvil
