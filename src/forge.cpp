#include "forge.h"

#include "artifacts.h"
#include "build_env.h"
#include "dependency_graph.h"
#include "errors.h"
#include "platform.h"
#include "submit.h"
#include "termination.h"
#include "tui.h"
#include "url.h"
#include "workspace.h"

#include "tbb/global_control.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <exception>
#include <system_error>
#include <utility>

namespace anvil {
namespace {

namespace fs = std::filesystem;

constexpr std::size_t kOutputTailLines{ 200 };
constexpr std::size_t kEchoedFailureLines{ 20 };

std::string archive_stem(std::string name) {
  for (std::string_view const suffix :
       { ".tar.gz", ".tar.xz", ".tar.bz2", ".tgz", ".tar", ".zip", ".7z" }) {
    if (util_iends_with(name, suffix)) {
      name.resize(name.size() - suffix.size());
      break;
    }
  }
  return name;
}

std::string name_for_locator(formula_source const &src) {
  if (src.kind == source_kind::LOCAL) {
    auto dir{ fetch_local_path(src.locator) };
    if (dir.filename().empty()) { dir = dir.parent_path(); }
    return dir.filename().string();
  }
  auto name{ url_repo_name(src.locator) };
  return src.kind == source_kind::ARCHIVE ? archive_stem(std::move(name)) : name;
}

// Previous installation moved aside for the duration of a re-forge.
struct install_backup {
  fs::path dir;
  std::vector<fs::path> link_targets;
};

std::optional<install_backup> backup_install(anvil_home const &home, std::string const &name) {
  auto const prefix{ home.package_dir(name) };
  std::error_code ec;
  if (!fs::exists(prefix, ec)) { return std::nullopt; }

  install_backup backup{ .dir = home.opt_dir() /
                                ("." + name + ".previous-" + util_random_hex(8)) };
  auto const links{ artifacts_links_into(home.bin_dir(), prefix) };
  for (auto const &link : links) {
    if (auto target{ artifacts_link_target(link) }) {
      backup.link_targets.push_back(std::move(*target));
    }
  }

  platform::atomic_rename(prefix, backup.dir);
  artifacts_unlink(links);
  tui::debug("Moved previous install of %s to %s", name.c_str(), backup.dir.string().c_str());
  return backup;
}

void restore_install(anvil_home const &home,
                     std::string const &name,
                     std::vector<bin_link> const &new_links,
                     std::optional<install_backup> const &backup,
                     std::string_view platform) {
  std::vector<fs::path> link_paths;
  for (auto const &link : new_links) { link_paths.push_back(link.link); }
  artifacts_unlink(link_paths);

  auto const prefix{ home.package_dir(name) };
  std::error_code ec;
  if (fs::exists(prefix, ec) &&
      !util_safe_remove_all(prefix, { home.root(), home.opt_dir() })) {
    tui::warn("Could not remove partial install %s", prefix.string().c_str());
  }

  if (!backup) { return; }
  try {
    platform::atomic_rename(backup->dir, prefix);
    artifacts_link_binaries(backup->link_targets, home.bin_dir(), platform);
    tui::info("Restored previous install of %s", name.c_str());
  } catch (std::exception const &e) {
    tui::error("Could not restore previous install of %s from %s: %s",
               name.c_str(),
               backup->dir.string().c_str(),
               e.what());
  }
}

}  // namespace

struct forge_pipeline::target {
  std::string name;
  std::string locator;
  formula_source source;
  std::optional<formula> indexed;
};

post_forge_hook_t forge_auto_submit_hook(repo_index &index, bool enabled) {
  return [&index, enabled](forge_outcome const &outcome) {
    if (!enabled || !outcome.remote) { return; }
    if (index.has_url(*outcome.remote)) {
      tui::debug("%s is already indexed", outcome.remote->c_str());
      return;
    }
    tui::info("Repository %s is not indexed; submitting it", outcome.remote->c_str());
    auto const link{ submit_local(index,
                                  { .name = outcome.installed.name,
                                    .url = *outcome.remote,
                                    .description = outcome.description }) };
    tui::print_stdout("Submit to the central index:\n%s\n", link.c_str());
  };
}

forge_pipeline::forge_pipeline(anvil_home const &home,
                               repo_index &index,
                               forge_options options,
                               post_forge_hook_t hook)
    : home_{ home }, index_{ index }, options_{ std::move(options) }, hook_{ std::move(hook) } {}

std::string forge_pipeline::platform() const {
  return options_.platform.empty() ? std::string{ platform::platform_key() } : options_.platform;
}

unsigned forge_pipeline::jobs() const {
  if (options_.jobs) { return *options_.jobs; }
  if (home_.config().jobs) { return *home_.config().jobs; }
  return platform::hardware_jobs();
}

std::atomic_bool const *forge_pipeline::cancel() const {
  return options_.cancel ? options_.cancel : &termination_cancel_flag();
}

receipt forge_pipeline::forge(std::string const &locator) {
  std::optional<tbb::global_control> parallelism;
  if (auto const n{ options_.jobs ? options_.jobs : home_.config().jobs }) {
    parallelism.emplace(tbb::global_control::max_allowed_parallelism, *n);
  }

  home_.ensure_layout();
  return forge_target(resolve_target(locator), true);
}

forge_pipeline::target forge_pipeline::resolve_target(std::string const &locator) const {
  if (util_trim(locator).empty()) { throw anvil_error{ "Nothing to forge: empty locator" }; }

  if (auto direct{ fetch_classify_locator(locator) }) {
    target t{ .name = name_for_locator(*direct), .locator = locator, .source = *direct };
    if (direct->kind != source_kind::LOCAL) {
      if (auto const entry{ index_.find_url(locator) }) {
        tui::debug("%s is indexed as %s", locator.c_str(), entry->name.c_str());
        t.name = entry->name;
        t.indexed = index_.lookup(entry->name);
      }
    }
    return t;
  }

  auto f{ index_.lookup(locator) };
  if (!f.source) { throw anvil_error{ "Formula '" + f.name + "' has no source" }; }
  target t{ .name = f.name, .locator = f.source->locator, .source = *f.source };
  t.indexed = std::move(f);
  return t;
}

build_plan forge_pipeline::resolve_plan(target const &t, acquired_source const &acquired) const {
  auto indexed{ t.indexed };
  if (!indexed && acquired.remote) {
    if (auto const entry{ index_.find_url(*acquired.remote) }) {
      indexed = index_.lookup(entry->name);
    }
  }

  build_plan plan;
  if (indexed && indexed->has_build_plan()) {
    tui::info("Using indexed formula for %s", t.name.c_str());
    plan = plan_from_formula(*indexed, platform());
    plan.detector = "index";
  } else {
    plan = auto_builder_detect({ .source_dir = acquired.dir,
                                 .platform = platform(),
                                 .name = t.name,
                                 .probe = options_.probe });
    if (indexed) {
      if (plan.binaries.empty() && !plan.library_only) { plan.binaries = indexed->binaries; }
      if (plan.version.empty()) { plan.version = indexed->version; }
      for (auto const &dep : indexed->dependencies) {
        if (std::find(plan.dependencies.begin(), plan.dependencies.end(), dep) ==
            plan.dependencies.end()) {
          plan.dependencies.push_back(dep);
        }
      }
    }
  }
  plan.name = t.name;

  for (auto const &dep : plan.dependencies) {
    if (dep == plan.name) {
      throw dependency_cycle_error{ { plan.name, plan.name } };
    }
  }
  return plan;
}

void forge_pipeline::build_dependencies(build_plan const &plan) {
  if (plan.dependencies.empty()) { return; }

  formula const root{ .name = plan.name, .dependencies = plan.dependencies };
  auto const deps{ dependency_graph_resolve(
      root,
      [this](std::string const &name) { return index_.lookup(name); },
      [this](std::string const &name) { return install_store_is_installed(home_, name); }) };
  if (deps.order.empty()) { return; }

  tui::info("Building %zu dependencies of %s", deps.order.size(), plan.name.c_str());
  dependency_graph_execute(deps, [this](formula const &f) {
    if (!f.source) { throw anvil_error{ "Dependency '" + f.name + "' has no source" }; }
    forge_target({ .name = f.name, .locator = f.source->locator, .source = *f.source, .indexed = f },
                 false);
  });
}

receipt forge_pipeline::forge_target(target const &t, bool with_dependencies) {
  platform::file_lock package_lock{ home_.package_lock(t.name), platform::lock_mode::try_once };
  if (!package_lock) { throw anvil_error{ "Package '" + t.name + "' is already being forged" }; }

  build_workspace workspace{ home_, t.name };
  if (cancel()->load()) { throw forge_cancelled{ workspace.dir() }; }

  auto const acquired{ fetch_source(t.source, workspace.dir(), t.name, cancel()) };
  auto const plan{ resolve_plan(t, acquired) };
  tui::info("Forging %s (%s plan, %zu steps)",
            t.name.c_str(),
            plan.detector.c_str(),
            plan.steps.size());

  if (with_dependencies) { build_dependencies(plan); }

  auto const prefix{ home_.package_dir(t.name) };
  auto const backup{ backup_install(home_, t.name) };
  std::vector<bin_link> links;
  receipt installed;
  try {
    fs::create_directories(prefix);
    run_steps(plan, acquired.dir, prefix, workspace.dir());
    if (cancel()->load()) { throw forge_cancelled{ workspace.dir() }; }

    auto libraries{ artifacts_collect_libraries(prefix, platform()) };
    if (plan.library_only) {
      if (libraries.empty()) { throw no_artifacts_produced{ t.name }; }
      tui::info("Installed %zu library artifacts", libraries.size());
    } else {
      auto const binaries{ artifacts_find_binaries(prefix, acquired.dir, plan.binaries) };
      if (binaries.empty() && libraries.empty()) { throw no_artifacts_produced{ t.name }; }
      links = artifacts_link_binaries(binaries, home_.bin_dir(), platform());
    }

    installed = receipt{ .name = t.name,
                         .version = plan.version,
                         .install_path = prefix,
                         .source = t.locator,
                         .detector = plan.detector,
                         .library_artifacts = std::move(libraries) };
    for (auto const &link : links) {
      installed.linked_binaries.push_back(link.link.filename().string());
    }
    receipt_write(home_, installed);
  } catch (...) {
    restore_install(home_, t.name, links, backup, platform());
    tui::error("Forge of %s failed; workspace kept at %s",
               t.name.c_str(),
               workspace.dir().string().c_str());
    throw;
  }

  if (backup && !util_safe_remove_all(backup->dir, { home_.root(), home_.opt_dir() })) {
    tui::warn("Could not remove previous install %s", backup->dir.string().c_str());
  }
  if (!workspace.commit(options_.keep_workspace)) {
    tui::warn("Could not remove workspace %s", workspace.dir().string().c_str());
  }
  tui::info("Forged %s", t.name.c_str());

  if (auto written{ receipt_read(home_, t.name) }) { installed = std::move(*written); }

  forge_outcome outcome{ .installed = installed,
                         .description = t.indexed ? t.indexed->description : std::string{} };
  if (t.source.kind != source_kind::ARCHIVE) { outcome.remote = acquired.remote; }
  notify(outcome);
  return installed;
}

void forge_pipeline::run_steps(build_plan const &plan,
                               fs::path const &source_dir,
                               fs::path const &prefix,
                               fs::path const &workspace) const {
  auto const &cfg{ home_.config() };
  auto const runtime{ options_.msvc_runtime ? options_.msvc_runtime
                      : plan.msvc_runtime   ? plan.msvc_runtime
                                            : cfg.msvc_runtime };
  bool const pic{ options_.force_pic || plan.force_pic.value_or(cfg.force_pic) };

  auto env{ build_env_make(shell_getenv(),
                           { .msvc_runtime = runtime, .force_pic = pic, .platform = platform() }) };
  if (runtime) { env["ANVIL_MSVC_RUNTIME"] = *runtime; }
  if (pic) { env["ANVIL_FORCE_PIC"] = "1"; }
  env["ANVIL_PREFIX"] = prefix.string();

  plan_substitutions const subs{ .prefix = prefix, .name = plan.name, .jobs = jobs() };

  for (auto const &step : plan.steps) {
    if (cancel()->load()) { throw forge_cancelled{ workspace }; }
    std::visit(
        match{
            [&](std::string const &command_template) {
              auto const rendered{ plan_render_command(command_template, subs) };
              auto const command{
                build_env_apply_cmake_runtime({ rendered }, runtime, platform()).front()
              };
              run_command(command, source_dir, env, workspace);
            },
            [&](copy_artifacts_step const &copy) {
              tui::info("%s", plan_describe_step(step).c_str());
              auto const copied{ artifacts_copy(copy, source_dir, prefix, plan.name, platform()) };
              tui::debug("Copied %zu files", copied.size());
            },
        },
        step);
  }
}

void forge_pipeline::run_command(std::string const &command,
                                 fs::path const &source_dir,
                                 shell_env_t const &env,
                                 fs::path const &workspace) const {
  tui::info("Running: %s", command.c_str());

  auto const timeout{ options_.timeout ? options_.timeout : home_.config().build_timeout };
  std::deque<std::string> tail;
  shell_run_cfg const cfg{
    .on_output_line =
        [&tail](std::string_view line) {
          tui::debug("  %.*s", static_cast<int>(line.size()), line.data());
          tail.emplace_back(line);
          if (tail.size() > kOutputTailLines) { tail.pop_front(); }
        },
    .cwd = source_dir,
    .env = env,
    .timeout = timeout ? std::optional<std::chrono::milliseconds>{ *timeout } : std::nullopt,
    .cancel = cancel(),
  };

  auto const result{ shell_run(command, cfg) };
  if (result.cancelled) { throw forge_cancelled{ workspace }; }
  if (result.timed_out) { throw build_timeout{ command, static_cast<long>(timeout->count()) }; }
  if (result.exit_code == 0 && !result.signal) { return; }

  auto const echoed{ std::min(tail.size(), kEchoedFailureLines) };
  for (auto it{ tail.end() - static_cast<std::ptrdiff_t>(echoed) }; it != tail.end(); ++it) {
    tui::error("  %s", it->c_str());
  }

  std::string output;
  for (auto const &line : tail) { output.append(line).push_back('\n'); }
  for (auto const &suggestion : build_env_link_suggestions(output)) {
    tui::warn("%s", suggestion.c_str());
  }

  throw build_command_failed{ command,
                              result.signal ? 128 + *result.signal : result.exit_code,
                              workspace };
}

void forge_pipeline::notify(forge_outcome const &outcome) const {
  if (!hook_) { return; }
  try {
    hook_(outcome);
  } catch (std::exception const &e) {
    tui::warn("Post-forge step for %s failed: %s", outcome.installed.name.c_str(), e.what());
  }
}

}  // namespace anvil
