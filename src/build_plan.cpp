#include "build_plan.h"

#include "util.h"

namespace anvil {

build_plan plan_from_formula(formula const &f, std::string_view platform) {
  build_plan plan{ .detector = "formula",
                   .name = f.name,
                   .version = f.version,
                   .binaries = f.binaries,
                   .dependencies = f.dependencies,
                   .from_formula = true,
                   .msvc_runtime = f.msvc_runtime,
                   .force_pic = f.force_pic };
  for (auto &command : formula_commands_for(f, platform)) {
    plan.steps.emplace_back(std::move(command));
  }
  return plan;
}

std::string plan_render_command(std::string_view command_template,
                                plan_substitutions const &subs) {
  auto out{ util_replace_all(command_template, "{PREFIX}", subs.prefix.generic_string()) };
  out = util_replace_all(out, "{NAME}", subs.name);
  return util_replace_all(out, "{JOBS}", std::to_string(subs.jobs));
}

std::vector<std::string> plan_shell_commands(build_plan const &plan) {
  std::vector<std::string> commands;
  for (auto const &step : plan.steps) {
    if (auto const *command{ std::get_if<std::string>(&step) }) {
      commands.push_back(*command);
    }
  }
  return commands;
}

std::string plan_describe_step(plan_step const &step) {
  return std::visit(
      match{
          [](std::string const &command) { return command; },
          [](copy_artifacts_step const &copy) {
            char const *what{ "" };
            switch (copy.what) {
              case copy_artifacts_step::selection::EXECUTABLES: what = "executables"; break;
              case copy_artifacts_step::selection::LIBRARIES: what = "libraries"; break;
              case copy_artifacts_step::selection::FILES: what = "files"; break;
              case copy_artifacts_step::selection::TREE: what = "tree"; break;
            }
            std::string from;
            for (auto const &dir : copy.from) {
              if (!from.empty()) { from.append(", "); }
              from.append(dir.empty() ? "." : dir);
            }
            return std::string{ "copy-artifacts " } + what + " from [" + from + "] to " +
                   (copy.dest.empty() ? "." : copy.dest);
          },
      },
      step);
}

}  // namespace anvil
