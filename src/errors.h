#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace anvil {

// Base of every failure a forge, detection or index operation can raise.
class anvil_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// No detector matched the source tree.
class detection_failure : public anvil_error {
 public:
  explicit detection_failure(std::filesystem::path const &source_dir,
                             std::string const &reason = "No build system detected");
};

class formula_parse_error : public anvil_error {
 public:
  formula_parse_error(std::string context, std::string const &detail);

  std::string const &context() const { return context_; }

 private:
  std::string context_;
};

class tool_not_found_error : public anvil_error {
 public:
  tool_not_found_error(std::string ecosystem, std::vector<std::string> candidates);

  std::string const &ecosystem() const { return ecosystem_; }
  std::vector<std::string> const &candidates() const { return candidates_; }

 private:
  std::string ecosystem_;
  std::vector<std::string> candidates_;
};

class build_command_failed : public anvil_error {
 public:
  build_command_failed(std::string command,
                       int exit_code,
                       std::filesystem::path workspace);

  std::string const &command() const { return command_; }
  int exit_code() const { return exit_code_; }
  std::filesystem::path const &workspace() const { return workspace_; }

 private:
  std::string command_;
  int exit_code_;
  std::filesystem::path workspace_;
};

class no_artifacts_produced : public anvil_error {
 public:
  explicit no_artifacts_produced(std::string const &name);
};

// Carries the cycle path, first element repeated at the end (a -> b -> a).
class dependency_cycle_error : public anvil_error {
 public:
  explicit dependency_cycle_error(std::vector<std::string> cycle);

  std::vector<std::string> const &cycle() const { return cycle_; }

 private:
  std::vector<std::string> cycle_;
};

class index_corruption : public anvil_error {
 public:
  using anvil_error::anvil_error;
};

class build_timeout : public anvil_error {
 public:
  build_timeout(std::string command, long seconds);

  std::string const &command() const { return command_; }

 private:
  std::string command_;
};

class forge_cancelled : public anvil_error {
 public:
  explicit forge_cancelled(std::filesystem::path workspace);

  std::filesystem::path const &workspace() const { return workspace_; }

 private:
  std::filesystem::path workspace_;
};

class formula_not_found : public anvil_error {
 public:
  explicit formula_not_found(std::string const &name);
};

}  // namespace anvil
