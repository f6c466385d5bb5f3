#include "libgit2_util.h"

#include "tui.h"

#include "git2.h"

#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace anvil {
namespace {

using repo_ptr = std::unique_ptr<git_repository, decltype(&git_repository_free)>;
using remote_ptr = std::unique_ptr<git_remote, decltype(&git_remote_free)>;
using object_ptr = std::unique_ptr<git_object, decltype(&git_object_free)>;
using reference_ptr = std::unique_ptr<git_reference, decltype(&git_reference_free)>;

[[noreturn]] void throw_git_error(std::string msg) {
  if (git_error const *err{ git_error_last() }; err && err->message) {
    msg += ": ";
    msg += err->message;
  }
  throw std::runtime_error(msg);
}

int transfer_progress(git_indexer_progress const *stats, void *payload) {
  auto const *cancel{ static_cast<std::atomic_bool const *>(payload) };
  if (cancel && cancel->load()) { return -1; }
  if (stats->total_objects > 0 && stats->received_objects == stats->total_objects) {
    tui::debug("git: received %u objects", stats->received_objects);
  }
  return 0;
}

void init_fetch_options(git_fetch_options &opts, std::atomic_bool const *cancel) {
  opts.callbacks.transfer_progress = transfer_progress;
  opts.callbacks.payload = const_cast<std::atomic_bool *>(cancel);
}

git_repository *try_clone(std::string const &url,
                          std::filesystem::path const &dest,
                          std::atomic_bool const *cancel,
                          int depth) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);
  init_fetch_options(clone_opts.fetch_opts, cancel);
  if (depth > 0) { clone_opts.fetch_opts.depth = depth; }

  git_repository *repo{ nullptr };
  if (git_clone(&repo, url.c_str(), dest.string().c_str(), &clone_opts)) { return nullptr; }
  return repo;
}

// Remote-tracking commit for the current branch, falling back to origin/HEAD.
object_ptr resolve_upstream(git_repository *repo) {
  std::vector<std::string> candidates;

  git_reference *head_raw{ nullptr };
  if (!git_repository_head(&head_raw, repo)) {
    reference_ptr head{ head_raw, git_reference_free };
    if (git_reference_is_branch(head.get())) {
      candidates.push_back(std::string{ "refs/remotes/origin/" } +
                           git_reference_shorthand(head.get()));
    }
  }
  for (char const *fallback : { "refs/remotes/origin/HEAD",
                                "refs/remotes/origin/main",
                                "refs/remotes/origin/master" }) {
    candidates.emplace_back(fallback);
  }

  for (auto const &spec : candidates) {
    git_object *obj{ nullptr };
    if (!git_revparse_single(&obj, repo, spec.c_str())) {
      tui::debug("git: upstream is %s", spec.c_str());
      return { obj, git_object_free };
    }
  }
  return { nullptr, git_object_free };
}

}  // namespace

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

void libgit2_clone(std::string const &url,
                   std::filesystem::path const &dest,
                   std::atomic_bool const *cancel) {
  if (cancel && cancel->load()) { throw std::runtime_error("clone of " + url + " cancelled"); }
  std::filesystem::create_directories(dest.parent_path());

  repo_ptr repo{ try_clone(url, dest, cancel, 1), git_repository_free };
  if (repo) { return; }
  if (cancel && cancel->load()) { throw_git_error("clone of " + url + " cancelled"); }

  // Some servers reject shallow fetches from libgit2; retry with full history.
  tui::debug("git: shallow clone of %s failed, retrying full clone", url.c_str());
  std::error_code ec;
  std::filesystem::remove_all(dest, ec);
  if (ec) {
    throw std::runtime_error("cannot reset clone destination " + dest.string() + ": " +
                             ec.message());
  }

  repo.reset(try_clone(url, dest, cancel, 0));
  if (!repo) { throw_git_error("git clone of " + url + " failed"); }
}

void libgit2_pull_or_clone(std::string const &url,
                           std::filesystem::path const &dest,
                           std::atomic_bool const *cancel) {
  if (!libgit2_is_repository(dest)) {
    std::error_code ec;
    std::filesystem::remove_all(dest, ec);
    libgit2_clone(url, dest, cancel);
    return;
  }

  git_repository *repo_raw{ nullptr };
  if (git_repository_open(&repo_raw, dest.string().c_str())) {
    throw_git_error("cannot open repository " + dest.string());
  }
  repo_ptr repo{ repo_raw, git_repository_free };

  git_remote *remote_raw{ nullptr };
  if (git_remote_lookup(&remote_raw, repo.get(), "origin")) {
    if (git_remote_create(&remote_raw, repo.get(), "origin", url.c_str())) {
      throw_git_error("cannot configure origin for " + dest.string());
    }
  } else if (git_remote_url(remote_raw) != url) {
    git_remote_free(remote_raw);
    remote_raw = nullptr;
    if (git_remote_set_url(repo.get(), "origin", url.c_str()) ||
        git_remote_lookup(&remote_raw, repo.get(), "origin")) {
      throw_git_error("cannot update origin for " + dest.string());
    }
  }
  remote_ptr remote{ remote_raw, git_remote_free };

  git_fetch_options fetch_opts;
  git_fetch_options_init(&fetch_opts, GIT_FETCH_OPTIONS_VERSION);
  init_fetch_options(fetch_opts, cancel);
  if (git_remote_fetch(remote.get(), nullptr, &fetch_opts, nullptr)) {
    throw_git_error("git fetch of " + url + " failed");
  }

  auto const upstream{ resolve_upstream(repo.get()) };
  if (!upstream) { throw_git_error("no upstream branch found in " + dest.string()); }

  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;
  if (git_reset(repo.get(), upstream.get(), GIT_RESET_HARD, &checkout_opts)) {
    throw_git_error("git reset of " + dest.string() + " failed");
  }
}

std::optional<std::string> libgit2_origin_url(std::filesystem::path const &dir) {
  git_repository *repo_raw{ nullptr };
  if (git_repository_open_ext(&repo_raw,
                              dir.string().c_str(),
                              GIT_REPOSITORY_OPEN_NO_SEARCH,
                              nullptr)) {
    return std::nullopt;
  }
  repo_ptr repo{ repo_raw, git_repository_free };

  git_remote *remote_raw{ nullptr };
  if (git_remote_lookup(&remote_raw, repo.get(), "origin")) { return std::nullopt; }
  remote_ptr remote{ remote_raw, git_remote_free };

  char const *url{ git_remote_url(remote.get()) };
  if (!url || !*url) { return std::nullopt; }
  return std::string{ url };
}

bool libgit2_is_repository(std::filesystem::path const &dir) {
  git_repository *repo_raw{ nullptr };
  if (git_repository_open_ext(&repo_raw,
                              dir.string().c_str(),
                              GIT_REPOSITORY_OPEN_NO_SEARCH,
                              nullptr)) {
    return false;
  }
  git_repository_free(repo_raw);
  return true;
}

}  // namespace anvil
