#pragma once

#include "anvil_home.h"
#include "formula.h"
#include "util.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace anvil {

enum class index_origin { CENTRAL, LOCAL };

char const *index_origin_name(index_origin origin);

struct index_entry {
  std::string name;
  std::string url;
  std::string normalized_url;  // filled by insert when empty
  std::string description;
  index_origin origin{ index_origin::LOCAL };
  std::string hammer;  // hammer that contributed a local entry, "" otherwise

  bool operator==(index_entry const &) const = default;
};

enum class insert_result { INSERTED, ALREADY_PRESENT };

struct index_update_summary {
  bool central_synced{ false };
  std::size_t central_added{ 0 };
  std::size_t local_added{ 0 };
  std::size_t repaired{ 0 };
  std::optional<std::filesystem::path> recovered_from;  // unreadable index.db moved here
};

// Persistent store of known formulas under <root>/index. Reads run concurrently (WAL);
// every mutation holds the advisory lock on index/index.lock.
class repo_index : unmovable {
 public:
  enum class open_mode {
    NORMAL,   // an unreadable database raises index_corruption
    RECOVER,  // an unreadable database is moved aside and recreated
  };

  explicit repo_index(anvil_home const &home, open_mode mode = open_mode::NORMAL);
  ~repo_index();

  // Keyed on the normalized URL; never throws on duplicates. A central entry upgrades a
  // local row with the same URL; a local entry never replaces a central one.
  insert_result insert(index_entry entry);

  std::vector<index_entry> list() const;
  std::vector<index_entry> search(std::string_view term) const;
  bool has_url(std::string_view url) const;
  std::optional<index_entry> find_url(std::string_view url) const;  // normalized match
  std::optional<index_entry> get(std::string_view name) const;
  bool remove(std::string_view name);
  std::size_t remove_hammer(std::string_view hammer);

  // Hammer formula, then central formula, then a git formula synthesized from the index
  // row. Throws formula_not_found.
  formula lookup(std::string_view name) const;

  // Drops invalid and colliding rows and refreshes stale normalized URLs. Returns the
  // number of rows changed.
  std::size_t repair();

  // Pull the central index (failure is logged), merge central then hammer entries, then
  // repair (failure is logged).
  index_update_summary update();

  // Merge the entries of one hammer. Returns the number of rows inserted.
  std::size_t merge_hammer(std::string_view hammer);

  // Where an unreadable database was moved by open_mode::RECOVER.
  std::optional<std::filesystem::path> const &recovered_from() const;

 private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

// Bootstrap row created with a new database.
inline constexpr char const kBootstrapName[]{ "anvil-core" };
inline constexpr char const kBootstrapUrl[]{ "https://github.com/sycomix/anvil-core.git" };

}  // namespace anvil
