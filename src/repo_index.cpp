#include "repo_index.h"

#include "errors.h"
#include "libgit2_util.h"
#include "platform.h"
#include "tui.h"
#include "url.h"

#include "nlohmann/json.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <system_error>

namespace anvil {
namespace {

namespace fs = std::filesystem;

constexpr int kBusyTimeoutMs{ 10000 };

struct db_deleter {
  void operator()(sqlite3 *db) const noexcept { sqlite3_close_v2(db); }
};
using db_ptr = std::unique_ptr<sqlite3, db_deleter>;

[[noreturn]] void throw_sqlite(sqlite3 *db, int rc, std::string const &what) {
  std::string msg{ what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)) };
  int const primary{ rc & 0xff };
  if (primary == SQLITE_NOTADB || primary == SQLITE_CORRUPT) {
    throw index_corruption{ "Index database is unreadable (" + msg +
                            "); run `anvil index repair`" };
  }
  throw std::runtime_error{ "index: " + msg };
}

class statement : unmovable {
 public:
  statement(sqlite3 *db, char const *sql) : db_{ db } {
    if (int const rc{ sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) }; rc != SQLITE_OK) {
      throw_sqlite(db, rc, "prepare");
    }
  }
  ~statement() { sqlite3_finalize(stmt_); }

  statement &bind(int index, std::string_view value) {
    if (int const rc{ sqlite3_bind_text(stmt_,
                                        index,
                                        value.data(),
                                        static_cast<int>(value.size()),
                                        SQLITE_TRANSIENT) };
        rc != SQLITE_OK) {
      throw_sqlite(db_, rc, "bind");
    }
    return *this;
  }

  statement &bind(int index, sqlite3_int64 value) {
    if (int const rc{ sqlite3_bind_int64(stmt_, index, value) }; rc != SQLITE_OK) {
      throw_sqlite(db_, rc, "bind");
    }
    return *this;
  }

  // true while a row is available.
  bool step() {
    int const rc{ sqlite3_step(stmt_) };
    if (rc == SQLITE_ROW) { return true; }
    if (rc == SQLITE_DONE) { return false; }
    throw_sqlite(db_, rc, "step");
  }

  std::string text(int column) const {
    auto const *value{ sqlite3_column_text(stmt_, column) };
    return value ? reinterpret_cast<char const *>(value) : std::string{};
  }

  sqlite3_int64 integer(int column) const { return sqlite3_column_int64(stmt_, column); }

 private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_{ nullptr };
};

void exec(sqlite3 *db, char const *sql) {
  char *err{ nullptr };
  if (int const rc{ sqlite3_exec(db, sql, nullptr, nullptr, &err) }; rc != SQLITE_OK) {
    std::string const detail{ err ? err : sqlite3_errstr(rc) };
    sqlite3_free(err);
    int const primary{ rc & 0xff };
    if (primary == SQLITE_NOTADB || primary == SQLITE_CORRUPT) {
      throw index_corruption{ "Index database is unreadable (" + detail +
                              "); run `anvil index repair`" };
    }
    throw std::runtime_error{ "index: " + detail };
  }
}

class transaction : unmovable {
 public:
  explicit transaction(sqlite3 *db) : db_{ db } { exec(db_, "BEGIN IMMEDIATE"); }
  ~transaction() {
    if (!committed_ && sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
      tui::warn("index: rollback failed: %s", sqlite3_errmsg(db_));
    }
  }

  void commit() {
    exec(db_, "COMMIT");
    committed_ = true;
  }

 private:
  sqlite3 *db_;
  bool committed_{ false };
};

constexpr char kSelectColumns[]{
  "SELECT name, url, normalized_url, description, origin, hammer FROM repositories"
};

index_origin origin_from(std::string const &value) {
  return value == "central" ? index_origin::CENTRAL : index_origin::LOCAL;
}

index_entry row_to_entry(statement const &s) {
  return { .name = s.text(0),
           .url = s.text(1),
           .normalized_url = s.text(2),
           .description = s.text(3),
           .origin = origin_from(s.text(4)),
           .hammer = s.text(5) };
}

db_ptr open_db(fs::path const &path, int flags) {
  sqlite3 *raw{ nullptr };
  int const rc{ sqlite3_open_v2(path.string().c_str(), &raw, flags, nullptr) };
  db_ptr db{ raw };
  if (rc != SQLITE_OK) { throw_sqlite(db.get(), rc, "open " + path.string()); }
  sqlite3_busy_timeout(db.get(), kBusyTimeoutMs);
  return db;
}

bool has_column(sqlite3 *db, std::string_view column) {
  statement s{ db, "PRAGMA table_info(repositories)" };
  while (s.step()) {
    if (s.text(1) == column) { return true; }
  }
  return false;
}

// Creates the schema and bootstrap row, or migrates a legacy table.
void prepare_schema(sqlite3 *db) {
  exec(db, "PRAGMA journal_mode=WAL");

  bool const existed{ [&] {
    statement s{ db, "SELECT 1 FROM sqlite_master WHERE type='table' AND name='repositories'" };
    return s.step();
  }() };

  if (!existed) {
    exec(db,
         "CREATE TABLE repositories ("
         " name TEXT PRIMARY KEY,"
         " url TEXT,"
         " normalized_url TEXT,"
         " description TEXT,"
         " origin TEXT NOT NULL DEFAULT 'local',"
         " hammer TEXT NOT NULL DEFAULT '')");
    statement{ db,
               "INSERT OR IGNORE INTO repositories "
               "(name, url, normalized_url, description, origin) "
               "VALUES (?1, ?2, ?3, 'Anvil Core', 'central')" }
        .bind(1, kBootstrapName)
        .bind(2, kBootstrapUrl)
        .bind(3, url_normalize(kBootstrapUrl))
        .step();
    tui::debug("index: created database with bootstrap entry %s", kBootstrapName);
  } else {
    if (!has_column(db, "normalized_url")) {
      exec(db, "ALTER TABLE repositories ADD COLUMN normalized_url TEXT");
      std::vector<std::pair<std::string, std::string>> rows;
      statement select{ db, "SELECT name, url FROM repositories" };
      while (select.step()) { rows.emplace_back(select.text(0), select.text(1)); }
      for (auto const &[name, url] : rows) {
        statement{ db, "UPDATE repositories SET normalized_url = ?1 WHERE name = ?2" }
            .bind(1, url.empty() ? std::string{} : url_normalize(url))
            .bind(2, name)
            .step();
      }
      tui::info("Migrated index: added normalized_url to %zu rows", rows.size());
    }
    if (!has_column(db, "origin")) {
      exec(db, "ALTER TABLE repositories ADD COLUMN origin TEXT NOT NULL DEFAULT 'local'");
    }
    if (!has_column(db, "hammer")) {
      exec(db, "ALTER TABLE repositories ADD COLUMN hammer TEXT NOT NULL DEFAULT ''");
    }
  }

  exec(db,
       "CREATE INDEX IF NOT EXISTS idx_repositories_normalized_url "
       "ON repositories(normalized_url)");
}

std::optional<fs::path> first_existing(std::vector<fs::path> const &candidates) {
  for (auto const &c : candidates) {
    std::error_code ec;
    if (fs::is_regular_file(c, ec)) { return c; }
  }
  return std::nullopt;
}

std::vector<fs::path> sorted_children(fs::path const &dir, bool directories) {
  std::vector<fs::path> result;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) { return result; }
  for (auto const &entry : fs::directory_iterator{ dir }) {
    if (entry.path().filename().string().starts_with(".")) { continue; }
    if (directories ? entry.is_directory() : entry.is_regular_file()) {
      result.push_back(entry.path());
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

// Index entries described by formula files in `dir`.
std::vector<index_entry> entries_from_formula_dir(fs::path const &dir,
                                                  index_origin origin,
                                                  std::string const &hammer) {
  std::vector<index_entry> entries;
  for (auto const &file : sorted_children(dir, false)) {
    auto const ext{ file.extension() };
    if (ext != ".json" && ext != ".lua") { continue; }
    if (file.filename() == "index.json") { continue; }

    try {
      auto const f{ formula_load_file(file, file.stem().string()) };
      if (!f.source) {
        tui::debug("index: %s has no source, not indexed", file.string().c_str());
        continue;
      }
      entries.push_back({ .name = f.name,
                          .url = f.source->locator,
                          .description = f.description,
                          .origin = origin,
                          .hammer = hammer });
    } catch (formula_parse_error const &e) {
      tui::warn("Skipping %s: %s", file.string().c_str(), e.what());
    }
  }
  return entries;
}

// index.json: an array of {name, url, description} or an object name -> url | {url, ...}.
std::vector<index_entry> entries_from_index_json(fs::path const &path) {
  std::vector<index_entry> entries;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) { return entries; }

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(util_load_text(path));
  } catch (std::exception const &e) {
    tui::warn("Skipping %s: %s", path.string().c_str(), e.what());
    return entries;
  }

  auto const add{ [&](std::string name, nlohmann::json const &value) {
    index_entry e{ .name = std::move(name), .origin = index_origin::CENTRAL };
    if (value.is_string()) {
      e.url = value.get<std::string>();
    } else if (value.is_object()) {
      if (e.name.empty()) { e.name = value.value("name", ""); }
      e.url = value.value("url", "");
      e.description = value.value("description", "");
    }
    if (e.name.empty() || e.url.empty()) {
      tui::debug("index: incomplete entry in %s", path.string().c_str());
      return;
    }
    entries.push_back(std::move(e));
  } };

  if (doc.is_array()) {
    for (auto const &item : doc) { add({}, item); }
  } else if (doc.is_object()) {
    for (auto const &[name, value] : doc.items()) { add(name, value); }
  } else {
    tui::warn("Skipping %s: expected an array or object", path.string().c_str());
  }
  return entries;
}

// Rows of the database the central repository publishes alongside its submissions.
std::vector<index_entry> entries_from_central_db(fs::path const &path) {
  std::vector<index_entry> entries;
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) { return entries; }

  try {
    auto const db{ open_db(path, SQLITE_OPEN_READONLY) };
    bool const described{ has_column(db.get(), "description") };
    statement s{ db.get(),
                 described ? "SELECT name, url, description FROM repositories"
                           : "SELECT name, url, '' FROM repositories" };
    while (s.step()) {
      entries.push_back({ .name = s.text(0),
                          .url = s.text(1),
                          .description = s.text(2),
                          .origin = index_origin::CENTRAL });
    }
  } catch (std::exception const &e) {
    tui::warn("Skipping central database %s: %s", path.string().c_str(), e.what());
  }
  return entries;
}

}  // namespace

char const *index_origin_name(index_origin origin) {
  return origin == index_origin::CENTRAL ? "central" : "local";
}

struct repo_index::impl {
  anvil_home const &home;
  db_ptr db;
  std::optional<fs::path> recovered_from;

  std::vector<index_entry> query(char const *where,
                                 std::vector<std::string> const &params = {}) const {
    std::string const sql{ std::string{ kSelectColumns } + where };
    statement s{ db.get(), sql.c_str() };
    for (std::size_t i{ 0 }; i < params.size(); ++i) {
      s.bind(static_cast<int>(i + 1), params[i]);
    }
    std::vector<index_entry> rows;
    while (s.step()) { rows.push_back(row_to_entry(s)); }
    return rows;
  }

  void write_row(index_entry const &e, bool replace) {
    statement{ db.get(),
               replace ? "UPDATE repositories SET url = ?2, normalized_url = ?3, "
                         "description = ?4, origin = ?5, hammer = ?6 WHERE name = ?1"
                       : "INSERT INTO repositories "
                         "(name, url, normalized_url, description, origin, hammer) "
                         "VALUES (?1, ?2, ?3, ?4, ?5, ?6)" }
        .bind(1, e.name)
        .bind(2, e.url)
        .bind(3, e.normalized_url)
        .bind(4, e.description)
        .bind(5, index_origin_name(e.origin))
        .bind(6, e.hammer)
        .step();
  }

  // Caller holds the index lock.
  insert_result insert_locked(index_entry entry) {
    if (util_trim(entry.url).empty()) {
      throw anvil_error{ "URL cannot be empty when adding '" + entry.name + "' to the index" };
    }
    validate_component_name("package", entry.name);
    if (entry.normalized_url.empty()) { entry.normalized_url = url_normalize(entry.url); }

    auto const by_url{ query(" WHERE normalized_url = ?1", { entry.normalized_url }) };
    if (!by_url.empty()) {
      auto const &existing{ by_url.front() };
      if (existing.origin == index_origin::LOCAL && entry.origin == index_origin::CENTRAL) {
        statement{ db.get(),
                   "UPDATE repositories SET origin = 'central', hammer = '', "
                   "description = CASE WHEN ?2 = '' THEN description ELSE ?2 END "
                   "WHERE name = ?1" }
            .bind(1, existing.name)
            .bind(2, entry.description)
            .step();
        tui::debug("index: %s upgraded to central", existing.name.c_str());
      }
      return insert_result::ALREADY_PRESENT;
    }

    auto const by_name{ query(" WHERE name = ?1", { entry.name }) };
    if (!by_name.empty()) {
      if (by_name.front().origin == index_origin::CENTRAL &&
          entry.origin == index_origin::LOCAL) {
        tui::warn("'%s' is a central index entry; local entry for %s not added",
                  entry.name.c_str(),
                  entry.url.c_str());
        return insert_result::ALREADY_PRESENT;
      }
      write_row(entry, true);
      return insert_result::INSERTED;
    }

    write_row(entry, false);
    return insert_result::INSERTED;
  }

  std::size_t insert_all(std::vector<index_entry> const &entries) {
    std::size_t added{ 0 };
    for (auto const &e : entries) {
      try {
        if (insert_locked(e) == insert_result::INSERTED) { ++added; }
      } catch (index_corruption const &) {
        throw;
      } catch (anvil_error const &err) {
        tui::warn("Skipping index entry '%s': %s", e.name.c_str(), err.what());
      }
    }
    return added;
  }

  std::vector<index_entry> hammer_entries(fs::path const &hammer_dir) const {
    auto const hammer{ hammer_dir.filename().string() };
    auto entries{ entries_from_formula_dir(hammer_dir / "formulas", index_origin::LOCAL, hammer) };
    auto top{ entries_from_formula_dir(hammer_dir, index_origin::LOCAL, hammer) };
    entries.insert(entries.end(), top.begin(), top.end());
    return entries;
  }

  std::size_t repair_locked() {
    transaction tx{ db.get() };
    std::size_t changed{ 0 };

    exec(db.get(),
         "DELETE FROM repositories WHERE name IS NULL OR trim(name) = '' "
         "OR url IS NULL OR trim(url) = ''");
    changed += static_cast<std::size_t>(sqlite3_changes(db.get()));

    auto rows{ query(" ORDER BY rowid") };
    for (auto &row : rows) {
      auto const expected{ url_normalize(row.url) };
      if (row.normalized_url == expected) { continue; }
      statement{ db.get(), "UPDATE repositories SET normalized_url = ?1 WHERE name = ?2" }
          .bind(1, expected)
          .bind(2, row.name)
          .step();
      row.normalized_url = expected;
      ++changed;
    }

    // Keep one row per URL: central first, then the oldest.
    std::map<std::string, index_entry const *> keep;
    for (auto const &row : rows) {
      auto [it, inserted] = keep.emplace(row.normalized_url, &row);
      if (!inserted && it->second->origin == index_origin::LOCAL &&
          row.origin == index_origin::CENTRAL) {
        it->second = &row;
      }
    }
    for (auto const &row : rows) {
      if (keep.at(row.normalized_url) == &row) { continue; }
      statement{ db.get(), "DELETE FROM repositories WHERE name = ?1" }.bind(1, row.name).step();
      tui::info("Removed duplicate index entry %s (%s)", row.name.c_str(), row.url.c_str());
      ++changed;
    }

    tx.commit();
    return changed;
  }
};

repo_index::repo_index(anvil_home const &home, open_mode mode)
    : impl_{ std::make_unique<impl>(impl{ .home = home }) } {
  fs::create_directories(home.index_dir());
  platform::file_lock lock{ home.index_lock() };

  int const flags{ SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX };
  try {
    impl_->db = open_db(home.index_db(), flags);
    prepare_schema(impl_->db.get());
  } catch (index_corruption const &e) {
    if (mode != open_mode::RECOVER) { throw; }
    impl_->db.reset();

    auto const aside{ home.index_db().string() + ".corrupt-" + util_random_hex(8) };
    tui::warn("%s; moving it to %s", e.what(), aside.c_str());
    platform::atomic_rename(home.index_db(), aside);
    for (char const *suffix : { "-wal", "-shm" }) {
      std::error_code ec;
      fs::remove(home.index_db().string() + suffix, ec);
    }
    impl_->recovered_from = aside;

    impl_->db = open_db(home.index_db(), flags);
    prepare_schema(impl_->db.get());
  }
}

repo_index::~repo_index() = default;

insert_result repo_index::insert(index_entry entry) {
  platform::file_lock lock{ impl_->home.index_lock() };
  return impl_->insert_locked(std::move(entry));
}

std::vector<index_entry> repo_index::list() const { return impl_->query(" ORDER BY name"); }

std::vector<index_entry> repo_index::search(std::string_view term) const {
  std::string escaped;
  for (char const c : term) {
    if (c == '%' || c == '_' || c == '\\') { escaped.push_back('\\'); }
    escaped.push_back(c);
  }
  std::string const pattern{ "%" + escaped + "%" };
  return impl_->query(
      " WHERE name LIKE ?1 ESCAPE '\\' OR description LIKE ?1 ESCAPE '\\' ORDER BY name",
      { pattern });
}

std::optional<index_entry> repo_index::find_url(std::string_view url) const {
  if (util_trim(url).empty()) { return std::nullopt; }
  auto const normalized{ url_normalize(url) };
  for (auto &row : impl_->query("")) {
    if (row.normalized_url == normalized ||
        (!row.url.empty() && url_normalize(row.url) == normalized)) {
      return std::move(row);
    }
  }
  return std::nullopt;
}

bool repo_index::has_url(std::string_view url) const { return find_url(url).has_value(); }

std::optional<index_entry> repo_index::get(std::string_view name) const {
  auto rows{ impl_->query(" WHERE name = ?1", { std::string{ name } }) };
  if (rows.empty()) { return std::nullopt; }
  return std::move(rows.front());
}

bool repo_index::remove(std::string_view name) {
  platform::file_lock lock{ impl_->home.index_lock() };
  statement{ impl_->db.get(), "DELETE FROM repositories WHERE name = ?1" }
      .bind(1, name)
      .step();
  return sqlite3_changes(impl_->db.get()) > 0;
}

std::size_t repo_index::remove_hammer(std::string_view hammer) {
  platform::file_lock lock{ impl_->home.index_lock() };
  statement{ impl_->db.get(),
             "DELETE FROM repositories WHERE origin = 'local' AND hammer = ?1" }
      .bind(1, hammer)
      .step();
  return static_cast<std::size_t>(sqlite3_changes(impl_->db.get()));
}

formula repo_index::lookup(std::string_view name) const {
  validate_component_name("package", name);
  std::string const n{ name };
  auto const &home{ impl_->home };
  auto const row{ get(name) };

  auto const load{ [&](fs::path const &path) {
    auto f{ formula_load_file(path, n) };
    if (!f.source && row) { f.source = formula_source{ source_kind::GIT, row->url }; }
    tui::debug("index: %s resolved from %s", n.c_str(), path.string().c_str());
    return f;
  } };

  for (auto const &hammer : sorted_children(home.hammers_dir(), true)) {
    if (auto const path{ first_existing({ hammer / "formulas" / (n + ".json"),
                                          hammer / "formulas" / (n + ".lua"),
                                          hammer / (n + ".json"),
                                          hammer / (n + ".lua") }) }) {
      return load(*path);
    }
  }

  auto const central{ home.central_index_dir() };
  if (auto const path{ first_existing({ central / "formulas" / (n + ".json"),
                                        central / "formulas" / (n + ".lua"),
                                        central / "submissions" / (n + ".json") }) }) {
    return load(*path);
  }

  if (row) {
    return formula{ .name = row->name,
                    .description = row->description,
                    .source = formula_source{ formula_infer_source_kind(row->url, false),
                                              row->url } };
  }

  throw formula_not_found{ n };
}

std::size_t repo_index::repair() {
  platform::file_lock lock{ impl_->home.index_lock() };
  return impl_->repair_locked();
}

index_update_summary repo_index::update() {
  auto const &home{ impl_->home };
  index_update_summary summary{ .recovered_from = impl_->recovered_from };

  tui::info("Syncing central index from %s", home.config().index_url.c_str());
  try {
    libgit2_pull_or_clone(home.config().index_url, home.central_index_dir());
    summary.central_synced = true;
  } catch (std::exception const &e) {
    tui::warn("Central index sync failed: %s; merging what is on disk", e.what());
  }

  auto const central{ home.central_index_dir() };
  std::vector<index_entry> central_entries;
  for (auto &&part : { entries_from_central_db(central / "index.db"),
                       entries_from_index_json(central / "index.json"),
                       entries_from_formula_dir(central / "submissions",
                                                index_origin::CENTRAL,
                                                {}),
                       entries_from_formula_dir(central / "formulas",
                                                index_origin::CENTRAL,
                                                {}) }) {
    central_entries.insert(central_entries.end(), part.begin(), part.end());
  }

  for (auto const &hammer : sorted_children(home.hammers_dir(), true)) {
    if (!libgit2_is_repository(hammer)) { continue; }
    if (auto const origin{ libgit2_origin_url(hammer) }) {
      try {
        libgit2_pull_or_clone(*origin, hammer);
      } catch (std::exception const &e) {
        tui::warn("Hammer %s sync failed: %s",
                  hammer.filename().string().c_str(),
                  e.what());
      }
    }
  }

  {
    platform::file_lock lock{ home.index_lock() };
    {
      transaction tx{ impl_->db.get() };
      summary.central_added = impl_->insert_all(central_entries);
      for (auto const &hammer : sorted_children(home.hammers_dir(), true)) {
        summary.local_added += impl_->insert_all(impl_->hammer_entries(hammer));
      }
      tx.commit();
    }

    try {
      summary.repaired = impl_->repair_locked();
    } catch (std::exception const &e) {
      tui::warn("Index repair after update failed: %s", e.what());
    }
  }

  tui::info("Index updated: %zu central, %zu local entries added",
            summary.central_added,
            summary.local_added);
  return summary;
}

std::size_t repo_index::merge_hammer(std::string_view hammer) {
  auto const dir{ impl_->home.hammer_dir(hammer) };
  platform::file_lock lock{ impl_->home.index_lock() };
  transaction tx{ impl_->db.get() };
  auto const added{ impl_->insert_all(impl_->hammer_entries(dir)) };
  tx.commit();
  return added;
}

std::optional<fs::path> const &repo_index::recovered_from() const {
  return impl_->recovered_from;
}

}  // namespace anvil
