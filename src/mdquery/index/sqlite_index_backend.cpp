#include "mdquery/index/sqlite_index_backend.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include "mdquery/predicate/predicate_evaluator.hpp"

namespace mdquery {

bool path_is_within(const std::string& path, const std::string& directory) {
  if (directory.empty()) {
    return false;
  }
  std::string prefix = directory;
  while (prefix.size() > 1 && prefix.back() == '/') {
    prefix.pop_back();
  }
  if (prefix == "/") {
    return !path.empty() && path.front() == '/';
  }
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string path_basename(const std::string& path) {
  std::string trimmed = path;
  while (trimmed.size() > 1 && trimmed.back() == '/') {
    trimmed.pop_back();
  }
  const auto slash = trimmed.find_last_of('/');
  return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

namespace {

sqlite::database open_database(const std::string& db_path) {
  try {
    return sqlite::database(db_path);
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("open " + db_path, e);
  }
}

bool is_numeric(const AttributeValue& value) {
  return std::holds_alternative<std::int64_t>(value) || std::holds_alternative<double>(value);
}

double as_double(const AttributeValue& value) {
  if (const auto* i = std::get_if<std::int64_t>(&value)) {
    return static_cast<double>(*i);
  }
  return std::get<double>(value);
}

template <typename T>
int three_way(const T& a, const T& b) {
  if (a < b) return -1;
  if (b < a) return 1;
  return 0;
}

// Ordering used for sort descriptors; missing values are handled by the caller.
int compare_values(const AttributeValue& a, const AttributeValue& b) {
  if (a.index() != b.index()) {
    if (is_numeric(a) && is_numeric(b)) {
      return three_way(as_double(a), as_double(b));
    }
    return three_way(a.index(), b.index());
  }
  if (const auto* s = std::get_if<std::string>(&a)) {
    return three_way(*s, std::get<std::string>(b));
  }
  if (const auto* i = std::get_if<std::int64_t>(&a)) {
    return three_way(*i, std::get<std::int64_t>(b));
  }
  if (const auto* d = std::get_if<double>(&a)) {
    return three_way(*d, std::get<double>(b));
  }
  if (const auto* flag = std::get_if<bool>(&a)) {
    return three_way(*flag, std::get<bool>(b));
  }
  if (const auto* tp = std::get_if<TimePoint>(&a)) {
    return three_way(*tp, std::get<TimePoint>(b));
  }
  if (const auto* list = std::get_if<std::vector<std::string>>(&a)) {
    return three_way(*list, std::get<std::vector<std::string>>(b));
  }
  return 0;
}

const AttributeValue& lookup_value(const AttributeValues& values, const std::string& key) {
  static const AttributeValue kMissing;
  auto it = values.find(key);
  return it == values.end() ? kMissing : it->second;
}

}  // namespace

SqliteIndexBackend::SqliteIndexBackend(const std::string& db_path, bool verbose)
    : verbose_(verbose), db_(open_database(db_path)) {
  if (const char* home = std::getenv("HOME")) {
    home_directory_ = home;
  }
  setup_schema();
  if (verbose_) {
    std::cout << "[IndexBackend] opened " << db_path << " (" << item_count() << " items)"
              << std::endl;
  }
}

void SqliteIndexBackend::setup_schema() {
  try {
    db_ << R"(
        CREATE TABLE IF NOT EXISTS items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            path TEXT UNIQUE NOT NULL,
            attributes TEXT NOT NULL
        )
      )";
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("setup_schema", e);
  }
}

void SqliteIndexBackend::set_home_directory(std::string path) {
  std::lock_guard<std::mutex> lk(mu_);
  home_directory_ = std::move(path);
}

// ----------------------------------------------------------------------------
// Storage
// ----------------------------------------------------------------------------

SqliteIndexBackend::Record SqliteIndexBackend::make_record(int64_t id, const std::string& path,
                                                           const std::string& attributes) {
  Record record;
  record.id = static_cast<ItemId>(id);
  record.path = path;
  try {
    record.values = attribute_values_from_json(nlohmann::json::parse(attributes));
  } catch (const std::exception& e) {
    std::cerr << "[IndexBackend] ERROR decoding attributes of " << path << ": " << e.what()
              << std::endl;
  }
  record.values[keys::kPath] = path;
  return record;
}

std::optional<SqliteIndexBackend::Record> SqliteIndexBackend::load_locked(ItemId id) const {
  std::optional<Record> record;
  try {
    db_ << "SELECT id, path, attributes FROM items WHERE id = ?" << static_cast<int64_t>(id) >>
        [&](int64_t row_id, std::string path, std::string attributes) {
          record = make_record(row_id, path, attributes);
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("load", e);
  }
  return record;
}

std::vector<SqliteIndexBackend::Record> SqliteIndexBackend::load_all_locked() const {
  std::vector<Record> records;
  try {
    db_ << "SELECT id, path, attributes FROM items ORDER BY id" >>
        [&](int64_t row_id, std::string path, std::string attributes) {
          records.push_back(make_record(row_id, path, attributes));
        };
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("load_all", e);
  }
  return records;
}

ItemId SqliteIndexBackend::upsert(const std::string& path, AttributeValues values) {
  if (path.empty()) {
    throw IndexBackendError(IndexErrorKind::InvalidArgument, "upsert requires a non-empty path");
  }
  values.erase(keys::kPath);
  if (values.count(keys::kFileName) == 0) {
    values[keys::kFileName] = path_basename(path);
  }

  std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mu_);
  PendingEvents events;
  ItemId id = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string attributes = attribute_values_to_json(values).dump();
    try {
      WriteTransaction tx(db_, "upsert " + path);

      std::optional<int64_t> existing_id;
      db_ << "SELECT id FROM items WHERE path = ?" << path >>
          [&](int64_t row_id) { existing_id = row_id; };

      if (existing_id) {
        db_ << "UPDATE items SET attributes = ? WHERE id = ?" << attributes << *existing_id;
        id = static_cast<ItemId>(*existing_id);
      } else {
        db_ << "INSERT INTO items (path, attributes) VALUES (?, ?)" << path << attributes;
        id = static_cast<ItemId>(db_.last_insert_rowid());
      }
      tx.commit();
    } catch (const sqlite::sqlite_exception& e) {
      throw make_index_error("upsert " + path, e);
    }

    Record record{id, path, std::move(values)};
    record.values[keys::kPath] = path;
    events = reevaluate_locked(id, &record);
  }
  dispatch(events);
  return id;
}

bool SqliteIndexBackend::remove(const std::string& path) {
  std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mu_);
  PendingEvents events;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::optional<int64_t> id;
    try {
      db_ << "SELECT id FROM items WHERE path = ?" << path >> [&](int64_t row_id) { id = row_id; };
      if (!id) {
        return false;
      }
      db_ << "DELETE FROM items WHERE id = ?" << *id;
    } catch (const sqlite::sqlite_exception& e) {
      throw make_index_error("remove " + path, e);
    }
    events = reevaluate_locked(static_cast<ItemId>(*id), nullptr);
  }
  dispatch(events);
  return true;
}

bool SqliteIndexBackend::move(const std::string& from, const std::string& to) {
  if (to.empty()) {
    throw IndexBackendError(IndexErrorKind::InvalidArgument,
                            "move requires a non-empty target path");
  }

  std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mu_);
  PendingEvents events;
  {
    std::lock_guard<std::mutex> lk(mu_);
    std::optional<Record> record;
    try {
      WriteTransaction tx(db_, "move " + from);

      std::optional<int64_t> id;
      db_ << "SELECT id FROM items WHERE path = ?" << from >> [&](int64_t row_id) { id = row_id; };
      if (!id) {
        return false;
      }
      bool target_taken = false;
      db_ << "SELECT 1 FROM items WHERE path = ? LIMIT 1" << to >> [&](int /*dummy*/) {
        target_taken = true;
      };
      if (target_taken) {
        throw IndexBackendError(IndexErrorKind::PathConflict,
                                "move target already indexed: " + to);
      }

      record = load_locked(static_cast<ItemId>(*id));
      record->path = to;
      record->values.erase(keys::kPath);
      record->values[keys::kFileName] = path_basename(to);
      const std::string attributes = attribute_values_to_json(record->values).dump();
      db_ << "UPDATE items SET path = ?, attributes = ? WHERE id = ?" << to << attributes << *id;
      tx.commit();
    } catch (const sqlite::sqlite_exception& e) {
      throw make_index_error("move " + from, e);
    }

    record->values[keys::kPath] = to;
    events = reevaluate_locked(record->id, &*record);
  }
  dispatch(events);
  return true;
}

std::optional<ItemId> SqliteIndexBackend::lookup(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<ItemId> id;
  try {
    db_ << "SELECT id FROM items WHERE path = ?" << path >>
        [&](int64_t row_id) { id = static_cast<ItemId>(row_id); };
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("lookup", e);
  }
  return id;
}

std::optional<AttributeValues> SqliteIndexBackend::values(ItemId id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto record = load_locked(id);
  if (!record) {
    return std::nullopt;
  }
  return record->values;
}

size_t SqliteIndexBackend::item_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  int64_t count = 0;
  try {
    db_ << "SELECT count(*) FROM items" >> count;
  } catch (const sqlite::sqlite_exception& e) {
    throw make_index_error("item_count", e);
  }
  return static_cast<size_t>(count);
}

// ----------------------------------------------------------------------------
// Matching
// ----------------------------------------------------------------------------

bool SqliteIndexBackend::in_scope_locked(const RequestState& state, const Record& record) const {
  const QueryRequest& request = state.request;
  if (!request.urls.empty()) {
    return state.pinned.count(record.id) > 0;
  }
  if (request.search_locations.empty() && request.search_scopes.empty()) {
    return true;
  }
  for (const auto& location : request.search_locations) {
    if (path_is_within(record.path, location)) {
      return true;
    }
  }
  for (SearchScope scope : request.search_scopes) {
    switch (scope) {
      case SearchScope::Home:
        if (path_is_within(record.path, home_directory_)) return true;
        break;
      case SearchScope::Local:
      case SearchScope::LocalIndexed:
        return true;
      case SearchScope::Network:
      case SearchScope::NetworkIndexed:
        // The index holds no network volumes.
        break;
    }
  }
  return false;
}

bool SqliteIndexBackend::matches_locked(const RequestState& state, const Record& record) const {
  return in_scope_locked(state, record) && evaluate_predicate(state.request.predicate, record.values);
}

void SqliteIndexBackend::sort_results(RequestState& state) const {
  const auto& sort = state.request.sort;
  if (sort.empty()) {
    std::sort(state.results.begin(), state.results.end());
    return;
  }
  std::stable_sort(state.results.begin(), state.results.end(), [&](ItemId a, ItemId b) {
    const AttributeValues& left = state.sort_values[a];
    const AttributeValues& right = state.sort_values[b];
    for (const auto& descriptor : sort) {
      const AttributeValue& lv = lookup_value(left, descriptor.backend_key());
      const AttributeValue& rv = lookup_value(right, descriptor.backend_key());
      const bool l_missing = is_null(lv);
      const bool r_missing = is_null(rv);
      if (l_missing || r_missing) {
        if (l_missing == r_missing) continue;
        // Missing values sort last in either direction.
        return r_missing;
      }
      const int order = compare_values(lv, rv);
      if (order != 0) {
        return descriptor.is_ascending() ? order < 0 : order > 0;
      }
    }
    return a < b;
  });
}

SqliteIndexBackend::PendingEvents SqliteIndexBackend::reevaluate_locked(ItemId id,
                                                                        const Record* record) {
  PendingEvents events;
  for (auto& [handle, state] : requests_) {
    if (!state.started || !state.live) {
      continue;
    }
    auto position = std::find(state.results.begin(), state.results.end(), id);
    const bool was_member = position != state.results.end();
    const bool is_member = record != nullptr && matches_locked(state, *record);
    if (!was_member && !is_member) {
      continue;
    }

    BackendEvent event;
    event.kind = BackendEventKind::ResultsUpdated;
    event.handle = handle;
    if (was_member && !is_member) {
      state.results.erase(position);
      state.sort_values.erase(id);
      event.removed.push_back(id);
    } else {
      if (!state.request.sort.empty()) {
        AttributeValues& sort_values = state.sort_values[id];
        sort_values.clear();
        for (const auto& descriptor : state.request.sort) {
          sort_values[descriptor.backend_key()] =
              lookup_value(record->values, descriptor.backend_key());
        }
      }
      if (was_member) {
        event.changed.push_back(id);
      } else {
        state.results.push_back(id);
        event.added.push_back(id);
      }
      sort_results(state);
    }
    events.push_back(std::move(event));
  }
  return events;
}

void SqliteIndexBackend::dispatch(const PendingEvents& events) {
  for (const auto& event : events) {
    Handler handler;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = requests_.find(event.handle);
      if (it == requests_.end()) {
        continue;
      }
      handler = it->second.handler;
    }
    if (verbose_) {
      std::cout << "[IndexBackend] request " << event.handle << ": " << to_string(event.kind)
                << " +" << event.added.size() << " -" << event.removed.size() << " ~"
                << event.changed.size() << std::endl;
    }
    if (!handler) {
      continue;
    }
    try {
      handler(event);
    } catch (const std::exception& e) {
      std::cerr << "[IndexBackend] ERROR in event handler for request " << event.handle << ": "
                << e.what() << std::endl;
    }
  }
}

// ----------------------------------------------------------------------------
// IQueryBackend
// ----------------------------------------------------------------------------

RequestHandle SqliteIndexBackend::submit(const QueryRequest& request, Handler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  const RequestHandle handle = next_handle_++;
  RequestState state;
  state.request = request;
  state.handler = std::move(handler);
  requests_.emplace(handle, std::move(state));
  if (verbose_) {
    std::cout << "[IndexBackend] submitted request " << handle << ": " << request.query
              << std::endl;
  }
  return handle;
}

void SqliteIndexBackend::start(RequestHandle handle) {
  std::lock_guard<std::recursive_mutex> dispatch_lock(dispatch_mu_);
  PendingEvents events;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = requests_.find(handle);
    if (it == requests_.end()) {
      std::cerr << "[IndexBackend] start: unknown request " << handle << std::endl;
      return;
    }
    RequestState& state = it->second;
    if (state.started) {
      return;
    }
    state.started = true;

    for (const auto& url : state.request.urls) {
      std::optional<int64_t> id;
      try {
        db_ << "SELECT id FROM items WHERE path = ?" << url >>
            [&](int64_t row_id) { id = row_id; };
      } catch (const sqlite::sqlite_exception& e) {
        throw make_index_error("resolve urls", e);
      }
      if (id) {
        state.pinned.insert(static_cast<ItemId>(*id));
      }
    }

    for (const auto& record : load_all_locked()) {
      if (!matches_locked(state, record)) {
        continue;
      }
      state.results.push_back(record.id);
      if (!state.request.sort.empty()) {
        AttributeValues& sort_values = state.sort_values[record.id];
        for (const auto& descriptor : state.request.sort) {
          sort_values[descriptor.backend_key()] =
              lookup_value(record.values, descriptor.backend_key());
        }
      }
    }
    sort_results(state);

    BackendEvent started;
    started.kind = BackendEventKind::GatheringStarted;
    started.handle = handle;
    events.push_back(started);

    const size_t chunk = std::max<size_t>(1, state.batching.gathering_threshold);
    for (size_t offset = 0; offset < state.results.size(); offset += chunk) {
      BackendEvent progress;
      progress.kind = BackendEventKind::GatheringProgress;
      progress.handle = handle;
      const size_t end = std::min(state.results.size(), offset + chunk);
      progress.added.assign(state.results.begin() + offset, state.results.begin() + end);
      events.push_back(std::move(progress));
    }

    BackendEvent finished;
    finished.kind = BackendEventKind::GatheringFinished;
    finished.handle = handle;
    events.push_back(finished);

    if (verbose_) {
      std::cout << "[IndexBackend] request " << handle << " gathered " << state.results.size()
                << " results" << std::endl;
    }
  }
  dispatch(events);
}

void SqliteIndexBackend::cancel(RequestHandle handle) {
  std::lock_guard<std::mutex> lk(mu_);
  if (requests_.erase(handle) > 0 && verbose_) {
    std::cout << "[IndexBackend] cancelled request " << handle << std::endl;
  }
}

std::vector<ItemId> SqliteIndexBackend::results(RequestHandle handle) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(handle);
  if (it == requests_.end()) {
    return {};
  }
  return it->second.results;
}

std::size_t SqliteIndexBackend::result_count(RequestHandle handle) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(handle);
  return it == requests_.end() ? 0 : it->second.results.size();
}

AttributeValues SqliteIndexBackend::fetch_values(RequestHandle /*handle*/,
                                                 const std::vector<std::string>& keys,
                                                 ItemId item) {
  std::lock_guard<std::mutex> lk(mu_);
  AttributeValues fetched;
  auto record = load_locked(item);
  if (!record) {
    return fetched;
  }
  for (const auto& key : keys) {
    auto it = record->values.find(key);
    if (it != record->values.end()) {
      fetched.emplace(key, it->second);
    }
  }
  return fetched;
}

void SqliteIndexBackend::enable_live_updates(RequestHandle handle) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(handle);
  if (it != requests_.end()) {
    it->second.live = true;
  }
}

void SqliteIndexBackend::disable_live_updates(RequestHandle handle) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(handle);
  if (it != requests_.end()) {
    it->second.live = false;
  }
}

void SqliteIndexBackend::set_batching(RequestHandle handle, const BatchingPolicy& policy) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = requests_.find(handle);
  if (it != requests_.end()) {
    it->second.batching = policy;
  }
}

size_t SqliteIndexBackend::active_requests() const {
  std::lock_guard<std::mutex> lk(mu_);
  return requests_.size();
}

}  // namespace mdquery
