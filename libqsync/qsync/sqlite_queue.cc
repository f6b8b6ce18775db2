#include "qsync/sqlite_queue.hh"

#include "qsync/internal/logger.hh"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <caf/binary_deserializer.hpp>
#include <caf/binary_serializer.hpp>
#include <caf/byte_buffer.hpp>
#include <caf/detail/scope_guard.hpp>

#include <sqlite3.h>

namespace qsync {

namespace {

auto make_statement_guard = [](sqlite3_stmt* stmt) {
  return caf::detail::make_scope_guard([=] { sqlite3_reset(stmt); });
};

template <class T>
auto to_blob(const T& x) {
  caf::byte_buffer buf;
  caf::binary_serializer sink{nullptr, buf};
  auto res = sink.apply(x);
  return std::make_pair(res, std::move(buf));
}

template <class T>
bool from_blob(const void* buf, size_t size, T& x) {
  caf::binary_deserializer source{nullptr, buf, size};
  return source.apply(x);
}

bool valid_option(std::string_view value,
                  std::initializer_list<std::string_view> allowed) {
  return value.empty()
         || std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

} // namespace

struct sqlite_queue::impl {
  explicit impl(sqlite_queue_options opts) : options(std::move(opts)) {
    if (!valid_option(options.synchronous,
                      {"OFF", "NORMAL", "FULL", "EXTRA"})) {
      log::store::error("sqlite-invalid-option",
                        "invalid value for synchronous: {}",
                        options.synchronous);
      return;
    }
    if (!valid_option(options.journal_mode, {"DELETE", "WAL"})) {
      log::store::error("sqlite-invalid-option",
                        "invalid value for journal_mode: {}",
                        options.journal_mode);
      return;
    }
    if (options.path.empty()) {
      log::store::error("sqlite-missing-path",
                        "SQLite queue options are missing the path");
      return;
    }
    if (!open(options.path))
      log::store::error("sqlite-open-failed", "unable to open database {}",
                        options.path);
  }

  ~impl() {
    if (!db)
      return;
    // Deallocate prepared statements.
    for (auto stmt : finalize)
      sqlite3_finalize(stmt);
    sqlite3_close(db);
  }

  // Assumes name and value have been verified previously and are safe to be
  // formatted into SQL.
  bool exec_pragma(std::string_view name, std::string_view value,
                   std::vector<std::string>* messages = nullptr) {
    auto query = std::string{"PRAGMA "};
    query += name;
    if (!value.empty()) {
      query += '=';
      query += value;
    }
    auto cb = [](void* arg, int, char** argv, char**) {
      auto messages = static_cast<std::vector<std::string>*>(arg);
      if (messages)
        messages->push_back(argv[0]);
      return 0;
    };
    auto result = sqlite3_exec(db, query.c_str(), cb, messages, nullptr);
    if (result != SQLITE_OK) {
      log::store::error("sqlite-pragma-failed", "failed to run {}: {}", query,
                        sqlite3_errmsg(db));
      return false;
    }
    return true;
  }

  void close() {
    for (auto stmt : finalize)
      sqlite3_finalize(stmt);
    finalize.clear();
    sqlite3_close(db);
    db = nullptr;
  }

  bool open(const std::string& path) {
    auto dir = std::filesystem::path{path}.parent_path();
    if (!dir.empty()) {
      std::error_code err;
      if (!std::filesystem::is_directory(dir, err)
          && !std::filesystem::create_directories(dir, err)) {
        log::store::error("sqlite-mkdir-failed",
                          "failed to create directory for database {}: {}",
                          dir.string(), err.message());
        return false;
      }
    }
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
      log::store::error("sqlite-open-failed", "failed to open database {}: {}",
                        path, sqlite3_errmsg(db));
      close();
      return false;
    }
    if (!options.synchronous.empty()
        && !exec_pragma("synchronous", options.synchronous)) {
      close();
      return false;
    }
    if (!options.journal_mode.empty()
        && !exec_pragma("journal_mode", options.journal_mode)) {
      close();
      return false;
    }
    // The sequence column defines the queue order.
    auto result = sqlite3_exec(db,
                               "create table if not exists messages"
                               "(seq integer primary key autoincrement,"
                               " msg blob, props blob, delivered integer);",
                               nullptr, nullptr, nullptr);
    if (result != SQLITE_OK) {
      log::store::error("sqlite-create-table-failed",
                        "failed to create messages table: {}",
                        sqlite3_errmsg(db));
      close();
      return false;
    }
    std::vector<std::pair<sqlite3_stmt**, const char*>> statements{
      {&insert,
       "insert into messages(msg, props, delivered) values(?, ?, ?);"},
      {&select_all, "select msg, props from messages order by seq;"},
      {&count, "select count(*) from messages;"},
      {&clear, "delete from messages;"},
    };
    auto prepare = [&](sqlite3_stmt** stmt, const char* sql) {
      if (sqlite3_prepare_v2(db, sql, -1, stmt, nullptr) != SQLITE_OK)
        return false;
      finalize.push_back(*stmt);
      return true;
    };
    for (auto& [stmt, sql] : statements) {
      if (!prepare(stmt, sql)) {
        log::store::error("sqlite-prepare-failed",
                          "failed to prepare statement {}: {}", sql,
                          sqlite3_errmsg(db));
        close();
        return false;
      }
    }
    log::store::debug("sqlite-open", "opened database {}", path);
    return true;
  }

  expected<uint64_t> size() {
    auto guard = make_statement_guard(count);
    if (sqlite3_step(count) != SQLITE_ROW)
      return make_error(ec::backend_failure, sqlite3_errmsg(db));
    return static_cast<uint64_t>(sqlite3_column_int64(count, 0));
  }

  sqlite_queue_options options;
  sqlite3* db = nullptr;
  sqlite3_stmt* insert = nullptr;
  sqlite3_stmt* select_all = nullptr;
  sqlite3_stmt* count = nullptr;
  sqlite3_stmt* clear = nullptr;
  std::vector<sqlite3_stmt*> finalize;
};

sqlite_queue::sqlite_queue(sqlite_queue_options opts)
  : impl_(std::make_unique<impl>(std::move(opts))) {
  // nop
}

sqlite_queue::~sqlite_queue() {
  // nop
}

bool sqlite_queue::init_failed() const {
  return !impl_->db;
}

bool sqlite_queue::exec_pragma(std::string_view name, std::string_view value,
                               std::vector<std::string>* messages) {
  if (!impl_->db)
    return false;
  return impl_->exec_pragma(name, value, messages);
}

error sqlite_queue::publish(const queue_message& msg,
                            const message_properties& props, bool delivered) {
  if (!impl_->db)
    return make_error(ec::backend_failure, "database not open");
  auto [msg_ok, msg_blob] = to_blob(msg);
  auto [props_ok, props_blob] = to_blob(props);
  if (!msg_ok || !props_ok) {
    log::store::debug("sqlite-serialize-failed",
                      "failed to serialize message {}", msg.id);
    return make_error(ec::invalid_data, "failed to serialize message");
  }
  auto stmt = impl_->insert;
  auto guard = make_statement_guard(stmt);
  if (sqlite3_bind_blob64(stmt, 1, msg_blob.data(), msg_blob.size(),
                          SQLITE_STATIC)
        != SQLITE_OK
      || sqlite3_bind_blob64(stmt, 2, props_blob.data(), props_blob.size(),
                             SQLITE_STATIC)
           != SQLITE_OK
      || sqlite3_bind_int(stmt, 3, delivered ? 1 : 0) != SQLITE_OK)
    return make_error(ec::backend_failure, sqlite3_errmsg(impl_->db));
  if (sqlite3_step(stmt) != SQLITE_DONE)
    return make_error(ec::backend_failure, sqlite3_errmsg(impl_->db));
  return {};
}

expected<uint64_t> sqlite_queue::purge() {
  if (!impl_->db)
    return make_error(ec::backend_failure, "database not open");
  auto n = impl_->size();
  if (!n)
    return n;
  auto guard = make_statement_guard(impl_->clear);
  if (sqlite3_step(impl_->clear) != SQLITE_DONE)
    return make_error(ec::backend_failure, sqlite3_errmsg(impl_->db));
  return n;
}

error sqlite_queue::fold(const visitor& f) const {
  if (!impl_->db)
    return make_error(ec::backend_failure, "database not open");
  auto stmt = impl_->select_all;
  auto guard = make_statement_guard(stmt);
  for (;;) {
    switch (sqlite3_step(stmt)) {
      case SQLITE_DONE:
        return {};
      case SQLITE_ROW: {
        queue_message msg;
        message_properties props;
        if (!from_blob(sqlite3_column_blob(stmt, 0),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, 0)), msg)
            || !from_blob(sqlite3_column_blob(stmt, 1),
                          static_cast<size_t>(sqlite3_column_bytes(stmt, 1)),
                          props))
          return make_error(ec::invalid_data, "failed to deserialize message");
        if (!f(msg, props))
          return {};
        break;
      }
      default:
        return make_error(ec::backend_failure, sqlite3_errmsg(impl_->db));
    }
  }
}

expected<uint64_t> sqlite_queue::len() const {
  if (!impl_->db)
    return make_error(ec::backend_failure, "database not open");
  return impl_->size();
}

} // namespace qsync
