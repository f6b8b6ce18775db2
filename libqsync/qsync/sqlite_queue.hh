#pragma once

#include "qsync/backing_queue.hh"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace qsync {

/// Configures a @ref sqlite_queue.
struct sqlite_queue_options {
  /// Location of the database on the filesystem. Required.
  std::string path;

  /// Value for PRAGMA synchronous. One of "OFF", "NORMAL", "FULL", or "EXTRA".
  /// Leaves the SQLite default in place when empty.
  std::string synchronous;

  /// Value for PRAGMA journal_mode. One of "DELETE" or "WAL". Leaves the
  /// SQLite default in place when empty.
  std::string journal_mode;
};

/// A message store that persists all messages in a SQLite database.
class sqlite_queue : public backing_queue {
public:
  /// Opens or creates the database at `opts.path`. Check @ref init_failed
  /// before using the queue.
  explicit sqlite_queue(sqlite_queue_options opts);

  ~sqlite_queue() override;

  /// Returns whether opening the database failed.
  bool init_failed() const;

  error publish(const queue_message& msg, const message_properties& props,
                bool delivered) override;

  expected<uint64_t> purge() override;

  error fold(const visitor& f) const override;

  expected<uint64_t> len() const override;

  /// Run PRAGMA command with an optional value.
  /// @param name The name of the PRAGMA to run.
  /// @param value An optional value for the PRAGMA.
  /// @param messages Pointer to vector for collecting the output.
  /// @returns True on success, false on error.
  bool exec_pragma(std::string_view name, std::string_view value = {},
                   std::vector<std::string>* messages = nullptr);

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace qsync
