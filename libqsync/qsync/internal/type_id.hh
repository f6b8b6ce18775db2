#pragma once

#include "qsync/error.hh"
#include "qsync/message.hh"
#include "qsync/round_id.hh"
#include "qsync/sync_start_msg.hh"
#include "qsync/time.hh"

#include <caf/fwd.hpp>
#include <caf/is_error_code_enum.hpp>
#include <caf/type_id.hpp>

// -- type announcements and custom atoms --------------------------------------

// Our type aliases for `timespan` and `timestamp` are identical to
// `caf::timespan` and `caf::timestamp`. Hence, these types should have a type
// ID assigned by CAF.

static_assert(caf::has_type_id_v<qsync::timespan>,
              "qsync::timespan != caf::timespan");

static_assert(caf::has_type_id_v<qsync::timestamp>,
              "qsync::timestamp != caf::timestamp");

#define QSYNC_ADD_ATOM(name) CAF_ADD_ATOM(qsync, qsync::atom, name)

#define QSYNC_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(qsync, type)

CAF_BEGIN_TYPE_ID_BLOCK(qsync, caf::first_custom_type_id)

  // -- atoms for the sync protocol --------------------------------------------

  QSYNC_ADD_ATOM(sync_start)
  QSYNC_ADD_ATOM(sync_ready)
  QSYNC_ADD_ATOM(msg)
  QSYNC_ADD_ATOM(msg_ok)
  QSYNC_ADD_ATOM(sync_msg)
  QSYNC_ADD_ATOM(bump_credit)
  QSYNC_ADD_ATOM(done)
  QSYNC_ADD_ATOM(sync_complete)
  QSYNC_ADD_ATOM(sync_complete_ok)

  // -- atoms for administrating slaves ----------------------------------------

  QSYNC_ADD_ATOM(set_ram_duration_target)
  QSYNC_ADD_ATOM(set_maximum_since_use)
  QSYNC_ADD_ATOM(update_ram_duration)

  // -- qsync types with type IDs ----------------------------------------------

  QSYNC_ADD_TYPE_ID((qsync::ec))
  QSYNC_ADD_TYPE_ID((qsync::message_properties))
  QSYNC_ADD_TYPE_ID((qsync::queue_message))
  QSYNC_ADD_TYPE_ID((qsync::round_id))
  QSYNC_ADD_TYPE_ID((qsync::sync_start_msg))

CAF_END_TYPE_ID_BLOCK(qsync)

// -- cleanup ------------------------------------------------------------------

#undef QSYNC_ADD_ATOM
#undef QSYNC_ADD_TYPE_ID

CAF_ERROR_CODE_ENUM(qsync::ec)
