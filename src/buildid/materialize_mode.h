/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/macros.h>

// How a debug file ends up at its .build-id location.
#define FOR_EACH_MATERIALIZE_MODE(MODE)                                                                           \
  MODE(Link, "Symbolic link to the absolute path of the debug file")                                              \
  MODE(Copy, "Copy of the debug file, permissions and modification time preserved")                              \
  MODE(Move, "The debug file itself, renamed into place")

ENUM_TYPE_METADATA(MaterializeMode, FOR_EACH_MATERIALIZE_MODE, DEFAULT_ENUM, u8)
