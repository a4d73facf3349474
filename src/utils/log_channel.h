/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                  \
  LOGCHANNEL(core, "Core", "Messages that don't have a intuitive log channel can be logged here.")                \
  LOGCHANNEL(files,                                                                                               \
    "Filesystem operations",                                                                                      \
    "Directory creation and removal, links, copies and moves into the debug file directory.")                     \
  LOGCHANNEL(reader, "Build-id reader", "Invocations of the external ELF reader and the parsing of its output.")  \
  LOGCHANNEL(warning, "Warnings", "Unexpected behaviors should be logged to this channel")

ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, DEFAULT_ENUM, i8)
