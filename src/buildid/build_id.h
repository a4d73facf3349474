/** LICENSE TEMPLATE */
#pragma once
// bidpop
#include <common/typedefs.h>

// stdlib
#include <optional>
#include <string>
#include <string_view>

namespace bidpop {

// Name of the directory, directly under the debug file directory, that debuggers search for separate debug info
// by build-id.
static constexpr std::string_view kBuildIdDirectoryName = ".build-id";
static constexpr std::string_view kDebugFileExtension = ".debug";

/**
 * A validated build-id, as text. The text is kept exactly as the ELF reader printed it (readelf prints lower case
 * hex). A BuildId can't be constructed from fewer than kMinimumLength characters, which guarantees both the
 * 2-character prefix directory and a non-empty file name.
 */
class BuildId
{
  std::string mValue;

  explicit BuildId(std::string value) noexcept : mValue(std::move(value)) {}

public:
  static constexpr size_t kMinimumLength = 3;
  static constexpr size_t kPrefixLength = 2;

  static std::optional<BuildId> Create(std::string_view text) noexcept;

  std::string_view Value() const noexcept;
  // First kPrefixLength characters, names the directory under .build-id/
  std::string_view Prefix() const noexcept;
  // Everything after the prefix, names the file (sans extension)
  std::string_view Suffix() const noexcept;

  // <root>/.build-id/<prefix>
  Path PrefixDirectory(const Path &root) const noexcept;
  // <root>/.build-id/<prefix>/<suffix>.debug
  Path DebugFilePath(const Path &root) const noexcept;

  friend bool operator==(const BuildId &, const BuildId &) = default;
};

// <root>/.build-id
Path BuildIdDirectory(const Path &root) noexcept;

} // namespace bidpop
