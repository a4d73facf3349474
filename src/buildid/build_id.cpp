/** LICENSE TEMPLATE */
#include "build_id.h"

// bidpop
#include <common.h>

// stdlib
#include <string>

namespace bidpop {

/* static */
std::optional<BuildId>
BuildId::Create(std::string_view text) noexcept
{
  if (text.size() < kMinimumLength) {
    return std::nullopt;
  }
  return BuildId{ std::string{ text } };
}

std::string_view
BuildId::Value() const noexcept
{
  return mValue;
}

std::string_view
BuildId::Prefix() const noexcept
{
  return std::string_view{ mValue }.substr(0, kPrefixLength);
}

std::string_view
BuildId::Suffix() const noexcept
{
  ASSERT(mValue.size() >= kMinimumLength, "Build-id '{}' escaped validation", mValue);
  return std::string_view{ mValue }.substr(kPrefixLength);
}

Path
BuildId::PrefixDirectory(const Path &root) const noexcept
{
  return BuildIdDirectory(root) / Prefix();
}

Path
BuildId::DebugFilePath(const Path &root) const noexcept
{
  std::string fileName{ Suffix() };
  fileName.append(kDebugFileExtension);
  return PrefixDirectory(root) / fileName;
}

Path
BuildIdDirectory(const Path &root) noexcept
{
  return root / kBuildIdDirectoryName;
}

} // namespace bidpop
