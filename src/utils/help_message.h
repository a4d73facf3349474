/** LICENSE TEMPLATE */
#pragma once

// bidpop
#include <common/typedefs.h>

// stdlib
#include <cctype>
#include <string_view>
#include <vector>

namespace bidpop {
struct HelpMessage
{
  std::string_view mInfo{};

  constexpr HelpMessage() noexcept = default;
  constexpr HelpMessage(std::string_view message) noexcept : mInfo(message) {}
  constexpr HelpMessage(const char *message) noexcept : mInfo(message) {}

  // Breaks the message into lines of at most `width` characters, preferring to break at whitespace. Explicit
  // '\n' in the message always start a new line.
  template <PushBackContainer ContainerType>
  void
  CreateLinesOfWidth(ContainerType &outResult, size_t width) const noexcept
  {
    size_t lastWordBoundary = 0;
    auto txt = mInfo;
    i64 i = 0;

    const auto processPrefix = [&](auto prefixLen, bool recordLine) noexcept {
      if (recordLine) {
        outResult.push_back(txt.substr(0, prefixLen));
      }
      // we "eat" the string, crawling the head along, making txt[0] always the start of the next line
      txt.remove_prefix(prefixLen);
      // i will ++ at end of loop => 0
      i = -1;
      lastWordBoundary = 0;
    };

    for (; i < static_cast<i64>(txt.size()); ++i) {
      lastWordBoundary = std::isspace(static_cast<unsigned char>(txt[i])) ? i : lastWordBoundary;
      if (txt[i] == '\n') {
        if (i == 0) {
          processPrefix(1, false);
          continue;
        }
        processPrefix(i, true);
        // We are creating artificial lines. Don't record the '\n' in the string_views
        processPrefix(1, false);
        continue;
      }
      if (i == static_cast<i64>(width)) {
        // A word boundary at 0 means one long word; it gets split where it hits the width.
        const auto subLength = lastWordBoundary == 0 ? width : lastWordBoundary;
        processPrefix(subLength, true);
        // Don't start the next line with the space we broke at.
        if (!txt.empty() && txt.front() == ' ') {
          txt.remove_prefix(1);
        }
      }
    }
    if (!txt.empty()) {
      outResult.push_back(txt);
    }
  }

  std::vector<std::string_view>
  CreateLinesOfWidth(size_t width) const noexcept
  {
    std::vector<std::string_view> result;
    CreateLinesOfWidth(result, width);
    return result;
  }
};

} // namespace bidpop
