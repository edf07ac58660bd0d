// tshl/match/highlight_instruction.hpp - Matcher output types
#pragma once

#include <cstdint>
#include <string>

namespace tshl
{

/// Zero-based row/column as reported by the parser (column in bytes)
struct TextPoint
{
  uint32_t row = 0;
  uint32_t column = 0;

  [[nodiscard]] bool operator==(const TextPoint & other) const noexcept
  {
    return row == other.row && column == other.column;
  }
  [[nodiscard]] bool operator!=(const TextPoint & other) const noexcept
  {
    return !(*this == other);
  }
};

/// Extent of one parse-tree node, copied verbatim from the node
struct TextSpan
{
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;
  TextPoint start;
  TextPoint end;

  [[nodiscard]] bool operator==(const TextSpan & other) const noexcept
  {
    return start_byte == other.start_byte && end_byte == other.end_byte &&
           start == other.start && end == other.end;
  }
  [[nodiscard]] bool operator!=(const TextSpan & other) const noexcept
  {
    return !(*this == other);
  }
};

struct HighlightInstruction
{
  TextSpan span;
  std::string label;

  [[nodiscard]] bool operator==(const HighlightInstruction & other) const noexcept
  {
    return span == other.span && label == other.label;
  }
  [[nodiscard]] bool operator!=(const HighlightInstruction & other) const noexcept
  {
    return !(*this == other);
  }
};

}  // namespace tshl
