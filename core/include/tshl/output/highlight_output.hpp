// tshl/output/highlight_output.hpp - Shaping matcher output for consumers
#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "tshl/match/highlight_instruction.hpp"

namespace tshl
{

/// [start_line, start_col, end_line, end_col], all 1-based
using LineColumnBox = std::array<uint32_t, 4>;

/**
 * Group instruction spans by label, the shape in which editors add text
 * properties in bulk. Spans keep their emission order within a label.
 */
[[nodiscard]] std::map<std::string, std::vector<LineColumnBox>> group_by_label(
  const std::vector<HighlightInstruction> & instructions);

[[nodiscard]] nlohmann::json to_json(const HighlightInstruction & instruction);
[[nodiscard]] nlohmann::json to_json(const std::vector<HighlightInstruction> & instructions);
[[nodiscard]] nlohmann::json to_json(
  const std::map<std::string, std::vector<LineColumnBox>> & grouped);

/// One line per instruction: "1:1-1:6 Class"
void write_text(const std::vector<HighlightInstruction> & instructions, std::ostream & os);

}  // namespace tshl
