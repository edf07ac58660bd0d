// tshl/output/highlight_output.cpp
#include "tshl/output/highlight_output.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>

namespace tshl
{

namespace
{

nlohmann::json point_to_json(const TextPoint & p)
{
  return nlohmann::json{{"row", p.row}, {"column", p.column}};
}

}  // namespace

std::map<std::string, std::vector<LineColumnBox>> group_by_label(
  const std::vector<HighlightInstruction> & instructions)
{
  std::map<std::string, std::vector<LineColumnBox>> grouped;
  for (const auto & inst : instructions) {
    const TextSpan & s = inst.span;
    grouped[inst.label].push_back(
      LineColumnBox{s.start.row + 1, s.start.column + 1, s.end.row + 1, s.end.column + 1});
  }
  return grouped;
}

nlohmann::json to_json(const HighlightInstruction & instruction)
{
  const TextSpan & s = instruction.span;
  return nlohmann::json{
    {"label", instruction.label},
    {"start_byte", s.start_byte},
    {"end_byte", s.end_byte},
    {"start", point_to_json(s.start)},
    {"end", point_to_json(s.end)},
  };
}

nlohmann::json to_json(const std::vector<HighlightInstruction> & instructions)
{
  nlohmann::json arr = nlohmann::json::array();
  for (const auto & inst : instructions) {
    arr.push_back(to_json(inst));
  }
  return arr;
}

nlohmann::json to_json(const std::map<std::string, std::vector<LineColumnBox>> & grouped)
{
  nlohmann::json obj = nlohmann::json::object();
  for (const auto & [label, boxes] : grouped) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto & box : boxes) {
      arr.push_back({box[0], box[1], box[2], box[3]});
    }
    obj[label] = std::move(arr);
  }
  return obj;
}

void write_text(const std::vector<HighlightInstruction> & instructions, std::ostream & os)
{
  for (const auto & inst : instructions) {
    const TextSpan & s = inst.span;
    fmt::print(
      os, "{}:{}-{}:{} {}\n", s.start.row + 1, s.start.column + 1, s.end.row + 1,
      s.end.column + 1, inst.label);
  }
}

}  // namespace tshl
