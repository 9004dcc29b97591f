#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace core::mcp {

struct ToolDescriptor {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
};

// Two descriptors are the same tool when the names match; this compares content.
bool SameContent(const ToolDescriptor& lhs, const ToolDescriptor& rhs);

nlohmann::json ToJson(const ToolDescriptor& tool);

// Tools every JetBrains IDE with the MCP plugin serves. Always listed, even when
// no IDE is reachable.
const std::vector<ToolDescriptor>& DefaultTools();

}  // namespace core::mcp
