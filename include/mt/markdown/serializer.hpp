#pragma once

#include "mt/markdown/ast.hpp"

#include <string>
#include <vector>

namespace mt::markdown
{

// Canonical markdown for a parsed tree. Parsing the result again yields the
// same structure (locations aside).
std::string toMarkdown(const Document &document);

std::string inlinesToMarkdown(const std::vector<InlineNode> &nodes);

} // namespace mt::markdown
