#pragma once

#include "mt/markdown/ast.hpp"

#include <string>

namespace mt::dump
{

// One line per block, indented by nesting, with its location and a short
// summary of its content.
std::string formatOutline(const markdown::Document &document, bool documentOffsets);

std::string plainText(const std::vector<markdown::InlineNode> &nodes);

} // namespace mt::dump
