#pragma once

#include "mt/markdown/ast.hpp"
#include "mt/markdown/parse_error.hpp"
#include "mt/markdown/references.hpp"

#include <string_view>

namespace mt::markdown
{

// Parses a whole document: block structure and reference definitions first,
// then the inline content of every heading and paragraph. Throws ParseError.
Document parse(std::string_view input, const ParserOptions &options = {});

} // namespace mt::markdown
