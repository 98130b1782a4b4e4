#pragma once

#include "mt/markdown/ast.hpp"

#include <nlohmann/json.hpp>

namespace mt::markdown
{

struct JsonExportOptions
{
    // Report every location in document coordinates instead of the
    // coordinate space of the enclosing container.
    bool documentOffsets = false;
};

nlohmann::json toJson(const Position &position);
nlohmann::json toJson(const SourceLocation &location);
nlohmann::json toJson(const Document &document, const JsonExportOptions &options = {});

} // namespace mt::markdown
