// portlang/ast/json_serializer.hpp - JSON serialization for documents and diagnostics
//
// Provides nlohmann::json views of the parsed document and of diagnostics,
// used by the JSON report renderer and by `portc --format json`.
//
#pragma once

#include <nlohmann/json.hpp>

#include "portlang/ast/document.hpp"
#include "portlang/basic/diagnostic.hpp"

namespace portlang
{

/**
 * Serialize a document.
 *
 * Absent optional fields are emitted as null; the allocation is an array of
 * {asset, percentage} objects in document order.
 */
[[nodiscard]] nlohmann::json to_json(const PortfolioDocument & document);

/// {code, category, severity, message, line, column, suggestion}
[[nodiscard]] nlohmann::json to_json(const Diagnostic & diagnostic);

/// Array of diagnostics in DiagnosticBag::all() order.
[[nodiscard]] nlohmann::json to_json(const DiagnosticBag & diagnostics);

}  // namespace portlang
