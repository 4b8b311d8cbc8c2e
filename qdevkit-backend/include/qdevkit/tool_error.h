#pragma once

#include "api_export.h"

namespace qdevkit {

// Every tool reports failures through its result struct using one of these
// kinds. None of them is fatal; the UI renders error_message in place of output.
enum class ToolErrorKind {
    None = 0,
    InvalidEncoding,        // Base64 / URL input is not well formed
    ParseError,             // JSON text could not be parsed
    MalformedToken,         // JWT structure or segment is broken
    InvalidTimestamp,       // Non-numeric, out of range, or unparseable date
    UnsupportedAlgorithm,   // Unknown hash algorithm name
    InvalidExpression,      // JSONPath expression could not be parsed
    InvalidArgument         // Option outside its accepted range
};

// Short display name ("InvalidEncoding", "ParseError", ...)
QDEVKIT_API const char* ToolErrorName(ToolErrorKind kind);

} // namespace qdevkit
