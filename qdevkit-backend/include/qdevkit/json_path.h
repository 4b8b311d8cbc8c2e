#pragma once

#include "api_export.h"
#include "tool_error.h"
#include <string>
#include <utility>
#include <vector>

namespace qdevkit {

// JSON Path filter result
struct QDEVKIT_API JsonPathResult {
    std::string expression;
    std::string output;                 // Single value, array of values, or "[]"
    int match_count = 0;
    bool success = false;
    ToolErrorKind error = ToolErrorKind::None;
    std::string error_message;
};

// JSONPath subset evaluator:
//   $  .name  ['name']  [n]  [-n]  [*]  .*  ..name  ..[...]  [a,b]  [s:e]
//   [?(@.field)]  [?(@.field OP literal)]  with OP in == != < <= > >=
class QDEVKIT_API JsonPath {
public:
    /**
     * Evaluate an expression against JSON text
     * @param json_text Input document
     * @param expression JSONPath expression starting with '$'
     * @return JsonPathResult, ParseError for bad JSON, InvalidExpression for a bad path
     */
    static JsonPathResult Filter(const std::string& json_text, const std::string& expression);

    /**
     * Check an expression without evaluating it
     * @param error Receives the parser message on failure
     */
    static bool IsValidExpression(const std::string& expression, std::string& error);

    // Expression / description pairs offered as quick examples
    static std::vector<std::pair<std::string, std::string>> GetExamples();
};

} // namespace qdevkit
