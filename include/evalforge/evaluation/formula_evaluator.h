#pragma once

#include <evalforge/core/types.h>

#include <nlohmann/json.hpp>
#include <string_view>

namespace evalforge::evaluation {

/**
 * @brief Arithmetic over numeric sample fields.
 *
 * Grammar:
 *   expr    := term (('+' | '-') term)*
 *   term    := unary (('*' | '/') unary)*
 *   unary   := '-' unary | primary
 *   primary := number | identifier ('.' identifier)* | '(' expr ')'
 *
 * Identifiers resolve against the sample object; dotted names walk nested objects.
 * Booleans read as 1/0, missing or non-numeric fields as 0, and division by zero
 * yields 0. Syntax errors are InvalidArgument.
 */
class FormulaEvaluator {
public:
    static Result<double> evaluate(std::string_view formula, const nlohmann::json& sample);
};

} // namespace evalforge::evaluation
