#pragma once

#include "core/diagnostics.h"
#include "core/value.h"
#include "engine/context.h"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gridfill
{
// ---------------------------------------------------------------------------
// Expression language
// ---------------------------------------------------------------------------
// Grammar (lowest to highest precedence):
//   ternary    := or ('?' ternary ':' ternary)?
//   or         := and (('||' | 'or') and)*
//   and        := equality (('&&' | 'and') equality)*
//   equality   := comparison (('==' | '!=') comparison)*
//   comparison := additive (('<' | '<=' | '>' | '>=') additive)*
//   additive   := term (('+' | '-') term)*
//   term       := unary (('*' | '/' | '%') unary)*
//   unary      := ('!' | 'not' | '-') unary | postfix
//   postfix    := primary ('.' ident)*
//   primary    := number | string | true | false | null | ident | call | '(' ternary ')'
//   call       := ident '(' (ternary (',' ternary)*)? ')'
//
// Built-in functions: hyperlink(url[, label]), len(x), upper(s), lower(s), default(x, fallback).

// Placeholder delimiters inside cell text and formulas.
struct Notation
{
    std::string begin = "${";
    std::string end = "}";
};

// Where an expression is evaluated. row/col are the output cell being rendered (0-based),
// exposed as _row (1-based) and _col (0-based); -1 when not rendering a cell.
struct EvalEnv
{
    const Context* context = nullptr;
    ScopeId scope = kRootScope;
    int row = -1;
    int col = -1;
};

struct EvalError
{
    ErrorCode code = ErrorCode::None;
    std::string message;
};

class Expression
{
public:
    struct Node;

    Expression(std::string source, std::unique_ptr<Node> root);
    ~Expression();
    Expression(const Expression&) = delete;
    Expression& operator=(const Expression&) = delete;

    const std::string& Source() const { return m_source; }
    bool Evaluate(const EvalEnv& env, Value& out, EvalError& err) const;

private:
    std::string m_source;
    std::unique_ptr<Node> m_root;
};

bool CompileExpression(std::string_view text, std::shared_ptr<const Expression>& out, std::string& err);

// ---------------------------------------------------------------------------
// Placeholder text
// ---------------------------------------------------------------------------
struct TextSegment
{
    bool expression = false;
    std::string text; // literal text, or the expression source between the markers
};

// An unterminated placeholder is kept as literal text.
void SplitPlaceholders(std::string_view text, const Notation& notation, std::vector<TextSegment>& out);
bool ContainsPlaceholder(std::string_view text, const Notation& notation);

// "${items}" -> "items"; anything else is returned unchanged (trimmed).
std::string_view UnwrapPlaceholder(std::string_view text, const Notation& notation);

// ---------------------------------------------------------------------------
// Evaluator (per fill; caches compiled expressions by source text)
// ---------------------------------------------------------------------------
class ExpressionEvaluator
{
public:
    bool Compile(std::string_view text, std::shared_ptr<const Expression>& out, std::string& err);

    bool Evaluate(std::string_view text, const EvalEnv& env, Value& out, EvalError& err);

    // Null counts as false; any non-boolean result is a TypeMismatch.
    bool EvaluateCondition(std::string_view text, const EvalEnv& env, bool& out, EvalError& err);

    // Cell text substitution. Text that is exactly one placeholder keeps the value's type;
    // otherwise every part is concatenated as a string (Null renders empty).
    bool EvaluateText(std::string_view text, const Notation& notation, const EvalEnv& env, Value& out, EvalError& err);

    std::size_t CacheSize() const { return m_cache.size(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const Expression>> m_cache;
};
} // namespace gridfill
