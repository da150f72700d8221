#pragma once

#include <string>
#include <vector>

namespace gridfill
{
// Error taxonomy shared by the parser, tree builder, engine and adapters.
enum class ErrorCategory
{
    Parse = 0,     // malformed/unknown command, missing attribute
    Configuration, // structurally invalid template or options
    Evaluation,    // recoverable unless fail-fast
    Adapter,       // I/O or container format failure
};

enum class ErrorCode
{
    None = 0,
    UnknownCommand,
    MissingAttribute,
    MalformedCommand,
    RegionOutOfBounds,
    OverlappingCommands,
    EmptyEachRegion,
    MultisheetMismatch,
    InvalidOption,
    UnresolvedVariable,
    TypeMismatch,
    MalformedExpression,
    Io,
    Format,
};

ErrorCategory CategoryOf(ErrorCode code);
const char* ErrorCodeName(ErrorCode code);
const char* ErrorCategoryName(ErrorCategory category);

struct Diagnostic
{
    ErrorCode code = ErrorCode::None;
    std::string location; // "Sheet1!B5" when known
    std::string message;

    bool Ok() const { return code == ErrorCode::None; }
    ErrorCategory Category() const { return CategoryOf(code); }
    // "[EvaluationError/TypeMismatch] Sheet1!B5: ..."
    std::string ToString() const;
};

Diagnostic MakeDiagnostic(ErrorCode code, std::string location, std::string message);

// Outcome of one fill invocation: either a completed document (ok) or the first fatal
// error, plus every non-fatal diagnostic recorded along the way.
struct FillResult
{
    bool ok = true;
    Diagnostic error;
    std::vector<Diagnostic> diagnostics;
};
} // namespace gridfill
