#include "core/diagnostics.h"

namespace gridfill
{
ErrorCategory CategoryOf(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None: return ErrorCategory::Evaluation;
        case ErrorCode::UnknownCommand: return ErrorCategory::Parse;
        case ErrorCode::MissingAttribute: return ErrorCategory::Parse;
        case ErrorCode::MalformedCommand: return ErrorCategory::Parse;
        case ErrorCode::RegionOutOfBounds: return ErrorCategory::Configuration;
        case ErrorCode::OverlappingCommands: return ErrorCategory::Configuration;
        case ErrorCode::EmptyEachRegion: return ErrorCategory::Configuration;
        case ErrorCode::MultisheetMismatch: return ErrorCategory::Configuration;
        case ErrorCode::InvalidOption: return ErrorCategory::Configuration;
        case ErrorCode::UnresolvedVariable: return ErrorCategory::Evaluation;
        case ErrorCode::TypeMismatch: return ErrorCategory::Evaluation;
        case ErrorCode::MalformedExpression: return ErrorCategory::Evaluation;
        case ErrorCode::Io: return ErrorCategory::Adapter;
        case ErrorCode::Format: return ErrorCategory::Adapter;
    }
    return ErrorCategory::Evaluation;
}

const char* ErrorCodeName(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::None: return "None";
        case ErrorCode::UnknownCommand: return "UnknownCommand";
        case ErrorCode::MissingAttribute: return "MissingAttribute";
        case ErrorCode::MalformedCommand: return "MalformedCommand";
        case ErrorCode::RegionOutOfBounds: return "RegionOutOfBounds";
        case ErrorCode::OverlappingCommands: return "OverlappingCommands";
        case ErrorCode::EmptyEachRegion: return "EmptyEachRegion";
        case ErrorCode::MultisheetMismatch: return "MultisheetMismatch";
        case ErrorCode::InvalidOption: return "InvalidOption";
        case ErrorCode::UnresolvedVariable: return "UnresolvedVariable";
        case ErrorCode::TypeMismatch: return "TypeMismatch";
        case ErrorCode::MalformedExpression: return "MalformedExpression";
        case ErrorCode::Io: return "Io";
        case ErrorCode::Format: return "Format";
    }
    return "Unknown";
}

const char* ErrorCategoryName(ErrorCategory category)
{
    switch (category)
    {
        case ErrorCategory::Parse: return "ParseError";
        case ErrorCategory::Configuration: return "ConfigurationError";
        case ErrorCategory::Evaluation: return "EvaluationError";
        case ErrorCategory::Adapter: return "AdapterError";
    }
    return "Error";
}

std::string Diagnostic::ToString() const
{
    std::string out = "[";
    out += ErrorCategoryName(Category());
    out += "/";
    out += ErrorCodeName(code);
    out += "]";
    if (!location.empty())
    {
        out += " ";
        out += location;
        out += ":";
    }
    out += " ";
    out += message;
    return out;
}

Diagnostic MakeDiagnostic(ErrorCode code, std::string location, std::string message)
{
    Diagnostic d;
    d.code = code;
    d.location = std::move(location);
    d.message = std::move(message);
    return d;
}
} // namespace gridfill
