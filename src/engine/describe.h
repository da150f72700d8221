#pragma once

#include "core/diagnostics.h"
#include "core/workbook.h"
#include "engine/fill_options.h"

#include <string>
#include <vector>

namespace gridfill
{
// Indented outline of a template's command tree, one line per command:
//   Sheet 'Report'
//     jx:area A1:D6
//       jx:each A2:D2 items="employees" var="e"
// Fails with the parse or tree error when the template is invalid.
bool DescribeTemplate(const Workbook& tmpl, std::string& out, Diagnostic& err);

enum class IssueSeverity
{
    Error = 0,
    Warning,
};

const char* IssueSeverityName(IssueSeverity s);

struct ValidationIssue
{
    IssueSeverity severity = IssueSeverity::Error;
    Diagnostic diagnostic;
};

// Static checks without filling: annotation parsing, tree structure, expression syntax in
// command attributes and cells, and placeholders that no jx:area will evaluate.
// Returns true when no error-severity issue was found.
bool ValidateTemplate(const Workbook& tmpl, const FillOptions& options, std::vector<ValidationIssue>& out);
} // namespace gridfill
