#include "core/diagnostics.h"
#include "core/value.h"
#include "core/workbook.h"
#include "engine/describe.h"
#include "engine/fill_options.h"
#include "engine/filler.h"
#include "io/data_json.h"
#include "io/fill_config.h"
#include "io/grid_document_adapter.h"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace gridfill;

namespace
{
static void PrintUsage(const char* argv0)
{
    std::cerr << "Usage:\n"
              << "  " << argv0 << " fill <template> <data.json> <output> [options]\n"
              << "  " << argv0 << " describe <template>\n"
              << "  " << argv0 << " validate <template> [--config <file>] [--notation <begin> <end>]\n"
              << "\n"
              << "Fills a template workbook (.json or .gfw) whose cell comments carry jx: commands\n"
              << "with the data of a JSON document.\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>         Fill options (JSON, schema_version 1)\n"
              << "  --fail-fast             Abort on the first evaluation error\n"
              << "  --keep-template-sheet   Keep multisheet template sheets in the output\n"
              << "  --notation <begin> <end>  Placeholder markers (default: ${ })\n"
              << "  --quiet                 Do not print recoverable diagnostics\n"
              << "\n"
              << "Exit codes: 0 ok, 1 fill or validation failure, 2 usage.\n";
}

struct CommandLine
{
    std::vector<std::string> positional;
    std::string config_path;
    bool fail_fast = false;
    bool keep_template_sheet = false;
    bool quiet = false;
    bool has_notation = false;
    std::string notation_begin;
    std::string notation_end;
};

static bool ParseArgs(int argc, char** argv, int first, CommandLine& out)
{
    for (int i = first; i < argc; ++i)
    {
        const std::string_view a = argv[i];
        auto need = [&](const char* opt, std::string& value) {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << opt << "\n";
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (a == "--config")
        {
            if (!need("--config", out.config_path))
                return false;
        }
        else if (a == "--notation")
        {
            if (!need("--notation", out.notation_begin) || !need("--notation", out.notation_end))
                return false;
            out.has_notation = true;
        }
        else if (a == "--fail-fast")
        {
            out.fail_fast = true;
        }
        else if (a == "--keep-template-sheet")
        {
            out.keep_template_sheet = true;
        }
        else if (a == "--quiet")
        {
            out.quiet = true;
        }
        else if (a.size() > 2 && a.substr(0, 2) == "--")
        {
            std::cerr << "Unknown arg: " << a << "\n";
            return false;
        }
        else
        {
            out.positional.emplace_back(a);
        }
    }
    return true;
}

// Config file first, command-line flags on top.
static bool ResolveOptions(const CommandLine& cl, FillOptions& options)
{
    options.log_diagnostics = !cl.quiet;
    std::string err;
    if (!cl.config_path.empty() && !fill_config::LoadFile(cl.config_path, options, err))
    {
        std::cerr << "gridfill: " << err << "\n";
        return false;
    }
    if (cl.fail_fast)
        options.fail_fast = true;
    if (cl.keep_template_sheet)
        options.keep_template_sheet = true;
    if (cl.has_notation)
    {
        options.notation_begin = cl.notation_begin;
        options.notation_end = cl.notation_end;
    }
    if (cl.quiet)
        options.log_diagnostics = false;
    return true;
}

static int RunFill(const CommandLine& cl, const char* argv0)
{
    if (cl.positional.size() != 3)
    {
        PrintUsage(argv0);
        return 2;
    }
    FillOptions options;
    if (!ResolveOptions(cl, options))
        return 2;

    Value data;
    std::string err;
    if (!data_json::LoadFile(cl.positional[1], data, err))
    {
        std::cerr << "gridfill: FAIL: " << err << "\n";
        return 1;
    }

    const FillResult r = FillToPath(cl.positional[0], data, cl.positional[2], options);
    if (!r.ok)
    {
        std::cerr << "gridfill: FAIL: " << r.error.ToString() << "\n";
        return 1;
    }
    std::cerr << "gridfill: wrote " << cl.positional[2];
    if (!r.diagnostics.empty())
        std::cerr << " (" << r.diagnostics.size() << " diagnostic(s))";
    std::cerr << "\n";
    return 0;
}

static int RunDescribe(const CommandLine& cl, const char* argv0)
{
    if (cl.positional.size() != 1)
    {
        PrintUsage(argv0);
        return 2;
    }
    Workbook tmpl;
    std::string err;
    if (!ReadWorkbookFile(cl.positional[0], tmpl, err))
    {
        std::cerr << "gridfill: FAIL: " << err << "\n";
        return 1;
    }
    std::string text;
    Diagnostic derr;
    if (!DescribeTemplate(tmpl, text, derr))
    {
        std::cerr << "gridfill: FAIL: " << derr.ToString() << "\n";
        return 1;
    }
    std::cout << text;
    return 0;
}

static int RunValidate(const CommandLine& cl, const char* argv0)
{
    if (cl.positional.size() != 1)
    {
        PrintUsage(argv0);
        return 2;
    }
    FillOptions options;
    if (!ResolveOptions(cl, options))
        return 2;

    Workbook tmpl;
    std::string err;
    if (!ReadWorkbookFile(cl.positional[0], tmpl, err))
    {
        std::cerr << "gridfill: FAIL: " << err << "\n";
        return 1;
    }

    std::vector<ValidationIssue> issues;
    const bool ok = ValidateTemplate(tmpl, options, issues);
    for (const ValidationIssue& issue : issues)
        std::cout << IssueSeverityName(issue.severity) << ": " << issue.diagnostic.ToString() << "\n";
    std::cout << (ok ? "OK" : "FAIL") << " (" << issues.size() << " issue(s))\n";
    return ok ? 0 : 1;
}
} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string_view command = argv[1];
    if (command == "--help" || command == "-h")
    {
        PrintUsage(argv[0]);
        return 0;
    }

    CommandLine cl;
    if (!ParseArgs(argc, argv, 2, cl))
    {
        PrintUsage(argv[0]);
        return 2;
    }

    if (command == "fill")
        return RunFill(cl, argv[0]);
    if (command == "describe")
        return RunDescribe(cl, argv[0]);
    if (command == "validate")
        return RunValidate(cl, argv[0]);

    std::cerr << "Unknown command: " << command << "\n";
    PrintUsage(argv[0]);
    return 2;
}
