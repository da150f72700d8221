#include "engine/filler.h"

#include "engine/command_tree.h"
#include "engine/context.h"
#include "engine/transform_engine.h"
#include "io/grid_document_adapter.h"

#include <cstdio>
#include <istream>
#include <iterator>
#include <ostream>

namespace gridfill
{
namespace
{
static FillResult Failed(Diagnostic error, std::vector<Diagnostic> diagnostics = {})
{
    FillResult r;
    r.ok = false;
    r.error = std::move(error);
    r.diagnostics = std::move(diagnostics);
    return r;
}

static bool DecodeTemplate(const std::vector<std::uint8_t>& bytes,
                           const IGridDocumentAdapter* adapter,
                           Workbook& out,
                           Diagnostic& error)
{
    if (!adapter)
        adapter = DetectAdapter(bytes);
    if (!adapter)
    {
        error = MakeDiagnostic(ErrorCode::Format, "", "Unrecognized template format.");
        return false;
    }
    std::string err;
    if (!adapter->Decode(bytes, out, err))
    {
        error = MakeDiagnostic(ErrorCode::Format, "", "Template: " + err);
        return false;
    }
    return true;
}

// Decodes with `reader`, fills, and encodes with `output_format` (or `reader` when empty).
static FillResult FillDecoded(const std::vector<std::uint8_t>& template_bytes,
                              const IGridDocumentAdapter* reader,
                              const Value& data,
                              const FillOptions& options,
                              std::vector<std::uint8_t>& out,
                              const std::string& output_format)
{
    const IGridDocumentAdapter* writer = output_format.empty() ? reader : FindAdapterByName(output_format);
    if (!writer && !output_format.empty())
        return Failed(MakeDiagnostic(ErrorCode::Format, "", "Unknown output format '" + output_format + "'."));

    Workbook tmpl;
    Diagnostic error;
    if (!DecodeTemplate(template_bytes, reader, tmpl, error))
        return Failed(std::move(error));

    Workbook filled;
    FillResult r = FillWorkbook(tmpl, data, options, filled);
    if (!r.ok)
        return r;

    std::string err;
    std::vector<std::uint8_t> encoded;
    if (!writer->Encode(filled, encoded, err))
        return Failed(MakeDiagnostic(ErrorCode::Format, "", err), std::move(r.diagnostics));
    out = std::move(encoded);
    return r;
}
} // namespace

FillResult FillWorkbook(const Workbook& tmpl, const Value& data, const FillOptions& options, Workbook& out)
{
    if (!data.IsNull() && !data.IsMapping())
    {
        return Failed(MakeDiagnostic(ErrorCode::InvalidOption,
                                     "",
                                     std::string("Fill data must be an object, got ") + TypeName(data.GetType()) + "."));
    }

    CommandTree tree;
    Diagnostic err;
    if (!BuildTemplateTree(tmpl, tree, err))
    {
        if (options.log_diagnostics)
            std::fprintf(stderr, "[gridfill] template rejected: %s\n", err.ToString().c_str());
        return Failed(std::move(err));
    }

    Context context(data.IsNull() ? Value::FromMapping({}) : data);
    TransformEngine engine(tmpl, tree, options, context);
    Workbook result;
    if (!engine.Run(result))
        return Failed(engine.Error(), engine.Diagnostics());

    if (options.log_diagnostics && !engine.Diagnostics().empty())
        std::fprintf(stderr, "[gridfill] filled with %zu diagnostic(s)\n", engine.Diagnostics().size());

    out = std::move(result);
    FillResult r;
    r.diagnostics = engine.Diagnostics();
    return r;
}

FillResult FillToPath(const std::string& template_path,
                      const Value& data,
                      const std::string& output_path,
                      const FillOptions& options)
{
    const IGridDocumentAdapter* writer = FindAdapterForPath(output_path);
    if (!writer)
        return Failed(MakeDiagnostic(ErrorCode::Format, "", "No workbook format for output path: " + output_path));

    std::vector<std::uint8_t> bytes;
    std::string io_err;
    if (!ReadAllBytes(template_path, bytes, io_err))
        return Failed(MakeDiagnostic(ErrorCode::Io, "", io_err));

    Workbook tmpl;
    Diagnostic error;
    if (!DecodeTemplate(bytes, FindAdapterForPath(template_path), tmpl, error))
        return Failed(std::move(error));

    Workbook out;
    FillResult r = FillWorkbook(tmpl, data, options, out);
    if (!r.ok)
        return r;

    std::vector<std::uint8_t> encoded;
    if (!writer->Encode(out, encoded, io_err))
        return Failed(MakeDiagnostic(ErrorCode::Format, "", io_err), std::move(r.diagnostics));
    if (!WriteAllBytesAtomic(output_path, encoded, io_err))
        return Failed(MakeDiagnostic(ErrorCode::Io, "", io_err), std::move(r.diagnostics));
    return r;
}

FillResult FillToBytes(const std::vector<std::uint8_t>& template_bytes,
                       const Value& data,
                       const FillOptions& options,
                       std::vector<std::uint8_t>& out,
                       const std::string& output_format)
{
    return FillDecoded(template_bytes, DetectAdapter(template_bytes), data, options, out, output_format);
}

FillResult FillToBytes(const std::string& template_path,
                       const Value& data,
                       const FillOptions& options,
                       std::vector<std::uint8_t>& out,
                       const std::string& output_format)
{
    std::vector<std::uint8_t> bytes;
    std::string io_err;
    if (!ReadAllBytes(template_path, bytes, io_err))
        return Failed(MakeDiagnostic(ErrorCode::Io, "", io_err));

    const IGridDocumentAdapter* reader = FindAdapterForPath(template_path);
    return FillDecoded(bytes, reader ? reader : DetectAdapter(bytes), data, options, out, output_format);
}

FillResult FillStream(std::istream& in, std::ostream& out, const Value& data, const FillOptions& options)
{
    const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        return Failed(MakeDiagnostic(ErrorCode::Io, "", "Failed to read the template stream."));

    std::vector<std::uint8_t> encoded;
    FillResult r = FillToBytes(bytes, data, options, encoded);
    if (!r.ok)
        return r;

    out.write(reinterpret_cast<const char*>(encoded.data()), (std::streamsize)encoded.size());
    if (!out)
        return Failed(MakeDiagnostic(ErrorCode::Io, "", "Failed to write the output stream."), std::move(r.diagnostics));
    return r;
}
} // namespace gridfill
