#include "engine/formula_processor.h"

#include <algorithm>
#include <cctype>

namespace gridfill
{
namespace
{
// Above this many operands a comma list would exceed the function argument limit of
// common spreadsheet applications, so the targets are summed with '+' instead.
static constexpr std::size_t kMaxListOperands = 255;

static bool IsWordChar(char c)
{
    return std::isalnum((unsigned char)c) || c == '_' || c == '.';
}

struct Box
{
    int sheet = 0;
    int first_row = 0;
    int first_col = 0;
    int last_row = 0;
    int last_col = 0;
};

// Parses "Sheet!$A$1" / "'My Sheet'!A1" / "A1" starting at i. `end` is one past the ref.
static bool ParseRefAt(const std::string& src, std::size_t i, bool allow_sheet, FormulaRef& ref, std::size_t& end)
{
    ref = FormulaRef{};
    std::size_t j = i;
    if (allow_sheet && j < src.size() && src[j] == '\'')
    {
        std::string name;
        std::size_t k = j + 1;
        bool closed = false;
        while (k < src.size())
        {
            if (src[k] == '\'')
            {
                if (k + 1 < src.size() && src[k + 1] == '\'')
                {
                    name.push_back('\'');
                    k += 2;
                    continue;
                }
                closed = true;
                break;
            }
            name.push_back(src[k]);
            ++k;
        }
        if (!closed || k + 1 >= src.size() || src[k + 1] != '!')
            return false;
        ref.sheet = name;
        ref.has_sheet = true;
        j = k + 2;
    }
    else if (allow_sheet)
    {
        std::size_t k = j;
        while (k < src.size() && IsWordChar(src[k]))
            ++k;
        if (k > j && k < src.size() && src[k] == '!')
        {
            ref.sheet = src.substr(j, k - j);
            ref.has_sheet = true;
            j = k + 1;
        }
    }

    if (j < src.size() && src[j] == '$')
    {
        ref.abs_col = true;
        ++j;
    }
    const std::size_t letters = j;
    while (j < src.size() && src[j] >= 'A' && src[j] <= 'Z')
        ++j;
    if (j == letters || j - letters > 3)
        return false;
    const int col = ColumnIndex(std::string_view(src).substr(letters, j - letters));
    if (j < src.size() && src[j] == '$')
    {
        ref.abs_row = true;
        ++j;
    }
    const std::size_t digits = j;
    while (j < src.size() && std::isdigit((unsigned char)src[j]))
        ++j;
    if (j == digits || j - digits > 7 || col < 0)
        return false;
    if (j < src.size() && (IsWordChar(src[j]) || src[j] == '(' || src[j] == '!'))
        return false;
    const int row = std::stoi(src.substr(digits, j - digits));
    if (row < 1)
        return false;
    ref.row = row - 1;
    ref.col = col;
    end = j;
    return true;
}

static bool IsRefBoundary(const std::string& src, std::size_t i)
{
    return i == 0 || !(IsWordChar(src[i - 1]) || src[i - 1] == '$' || src[i - 1] == '\'');
}

// Skips a "..." literal starting at i ("" escapes a quote). Returns one past its end.
static std::size_t SkipStringLiteral(const std::string& src, std::size_t i)
{
    std::size_t j = i + 1;
    while (j < src.size())
    {
        if (src[j] == '"')
        {
            if (j + 1 < src.size() && src[j + 1] == '"')
            {
                j += 2;
                continue;
            }
            break;
        }
        ++j;
    }
    return std::min(j + 1, src.size());
}
} // namespace

std::vector<FormulaRef> FindFormulaRefs(const std::string& formula)
{
    std::vector<FormulaRef> out;
    std::size_t i = 0;
    while (i < formula.size())
    {
        const char c = formula[i];
        if (c == '"')
        {
            i = SkipStringLiteral(formula, i);
            continue;
        }
        FormulaRef ref;
        std::size_t end = 0;
        if (IsRefBoundary(formula, i) && ParseRefAt(formula, i, true, ref, end))
        {
            out.push_back(ref);
            FormulaRef tail;
            std::size_t tail_end = 0;
            if (end < formula.size() && formula[end] == ':' && ParseRefAt(formula, end + 1, false, tail, tail_end))
            {
                tail.sheet = ref.sheet;
                tail.has_sheet = ref.has_sheet;
                out.push_back(tail);
                end = tail_end;
            }
            i = end;
            continue;
        }
        if (IsWordChar(c))
        {
            while (i < formula.size() && IsWordChar(formula[i]))
                ++i;
            continue;
        }
        ++i;
    }
    return out;
}

// ---------------------------------------------------------------------------
// CellTracker
// ---------------------------------------------------------------------------
CellTracker::CellTracker()
{
    m_instance_parent.push_back(0);
}

std::uint32_t CellTracker::NewInstance(std::uint32_t parent)
{
    m_instance_parent.push_back(parent);
    return (std::uint32_t)(m_instance_parent.size() - 1);
}

bool CellTracker::IsWithin(std::uint32_t instance, std::uint32_t ancestor) const
{
    std::uint32_t cur = instance;
    for (;;)
    {
        if (cur == ancestor)
            return true;
        if (cur == 0)
            return false;
        cur = m_instance_parent[cur];
    }
}

int CellTracker::AddOutputSheet(const std::string& name)
{
    m_output_sheets.push_back(name);
    return (int)m_output_sheets.size() - 1;
}

int CellTracker::FindOutputSheet(const std::string& name) const
{
    for (std::size_t i = 0; i < m_output_sheets.size(); ++i)
        if (m_output_sheets[i] == name)
            return (int)i;
    return -1;
}

void CellTracker::Record(const SourceCell& source, const TargetCell& target)
{
    m_targets[source].push_back(target);
}

const std::vector<TargetCell>* CellTracker::TargetsOf(const SourceCell& source) const
{
    auto it = m_targets.find(source);
    if (it == m_targets.end())
        return nullptr;
    return &it->second;
}

// ---------------------------------------------------------------------------
// FormulaProcessor
// ---------------------------------------------------------------------------
FormulaProcessor::FormulaProcessor(const CellTracker& tracker,
                                   std::vector<std::string> template_sheets,
                                   std::vector<Region> area_regions,
                                   std::string default_value)
    : m_tracker(tracker)
    , m_template_sheets(std::move(template_sheets))
    , m_area_regions(std::move(area_regions))
    , m_default_value(std::move(default_value))
{
}

int FormulaProcessor::TemplateSheetIndex(const std::string& name) const
{
    for (std::size_t i = 0; i < m_template_sheets.size(); ++i)
        if (m_template_sheets[i] == name)
            return (int)i;
    return -1;
}

bool FormulaProcessor::InArea(int sheet, int row, int col) const
{
    if (sheet < 0 || sheet >= (int)m_template_sheets.size())
        return false;
    const std::string& name = m_template_sheets[(std::size_t)sheet];
    for (const Region& r : m_area_regions)
        if (r.sheet == name && r.Contains(row, col))
            return true;
    return false;
}

bool FormulaProcessor::Resolve(const Ref& ref,
                               const PendingFormula& f,
                               FormulaStrategy strategy,
                               std::vector<TargetCell>& out) const
{
    out.clear();
    const int sheet = ref.has_sheet ? TemplateSheetIndex(ref.sheet) : f.source.sheet;
    if (sheet < 0)
        return false;

    const std::vector<TargetCell>* all = m_tracker.TargetsOf(SourceCell{sheet, ref.row, ref.col});
    if (!all || all->empty())
        return InArea(sheet, ref.row, ref.col);

    // Prefer the targets rendered inside the innermost instance shared with the formula.
    std::uint32_t inst = f.target.instance;
    for (;;)
    {
        for (const TargetCell& t : *all)
            if (m_tracker.IsWithin(t.instance, inst))
                out.push_back(t);
        if (!out.empty() || inst == 0)
            break;
        inst = m_tracker.ParentOf(inst);
    }

    if (strategy == FormulaStrategy::ByColumn)
        out.erase(std::remove_if(out.begin(), out.end(), [&](const TargetCell& t) { return t.col != f.target.col; }),
                  out.end());
    else if (strategy == FormulaStrategy::ByRow)
        out.erase(std::remove_if(out.begin(), out.end(), [&](const TargetCell& t) { return t.row != f.target.row; }),
                  out.end());
    return true;
}

std::string FormulaProcessor::FormatTarget(const TargetCell& t,
                                           const Ref& style,
                                           const PendingFormula& f,
                                           bool with_sheet) const
{
    std::string out;
    if (with_sheet || style.has_sheet || t.sheet != f.target.sheet)
        out = QuoteSheetName(m_tracker.OutputSheetName(t.sheet)) + "!";
    if (style.abs_col)
        out.push_back('$');
    out += ColumnName(t.col);
    if (style.abs_row)
        out.push_back('$');
    out += std::to_string(t.row + 1);
    return out;
}

std::string FormulaProcessor::FormatTargets(std::vector<TargetCell> targets,
                                            const Ref& style,
                                            const PendingFormula& f) const
{
    std::sort(targets.begin(), targets.end(), [](const TargetCell& a, const TargetCell& b) {
        if (a.sheet != b.sheet)
            return a.sheet < b.sheet;
        if (a.row != b.row)
            return a.row < b.row;
        return a.col < b.col;
    });
    targets.erase(std::unique(targets.begin(),
                              targets.end(),
                              [](const TargetCell& a, const TargetCell& b) {
                                  return a.sheet == b.sheet && a.row == b.row && a.col == b.col;
                              }),
                  targets.end());

    if (targets.size() == 1)
        return FormatTarget(targets[0], style, f, false);

    bool same_sheet = true;
    bool same_col = true;
    bool same_row = true;
    bool rows_consecutive = true;
    bool cols_consecutive = true;
    for (std::size_t i = 1; i < targets.size(); ++i)
    {
        const TargetCell& p = targets[i - 1];
        const TargetCell& t = targets[i];
        same_sheet = same_sheet && t.sheet == p.sheet;
        same_col = same_col && t.col == p.col;
        same_row = same_row && t.row == p.row;
        rows_consecutive = rows_consecutive && t.row == p.row + 1;
        cols_consecutive = cols_consecutive && t.col == p.col + 1;
    }
    if (same_sheet && ((same_col && rows_consecutive) || (same_row && cols_consecutive)))
    {
        Ref last_style = style;
        last_style.has_sheet = false;
        const TargetCell& first = targets.front();
        TargetCell last = targets.back();
        last.sheet = f.target.sheet; // never prefix the second half of a range
        return FormatTarget(first, style, f, false) + ":" + FormatTarget(last, last_style, f, false);
    }

    const char* sep = targets.size() > kMaxListOperands ? "+" : ",";
    std::string out;
    for (std::size_t i = 0; i < targets.size(); ++i)
    {
        if (i)
            out += sep;
        out += FormatTarget(targets[i], style, f, false);
    }
    return out;
}

std::string FormulaProcessor::Translate(const PendingFormula& f, const FormulaParams* params) const
{
    const std::string& src = f.formula;
    const FormulaStrategy strategy = params ? params->strategy : FormulaStrategy::Default;
    const std::string default_value =
        (params && params->default_value.has_value()) ? *params->default_value : m_default_value;

    std::string out;
    out.reserve(src.size());
    std::size_t i = 0;
    std::vector<TargetCell> targets;
    std::vector<TargetCell> second;
    while (i < src.size())
    {
        const char c = src[i];
        if (c == '"')
        {
            const std::size_t j = SkipStringLiteral(src, i);
            out.append(src, i, j - i);
            i = j;
            continue;
        }

        Ref ref;
        std::size_t end = 0;
        if (IsRefBoundary(src, i) && ParseRefAt(src, i, true, ref, end))
        {
            Ref ref2;
            std::size_t end2 = 0;
            if (end < src.size() && src[end] == ':' && ParseRefAt(src, end + 1, false, ref2, end2))
            {
                ref2.sheet = ref.sheet;
                ref2.has_sheet = ref.has_sheet;
                const bool ok_a = Resolve(ref, f, strategy, targets);
                const bool ok_b = Resolve(ref2, f, strategy, second);
                if (!ok_a && !ok_b)
                {
                    out.append(src, i, end2 - i);
                    i = end2;
                    continue;
                }

                // Untracked ends outside every area keep their literal coordinate.
                const std::string sheet_name = ref.has_sheet
                                                   ? ref.sheet
                                                   : m_template_sheets[(std::size_t)f.source.sheet];
                const int literal_slot = m_tracker.FindOutputSheet(sheet_name);
                for (int k = 0; k < 2; ++k)
                {
                    const bool ok = k == 0 ? ok_a : ok_b;
                    const Ref& r = k == 0 ? ref : ref2;
                    if (!ok && literal_slot >= 0)
                        targets.push_back(TargetCell{literal_slot, r.row, r.col, 0});
                }
                targets.insert(targets.end(), second.begin(), second.end());

                if (targets.empty())
                {
                    out += default_value;
                    i = end2;
                    continue;
                }

                // Bounding box per output sheet.
                std::vector<Box> boxes;
                for (const TargetCell& t : targets)
                {
                    auto it = std::find_if(boxes.begin(), boxes.end(), [&](const Box& b) { return b.sheet == t.sheet; });
                    if (it == boxes.end())
                    {
                        boxes.push_back(Box{t.sheet, t.row, t.col, t.row, t.col});
                        continue;
                    }
                    it->first_row = std::min(it->first_row, t.row);
                    it->first_col = std::min(it->first_col, t.col);
                    it->last_row = std::max(it->last_row, t.row);
                    it->last_col = std::max(it->last_col, t.col);
                }
                for (std::size_t b = 0; b < boxes.size(); ++b)
                {
                    if (b)
                        out += ",";
                    const Box& box = boxes[b];
                    out += FormatTarget(TargetCell{box.sheet, box.first_row, box.first_col, 0},
                                        ref,
                                        f,
                                        boxes.size() > 1);
                    if (box.last_row != box.first_row || box.last_col != box.first_col)
                    {
                        Ref tail = ref2;
                        tail.has_sheet = false;
                        out += ":";
                        out += FormatTarget(TargetCell{f.target.sheet, box.last_row, box.last_col, 0}, tail, f, false);
                    }
                }
                i = end2;
                continue;
            }

            if (!Resolve(ref, f, strategy, targets))
                out.append(src, i, end - i);
            else if (targets.empty())
                out += default_value;
            else
                out += FormatTargets(targets, ref, f);
            i = end;
            continue;
        }

        if (IsWordChar(c))
        {
            // Function names and other identifiers pass through whole.
            std::size_t j = i;
            while (j < src.size() && IsWordChar(src[j]))
                ++j;
            out.append(src, i, j - i);
            i = j;
            continue;
        }

        out.push_back(c);
        ++i;
    }
    return out;
}
} // namespace gridfill
