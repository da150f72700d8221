#pragma once

#include "engine/command.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gridfill
{
// ---------------------------------------------------------------------------
// Source -> target tracking
// ---------------------------------------------------------------------------
// Every template cell the engine renders records where it landed. Each target also
// records the render instance it was produced in: instance 0 is the sheet itself, and
// every loop iteration (and every multisheet copy) opens a child instance. Formula
// references use the instance tree to prefer cells rendered in the same iteration.

struct SourceCell
{
    int sheet = 0; // template sheet index
    int row = 0;
    int col = 0;

    bool operator<(const SourceCell& o) const
    {
        if (sheet != o.sheet)
            return sheet < o.sheet;
        if (row != o.row)
            return row < o.row;
        return col < o.col;
    }
};

struct TargetCell
{
    int sheet = 0; // output sheet slot (see CellTracker::OutputSheetName)
    int row = 0;
    int col = 0;
    std::uint32_t instance = 0;
};

class CellTracker
{
public:
    CellTracker();

    std::uint32_t NewInstance(std::uint32_t parent);
    std::uint32_t ParentOf(std::uint32_t instance) const { return m_instance_parent[instance]; }
    // True if `instance` is `ancestor` or nested anywhere below it.
    bool IsWithin(std::uint32_t instance, std::uint32_t ancestor) const;

    int AddOutputSheet(const std::string& name);
    int FindOutputSheet(const std::string& name) const; // -1 if missing
    const std::string& OutputSheetName(int slot) const { return m_output_sheets[(std::size_t)slot]; }

    void Record(const SourceCell& source, const TargetCell& target);
    const std::vector<TargetCell>* TargetsOf(const SourceCell& source) const;

private:
    std::vector<std::uint32_t> m_instance_parent;
    std::vector<std::string> m_output_sheets;
    std::map<SourceCell, std::vector<TargetCell>> m_targets;
};

// ---------------------------------------------------------------------------
// Reference translation
// ---------------------------------------------------------------------------
struct FormulaRef
{
    std::string sheet; // as written (unquoted); meaningful when has_sheet
    bool has_sheet = false;
    bool abs_col = false;
    bool abs_row = false;
    int row = 0;
    int col = 0;
};

// Every cell reference in formula text; both ends of a range are listed.
std::vector<FormulaRef> FindFormulaRefs(const std::string& formula);

struct PendingFormula
{
    SourceCell source;
    TargetCell target;
    std::string formula; // after ${} parameter substitution, without '='
};

class FormulaProcessor
{
public:
    // template_sheets: template sheet names by index.
    // area_regions: regions rendered by the engine; a reference into one of them that
    // produced no output is replaced with the default value.
    FormulaProcessor(const CellTracker& tracker,
                     std::vector<std::string> template_sheets,
                     std::vector<Region> area_regions,
                     std::string default_value);

    std::string Translate(const PendingFormula& f, const FormulaParams* params) const;

private:
    using Ref = FormulaRef;

    int TemplateSheetIndex(const std::string& name) const;
    bool InArea(int sheet, int row, int col) const;
    // Targets of one reference end, narrowed to the formula's instance and strategy.
    // Returns false when the reference is untracked and outside every area.
    bool Resolve(const Ref& ref,
                 const PendingFormula& f,
                 FormulaStrategy strategy,
                 std::vector<TargetCell>& out) const;
    std::string FormatTarget(const TargetCell& t, const Ref& style, const PendingFormula& f, bool with_sheet) const;
    std::string FormatTargets(std::vector<TargetCell> targets, const Ref& style, const PendingFormula& f) const;

    const CellTracker& m_tracker;
    std::vector<std::string> m_template_sheets;
    std::vector<Region> m_area_regions;
    std::string m_default_value;
};
} // namespace gridfill
