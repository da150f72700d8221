#include "core/cell_ref.h"

#include <cctype>

namespace gridfill
{
namespace
{
static constexpr std::size_t kMaxSheetNameLength = 31;
// XFD, the widest column common spreadsheet applications address.
static constexpr int kMaxColumns = 16384;
static constexpr int kMaxRows = 1048576;

static bool NeedsQuoting(const std::string& name)
{
    if (name.empty())
        return false;
    if (std::isdigit((unsigned char)name[0]))
        return true;
    for (unsigned char c : name)
    {
        if (!std::isalnum(c) && c != '_')
            return true;
    }
    return false;
}
} // namespace

std::string ColumnName(int col)
{
    if (col < 0)
        return std::string();
    std::string out;
    int n = col + 1;
    while (n > 0)
    {
        const int rem = (n - 1) % 26;
        out.insert(out.begin(), (char)('A' + rem));
        n = (n - 1) / 26;
    }
    return out;
}

int ColumnIndex(std::string_view letters)
{
    if (letters.empty() || letters.size() > 3)
        return -1;
    int n = 0;
    for (char ch : letters)
    {
        const int c = std::toupper((unsigned char)ch);
        if (c < 'A' || c > 'Z')
            return -1;
        n = n * 26 + (c - 'A' + 1);
    }
    if (n > kMaxColumns)
        return -1;
    return n - 1;
}

bool ParseCellRef(std::string_view text, CellRef& out, std::string& err)
{
    err.clear();
    out = CellRef{};

    std::string_view s = text;
    while (!s.empty() && std::isspace((unsigned char)s.front()))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))
        s.remove_suffix(1);

    const std::size_t bang = s.rfind('!');
    if (bang != std::string_view::npos)
    {
        std::string_view sheet = s.substr(0, bang);
        if (sheet.size() >= 2 && sheet.front() == '\'' && sheet.back() == '\'')
        {
            sheet = sheet.substr(1, sheet.size() - 2);
            // '' inside a quoted name is an escaped quote.
            std::string unescaped;
            for (std::size_t i = 0; i < sheet.size(); ++i)
            {
                unescaped.push_back(sheet[i]);
                if (sheet[i] == '\'' && i + 1 < sheet.size() && sheet[i + 1] == '\'')
                    ++i;
            }
            out.sheet = unescaped;
        }
        else
        {
            out.sheet = std::string(sheet);
        }
        if (out.sheet.empty())
        {
            err = "Empty sheet name in cell reference '" + std::string(text) + "'.";
            return false;
        }
        s = s.substr(bang + 1);
    }

    std::size_t i = 0;
    if (i < s.size() && s[i] == '$')
        ++i;
    const std::size_t letters_begin = i;
    while (i < s.size() && std::isalpha((unsigned char)s[i]))
        ++i;
    const std::string_view letters = s.substr(letters_begin, i - letters_begin);
    if (i < s.size() && s[i] == '$')
        ++i;
    const std::size_t digits_begin = i;
    while (i < s.size() && std::isdigit((unsigned char)s[i]))
        ++i;
    const std::string_view digits = s.substr(digits_begin, i - digits_begin);

    if (i != s.size() || letters.empty() || digits.empty() || digits.size() > 7)
    {
        err = "Invalid cell reference '" + std::string(text) + "'.";
        return false;
    }

    const int col = ColumnIndex(letters);
    int row = 0;
    for (char d : digits)
        row = row * 10 + (d - '0');
    if (col < 0 || row < 1 || row > kMaxRows)
    {
        err = "Cell reference out of range '" + std::string(text) + "'.";
        return false;
    }

    out.row = row - 1;
    out.col = col;
    return true;
}

std::string QuoteSheetName(const std::string& name)
{
    if (!NeedsQuoting(name))
        return name;
    std::string out = "'";
    for (char c : name)
    {
        out.push_back(c);
        if (c == '\'')
            out.push_back('\'');
    }
    out.push_back('\'');
    return out;
}

std::string FormatCellRef(const CellRef& ref, bool with_sheet)
{
    std::string out;
    if (with_sheet && !ref.sheet.empty())
        out = QuoteSheetName(ref.sheet) + "!";
    out += ColumnName(ref.col);
    out += std::to_string(ref.row + 1);
    return out;
}

std::string FormatRegion(const Region& region)
{
    std::string out = FormatCellRef(CellRef{region.sheet, region.first_row, region.first_col}, true);
    out += ":";
    out += FormatCellRef(CellRef{std::string(), region.last_row, region.last_col}, false);
    return out;
}

std::string SafeSheetName(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        switch (c)
        {
            case '/':
            case '\\':
            case ':':
            case '*':
            case '?':
            case '[':
            case ']':
                out.push_back('_');
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    if (out.size() > kMaxSheetNameLength)
    {
        // Never cut a UTF-8 sequence in half.
        std::size_t cut = kMaxSheetNameLength;
        while (cut > 0 && (((unsigned char)out[cut]) & 0xC0u) == 0x80u)
            --cut;
        out.resize(cut);
    }
    if (out.empty())
        out = "Sheet";
    return out;
}
} // namespace gridfill
