#include "engine/expression.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace gridfill
{
struct Expression::Node
{
    enum class Kind
    {
        Literal = 0,
        Variable,
        Member,
        Unary,
        Binary,
        And,
        Or,
        Conditional,
        Call,
    };

    Kind kind = Kind::Literal;
    Value literal;
    std::string name; // variable / member / operator / function
    std::vector<std::unique_ptr<Node>> args;
};

namespace
{
using Node = Expression::Node;

// ---------------------------------------------------------------------------
// Lexer
// ---------------------------------------------------------------------------
enum class TokenKind
{
    End = 0,
    Number,
    String,
    Ident,
    Op,
};

struct Token
{
    TokenKind kind = TokenKind::End;
    std::string text;
    double number = 0.0;
    std::size_t pos = 0;
};

static bool Tokenize(std::string_view src, std::vector<Token>& out, std::string& err)
{
    static constexpr std::string_view kTwoCharOps[] = {"==", "!=", "<=", ">=", "&&", "||"};
    static constexpr std::string_view kOneCharOps = "+-*/%<>!().,?:";

    out.clear();
    std::size_t i = 0;
    while (i < src.size())
    {
        const unsigned char c = (unsigned char)src[i];
        if (std::isspace(c))
        {
            ++i;
            continue;
        }

        Token t;
        t.pos = i;

        if (std::isdigit(c) || (c == '.' && i + 1 < src.size() && std::isdigit((unsigned char)src[i + 1])))
        {
            std::size_t j = i;
            while (j < src.size() && (std::isdigit((unsigned char)src[j]) || src[j] == '.'))
                ++j;
            if (j < src.size() && (src[j] == 'e' || src[j] == 'E'))
            {
                std::size_t k = j + 1;
                if (k < src.size() && (src[k] == '+' || src[k] == '-'))
                    ++k;
                if (k < src.size() && std::isdigit((unsigned char)src[k]))
                {
                    j = k;
                    while (j < src.size() && std::isdigit((unsigned char)src[j]))
                        ++j;
                }
            }
            const std::string num(src.substr(i, j - i));
            char* end = nullptr;
            t.number = std::strtod(num.c_str(), &end);
            if (!end || *end != '\0')
            {
                err = "invalid number '" + num + "' at position " + std::to_string(i);
                return false;
            }
            t.kind = TokenKind::Number;
            t.text = num;
            i = j;
        }
        else if (c == '"' || c == '\'')
        {
            const char quote = (char)c;
            std::string s;
            std::size_t j = i + 1;
            bool closed = false;
            while (j < src.size())
            {
                const char ch = src[j];
                if (ch == '\\' && j + 1 < src.size())
                {
                    const char esc = src[j + 1];
                    switch (esc)
                    {
                        case 'n': s.push_back('\n'); break;
                        case 't': s.push_back('\t'); break;
                        default: s.push_back(esc); break;
                    }
                    j += 2;
                    continue;
                }
                if (ch == quote)
                {
                    closed = true;
                    ++j;
                    break;
                }
                s.push_back(ch);
                ++j;
            }
            if (!closed)
            {
                err = "unterminated string starting at position " + std::to_string(i);
                return false;
            }
            t.kind = TokenKind::String;
            t.text = std::move(s);
            i = j;
        }
        else if (std::isalpha(c) || c == '_')
        {
            std::size_t j = i;
            while (j < src.size() && (std::isalnum((unsigned char)src[j]) || src[j] == '_'))
                ++j;
            t.kind = TokenKind::Ident;
            t.text = std::string(src.substr(i, j - i));
            i = j;
        }
        else
        {
            bool matched = false;
            for (std::string_view op : kTwoCharOps)
            {
                if (src.substr(i, 2) == op)
                {
                    t.kind = TokenKind::Op;
                    t.text = std::string(op);
                    i += 2;
                    matched = true;
                    break;
                }
            }
            if (!matched)
            {
                if (kOneCharOps.find((char)c) == std::string_view::npos)
                {
                    err = std::string("unexpected character '") + (char)c + "' at position " + std::to_string(i);
                    return false;
                }
                t.kind = TokenKind::Op;
                t.text = std::string(1, (char)c);
                ++i;
            }
        }
        out.push_back(std::move(t));
    }

    Token end;
    end.kind = TokenKind::End;
    end.pos = src.size();
    out.push_back(end);
    return true;
}

// ---------------------------------------------------------------------------
// Parser
// ---------------------------------------------------------------------------
struct FunctionArity
{
    std::string_view name;
    int min_args;
    int max_args;
};

static const FunctionArity* FindFunction(std::string_view name)
{
    static const FunctionArity kFunctions[] = {
        {"hyperlink", 1, 2},
        {"len", 1, 1},
        {"upper", 1, 1},
        {"lower", 1, 1},
        {"default", 2, 2},
    };
    for (const auto& f : kFunctions)
        if (f.name == name)
            return &f;
    return nullptr;
}

class Parser
{
public:
    explicit Parser(std::vector<Token> tokens)
        : m_tokens(std::move(tokens))
    {
    }

    std::unique_ptr<Node> ParseAll(std::string& err)
    {
        auto root = ParseTernary();
        if (root && Peek().kind != TokenKind::End)
            Fail("unexpected '" + Describe(Peek()) + "'");
        if (!m_err.empty())
        {
            err = m_err;
            return nullptr;
        }
        return root;
    }

private:
    const Token& Peek() const { return m_tokens[m_pos]; }
    const Token& Next() { return m_tokens[m_pos < m_tokens.size() - 1 ? m_pos++ : m_pos]; }

    bool IsOp(std::string_view op) const { return Peek().kind == TokenKind::Op && Peek().text == op; }
    bool IsWord(std::string_view w) const { return Peek().kind == TokenKind::Ident && Peek().text == w; }

    static std::string Describe(const Token& t)
    {
        if (t.kind == TokenKind::End)
            return "end of expression";
        return t.text;
    }

    std::unique_ptr<Node> Fail(const std::string& msg)
    {
        if (m_err.empty())
            m_err = msg + " at position " + std::to_string(Peek().pos);
        return nullptr;
    }

    static std::unique_ptr<Node> MakeBinary(Node::Kind kind, std::string op, std::unique_ptr<Node> a, std::unique_ptr<Node> b)
    {
        auto n = std::make_unique<Node>();
        n->kind = kind;
        n->name = std::move(op);
        n->args.push_back(std::move(a));
        n->args.push_back(std::move(b));
        return n;
    }

    std::unique_ptr<Node> ParseTernary()
    {
        auto cond = ParseOr();
        if (!cond || !IsOp("?"))
            return cond;
        Next();
        auto a = ParseTernary();
        if (!a)
            return nullptr;
        if (!IsOp(":"))
            return Fail("expected ':' in conditional expression");
        Next();
        auto b = ParseTernary();
        if (!b)
            return nullptr;
        auto n = std::make_unique<Node>();
        n->kind = Node::Kind::Conditional;
        n->args.push_back(std::move(cond));
        n->args.push_back(std::move(a));
        n->args.push_back(std::move(b));
        return n;
    }

    std::unique_ptr<Node> ParseOr()
    {
        auto lhs = ParseAnd();
        while (lhs && (IsOp("||") || IsWord("or")))
        {
            Next();
            auto rhs = ParseAnd();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::Or, "||", std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseAnd()
    {
        auto lhs = ParseEquality();
        while (lhs && (IsOp("&&") || IsWord("and")))
        {
            Next();
            auto rhs = ParseEquality();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::And, "&&", std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseEquality()
    {
        auto lhs = ParseComparison();
        while (lhs && (IsOp("==") || IsOp("!=")))
        {
            const std::string op = Next().text;
            auto rhs = ParseComparison();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::Binary, op, std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseComparison()
    {
        auto lhs = ParseAdditive();
        while (lhs && (IsOp("<") || IsOp("<=") || IsOp(">") || IsOp(">=")))
        {
            const std::string op = Next().text;
            auto rhs = ParseAdditive();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::Binary, op, std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseAdditive()
    {
        auto lhs = ParseTerm();
        while (lhs && (IsOp("+") || IsOp("-")))
        {
            const std::string op = Next().text;
            auto rhs = ParseTerm();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::Binary, op, std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseTerm()
    {
        auto lhs = ParseUnary();
        while (lhs && (IsOp("*") || IsOp("/") || IsOp("%")))
        {
            const std::string op = Next().text;
            auto rhs = ParseUnary();
            if (!rhs)
                return nullptr;
            lhs = MakeBinary(Node::Kind::Binary, op, std::move(lhs), std::move(rhs));
        }
        return lhs;
    }

    std::unique_ptr<Node> ParseUnary()
    {
        if (IsOp("!") || IsWord("not") || IsOp("-"))
        {
            const std::string op = IsOp("-") ? "-" : "!";
            Next();
            auto operand = ParseUnary();
            if (!operand)
                return nullptr;
            auto n = std::make_unique<Node>();
            n->kind = Node::Kind::Unary;
            n->name = op;
            n->args.push_back(std::move(operand));
            return n;
        }
        return ParsePostfix();
    }

    std::unique_ptr<Node> ParsePostfix()
    {
        auto base = ParsePrimary();
        while (base && IsOp("."))
        {
            Next();
            if (Peek().kind != TokenKind::Ident)
                return Fail("expected member name after '.'");
            auto n = std::make_unique<Node>();
            n->kind = Node::Kind::Member;
            n->name = Next().text;
            n->args.push_back(std::move(base));
            base = std::move(n);
        }
        return base;
    }

    std::unique_ptr<Node> ParsePrimary()
    {
        const Token& t = Peek();
        if (t.kind == TokenKind::Number)
        {
            auto n = std::make_unique<Node>();
            n->literal = Value::FromNumber(Next().number);
            return n;
        }
        if (t.kind == TokenKind::String)
        {
            auto n = std::make_unique<Node>();
            n->literal = Value::FromString(Next().text);
            return n;
        }
        if (t.kind == TokenKind::Ident)
        {
            const std::string word = Next().text;
            if (word == "true" || word == "false")
            {
                auto n = std::make_unique<Node>();
                n->literal = Value::FromBool(word == "true");
                return n;
            }
            if (word == "null" || word == "nil")
                return std::make_unique<Node>();
            if (word == "and" || word == "or" || word == "not")
                return Fail("unexpected keyword '" + word + "'");

            if (IsOp("("))
                return ParseCall(word);

            auto n = std::make_unique<Node>();
            n->kind = Node::Kind::Variable;
            n->name = word;
            return n;
        }
        if (IsOp("("))
        {
            Next();
            auto inner = ParseTernary();
            if (!inner)
                return nullptr;
            if (!IsOp(")"))
                return Fail("expected ')'");
            Next();
            return inner;
        }
        return Fail("unexpected '" + Describe(t) + "'");
    }

    std::unique_ptr<Node> ParseCall(const std::string& name)
    {
        const FunctionArity* fn = FindFunction(name);
        if (!fn)
            return Fail("unknown function '" + name + "'");
        Next(); // '('
        auto n = std::make_unique<Node>();
        n->kind = Node::Kind::Call;
        n->name = name;
        if (!IsOp(")"))
        {
            for (;;)
            {
                auto arg = ParseTernary();
                if (!arg)
                    return nullptr;
                n->args.push_back(std::move(arg));
                if (IsOp(","))
                {
                    Next();
                    continue;
                }
                break;
            }
        }
        if (!IsOp(")"))
            return Fail("expected ')' after arguments to '" + name + "'");
        Next();
        const int argc = (int)n->args.size();
        if (argc < fn->min_args || argc > fn->max_args)
            return Fail("wrong number of arguments to '" + name + "'");
        return n;
    }

    std::vector<Token> m_tokens;
    std::size_t m_pos = 0;
    std::string m_err;
};

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------
static bool TypeError(EvalError& err, std::string msg)
{
    err.code = ErrorCode::TypeMismatch;
    err.message = std::move(msg);
    return false;
}

static bool ToCondition(const Value& v, bool& out, EvalError& err)
{
    if (v.IsNull())
    {
        out = false;
        return true;
    }
    if (v.IsBool())
    {
        out = v.AsBool();
        return true;
    }
    return TypeError(err, std::string("expected a boolean, got ") + TypeName(v.GetType()));
}

static std::size_t Utf8Length(const std::string& s)
{
    std::size_t n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0u) != 0x80u)
            ++n;
    return n;
}

static bool Eval(const Node& n, const EvalEnv& env, Value& out, EvalError& err);

static bool EvalBinary(const Node& n, const EvalEnv& env, Value& out, EvalError& err)
{
    Value a;
    Value b;
    if (!Eval(*n.args[0], env, a, err) || !Eval(*n.args[1], env, b, err))
        return false;
    const std::string& op = n.name;

    if (op == "==")
    {
        out = Value::FromBool(ValuesEqual(a, b));
        return true;
    }
    if (op == "!=")
    {
        out = Value::FromBool(!ValuesEqual(a, b));
        return true;
    }
    if (op == "<" || op == "<=" || op == ">" || op == ">=")
    {
        int c = 0;
        if (a.IsNumber() && b.IsNumber())
            c = a.AsNumber() < b.AsNumber() ? -1 : (a.AsNumber() > b.AsNumber() ? 1 : 0);
        else if (a.IsString() && b.IsString())
            c = a.AsString().compare(b.AsString());
        else
            return TypeError(err,
                             "cannot compare " + std::string(TypeName(a.GetType())) + " with " +
                                 TypeName(b.GetType()));
        bool r = false;
        if (op == "<")
            r = c < 0;
        else if (op == "<=")
            r = c <= 0;
        else if (op == ">")
            r = c > 0;
        else
            r = c >= 0;
        out = Value::FromBool(r);
        return true;
    }
    if (op == "+")
    {
        if (a.IsString() || b.IsString())
        {
            out = Value::FromString(a.ToDisplayString() + b.ToDisplayString());
            return true;
        }
        if (a.IsNumber() && b.IsNumber())
        {
            out = Value::FromNumber(a.AsNumber() + b.AsNumber());
            return true;
        }
        return TypeError(err,
                         "cannot add " + std::string(TypeName(a.GetType())) + " and " + TypeName(b.GetType()));
    }

    if (!a.IsNumber() || !b.IsNumber())
        return TypeError(err,
                         "operator '" + op + "' needs numbers, got " + TypeName(a.GetType()) + " and " +
                             TypeName(b.GetType()));
    const double x = a.AsNumber();
    const double y = b.AsNumber();
    if (op == "-")
        out = Value::FromNumber(x - y);
    else if (op == "*")
        out = Value::FromNumber(x * y);
    else if (op == "/" || op == "%")
    {
        if (y == 0.0)
            return TypeError(err, "division by zero");
        out = Value::FromNumber(op == "/" ? x / y : std::fmod(x, y));
    }
    else
        return TypeError(err, "unknown operator '" + op + "'");
    return true;
}

static bool EvalCall(const Node& n, const EvalEnv& env, Value& out, EvalError& err)
{
    if (n.name == "default")
    {
        Value v;
        EvalError first;
        if (!Eval(*n.args[0], env, v, first))
        {
            if (first.code != ErrorCode::UnresolvedVariable)
            {
                err = first;
                return false;
            }
            v = Value();
        }
        if (!v.IsNull())
        {
            out = std::move(v);
            return true;
        }
        return Eval(*n.args[1], env, out, err);
    }

    std::vector<Value> args(n.args.size());
    for (std::size_t i = 0; i < n.args.size(); ++i)
        if (!Eval(*n.args[i], env, args[i], err))
            return false;

    if (n.name == "hyperlink")
    {
        const std::string url = args[0].ToDisplayString();
        const std::string label = args.size() > 1 ? args[1].ToDisplayString() : std::string();
        out = Value::FromHyperlink(url, label);
        return true;
    }
    if (n.name == "len")
    {
        const Value& v = args[0];
        switch (v.GetType())
        {
            case Value::Type::Null: out = Value::FromNumber(0); return true;
            case Value::Type::String: out = Value::FromNumber((double)Utf8Length(v.AsString())); return true;
            case Value::Type::Sequence: out = Value::FromNumber((double)v.AsSequence().size()); return true;
            case Value::Type::Mapping: out = Value::FromNumber((double)v.AsMapping().size()); return true;
            case Value::Type::Binary: out = Value::FromNumber((double)v.AsBinary().size()); return true;
            default: return TypeError(err, std::string("len() of ") + TypeName(v.GetType()));
        }
    }
    if (n.name == "upper" || n.name == "lower")
    {
        std::string s = args[0].ToDisplayString();
        for (char& c : s)
            c = (char)(n.name == "upper" ? std::toupper((unsigned char)c) : std::tolower((unsigned char)c));
        out = Value::FromString(std::move(s));
        return true;
    }
    err.code = ErrorCode::MalformedExpression;
    err.message = "unknown function '" + n.name + "'";
    return false;
}

static bool Eval(const Node& n, const EvalEnv& env, Value& out, EvalError& err)
{
    switch (n.kind)
    {
        case Node::Kind::Literal:
            out = n.literal;
            return true;

        case Node::Kind::Variable:
        {
            // Lookup pointers are only valid until the next Push; copy right away.
            if (env.context)
            {
                if (const Value* v = env.context->Lookup(env.scope, n.name))
                {
                    out = *v;
                    return true;
                }
            }
            if (n.name == "_row" && env.row >= 0)
            {
                out = Value::FromNumber((double)(env.row + 1));
                return true;
            }
            if (n.name == "_col" && env.col >= 0)
            {
                out = Value::FromNumber((double)env.col);
                return true;
            }
            err.code = ErrorCode::UnresolvedVariable;
            err.message = "unresolved variable '" + n.name + "'";
            return false;
        }

        case Node::Kind::Member:
        {
            Value base;
            if (!Eval(*n.args[0], env, base, err))
                return false;
            if (base.IsNull())
            {
                out = Value();
                return true;
            }
            if (base.IsMapping())
            {
                const Value* m = base.Member(n.name);
                out = m ? *m : Value();
                return true;
            }
            if (base.IsHyperlink() && (n.name == "url" || n.name == "label"))
            {
                out = Value::FromString(n.name == "url" ? base.AsHyperlink().url : base.AsHyperlink().label);
                return true;
            }
            return TypeError(err,
                             "cannot access member '" + n.name + "' of " + TypeName(base.GetType()));
        }

        case Node::Kind::Unary:
        {
            Value v;
            if (!Eval(*n.args[0], env, v, err))
                return false;
            if (n.name == "-")
            {
                if (!v.IsNumber())
                    return TypeError(err, std::string("cannot negate ") + TypeName(v.GetType()));
                out = Value::FromNumber(-v.AsNumber());
                return true;
            }
            bool b = false;
            if (!ToCondition(v, b, err))
                return false;
            out = Value::FromBool(!b);
            return true;
        }

        case Node::Kind::Binary:
            return EvalBinary(n, env, out, err);

        case Node::Kind::And:
        case Node::Kind::Or:
        {
            Value a;
            bool ab = false;
            if (!Eval(*n.args[0], env, a, err) || !ToCondition(a, ab, err))
                return false;
            if (n.kind == Node::Kind::And && !ab)
            {
                out = Value::FromBool(false);
                return true;
            }
            if (n.kind == Node::Kind::Or && ab)
            {
                out = Value::FromBool(true);
                return true;
            }
            Value b;
            bool bb = false;
            if (!Eval(*n.args[1], env, b, err) || !ToCondition(b, bb, err))
                return false;
            out = Value::FromBool(bb);
            return true;
        }

        case Node::Kind::Conditional:
        {
            Value c;
            bool cb = false;
            if (!Eval(*n.args[0], env, c, err) || !ToCondition(c, cb, err))
                return false;
            return Eval(*n.args[cb ? 1 : 2], env, out, err);
        }

        case Node::Kind::Call:
            return EvalCall(n, env, out, err);
    }
    return TypeError(err, "invalid expression node");
}

static std::string_view TrimView(std::string_view s)
{
    while (!s.empty() && std::isspace((unsigned char)s.front()))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back()))
        s.remove_suffix(1);
    return s;
}

// Index of the end marker closing a placeholder whose body starts at `from`, honoring
// nested placeholders and quoted strings. npos when unterminated.
static std::size_t FindPlaceholderEnd(std::string_view text, std::size_t from, const Notation& n)
{
    int depth = 1;
    std::size_t i = from;
    while (i < text.size())
    {
        const char c = text[i];
        if (c == '"' || c == '\'')
        {
            const std::size_t close = text.find(c, i + 1);
            if (close == std::string_view::npos)
                return std::string_view::npos;
            i = close + 1;
            continue;
        }
        if (text.compare(i, n.begin.size(), n.begin) == 0)
        {
            ++depth;
            i += n.begin.size();
            continue;
        }
        if (text.compare(i, n.end.size(), n.end) == 0)
        {
            if (--depth == 0)
                return i;
            i += n.end.size();
            continue;
        }
        ++i;
    }
    return std::string_view::npos;
}
} // namespace

// ---------------------------------------------------------------------------
// Expression
// ---------------------------------------------------------------------------
Expression::Expression(std::string source, std::unique_ptr<Node> root)
    : m_source(std::move(source))
    , m_root(std::move(root))
{
}

Expression::~Expression() = default;

bool Expression::Evaluate(const EvalEnv& env, Value& out, EvalError& err) const
{
    err = EvalError{};
    out = Value();
    if (!Eval(*m_root, env, out, err))
    {
        out = Value();
        return false;
    }
    return true;
}

bool CompileExpression(std::string_view text, std::shared_ptr<const Expression>& out, std::string& err)
{
    err.clear();
    out.reset();

    const std::string_view src = TrimView(text);
    if (src.empty())
    {
        err = "empty expression";
        return false;
    }

    std::vector<Token> tokens;
    if (!Tokenize(src, tokens, err))
        return false;

    Parser parser(std::move(tokens));
    std::unique_ptr<Node> root = parser.ParseAll(err);
    if (!root)
        return false;
    out = std::make_shared<const Expression>(std::string(src), std::move(root));
    return true;
}

// ---------------------------------------------------------------------------
// Placeholders
// ---------------------------------------------------------------------------
void SplitPlaceholders(std::string_view text, const Notation& notation, std::vector<TextSegment>& out)
{
    out.clear();
    if (notation.begin.empty() || notation.end.empty())
    {
        out.push_back(TextSegment{false, std::string(text)});
        return;
    }

    std::size_t pos = 0;
    std::string literal;
    while (pos < text.size())
    {
        const std::size_t open = text.find(notation.begin, pos);
        if (open == std::string_view::npos)
            break;
        const std::size_t body = open + notation.begin.size();
        const std::size_t close = FindPlaceholderEnd(text, body, notation);
        if (close == std::string_view::npos)
            break;

        literal += std::string(text.substr(pos, open - pos));
        if (!literal.empty())
        {
            out.push_back(TextSegment{false, literal});
            literal.clear();
        }
        out.push_back(TextSegment{true, std::string(text.substr(body, close - body))});
        pos = close + notation.end.size();
    }
    literal += std::string(text.substr(pos));
    if (!literal.empty())
        out.push_back(TextSegment{false, literal});
}

bool ContainsPlaceholder(std::string_view text, const Notation& notation)
{
    if (notation.begin.empty() || text.find(notation.begin) == std::string_view::npos)
        return false;
    std::vector<TextSegment> segs;
    SplitPlaceholders(text, notation, segs);
    for (const auto& s : segs)
        if (s.expression)
            return true;
    return false;
}

std::string_view UnwrapPlaceholder(std::string_view text, const Notation& notation)
{
    const std::string_view t = TrimView(text);
    if (notation.begin.empty() || notation.end.empty())
        return t;
    if (t.size() < notation.begin.size() + notation.end.size())
        return t;
    if (t.substr(0, notation.begin.size()) != notation.begin)
        return t;
    const std::size_t close = FindPlaceholderEnd(t, notation.begin.size(), notation);
    if (close == std::string_view::npos || close + notation.end.size() != t.size())
        return t;
    return TrimView(t.substr(notation.begin.size(), close - notation.begin.size()));
}

// ---------------------------------------------------------------------------
// ExpressionEvaluator
// ---------------------------------------------------------------------------
bool ExpressionEvaluator::Compile(std::string_view text, std::shared_ptr<const Expression>& out, std::string& err)
{
    err.clear();
    const std::string key(text);
    auto it = m_cache.find(key);
    if (it != m_cache.end())
    {
        out = it->second;
        return true;
    }
    if (!CompileExpression(text, out, err))
        return false;
    m_cache.emplace(key, out);
    return true;
}

bool ExpressionEvaluator::Evaluate(std::string_view text, const EvalEnv& env, Value& out, EvalError& err)
{
    err = EvalError{};
    out = Value();
    std::shared_ptr<const Expression> expr;
    std::string cerr;
    if (!Compile(text, expr, cerr))
    {
        err.code = ErrorCode::MalformedExpression;
        err.message = "'" + std::string(text) + "': " + cerr;
        return false;
    }
    return expr->Evaluate(env, out, err);
}

bool ExpressionEvaluator::EvaluateCondition(std::string_view text, const EvalEnv& env, bool& out, EvalError& err)
{
    out = false;
    Value v;
    if (!Evaluate(text, env, v, err))
        return false;
    if (!ToCondition(v, out, err))
    {
        err.message = "condition '" + std::string(text) + "': " + err.message;
        return false;
    }
    return true;
}

bool ExpressionEvaluator::EvaluateText(std::string_view text,
                                       const Notation& notation,
                                       const EvalEnv& env,
                                       Value& out,
                                       EvalError& err)
{
    err = EvalError{};
    std::vector<TextSegment> segs;
    SplitPlaceholders(text, notation, segs);

    // Exactly one placeholder (surrounding whitespace aside) keeps its native type and
    // drops the whitespace.
    const TextSegment* only = nullptr;
    int expr_count = 0;
    bool other_text = false;
    for (const auto& s : segs)
    {
        if (s.expression)
        {
            ++expr_count;
            only = &s;
        }
        else if (!TrimView(s.text).empty())
        {
            other_text = true;
        }
    }
    if (expr_count == 0)
    {
        out = Value::FromString(std::string(text));
        return true;
    }
    if (expr_count == 1 && !other_text)
        return Evaluate(only->text, env, out, err);

    std::string joined;
    for (const auto& s : segs)
    {
        if (!s.expression)
        {
            joined += s.text;
            continue;
        }
        Value v;
        if (!Evaluate(s.text, env, v, err))
        {
            out = Value();
            return false;
        }
        joined += v.ToDisplayString();
    }
    out = Value::FromString(std::move(joined));
    return true;
}
} // namespace gridfill
