#include "engine/expression.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace gridfill;

namespace
{
class ExpressionTest : public ::testing::Test
{
protected:
    ExpressionTest()
        : m_context(test::ParseData(R"({
              "x": 3,
              "name": "Alice",
              "nothing": null,
              "e": {"name": "Bob", "salary": 6000, "tags": ["a", "b"]},
              "link": {"$hyperlink": "https://example.com", "label": "Example"}
          })"))
    {
    }

    Value Eval(const std::string& text)
    {
        Value v;
        EvalError err;
        EXPECT_TRUE(m_eval.Evaluate(text, Env(), v, err)) << text << ": " << err.message;
        return v;
    }

    ErrorCode EvalFailure(const std::string& text)
    {
        Value v;
        EvalError err;
        EXPECT_FALSE(m_eval.Evaluate(text, Env(), v, err)) << text;
        return err.code;
    }

    EvalEnv Env(int row = -1, int col = -1) const
    {
        EvalEnv env;
        env.context = &m_context;
        env.row = row;
        env.col = col;
        return env;
    }

    Context m_context;
    ExpressionEvaluator m_eval;
};
} // namespace

TEST_F(ExpressionTest, Arithmetic)
{
    EXPECT_EQ(Eval("1 + 2 * 3").AsNumber(), 7);
    EXPECT_EQ(Eval("(1 + 2) * 3").AsNumber(), 9);
    EXPECT_EQ(Eval("7 % 4").AsNumber(), 3);
    EXPECT_EQ(Eval("-x + 1").AsNumber(), -2);
    EXPECT_EQ(Eval("x / 2").AsNumber(), 1.5);
    EXPECT_EQ(Eval("1.5e2").AsNumber(), 150);
    EXPECT_EQ(EvalFailure("x / 0"), ErrorCode::TypeMismatch);
    EXPECT_EQ(EvalFailure("name * 2"), ErrorCode::TypeMismatch);
}

TEST_F(ExpressionTest, PlusConcatenatesWhenEitherSideIsText)
{
    EXPECT_EQ(Eval("'n=' + x").AsString(), "n=3");
    EXPECT_EQ(Eval("name + \" \" + e.name").AsString(), "Alice Bob");
}

TEST_F(ExpressionTest, Comparisons)
{
    EXPECT_TRUE(Eval("2 < 10").AsBool());
    EXPECT_TRUE(Eval("e.salary >= 6000").AsBool());
    EXPECT_TRUE(Eval("'b' > 'a'").AsBool());
    EXPECT_TRUE(Eval("name == 'Alice'").AsBool());
    EXPECT_TRUE(Eval("nothing == null").AsBool());
    EXPECT_TRUE(Eval("x != '3'").AsBool());
    EXPECT_EQ(EvalFailure("x < 'a'"), ErrorCode::TypeMismatch);
}

TEST_F(ExpressionTest, LogicShortCircuits)
{
    EXPECT_TRUE(Eval("true && !false").AsBool());
    EXPECT_TRUE(Eval("not false and x > 1").AsBool());
    EXPECT_TRUE(Eval("x > 1 or nosuch").AsBool());
    EXPECT_FALSE(Eval("false && nosuch").AsBool());
    EXPECT_FALSE(Eval("nothing || false").AsBool());
    EXPECT_EQ(EvalFailure("x && true"), ErrorCode::TypeMismatch);
}

TEST_F(ExpressionTest, Conditional)
{
    EXPECT_EQ(Eval("x > 1 ? 'big' : 'small'").AsString(), "big");
    EXPECT_EQ(Eval("x > 5 ? 'big' : x > 2 ? 'medium' : 'small'").AsString(), "medium");
}

TEST_F(ExpressionTest, MemberAccess)
{
    EXPECT_EQ(Eval("e.name").AsString(), "Bob");
    EXPECT_TRUE(Eval("e.missing").IsNull());
    EXPECT_TRUE(Eval("nothing.deeper.still").IsNull());
    EXPECT_EQ(Eval("link.url").AsString(), "https://example.com");
    EXPECT_EQ(EvalFailure("x.field"), ErrorCode::TypeMismatch);
    EXPECT_EQ(EvalFailure("nosuch"), ErrorCode::UnresolvedVariable);
}

TEST_F(ExpressionTest, BuiltInFunctions)
{
    EXPECT_EQ(Eval("len(e.tags)").AsNumber(), 2);
    EXPECT_EQ(Eval("len(name)").AsNumber(), 5);
    EXPECT_EQ(Eval("len(nothing)").AsNumber(), 0);
    EXPECT_EQ(Eval("upper(name)").AsString(), "ALICE");
    EXPECT_EQ(Eval("lower('MiXeD')").AsString(), "mixed");
    EXPECT_EQ(Eval("default(nosuch, 'fallback')").AsString(), "fallback");
    EXPECT_EQ(Eval("default(nothing, 0)").AsNumber(), 0);
    EXPECT_EQ(Eval("default(name, 'fallback')").AsString(), "Alice");
    EXPECT_EQ(EvalFailure("len(x)"), ErrorCode::TypeMismatch);

    const Value link = Eval("hyperlink('https://example.com/' + e.name, e.name)");
    ASSERT_TRUE(link.IsHyperlink());
    EXPECT_EQ(link.AsHyperlink().url, "https://example.com/Bob");
    EXPECT_EQ(link.AsHyperlink().label, "Bob");
}

TEST_F(ExpressionTest, RowAndColumnOfTheRenderedCell)
{
    Value v;
    EvalError err;
    ASSERT_TRUE(m_eval.Evaluate("_row", Env(4, 2), v, err));
    EXPECT_EQ(v.AsNumber(), 5);
    ASSERT_TRUE(m_eval.Evaluate("_col", Env(4, 2), v, err));
    EXPECT_EQ(v.AsNumber(), 2);
    EXPECT_FALSE(m_eval.Evaluate("_row", Env(), v, err));
    EXPECT_EQ(err.code, ErrorCode::UnresolvedVariable);
}

TEST_F(ExpressionTest, SyntaxErrorsAreMalformedExpressions)
{
    EXPECT_EQ(EvalFailure("1 +"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("frobnicate(1)"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("len()"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("'open"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("a # b"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("(x"), ErrorCode::MalformedExpression);
    EXPECT_EQ(EvalFailure("x ? 1"), ErrorCode::MalformedExpression);

    std::shared_ptr<const Expression> expr;
    std::string err;
    EXPECT_FALSE(CompileExpression("   ", expr, err));
    EXPECT_EQ(err, "empty expression");
}

TEST_F(ExpressionTest, ConditionsAcceptOnlyBooleansAndNull)
{
    bool out = true;
    EvalError err;
    ASSERT_TRUE(m_eval.EvaluateCondition("nothing", Env(), out, err));
    EXPECT_FALSE(out);
    ASSERT_TRUE(m_eval.EvaluateCondition("x == 3", Env(), out, err));
    EXPECT_TRUE(out);
    EXPECT_FALSE(m_eval.EvaluateCondition("x", Env(), out, err));
    EXPECT_EQ(err.code, ErrorCode::TypeMismatch);
}

TEST_F(ExpressionTest, CompiledExpressionsAreCached)
{
    Eval("x + 1");
    Eval("x + 1");
    Eval("x + 2");
    EXPECT_EQ(m_eval.CacheSize(), 2u);
}

TEST(Placeholders, SplitsLiteralAndExpressionSegments)
{
    const Notation n;
    std::vector<TextSegment> segs;
    SplitPlaceholders("Hi ${e.name}!", n, segs);
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_FALSE(segs[0].expression);
    EXPECT_EQ(segs[0].text, "Hi ");
    EXPECT_TRUE(segs[1].expression);
    EXPECT_EQ(segs[1].text, "e.name");
    EXPECT_EQ(segs[2].text, "!");

    SplitPlaceholders("${'}' + x}", n, segs);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].text, "'}' + x");

    SplitPlaceholders("cost ${unterminated", n, segs);
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_FALSE(segs[0].expression);
    EXPECT_EQ(segs[0].text, "cost ${unterminated");
}

TEST(Placeholders, DetectionAndUnwrapping)
{
    const Notation n;
    EXPECT_TRUE(ContainsPlaceholder("a ${b} c", n));
    EXPECT_FALSE(ContainsPlaceholder("plain", n));
    EXPECT_FALSE(ContainsPlaceholder("${open", n));

    EXPECT_EQ(UnwrapPlaceholder("${employees}", n), "employees");
    EXPECT_EQ(UnwrapPlaceholder("  employees ", n), "employees");
    EXPECT_EQ(UnwrapPlaceholder("${a}${b}", n), "${a}${b}");

    Notation mustache;
    mustache.begin = "{{";
    mustache.end = "}}";
    EXPECT_TRUE(ContainsPlaceholder("{{ x }}", mustache));
    EXPECT_FALSE(ContainsPlaceholder("${x}", mustache));
    EXPECT_EQ(UnwrapPlaceholder("{{ items }}", mustache), "items");
}

TEST_F(ExpressionTest, TextSubstitutionKeepsTypeOfASinglePlaceholder)
{
    const Notation n;
    Value v;
    EvalError err;

    ASSERT_TRUE(m_eval.EvaluateText("${x}", n, Env(), v, err));
    ASSERT_TRUE(v.IsNumber());
    EXPECT_EQ(v.AsNumber(), 3);

    ASSERT_TRUE(m_eval.EvaluateText(" ${nothing} ", n, Env(), v, err));
    EXPECT_TRUE(v.IsNull());

    // Whitespace around a lone placeholder is layout, not content.
    ASSERT_TRUE(m_eval.EvaluateText("\t ${x}  ", n, Env(), v, err));
    ASSERT_TRUE(v.IsNumber());
    EXPECT_EQ(v.AsNumber(), 3);
    ASSERT_TRUE(m_eval.EvaluateText("= ${x} ", n, Env(), v, err));
    EXPECT_EQ(v.AsString(), "= 3 ");

    ASSERT_TRUE(m_eval.EvaluateText("x=${x}, ${nothing}!", n, Env(), v, err));
    EXPECT_EQ(v.AsString(), "x=3, !");

    ASSERT_TRUE(m_eval.EvaluateText("no placeholders", n, Env(), v, err));
    EXPECT_EQ(v.AsString(), "no placeholders");

    EXPECT_FALSE(m_eval.EvaluateText("a ${nosuch} b", n, Env(), v, err));
    EXPECT_EQ(err.code, ErrorCode::UnresolvedVariable);
    EXPECT_TRUE(v.IsNull());
}
