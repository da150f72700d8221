#include "engine/context.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace gridfill;

TEST(Context, RootMembersAreVisible)
{
    Context ctx(test::ParseData(R"({"title": "Report", "count": 3})"));
    const Value* title = ctx.Lookup(kRootScope, "title");
    ASSERT_NE(title, nullptr);
    EXPECT_EQ(title->AsString(), "Report");
    EXPECT_EQ(ctx.Lookup(kRootScope, "missing"), nullptr);
}

TEST(Context, ChildBindingsShadowParents)
{
    Context ctx(test::ParseData(R"({"e": "root", "title": "Report"})"));
    const ScopeId child = ctx.Push(kRootScope, {{"e", Value::FromString("child")}});

    EXPECT_EQ(ctx.Lookup(child, "e")->AsString(), "child");
    EXPECT_EQ(ctx.Lookup(child, "title")->AsString(), "Report");
    EXPECT_EQ(ctx.Lookup(kRootScope, "e")->AsString(), "root");
    EXPECT_EQ(ctx.Parent(child), kRootScope);
}

TEST(Context, FieldsSitBehindExplicitBindings)
{
    Context ctx;
    const Value item = test::ParseData(R"({"name": "Alice", "e": "field"})");
    const ScopeId s = ctx.Push(kRootScope, {{"e", item}}, item);

    ASSERT_NE(ctx.Lookup(s, "name"), nullptr);
    EXPECT_EQ(ctx.Lookup(s, "name")->AsString(), "Alice");
    EXPECT_TRUE(ctx.Lookup(s, "e")->IsMapping());
}

TEST(Context, ScopeGuardReleasesFrames)
{
    Context ctx;
    const std::size_t before = ctx.FrameCount();
    {
        Context::Scope outer(ctx, kRootScope, {{"i", Value::FromNumber(0)}});
        {
            Context::Scope inner(ctx, outer.Id(), {{"j", Value::FromNumber(1)}});
            EXPECT_EQ(ctx.FrameCount(), before + 2);
            EXPECT_EQ(ctx.Lookup(inner.Id(), "i")->AsNumber(), 0);
        }
        EXPECT_EQ(ctx.FrameCount(), before + 1);
    }
    EXPECT_EQ(ctx.FrameCount(), before);
}

TEST(Context, SiblingScopesDoNotSeeEachOther)
{
    Context ctx;
    ScopeId first = kRootScope;
    {
        Context::Scope a(ctx, kRootScope, {{"x", Value::FromNumber(1)}});
        first = a.Id();
    }
    Context::Scope b(ctx, kRootScope, {{"y", Value::FromNumber(2)}});
    // The slot is reused by the second sibling.
    EXPECT_EQ(b.Id(), first);
    EXPECT_EQ(ctx.Lookup(b.Id(), "x"), nullptr);
    EXPECT_NE(ctx.Lookup(b.Id(), "y"), nullptr);
}

TEST(Context, ReleaseNeverDropsTheRoot)
{
    Context ctx(test::ParseData(R"({"a": 1})"));
    ctx.Push(kRootScope, {});
    ctx.Release(0);
    EXPECT_EQ(ctx.FrameCount(), 1u);
    EXPECT_NE(ctx.Lookup(kRootScope, "a"), nullptr);
}
