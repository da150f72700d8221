#include "engine/context.h"

namespace gridfill
{
Context::Context(Value root)
{
    Frame f;
    f.parent = kRootScope;
    f.fields = std::move(root);
    m_frames.push_back(std::move(f));
}

ScopeId Context::Push(ScopeId parent, Bindings bindings, Value fields)
{
    Frame f;
    f.parent = parent < m_frames.size() ? parent : kRootScope;
    f.bindings = std::move(bindings);
    f.fields = std::move(fields);
    m_frames.push_back(std::move(f));
    return (ScopeId)(m_frames.size() - 1);
}

const Value* Context::Lookup(ScopeId scope, std::string_view name) const
{
    if (scope >= m_frames.size())
        return nullptr;
    ScopeId cur = scope;
    for (;;)
    {
        const Frame& f = m_frames[cur];
        // Later bindings shadow earlier ones within a frame.
        for (auto it = f.bindings.rbegin(); it != f.bindings.rend(); ++it)
            if (it->first == name)
                return &it->second;
        if (const Value* v = f.fields.Member(name))
            return v;
        if (cur == kRootScope)
            return nullptr;
        cur = f.parent;
    }
}

void Context::Release(std::size_t mark)
{
    if (mark < 1)
        mark = 1;
    if (mark < m_frames.size())
        m_frames.resize(mark);
}

Context::Scope::Scope(Context& ctx, ScopeId parent, Bindings bindings, Value fields)
    : m_ctx(ctx)
    , m_mark(ctx.Mark())
{
    m_id = ctx.Push(parent, std::move(bindings), std::move(fields));
}

Context::Scope::~Scope()
{
    m_ctx.Release(m_mark);
}
} // namespace gridfill
