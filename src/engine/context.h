#pragma once

#include "core/value.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gridfill
{
using ScopeId = std::uint32_t;
static constexpr ScopeId kRootScope = 0;

// Chained variable scopes stored in an index-addressed arena.
//
// Each frame records its parent's index and is never modified after Push(). Lookup walks
// from a frame toward the root. Frames are released in stack order (Mark/Release or the
// Scope guard) once the subtree that needed them has been rendered, so sibling iterations
// can never observe each other's bindings.
class Context
{
public:
    using Bindings = std::vector<std::pair<std::string, Value>>;

    // `root` should be a Mapping; its members become the root frame's names.
    explicit Context(Value root = Value::FromMapping({}));

    // Creates a child of `parent` holding `bindings`. When `fields` is a Mapping its members
    // are visible too, behind the explicit bindings.
    ScopeId Push(ScopeId parent, Bindings bindings, Value fields = Value());

    // Innermost binding of `name` visible from `scope`, or nullptr.
    const Value* Lookup(ScopeId scope, std::string_view name) const;

    ScopeId Parent(ScopeId scope) const { return m_frames[scope].parent; }
    std::size_t FrameCount() const { return m_frames.size(); }

    std::size_t Mark() const { return m_frames.size(); }
    // Drops every frame created after `mark`. The root frame is never dropped.
    void Release(std::size_t mark);

    // Pushes on construction, releases on destruction.
    class Scope
    {
    public:
        Scope(Context& ctx, ScopeId parent, Bindings bindings, Value fields = Value());
        ~Scope();
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        ScopeId Id() const { return m_id; }

    private:
        Context& m_ctx;
        std::size_t m_mark = 0;
        ScopeId m_id = kRootScope;
    };

private:
    struct Frame
    {
        ScopeId parent = kRootScope;
        Bindings bindings;
        Value fields;
    };

    std::vector<Frame> m_frames;
};
} // namespace gridfill
