// weave

#pragma once

#include "weave/export.hh"
#include "weave/lower.hh"
#include "weave/types.hh"

namespace weave {
    class wvAllocator;

    // resolves the free identifiers of an expression while it is lowered
    class wvExpressionHost
    {
    public:
        virtual wvExprId lookupIdentifier(wvName name, wvLowerContext& context) = 0;

    protected:
        ~wvExpressionHost() = default;
    };

    class wvExpressionCompiler
    {
    public:
        virtual void reset() = 0;

        [[nodiscard]] virtual bool compile(char const* expression, char const* expressionEnd = nullptr) = 0;
        [[nodiscard]] virtual bool optimize() = 0;

        // lowers into IR through the context; wvInvalidExprId on failure
        [[nodiscard]] virtual wvExprId build(wvLowerContext& context, wvExpressionHost& host) = 0;

        [[nodiscard]] virtual bool isEmpty() const noexcept = 0;
        [[nodiscard]] virtual bool isConstant() const noexcept = 0;
        [[nodiscard]] virtual bool asConstant(float& out_value) const noexcept = 0;

        // byte offset of the first problem found by compile()
        [[nodiscard]] virtual uint32_t errorOffset() const noexcept = 0;

    protected:
        ~wvExpressionCompiler() = default;
    };

    WV_API [[nodiscard]] wvExpressionCompiler* wvCreateExpressionCompiler(wvAllocator& alloc);
    WV_API void wvDestroyExpressionCompiler(wvExpressionCompiler* compiler);
} // namespace weave
