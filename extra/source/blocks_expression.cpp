// weave

#include "weave/blocks.hh"
#include "weave/expression_compiler.hh"
#include "weave/lower.hh"

#include "blocks_internal.hh"

#include <cstring>

namespace weave {
    namespace {
        constexpr wvInputPortIndex in0{0};
        constexpr wvOutputPortIndex out0{0};

        // a..h name the operands in connection order; t, dt, i, n and u name time and element context
        class ExpressionBlockHost final : public wvExpressionHost
        {
        public:
            explicit ExpressionBlockHost(wvInstanceId instance) noexcept : instance_(instance) {}

            wvExprId lookupIdentifier(wvName name, wvLowerContext& context) override
            {
                char const* const end = name.nameEnd != nullptr ? name.nameEnd : name.name + std::strlen(name.name);
                if (end - name.name == 1 && name.name[0] >= 'a' && name.name[0] <= 'h')
                {
                    uint32_t const operand = static_cast<uint32_t>(name.name[0] - 'a');
                    if (operand >= context.inputElementCount(in0))
                        return wvInvalidExprId;
                    return context.input(in0, operand);
                }

                switch (wvHashName(name.name, name.nameEnd))
                {
                case wvHashName("t"): return context.time();
                case wvHashName("dt"): return context.deltaTime();
                case wvHashName("i"): return instance_ != wvInvalidInstanceId ? context.elementIndex(instance_) : wvInvalidExprId;
                case wvHashName("n"): return instance_ != wvInvalidInstanceId ? context.elementCount(instance_) : wvInvalidExprId;
                case wvHashName("u"): return instance_ != wvInvalidInstanceId ? normalized(context) : wvInvalidExprId;
                default: return wvInvalidExprId;
                }
            }

        private:
            wvExprId normalized(wvLowerContext& context)
            {
                wvExprId const last = context.kernel(wvOpCode::Max,
                    context.kernel(wvOpCode::Sub, context.elementCount(instance_), context.constant(1.f)), context.constant(1.f));
                return context.kernel(wvOpCode::Div, context.elementIndex(instance_), last);
            }

            wvInstanceId instance_;
        };
    } // namespace

    bool wvLowerExpressionBlock(wvLowerContext& context, void* userData)
    {
        if (userData == nullptr)
            return false;
        wvStandardCatalog const& catalog = *static_cast<wvStandardCatalog const*>(userData);

        wvName text;
        if (!wvParamText(context, "expression", text))
        {
            context.error(wvCompileErrorCode::ExpressionCompileError, "expression block has no expression");
            return false;
        }

        wvExpressionCompiler* const compiler = wvCreateExpressionCompiler(catalog.allocator());
        if (!compiler->compile(text.name, text.nameEnd) || !compiler->optimize())
        {
            context.error(wvCompileErrorCode::ExpressionCompileError, "expression does not parse", compiler->errorOffset());
            wvDestroyExpressionCompiler(compiler);
            return false;
        }

        ExpressionBlockHost host(wvOutputInstance(context, out0));
        wvExprId const value = compiler->build(context, host);
        wvDestroyExpressionCompiler(compiler);

        context.setOutput(out0, value);
        return value != wvInvalidExprId;
    }
} // namespace weave
