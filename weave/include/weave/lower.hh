// weave

#pragma once

#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"
#include "weave/continuity.hh"
#include "weave/key.hh"
#include "weave/ops.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    // identifiers valid only for the duration of a single compile
    WV_DEFINE_KEY(wvExprId, uint32_t);
    WV_DEFINE_KEY(wvStateId, uint32_t);

    static constexpr wvExprId wvInvalidExprId{~uint32_t{0}};
    static constexpr wvStateId wvInvalidStateId{~uint32_t{0}};

    /// Interface handed to a node's lowering function.
    ///
    /// Builders return wvInvalidExprId on failure and accept invalid
    /// arguments silently, so a lowering function can chain calls and
    /// check once at the end; the first failure is already reported.
    class wvLowerContext
    {
    public:
        // node queries
        virtual wvNodeId nodeId() const noexcept = 0;
        virtual wvNodeTypeId nodeTypeId() const noexcept = 0;
        virtual wvInstanceId nodeInstance() const noexcept = 0;

        // number of elements bound to an input; always 1 for non-vararg ports
        virtual uint32_t inputElementCount(wvInputPortIndex port) const noexcept = 0;
        virtual wvCanonicalType inputType(wvInputPortIndex port, uint32_t element = 0) const noexcept = 0;
        virtual wvCanonicalType outputType(wvOutputPortIndex port) const noexcept = 0;
        virtual wvExprId input(wvInputPortIndex port, uint32_t element = 0) = 0;

        virtual bool findParam(char const* name, wvParamValue& out_value) const noexcept = 0;

        // expression queries
        virtual uint32_t stride(wvExprId expr) const noexcept = 0;
        virtual bool isField(wvExprId expr) const noexcept = 0;
        virtual wvInstanceId instanceOf(wvExprId expr) const noexcept = 0;

        // expression builders
        virtual wvExprId constant(float const* values, uint32_t count) = 0;
        virtual wvExprId time() = 0;
        virtual wvExprId deltaTime() = 0;
        virtual wvExprId external(wvName name, float const* defaults, uint32_t stride) = 0;
        virtual wvExprId kernel(wvOpCode op, wvExprId const* args, uint32_t argCount, uint32_t immediate = 0) = 0;
        virtual wvExprId broadcast(wvExprId signal, wvInstanceId instance) = 0;
        virtual wvExprId elementIndex(wvInstanceId instance) = 0;
        virtual wvExprId elementCount(wvInstanceId instance) = 0;
        virtual wvExprId elementId(wvInstanceId instance) = 0;
        virtual wvExprId reduce(wvReduceOp op, wvExprId field) = 0;
        virtual wvExprId readState(wvStateId state) = 0;

        // side effects
        virtual wvStateId allocState(char const* key, float const* initial, uint32_t stride,
            wvInstanceId perElement = wvInvalidInstanceId) = 0;
        virtual void writeState(wvStateId state, wvExprId value) = 0;
        virtual bool declareInstance(uint32_t maxCount, wvExprId count = wvInvalidExprId) = 0;
        virtual wvExprId emitEvent(char const* key, wvExprId predicate) = 0;
        virtual void emitRender(wvExprId position, wvExprId color, wvExprId size) = 0;
        virtual void emitOutput(wvName name, wvExprId value) = 0;
        virtual wvExprId applyContinuity(wvExprId field, wvContinuitySpec const& spec) = 0;
        virtual void setOutput(wvOutputPortIndex port, wvExprId value) = 0;
        virtual void error(char const* message) = 0;
        // reports a specific code; detail lands in the error's count
        virtual void error(wvCompileErrorCode code, char const* message, uint32_t detail = 0) = 0;

        // conveniences
        wvExprId constant(float value) { return constant(&value, 1); }
        wvExprId kernel(wvOpCode op, wvExprId arg) { return kernel(op, &arg, 1); }
        wvExprId kernel(wvOpCode op, wvExprId left, wvExprId right)
        {
            wvExprId const args[] = {left, right};
            return kernel(op, args, 2);
        }
        wvExprId kernel(wvOpCode op, wvExprId first, wvExprId second, wvExprId third)
        {
            wvExprId const args[] = {first, second, third};
            return kernel(op, args, 3);
        }

        float paramFloat(char const* name, float fallback) const noexcept
        {
            wvParamValue value;
            if (!findParam(name, value) || value.count == 0)
                return fallback;
            return value.values[0];
        }

    protected:
        ~wvLowerContext() = default;
    };
} // namespace weave
