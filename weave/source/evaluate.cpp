// weave

#include "weave/canonical_type.hh"
#include "weave/fatal.hh"

#include "evaluate.hh"
#include "kernels.hh"

#include <cmath>
#include <cstring>

namespace weave {
    namespace {
        // one argument of a kernel as seen from a single lane
        struct Operand
        {
            float const* values = nullptr;
            uint32_t stride = 1;
            bool field = false;

            float const* lane(uint32_t index) const noexcept { return field ? values + index * stride : values; }
            float component(uint32_t index, uint32_t part) const noexcept { return lane(index)[stride == 1 ? 0 : part]; }
        };
    } // namespace

    wvFrameEvaluator::wvFrameEvaluator(wvProgramState& state) noexcept
        : state_(state), header_(state.header()), stamp_(wvFrameStamp(state))
    {
    }

    uint32_t wvFrameEvaluator::instanceCount(wvProgramInstanceIndex index)
    {
        uint32_t const slot = index.value();
        if (state_.instanceStamps[slot] == stamp_)
            return state_.instanceCounts[slot];

        wvProgramInstance const& instance = header_.instances[index];

        uint32_t count = instance.maxCount;
        if (instance.countExpr != wvInvalidIndex)
        {
            float const requested = evaluate(instance.countExpr)[0];
            if (!(requested > 0.f))
                count = 0;
            else if (requested < static_cast<float>(instance.maxCount))
                count = static_cast<uint32_t>(requested);
        }

        state_.instanceCounts[slot] = count;
        state_.instanceStamps[slot] = stamp_;
        return count;
    }

    float const* wvFrameEvaluator::evaluate(wvProgramExprIndex index)
    {
        wvProgramExpr const& expr = header_.exprs[index];

        // values that already live somewhere else are never copied
        switch (expr.kind)
        {
        case wvExprKind::Constant: return header_.floats.data() + expr.firstArg;
        case wvExprKind::External: return state_.externals.data() + expr.immediate * 4;
        case wvExprKind::SlotRead:
            if (state_.slotStamps[expr.immediate] != stamp_)
                wvFatal(wvRuntimeErrorCode::PhaseViolation, "slot read before it was written this frame");
            return state_.scratch.data() + state_.program->slotOffsets[wvProgramSlotIndex{expr.immediate}];
        case wvExprKind::StateRead: return state_.state.data() + state_.program->stateOffsets[wvProgramStateIndex{expr.immediate}];
        default: break;
        }

        if (state_.cacheStamps[index.value()] == stamp_)
            return state_.cache.data() + state_.program->exprOffsets[index];

        return compute(index, expr);
    }

    float const* wvFrameEvaluator::compute(wvProgramExprIndex index, wvProgramExpr const& expr)
    {
        float* const out = state_.cache.data() + state_.program->exprOffsets[index];
        uint32_t const stride = expr.stride;
        uint32_t const count = lanes(expr.instance);

        switch (expr.kind)
        {
        case wvExprKind::Time: out[0] = static_cast<float>(state_.timeMs - state_.startMs); break;
        case wvExprKind::DeltaTime: out[0] = static_cast<float>(state_.deltaMs); break;
        case wvExprKind::Kernel: kernel(expr, out); break;
        case wvExprKind::Broadcast: {
            float const* const signal = evaluate(wvProgramExprIndex{header_.args[expr.firstArg]});
            for (uint32_t lane = 0; lane != count; ++lane)
                std::memcpy(out + lane * stride, signal, stride * sizeof(float));
            break;
        }
        case wvExprKind::ElementIndex:
        case wvExprKind::ElementId:
            // elements of an instance are identified by their position
            for (uint32_t lane = 0; lane != count; ++lane)
                out[lane] = static_cast<float>(lane);
            break;
        case wvExprKind::ElementCount: out[0] = static_cast<float>(instanceCount(wvProgramInstanceIndex{expr.immediate})); break;
        case wvExprKind::Reduce: {
            wvProgramExprIndex const argIndex{header_.args[expr.firstArg]};
            float const* const field = evaluate(argIndex);
            uint32_t const elements = lanes(header_.exprs[argIndex].instance);
            wvReduceOp const op = static_cast<wvReduceOp>(expr.op);

            for (uint32_t component = 0; component != stride; ++component)
            {
                if (elements == 0)
                {
                    out[component] = 0.f;
                    continue;
                }

                float total = field[component];
                for (uint32_t lane = 1; lane != elements; ++lane)
                {
                    float const value = field[lane * stride + component];
                    switch (op)
                    {
                    case wvReduceOp::Sum:
                    case wvReduceOp::Mean: total += value; break;
                    case wvReduceOp::Min: total = value < total ? value : total; break;
                    case wvReduceOp::Max: total = value > total ? value : total; break;
                    }
                }
                out[component] = op == wvReduceOp::Mean ? total / static_cast<float>(elements) : total;
            }
            break;
        }
        case wvExprKind::Constant:
        case wvExprKind::External:
        case wvExprKind::SlotRead:
        case wvExprKind::StateRead: WV_ASSERT(false); break;
        }

        state_.cacheStamps[index.value()] = stamp_;
        return out;
    }

    void wvFrameEvaluator::kernel(wvProgramExpr const& expr, float* out_values)
    {
        Operand operands[wvMaxStride];
        for (uint32_t arg = 0; arg != expr.argCount; ++arg)
        {
            wvProgramExprIndex const argIndex{header_.args[expr.firstArg + arg]};
            wvProgramExpr const& argExpr = header_.exprs[argIndex];
            operands[arg] = {.values = evaluate(argIndex), .stride = argExpr.stride, .field = argExpr.field != 0};
        }

        wvOpCode const op = static_cast<wvOpCode>(expr.op);
        uint32_t const stride = expr.stride;
        uint32_t const count = lanes(expr.instance);

        for (uint32_t lane = 0; lane != count; ++lane)
        {
            float* const out = out_values + lane * stride;
            switch (op)
            {
            case wvOpCode::Component: out[0] = operands[0].lane(lane)[expr.immediate]; break;
            case wvOpCode::Pack: {
                uint32_t written = 0;
                for (uint32_t arg = 0; arg != expr.argCount; ++arg)
                {
                    std::memcpy(out + written, operands[arg].lane(lane), operands[arg].stride * sizeof(float));
                    written += operands[arg].stride;
                }
                break;
            }
            case wvOpCode::HsvToRgb:
                wvHsvToRgb(operands[0].lane(lane)[0], operands[1].lane(lane)[0], operands[2].lane(lane)[0], out);
                break;
            default:
                for (uint32_t component = 0; component != stride; ++component)
                {
                    float values[3] = {};
                    for (uint32_t arg = 0; arg != expr.argCount && arg != 3; ++arg)
                        values[arg] = operands[arg].component(lane, component);
                    out[component] = wvApplyOp(op, values[0], values[1], values[2]);
                }
                break;
            }
        }
    }
} // namespace weave
