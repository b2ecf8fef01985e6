// weave

#include "weave/log.hh"

#include "lowering.hh"
#include "passes.hh"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>

namespace weave {
    namespace {
        constexpr uint32_t invalid = ~uint32_t{0};

        // resources are slots followed by one mapping per continuity record
        class StepGraph
        {
        public:
            StepGraph(wvAllocator& alloc, wvIrBuilder const& ir) noexcept
                : ir_(ir), steps_(alloc), writer_(alloc), reads_(alloc), readStart_(alloc), visited_(alloc), stack_(alloc)
            {
            }

            void build();
            bool sort(wvArray<wvProgramStep>& out_order);

            uint32_t leftover() const noexcept { return leftover_; }

        private:
            uint32_t mappingResource(uint32_t continuity) const noexcept { return ir_.slots.size() + continuity; }

            void readExpr(wvProgramExprIndex root);
            void readInstance(wvProgramInstanceIndex instance);
            void readResource(uint32_t resource);

            wvIrBuilder const& ir_;
            wvArray<uint32_t> steps_;     // ir step indices of phase 1
            wvArray<uint32_t> writer_;    // phase 1 position per resource
            wvArray<uint32_t> reads_;     // resources read, per step
            wvArray<uint32_t> readStart_; // offsets into reads_
            wvArray<uint32_t> visited_;   // expression stamps
            wvArray<uint32_t> stack_;
            uint32_t stamp_ = 0;
            uint32_t leftover_ = 0;
        };

        void StepGraph::readResource(uint32_t resource) { reads_.pushBack(resource); }

        void StepGraph::readInstance(wvProgramInstanceIndex instance)
        {
            if (instance == wvInvalidIndex)
                return;
            wvProgramExprIndex const count = ir_.instances[instance.value()].countExpr;
            if (count != wvInvalidIndex && visited_[count.value()] != stamp_)
                stack_.pushBack(count.value());
        }

        void StepGraph::readExpr(wvProgramExprIndex root)
        {
            stack_.clear();
            stack_.pushBack(root.value());

            while (!stack_.empty())
            {
                uint32_t const index = stack_.popBack();
                if (visited_[index] == stamp_)
                    continue;
                visited_[index] = stamp_;

                wvProgramExpr const& expr = ir_.expr(index);
                if (expr.kind == wvExprKind::SlotRead)
                    readResource(expr.immediate);
                if (expr.kind == wvExprKind::ElementCount)
                    readInstance(wvProgramInstanceIndex{expr.immediate});

                // lane counts of fields come from the instance count
                readInstance(expr.instance);

                if (expr.kind == wvExprKind::Constant)
                    continue;
                for (uint32_t arg = 0; arg != expr.argCount; ++arg)
                    stack_.pushBack(ir_.arg(index, arg));
            }
        }

        void StepGraph::build()
        {
            writer_.resize(ir_.slots.size() + ir_.continuity.size(), invalid);
            visited_.resize(ir_.exprs.size(), 0);

            for (uint32_t index = 0; index != ir_.steps.size(); ++index)
                if (!ir_.steps[index].phase2)
                    steps_.pushBack(index);

            for (uint32_t position = 0; position != steps_.size(); ++position)
            {
                wvProgramStep const& step = ir_.steps[steps_[position]].step;
                readStart_.pushBack(reads_.size());
                ++stamp_;

                switch (step.kind)
                {
                case wvStepKind::EvalSignal:
                case wvStepKind::MaterializeField:
                case wvStepKind::EvalEvent:
                    readExpr(step.expr);
                    writer_[step.slot.value()] = position;
                    break;
                case wvStepKind::WriteSlot:
                    readResource(step.slot.value());
                    break;
                case wvStepKind::BuildContinuityMapping: {
                    wvProgramContinuity const& record = ir_.continuity[step.target];
                    stack_.clear();
                    readInstance(record.instance);
                    if (!stack_.empty())
                        readExpr(wvProgramExprIndex{stack_.back()});
                    writer_[mappingResource(step.target)] = position;
                    break;
                }
                case wvStepKind::ApplyContinuity: {
                    wvProgramContinuity const& record = ir_.continuity[step.target];
                    readResource(record.inputSlot.value());
                    readResource(mappingResource(step.target));
                    writer_[step.slot.value()] = position;
                    break;
                }
                case wvStepKind::RenderEmit: {
                    wvProgramRender const& render = ir_.renders[step.target];
                    readResource(render.positionSlot.value());
                    readResource(render.colorSlot.value());
                    readResource(render.sizeSlot.value());
                    break;
                }
                case wvStepKind::WriteStateScalar:
                case wvStepKind::WriteStateField:
                    WV_ASSERT(false);
                    break;
                }
            }
            readStart_.pushBack(reads_.size());
        }

        bool StepGraph::sort(wvArray<wvProgramStep>& out_order)
        {
            uint32_t const count = steps_.size();
            wvAllocator& alloc = reads_.allocator();

            wvArray<uint32_t> indegree(alloc);
            wvArray<uint32_t> successorStart(alloc);
            wvArray<uint32_t> successors(alloc);
            indegree.resize(count, 0);
            successorStart.resize(count + 1, 0);

            // one edge per read with a writer; a step reading its own slot never becomes ready
            auto const writerOf = [&](uint32_t read) noexcept { return writer_[reads_[read]]; };
            for (uint32_t position = 0; position != count; ++position)
            {
                for (uint32_t read = readStart_[position]; read != readStart_[position + 1]; ++read)
                {
                    uint32_t const writer = writerOf(read);
                    if (writer == invalid)
                        continue;
                    ++indegree[position];
                    ++successorStart[writer + 1];
                }
            }
            for (uint32_t position = 0; position != count; ++position)
                successorStart[position + 1] += successorStart[position];

            wvArray<uint32_t> cursor(alloc);
            cursor.assign(successorStart.data(), count);
            successors.resize(successorStart[count], invalid);
            for (uint32_t position = 0; position != count; ++position)
            {
                for (uint32_t read = readStart_[position]; read != readStart_[position + 1]; ++read)
                {
                    uint32_t const writer = writerOf(read);
                    if (writer == invalid)
                        continue;
                    successors[cursor[writer]++] = position;
                }
            }

            // ready steps in a min-heap, so the earliest created step runs first
            wvArray<uint32_t> ready(alloc);
            for (uint32_t position = 0; position != count; ++position)
                if (indegree[position] == 0)
                    ready.pushBack(position);
            std::make_heap(ready.begin(), ready.end(), std::greater<>{});

            while (!ready.empty())
            {
                std::pop_heap(ready.begin(), ready.end(), std::greater<>{});
                uint32_t const position = ready.popBack();
                out_order.pushBack(ir_.steps[steps_[position]].step);

                for (uint32_t edge = successorStart[position]; edge != successorStart[position + 1]; ++edge)
                {
                    uint32_t const next = successors[edge];
                    if (--indegree[next] == 0)
                    {
                        ready.pushBack(next);
                        std::push_heap(ready.begin(), ready.end(), std::greater<>{});
                    }
                }
            }

            leftover_ = count - out_order.size();
            return leftover_ == 0;
        }
    } // namespace

    bool wvBuildSchedule(wvPassContext& context, wvIrBuilder const& ir, wvArray<wvProgramStep>& out_phase1,
        wvArray<wvProgramStep>& out_phase2)
    {
        out_phase1.clear();
        out_phase2.clear();

        StepGraph graph(context.allocator(), ir);
        graph.build();
        if (!graph.sort(out_phase1))
        {
            SPDLOG_LOGGER_ERROR(wvLog(), "schedule: {} steps are part of a dependency cycle", graph.leftover());
            return context.error({.code = wvCompileErrorCode::ScheduleCycle, .count = graph.leftover()});
        }

        // state commits keep the order lowering produced them in
        for (wvIrStep const& step : ir.steps)
            if (step.phase2)
                out_phase2.pushBack(step.step);

        return true;
    }
} // namespace weave
