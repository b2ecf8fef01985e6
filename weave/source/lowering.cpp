// weave

#include "lowering.hh"

#include "weave/log.hh"
#include "weave/program.hh"

#include "passes.hh"
#include "utility.hh"

#include <spdlog/spdlog.h>

namespace weave {
    namespace {
        constexpr uint32_t invalid = ~uint32_t{0};

        class NodeLowering final : public wvLowerContext
        {
        public:
            NodeLowering(wvPassContext& context, wvGraph const& graph, wvTypeInference const& inference, wvIrBuilder& ir) noexcept
                : context_(context), graph_(graph), inference_(inference), ir_(ir), incomingStart_(context.allocator()),
                  incoming_(context.allocator()), outputBase_(context.allocator()), outputExpr_(context.allocator()),
                  placeholder_(context.allocator()), slotOfExpr_(context.allocator()), declared_(context.allocator()),
                  instanceUser_(context.allocator()), stateWritten_(context.allocator())
            {
            }

            bool run(wvArray<uint32_t> const& order);

            using wvLowerContext::constant;
            using wvLowerContext::kernel;

            // node queries
            wvNodeId nodeId() const noexcept override { return node().nodeId; }
            wvNodeTypeId nodeTypeId() const noexcept override { return node().typeId; }
            wvInstanceId nodeInstance() const noexcept override { return wvNodeInstanceId(node().nodeId); }

            uint32_t inputElementCount(wvInputPortIndex port) const noexcept override;
            wvCanonicalType inputType(wvInputPortIndex port, uint32_t element) const noexcept override;
            wvCanonicalType outputType(wvOutputPortIndex port) const noexcept override;
            wvExprId input(wvInputPortIndex port, uint32_t element) override;

            bool findParam(char const* name, wvParamValue& out_value) const noexcept override;

            // expression queries
            uint32_t stride(wvExprId expr) const noexcept override { return isValid(expr) ? ir_.expr(expr.value()).stride : 0; }
            bool isField(wvExprId expr) const noexcept override { return isValid(expr) && ir_.expr(expr.value()).field != 0; }
            wvInstanceId instanceOf(wvExprId expr) const noexcept override;

            // expression builders
            wvExprId constant(float const* values, uint32_t count) override;
            wvExprId time() override { return make({.kind = wvExprKind::Time}); }
            wvExprId deltaTime() override { return make({.kind = wvExprKind::DeltaTime}); }
            wvExprId external(wvName name, float const* defaults, uint32_t stride) override;
            wvExprId kernel(wvOpCode op, wvExprId const* args, uint32_t argCount, uint32_t immediate) override;
            wvExprId broadcast(wvExprId signal, wvInstanceId instance) override;
            wvExprId elementIndex(wvInstanceId instance) override;
            wvExprId elementCount(wvInstanceId instance) override;
            wvExprId elementId(wvInstanceId instance) override;
            wvExprId reduce(wvReduceOp op, wvExprId field) override;
            wvExprId readState(wvStateId state) override;

            // side effects
            wvStateId allocState(char const* key, float const* initial, uint32_t stride, wvInstanceId perElement) override;
            void writeState(wvStateId state, wvExprId value) override;
            bool declareInstance(uint32_t maxCount, wvExprId count) override;
            wvExprId emitEvent(char const* key, wvExprId predicate) override;
            void emitRender(wvExprId position, wvExprId color, wvExprId size) override;
            void emitOutput(wvName name, wvExprId value) override;
            wvExprId applyContinuity(wvExprId field, wvContinuitySpec const& spec) override;
            void setOutput(wvOutputPortIndex port, wvExprId value) override;
            void error(char const* message) override;
            void error(wvCompileErrorCode code, char const* message, uint32_t detail) override;

        private:
            wvGraphNode const& node() const noexcept { return graph_.nodes[nodeIndex_]; }

            bool isValid(wvExprId expr) const noexcept { return expr != wvInvalidExprId && expr.value() < ir_.exprs.size(); }

            wvExprId fail(char const* message);
            wvExprId make(wvProgramExpr const& expr, uint32_t const* args = nullptr, uint32_t argCount = 0);
            wvExprId slotRead(uint32_t slot);

            wvProgramInstanceIndex instanceIndex(wvInstanceId instanceId);
            wvProgramInstanceIndex typeInstance(wvCanonicalType const& type);

            // broadcasts signals; fails on a field of another instance
            wvExprId toInstance(wvExprId value, wvProgramInstanceIndex instance);

            uint32_t ensureSlot(wvExprId value);
            uint32_t findIncoming(wvInputPortIndex port, uint32_t element) const noexcept;

            wvPassContext& context_;
            wvGraph const& graph_;
            wvTypeInference const& inference_;
            wvIrBuilder& ir_;

            uint32_t nodeIndex_ = 0;
            wvNodeCompileMeta meta_;
            uint32_t continuityIndex_ = 0;

            wvArray<uint32_t> incomingStart_;
            wvArray<uint32_t> incoming_;
            wvArray<uint32_t> outputBase_;
            wvArray<uint32_t> outputExpr_;
            wvArray<uint32_t> placeholder_;
            wvArray<uint32_t> slotOfExpr_;
            wvArray<bool> declared_;
            wvArray<wvNodeId> instanceUser_;
            wvArray<bool> stateWritten_;
        };

        bool NodeLowering::run(wvArray<uint32_t> const& order)
        {
            uint32_t const errorsBefore = context_.errorCount();
            uint32_t const nodeCount = graph_.nodes.size();

            // incoming edges per node, in edge order
            incomingStart_.resize(nodeCount + 1, 0);
            for (wvGraphEdge const& edge : graph_.edges)
            {
                uint32_t const to = graph_.findNode(edge.toNodeId);
                if (to != invalid)
                    ++incomingStart_[to + 1];
            }
            for (uint32_t index = 0; index != nodeCount; ++index)
                incomingStart_[index + 1] += incomingStart_[index];

            wvArray<uint32_t> cursor(context_.allocator());
            cursor.assign(incomingStart_.data(), nodeCount);
            incoming_.resize(graph_.edges.size(), invalid);
            for (uint32_t edgeIndex = 0; edgeIndex != graph_.edges.size(); ++edgeIndex)
            {
                uint32_t const to = graph_.findNode(graph_.edges[edgeIndex].toNodeId);
                if (to != invalid)
                    incoming_[cursor[to]++] = edgeIndex;
            }

            uint32_t outputCount = 0;
            outputBase_.resize(nodeCount, invalid);
            for (uint32_t index = 0; index != nodeCount; ++index)
            {
                if (!inference_.hasMeta(index))
                    continue;
                outputBase_[index] = outputCount;
                outputCount += inference_.meta(index).outputCount;
            }
            outputExpr_.resize(outputCount, invalid);
            placeholder_.resize(outputCount, invalid);

            for (uint32_t const index : order)
            {
                if (!inference_.hasMeta(index))
                    continue;

                nodeIndex_ = index;
                meta_ = inference_.meta(index);
                continuityIndex_ = 0;

                if (meta_.lower == nullptr)
                {
                    fail("node type has no lowering function");
                    continue;
                }

                uint32_t const errorsBeforeNode = context_.errorCount();
                if (!meta_.lower(*this, meta_.userData) && context_.errorCount() == errorsBeforeNode)
                    fail("lowering function failed");
            }

            // outputs read through a placeholder must have been produced
            for (uint32_t index = 0; index != nodeCount; ++index)
            {
                if (outputBase_[index] == invalid)
                    continue;
                for (uint32_t port = 0; port != inference_.meta(index).outputCount; ++port)
                {
                    uint32_t const output = outputBase_[index] + port;
                    if (placeholder_[output] != invalid && outputExpr_[output] == invalid)
                    {
                        context_.error({
                            .code = wvCompileErrorCode::LoweringFailed,
                            .nodeId = graph_.nodes[index].nodeId,
                            .otherPort = wvOutputPortIndex{static_cast<uint8_t>(port)},
                        });
                    }
                }
            }

            for (uint32_t instance = 0; instance != ir_.instances.size(); ++instance)
            {
                if (!declared_[instance])
                {
                    context_.error({
                        .code = wvCompileErrorCode::LoweringFailed,
                        .nodeId = instanceUser_[instance],
                    });
                }
            }

            return context_.errorCount() == errorsBefore;
        }

        wvExprId NodeLowering::fail(char const* message)
        {
            SPDLOG_LOGGER_DEBUG(wvLog(), "lowering node {:016x}: {}", node().nodeId.value(), message);
            context_.error({
                .code = wvCompileErrorCode::LoweringFailed,
                .nodeId = node().nodeId,
                .typeId = node().typeId,
            });
            return wvInvalidExprId;
        }

        wvExprId NodeLowering::make(wvProgramExpr const& expr, uint32_t const* args, uint32_t argCount)
        {
            uint32_t const index = ir_.addExpr(expr, args, argCount);
            if (slotOfExpr_.size() < ir_.exprs.size())
                slotOfExpr_.resize(ir_.exprs.size(), invalid);
            return wvExprId{index};
        }

        wvExprId NodeLowering::slotRead(uint32_t slot)
        {
            wvProgramSlot const& record = ir_.slots[slot];
            return make({
                .kind = wvExprKind::SlotRead,
                .stride = static_cast<uint8_t>(record.stride),
                .field = static_cast<uint8_t>(record.instance != wvInvalidIndex ? 1 : 0),
                .immediate = slot,
                .instance = record.instance,
            });
        }

        wvProgramInstanceIndex NodeLowering::instanceIndex(wvInstanceId instanceId)
        {
            wvProgramInstanceIndex const index = ir_.findOrAddInstance(instanceId);
            if (declared_.size() < ir_.instances.size())
            {
                declared_.resize(ir_.instances.size(), false);
                instanceUser_.resize(ir_.instances.size(), node().nodeId);
            }
            return index;
        }

        wvProgramInstanceIndex NodeLowering::typeInstance(wvCanonicalType const& type)
        {
            if (!wvIsField(type))
                return wvInvalidIndex;
            return instanceIndex(type.extent.cardinality.value().instance);
        }

        wvExprId NodeLowering::toInstance(wvExprId value, wvProgramInstanceIndex instance)
        {
            if (!isValid(value))
                return wvInvalidExprId;

            wvProgramExpr const expr = ir_.expr(value.value());
            if (expr.instance == instance)
                return value;
            if (expr.field != 0)
                return fail("field belongs to another instance");

            uint32_t const arg = value.value();
            return make({
                .kind = wvExprKind::Broadcast,
                .stride = expr.stride,
                .field = 1,
                .instance = instance,
            }, &arg, 1);
        }

        uint32_t NodeLowering::ensureSlot(wvExprId value)
        {
            wvProgramExpr const expr = ir_.expr(value.value());
            if (expr.kind == wvExprKind::SlotRead)
                return expr.immediate;
            if (slotOfExpr_[value.value()] != invalid)
                return slotOfExpr_[value.value()];

            uint32_t const slot = ir_.addSlot(expr.stride, expr.instance);
            ir_.addStep({
                .kind = expr.field != 0 ? wvStepKind::MaterializeField : wvStepKind::EvalSignal,
                .expr = wvProgramExprIndex{value.value()},
                .slot = wvProgramSlotIndex{slot},
            }, false);
            slotOfExpr_[value.value()] = slot;
            return slot;
        }

        uint32_t NodeLowering::findIncoming(wvInputPortIndex port, uint32_t element) const noexcept
        {
            for (uint32_t cursor = incomingStart_[nodeIndex_]; cursor != incomingStart_[nodeIndex_ + 1]; ++cursor)
            {
                wvGraphEdge const& edge = graph_.edges[incoming_[cursor]];
                if (edge.toPort == port && edge.toElement == element)
                    return incoming_[cursor];
            }
            return invalid;
        }

        uint32_t NodeLowering::inputElementCount(wvInputPortIndex port) const noexcept
        {
            wvPortMeta const* const meta = wvFindInput(meta_, port);
            if (meta == nullptr)
                return 0;
            if (!meta->vararg)
                return 1;

            uint32_t count = 0;
            for (uint32_t cursor = incomingStart_[nodeIndex_]; cursor != incomingStart_[nodeIndex_ + 1]; ++cursor)
                if (graph_.edges[incoming_[cursor]].toPort == port)
                    ++count;
            return count;
        }

        wvCanonicalType NodeLowering::inputType(wvInputPortIndex port, uint32_t element) const noexcept
        {
            wvCanonicalType type;
            if (!inference_.inputType(nodeIndex_, port, element, type))
                return {};
            return type;
        }

        wvCanonicalType NodeLowering::outputType(wvOutputPortIndex port) const noexcept
        {
            wvCanonicalType type;
            if (!inference_.outputType(nodeIndex_, port, type))
                return {};
            return type;
        }

        wvExprId NodeLowering::input(wvInputPortIndex port, uint32_t element)
        {
            uint32_t const edgeIndex = findIncoming(port, element);
            if (edgeIndex == invalid)
                return fail("input is not connected");

            wvGraphEdge const& edge = graph_.edges[edgeIndex];
            uint32_t const fromIndex = graph_.findNode(edge.fromNodeId);
            if (fromIndex == invalid || outputBase_[fromIndex] == invalid)
                return fail("input source is unknown");

            uint32_t const output = outputBase_[fromIndex] + edge.fromPort.value();
            if (outputExpr_[output] != invalid)
                return wvExprId{outputExpr_[output]};

            // the producer comes later in this cycle
            if (placeholder_[output] == invalid)
            {
                wvCanonicalType type;
                if (!inference_.outputType(fromIndex, edge.fromPort, type))
                    return fail("input source port is unknown");
                placeholder_[output] = ir_.addSlot(wvPayloadStride(type.payload), typeInstance(type));
            }
            return slotRead(placeholder_[output]);
        }

        bool NodeLowering::findParam(char const* name, wvParamValue& out_value) const noexcept
        {
            wvGraphParam const* const param = graph_.findParam(node().nodeId, wvHashName(name));
            return param != nullptr && graph_.paramValue(*param, out_value);
        }

        wvInstanceId NodeLowering::instanceOf(wvExprId expr) const noexcept
        {
            if (!isValid(expr))
                return wvInvalidInstanceId;
            wvProgramInstanceIndex const instance = ir_.expr(expr.value()).instance;
            if (instance == wvInvalidIndex)
                return wvInvalidInstanceId;
            return wvInstanceId{ir_.instances[instance.value()].instanceId};
        }

        wvExprId NodeLowering::constant(float const* values, uint32_t count)
        {
            if (count == 0 || count > wvMaxStride)
                return fail("constant has an invalid width");

            uint32_t const index = ir_.addConstant(values, count);
            if (slotOfExpr_.size() < ir_.exprs.size())
                slotOfExpr_.resize(ir_.exprs.size(), invalid);
            return wvExprId{index};
        }

        wvExprId NodeLowering::external(wvName name, float const* defaults, uint32_t stride)
        {
            if (wvIsNameEmpty(name) || stride == 0 || stride > wvMaxStride)
                return fail("external channel is malformed");

            uint64_t const nameHash = wvHashName(name.name, name.nameEnd);
            uint32_t index = ir_.findExternal(nameHash);
            if (index == invalid)
            {
                wvProgramExternal external{.nameHash = nameHash, .stride = stride};
                if (defaults != nullptr)
                    wvCopyFloats(external.defaults, defaults, stride);
                index = ir_.externals.size();
                ir_.externals.pushBack(external);
            }
            else if (ir_.externals[index].stride != stride)
            {
                return fail("external channel is used with two widths");
            }

            return make({.kind = wvExprKind::External, .stride = static_cast<uint8_t>(stride), .immediate = index});
        }

        wvExprId NodeLowering::kernel(wvOpCode op, wvExprId const* args, uint32_t argCount, uint32_t immediate)
        {
            for (uint32_t arg = 0; arg != argCount; ++arg)
                if (!isValid(args[arg]))
                    return wvInvalidExprId;

            if (op == wvOpCode::Nop || op >= wvOpCode::Last)
                return fail("unknown kernel operation");

            uint32_t const arity = wvOpArity(op);
            if ((arity != 0 && argCount != arity) || argCount == 0)
                return fail("kernel has the wrong number of arguments");

            // field arguments must agree on their instance; signals are broadcast
            wvProgramInstanceIndex instance = wvInvalidIndex;
            for (uint32_t arg = 0; arg != argCount; ++arg)
            {
                wvProgramExpr const& expr = ir_.expr(args[arg].value());
                if (expr.field == 0)
                    continue;
                if (instance != wvInvalidIndex && instance != expr.instance)
                    return fail("kernel mixes fields of different instances");
                instance = expr.instance;
            }

            uint32_t stride = 1;
            switch (op)
            {
            case wvOpCode::Component:
                if (immediate >= ir_.expr(args[0].value()).stride)
                    return fail("component index is out of range");
                stride = 1;
                break;
            case wvOpCode::Pack:
                stride = 0;
                for (uint32_t arg = 0; arg != argCount; ++arg)
                    stride += ir_.expr(args[arg].value()).stride;
                if (stride > wvMaxStride)
                    return fail("packed value is too wide");
                break;
            case wvOpCode::HsvToRgb:
                for (uint32_t arg = 0; arg != argCount; ++arg)
                    if (ir_.expr(args[arg].value()).stride != 1)
                        return fail("color conversion takes scalar arguments");
                stride = 4;
                break;
            default:
                // component-wise; every argument is either scalar or the full width
                for (uint32_t arg = 0; arg != argCount; ++arg)
                {
                    uint32_t const argStride = ir_.expr(args[arg].value()).stride;
                    if (argStride > stride)
                        stride = argStride;
                }
                for (uint32_t arg = 0; arg != argCount; ++arg)
                {
                    uint32_t const argStride = ir_.expr(args[arg].value()).stride;
                    if (argStride != 1 && argStride != stride)
                        return fail("kernel arguments have incompatible widths");
                }
                break;
            }

            // arity and the packed width bound the argument count
            uint32_t argIndices[wvMaxStride] = {};
            for (uint32_t arg = 0; arg != argCount; ++arg)
                argIndices[arg] = args[arg].value();

            return make(
                {
                    .kind = wvExprKind::Kernel,
                    .op = static_cast<uint8_t>(op),
                    .stride = static_cast<uint8_t>(stride),
                    .field = static_cast<uint8_t>(instance != wvInvalidIndex ? 1 : 0),
                    .immediate = immediate,
                    .instance = instance,
                },
                argIndices, argCount);
        }

        wvExprId NodeLowering::broadcast(wvExprId signal, wvInstanceId instance)
        {
            if (!isValid(signal))
                return wvInvalidExprId;
            if (instance == wvInvalidInstanceId)
                return fail("broadcast needs an instance");
            return toInstance(signal, instanceIndex(instance));
        }

        wvExprId NodeLowering::elementIndex(wvInstanceId instance)
        {
            if (instance == wvInvalidInstanceId)
                return fail("element index needs an instance");
            return make({.kind = wvExprKind::ElementIndex, .field = 1, .instance = instanceIndex(instance)});
        }

        wvExprId NodeLowering::elementCount(wvInstanceId instance)
        {
            if (instance == wvInvalidInstanceId)
                return fail("element count needs an instance");
            return make({.kind = wvExprKind::ElementCount, .immediate = instanceIndex(instance).value()});
        }

        wvExprId NodeLowering::elementId(wvInstanceId instance)
        {
            if (instance == wvInvalidInstanceId)
                return fail("element id needs an instance");
            return make({.kind = wvExprKind::ElementId, .field = 1, .instance = instanceIndex(instance)});
        }

        wvExprId NodeLowering::reduce(wvReduceOp op, wvExprId field)
        {
            if (!isValid(field))
                return wvInvalidExprId;

            // a signal is its own reduction
            wvProgramExpr const expr = ir_.expr(field.value());
            if (expr.field == 0)
                return field;

            uint32_t const arg = field.value();
            return make({.kind = wvExprKind::Reduce, .op = static_cast<uint8_t>(op), .stride = expr.stride}, &arg, 1);
        }

        wvExprId NodeLowering::readState(wvStateId state)
        {
            if (state == wvInvalidStateId || state.value() >= ir_.states.size())
                return wvInvalidExprId;

            wvProgramStateRecord const& record = ir_.states[state.value()];
            return make({
                .kind = wvExprKind::StateRead,
                .stride = static_cast<uint8_t>(record.stride),
                .field = static_cast<uint8_t>(record.instance != wvInvalidIndex ? 1 : 0),
                .immediate = state.value(),
                .instance = record.instance,
            });
        }

        wvStateId NodeLowering::allocState(char const* key, float const* initial, uint32_t stride, wvInstanceId perElement)
        {
            if (key == nullptr || stride == 0 || stride > wvMaxStride)
            {
                fail("state is malformed");
                return wvInvalidStateId;
            }

            wvStableId const stableId = wvMakeStableId(node().nodeId, key);
            if (ir_.findState(stableId) != invalid)
            {
                context_.error({
                    .code = wvCompileErrorCode::DuplicateStateKey,
                    .nodeId = node().nodeId,
                    .typeId = node().typeId,
                });
                return wvInvalidStateId;
            }

            wvProgramStateRecord record{
                .stableId = stableId.value(),
                .stride = stride,
                .instance = perElement != wvInvalidInstanceId ? instanceIndex(perElement) : wvProgramInstanceIndex{wvInvalidIndex},
                .initialStart = ir_.floats.size(),
            };
            for (uint32_t component = 0; component != stride; ++component)
                ir_.floats.pushBack(initial != nullptr ? initial[component] : 0.f);

            ir_.states.pushBack(record);
            stateWritten_.pushBack(false);
            return wvStateId{ir_.states.size() - 1};
        }

        void NodeLowering::writeState(wvStateId state, wvExprId value)
        {
            if (state == wvInvalidStateId || state.value() >= ir_.states.size() || !isValid(value))
                return;

            if (stateWritten_[state.value()])
            {
                fail("state is written twice");
                return;
            }

            wvProgramStateRecord const record = ir_.states[state.value()];
            if (ir_.expr(value.value()).stride != record.stride)
            {
                fail("state write has the wrong width");
                return;
            }

            wvExprId source = value;
            if (record.instance != wvInvalidIndex)
                source = toInstance(value, record.instance);
            else if (ir_.expr(value.value()).field != 0)
                source = fail("scalar state written from a field");

            if (!isValid(source))
                return;

            stateWritten_[state.value()] = true;
            uint32_t const slot = ensureSlot(source);
            ir_.addStep({
                .kind = record.instance != wvInvalidIndex ? wvStepKind::WriteStateField : wvStepKind::WriteStateScalar,
                .slot = wvProgramSlotIndex{slot},
                .target = state.value(),
            }, true);
        }

        bool NodeLowering::declareInstance(uint32_t maxCount, wvExprId count)
        {
            if (maxCount == 0 || maxCount > wvMaxInstanceCount)
            {
                fail("instance capacity is out of range");
                return false;
            }

            wvProgramExprIndex countExpr = wvInvalidIndex;
            if (count != wvInvalidExprId)
            {
                if (!isValid(count))
                    return false;
                wvProgramExpr const& expr = ir_.expr(count.value());
                if (expr.field != 0 || expr.stride != 1)
                {
                    fail("instance count must be a scalar signal");
                    return false;
                }
                countExpr = wvProgramExprIndex{count.value()};
            }

            wvProgramInstanceIndex const index = instanceIndex(nodeInstance());
            if (declared_[index.value()])
            {
                fail("instance is declared twice");
                return false;
            }

            declared_[index.value()] = true;
            ir_.instances[index.value()].maxCount = maxCount;
            ir_.instances[index.value()].countExpr = countExpr;
            return true;
        }

        wvExprId NodeLowering::emitEvent(char const* key, wvExprId predicate)
        {
            if (!isValid(predicate))
                return wvInvalidExprId;

            wvProgramExpr const expr = ir_.expr(predicate.value());
            if (expr.field != 0 || expr.stride != 1)
                return fail("event predicate must be a scalar signal");

            float const zero = 0.f;
            wvStateId const latch = allocState(key, &zero, 1, wvInvalidInstanceId);
            if (latch == wvInvalidStateId)
                return wvInvalidExprId;

            // rising edge: high now, low at the end of the previous frame
            wvExprId const raised = kernel(wvOpCode::Greater, predicate, constant(0.5f));
            wvExprId const fired = kernel(wvOpCode::And, raised, kernel(wvOpCode::Not, readState(latch)));
            if (!isValid(fired))
                return wvInvalidExprId;

            uint32_t const slot = ir_.addSlot(1, wvInvalidIndex);
            ir_.addStep({
                .kind = wvStepKind::EvalEvent,
                .expr = wvProgramExprIndex{fired.value()},
                .slot = wvProgramSlotIndex{slot},
            }, false);

            writeState(latch, raised);
            return slotRead(slot);
        }

        void NodeLowering::emitRender(wvExprId position, wvExprId color, wvExprId size)
        {
            if (!isValid(position) || !isValid(color) || !isValid(size))
                return;

            wvProgramExpr const expr = ir_.expr(position.value());
            if (expr.field == 0 || expr.stride != 2)
            {
                fail("render positions must be a 2D field");
                return;
            }
            if (ir_.expr(color.value()).stride != 4 || ir_.expr(size.value()).stride != 1)
            {
                fail("render colors or sizes have the wrong width");
                return;
            }

            wvExprId const colors = toInstance(color, expr.instance);
            wvExprId const sizes = toInstance(size, expr.instance);
            if (!isValid(colors) || !isValid(sizes))
                return;

            ir_.renders.pushBack(wvProgramRender{
                .instance = expr.instance,
                .positionSlot = wvProgramSlotIndex{ensureSlot(position)},
                .colorSlot = wvProgramSlotIndex{ensureSlot(colors)},
                .sizeSlot = wvProgramSlotIndex{ensureSlot(sizes)},
            });
            ir_.addStep({.kind = wvStepKind::RenderEmit, .target = ir_.renders.size() - 1}, false);
        }

        void NodeLowering::emitOutput(wvName name, wvExprId value)
        {
            if (!isValid(value))
                return;
            if (wvIsNameEmpty(name))
            {
                fail("output has no name");
                return;
            }

            uint32_t const slot = ensureSlot(value);
            ir_.outputs.pushBack(wvProgramOutput{.nameHash = wvHashName(name.name, name.nameEnd), .slot = wvProgramSlotIndex{slot}});
            ir_.addStep({
                .kind = wvStepKind::WriteSlot,
                .slot = wvProgramSlotIndex{slot},
                .target = ir_.outputs.size() - 1,
            }, false);
        }

        wvExprId NodeLowering::applyContinuity(wvExprId field, wvContinuitySpec const& spec)
        {
            if (!isValid(field))
                return wvInvalidExprId;

            // signals have no elements to keep apart
            wvProgramExpr const expr = ir_.expr(field.value());
            if (expr.field == 0)
                return field;

            uint32_t const input = ensureSlot(field);
            uint32_t const output = ir_.addSlot(expr.stride, expr.instance);

            uint64_t const base = wvMakeStableId(node().nodeId, "continuity").value();
            uint32_t const target = ir_.continuity.size();
            ir_.continuity.pushBack(wvProgramContinuity{
                .stableId = wvHashCombine(base, continuityIndex_++),
                .instance = expr.instance,
                .stride = expr.stride,
                .policy = static_cast<uint8_t>(spec.policy),
                .retirement = static_cast<uint8_t>(spec.retirement),
                .tauMs = spec.tauMs,
                .decayMs = spec.decayMs,
                .inputSlot = wvProgramSlotIndex{input},
                .outputSlot = wvProgramSlotIndex{output},
            });

            ir_.addStep({.kind = wvStepKind::BuildContinuityMapping, .target = target}, false);
            ir_.addStep({.kind = wvStepKind::ApplyContinuity, .slot = wvProgramSlotIndex{output}, .target = target}, false);
            return slotRead(output);
        }

        void NodeLowering::setOutput(wvOutputPortIndex port, wvExprId value)
        {
            if (!isValid(value))
                return;
            if (port.value() >= meta_.outputCount)
            {
                fail("output port is out of range");
                return;
            }

            uint32_t const output = outputBase_[nodeIndex_] + port.value();
            if (outputExpr_[output] != invalid)
            {
                fail("output is set twice");
                return;
            }

            wvCanonicalType const type = outputType(port);
            if (ir_.expr(value.value()).stride != wvPayloadStride(type.payload))
            {
                fail("output value has the wrong width");
                return;
            }

            wvExprId coerced = value;
            if (wvIsField(type))
                coerced = toInstance(value, typeInstance(type));
            else if (ir_.expr(value.value()).field != 0)
                coerced = fail("field produced on a signal output");

            if (!isValid(coerced))
                return;

            outputExpr_[output] = coerced.value();

            // a consumer lowered earlier reads this output through a placeholder
            if (placeholder_[output] != invalid)
            {
                wvProgramExpr const expr = ir_.expr(coerced.value());
                ir_.addStep({
                    .kind = expr.field != 0 ? wvStepKind::MaterializeField : wvStepKind::EvalSignal,
                    .expr = wvProgramExprIndex{coerced.value()},
                    .slot = wvProgramSlotIndex{placeholder_[output]},
                }, false);
            }
        }

        void NodeLowering::error(char const* message) { fail(message != nullptr ? message : "lowering error"); }

        void NodeLowering::error(wvCompileErrorCode code, char const* message, uint32_t detail)
        {
            SPDLOG_LOGGER_DEBUG(wvLog(), "lowering node {:016x}: {}", node().nodeId.value(), message != nullptr ? message : "");
            context_.error({
                .code = code,
                .nodeId = node().nodeId,
                .count = detail,
                .typeId = node().typeId,
            });
        }
    } // namespace

    bool wvLowerGraph(wvPassContext& context, wvGraph const& graph, wvTypeInference const& inference, wvCycleAnalysis const& cycles,
        wvIrBuilder& out_ir)
    {
        out_ir.clear();

        NodeLowering lowering(context, graph, inference, out_ir);
        return lowering.run(cycles.order);
    }
} // namespace weave
