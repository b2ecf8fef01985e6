// weave

#include "inference.hh"

#include "weave/alloc.hh"

#include "passes.hh"

namespace weave {
    wvTypeInference::wvTypeInference(wvPassContext& context, wvGraph const& graph) noexcept
        : context_(context), graph_(graph), solver_(context.allocator()), nodes_(context.allocator()), inputs_(context.allocator()),
          outputs_(context.allocator()), edgeInputs_(context.allocator()), edgeOutputs_(context.allocator())
    {
    }

    void wvTypeInference::build()
    {
        solver_.clear();
        nodes_.clear();
        inputs_.clear();
        outputs_.clear();
        edgeInputs_.resize(graph_.edges.size(), ~uint32_t{0});
        edgeOutputs_.resize(graph_.edges.size(), ~uint32_t{0});

        for (uint32_t nodeIndex = 0; nodeIndex != graph_.nodes.size(); ++nodeIndex)
        {
            wvGraphNode const& node = graph_.nodes[nodeIndex];

            NodeEntry& entry = nodes_.pushBack(NodeEntry{});
            entry.known = context_.lookupNode(node.typeId, entry.meta);
            entry.generic = wvPortVars{
                .payload = solver_.payload().makeVariable(),
                .cardinality = solver_.cardinality().makeVariable(),
                .temporality = solver_.temporality().makeVariable(),
                .binding = solver_.binding().makeVariable(),
                .perspective = solver_.perspective().makeVariable(),
                .branch = solver_.branch().makeVariable(),
            };

            entry.firstOutput = outputs_.size();
            entry.firstInput = inputs_.size();
            if (!entry.known)
                continue;

            NodeEntry const snapshot = entry;

            for (uint32_t portIndex = 0; portIndex != snapshot.meta.outputCount; ++portIndex)
            {
                outputs_.pushBack(PortEntry{
                    .nodeIndex = nodeIndex,
                    .port = static_cast<uint8_t>(portIndex),
                    .vars = makePortVars(snapshot.meta.outputs[portIndex].type, snapshot.generic, node.nodeId),
                });
            }

            for (uint32_t portIndex = 0; portIndex != snapshot.meta.inputCount; ++portIndex)
            {
                wvPortMeta const& port = snapshot.meta.inputs[portIndex];

                if (!port.vararg)
                {
                    inputs_.pushBack(PortEntry{
                        .nodeIndex = nodeIndex,
                        .port = static_cast<uint8_t>(portIndex),
                        .vars = makePortVars(port.type, snapshot.generic, node.nodeId),
                    });
                    continue;
                }

                // one entry per connected element
                for (uint32_t edgeIndex = 0; edgeIndex != graph_.edges.size(); ++edgeIndex)
                {
                    wvGraphEdge const& edge = graph_.edges[edgeIndex];
                    if (edge.toNodeId != node.nodeId || edge.toPort.value() != portIndex)
                        continue;

                    edgeInputs_[edgeIndex] = inputs_.size();
                    inputs_.pushBack(PortEntry{
                        .nodeIndex = nodeIndex,
                        .port = static_cast<uint8_t>(portIndex),
                        .element = edge.toElement,
                        .vars = makePortVars(port.type, snapshot.generic, node.nodeId),
                    });
                }
            }

            NodeEntry& built = nodes_.back();
            built.outputCount = outputs_.size() - built.firstOutput;
            built.inputCount = inputs_.size() - built.firstInput;
        }

        for (uint32_t edgeIndex = 0; edgeIndex != graph_.edges.size(); ++edgeIndex)
        {
            wvGraphEdge const& edge = graph_.edges[edgeIndex];
            uint32_t const fromIndex = graph_.findNode(edge.fromNodeId);
            uint32_t const toIndex = graph_.findNode(edge.toNodeId);
            WV_ASSERT(fromIndex != ~uint32_t{0} && toIndex != ~uint32_t{0});

            NodeEntry const& from = nodes_[fromIndex];
            if (from.known && edge.fromPort.value() < from.outputCount)
                edgeOutputs_[edgeIndex] = from.firstOutput + edge.fromPort.value();

            if (edgeInputs_[edgeIndex] == ~uint32_t{0})
            {
                NodeEntry const& to = nodes_[toIndex];
                for (uint32_t inputIndex = to.firstInput; inputIndex != to.firstInput + to.inputCount; ++inputIndex)
                {
                    if (inputs_[inputIndex].port == edge.toPort.value())
                    {
                        edgeInputs_[edgeIndex] = inputIndex;
                        break;
                    }
                }
            }
        }
    }

    wvPortVars wvTypeInference::makePortVars(wvPortType const& type, wvPortVars const& generic, wvNodeId nodeId)
    {
        wvPortVars vars = generic;

        switch (type.payloadMode)
        {
        case wvAxisMode::Fixed: vars.payload = solver_.payload().makeBound(type.payload); break;
        case wvAxisMode::Generic: break;
        case wvAxisMode::Free: vars.payload = solver_.payload().makeVariable(); break;
        }

        switch (type.cardinalityMode)
        {
        case wvAxisMode::Fixed:
            switch (type.cardinality)
            {
            case wvCardinalityKind::Zero: vars.cardinality = solver_.cardinality().makeBound(wvCardinality::zero()); break;
            case wvCardinalityKind::One: vars.cardinality = solver_.cardinality().makeBound(wvCardinality::one()); break;
            case wvCardinalityKind::Many:
                vars.cardinality = solver_.cardinality().makeBound(wvCardinality::many(wvNodeInstanceId(nodeId)));
                break;
            }
            break;
        case wvAxisMode::Generic: break;
        case wvAxisMode::Free: vars.cardinality = solver_.cardinality().makeVariable(); break;
        }

        switch (type.temporalityMode)
        {
        case wvAxisMode::Fixed: vars.temporality = solver_.temporality().makeBound(type.temporality); break;
        case wvAxisMode::Generic: break;
        case wvAxisMode::Free: vars.temporality = solver_.temporality().makeVariable(); break;
        }

        return vars;
    }

    bool wvTypeInference::canUnifyEdge(uint32_t edgeIndex, wvAxisConflict* out_conflict) const noexcept
    {
        if (edgeOutputs_[edgeIndex] == ~uint32_t{0} || edgeInputs_[edgeIndex] == ~uint32_t{0})
            return true;
        return solver_.canUnify(outputVars(edgeIndex), inputVars(edgeIndex), out_conflict);
    }

    bool wvTypeInference::unifyEdge(uint32_t edgeIndex, wvAxisConflict* out_conflict) noexcept
    {
        if (edgeOutputs_[edgeIndex] == ~uint32_t{0} || edgeInputs_[edgeIndex] == ~uint32_t{0})
            return true;
        return solver_.unify(outputVars(edgeIndex), inputVars(edgeIndex), out_conflict);
    }

    bool wvTypeInference::solve()
    {
        uint32_t const errorsBefore = context_.errorCount();

        for (uint32_t edgeIndex = 0; edgeIndex != graph_.edges.size(); ++edgeIndex)
        {
            wvGraphEdge const& edge = graph_.edges[edgeIndex];

            // already reported when no adapter could bridge it
            if (edge.adapterFailed)
                continue;

            wvAxisConflict conflict;
            if (!unifyEdge(edgeIndex, &conflict))
            {
                context_.error({
                    .code = wvCompileErrorCode::AxisConflict,
                    .nodeId = edge.toNodeId,
                    .port = edge.toPort,
                    .otherNodeId = edge.fromNodeId,
                    .otherPort = edge.fromPort,
                    .element = edge.toElement,
                    .conflict = conflict,
                });
            }
        }

        // declared payload defaults, in node order
        for (NodeEntry const& node : nodes_)
        {
            if (node.known && node.meta.hasDefaultPayload && !solver_.payload().isBound(node.generic.payload))
                solver_.payload().bind(node.generic.payload, node.meta.defaultPayload);
        }

        // payloads have no v0 default; report each unresolved class once
        wvArray<uint32_t> reported(context_.allocator());
        auto reportOnce = [&](wvTypeVarId var, wvCompileError const& error) {
            uint32_t const root = solver_.payload().findConst(var).value();
            for (uint32_t const seen : reported)
                if (seen == root)
                    return;
            reported.pushBack(root);
            context_.error(error);
        };

        for (PortEntry const& input : inputs_)
        {
            if (solver_.payload().isBound(input.vars.payload))
                continue;

            wvCompileError error{
                .code = wvCompileErrorCode::UnresolvedRequiredAxis,
                .nodeId = graph_.nodes[input.nodeIndex].nodeId,
                .port = wvInputPortIndex{input.port},
                .element = input.element,
            };
            error.conflict.axis = wvAxisName::Payload;
            reportOnce(input.vars.payload, error);
        }

        for (PortEntry const& output : outputs_)
        {
            if (solver_.payload().isBound(output.vars.payload))
                continue;

            wvCompileError error{
                .code = wvCompileErrorCode::UnresolvedRequiredAxis,
                .nodeId = graph_.nodes[output.nodeIndex].nodeId,
                .otherPort = wvOutputPortIndex{output.port},
            };
            error.conflict.axis = wvAxisName::Payload;
            reportOnce(output.vars.payload, error);
        }

        solver_.applyDefaults();

        return context_.errorCount() == errorsBefore;
    }

    uint32_t wvTypeInference::findInput(uint32_t nodeIndex, wvInputPortIndex port, uint32_t element) const noexcept
    {
        NodeEntry const& node = nodes_[nodeIndex];
        for (uint32_t inputIndex = node.firstInput; inputIndex != node.firstInput + node.inputCount; ++inputIndex)
        {
            PortEntry const& entry = inputs_[inputIndex];
            if (entry.port == port.value() && entry.element == element)
                return inputIndex;
        }
        return ~uint32_t{0};
    }

    bool wvTypeInference::inputType(uint32_t nodeIndex, wvInputPortIndex port, uint32_t element, wvCanonicalType& out_type) const noexcept
    {
        if (nodeIndex >= nodes_.size())
            return false;

        uint32_t const inputIndex = findInput(nodeIndex, port, element);
        if (inputIndex == ~uint32_t{0})
            return false;

        out_type = solver_.resolve(inputs_[inputIndex].vars);
        return true;
    }

    bool wvTypeInference::outputType(uint32_t nodeIndex, wvOutputPortIndex port, wvCanonicalType& out_type) const noexcept
    {
        if (nodeIndex >= nodes_.size())
            return false;

        NodeEntry const& node = nodes_[nodeIndex];
        if (port.value() >= node.outputCount)
            return false;

        out_type = solver_.resolve(outputs_[node.firstOutput + port.value()].vars);
        return true;
    }
} // namespace weave
