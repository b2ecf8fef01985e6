// weave

#include "weave/alloc.hh"
#include "weave/hash.hh"

#include "passes.hh"

namespace weave {
    namespace {
        struct InputBinding
        {
            wvNodeId compositeId = wvInvalidNodeId;
            wvInputPortIndex port = wvInvalidInputPort;
            wvNodeId targetId = wvInvalidNodeId;
            wvInputPortIndex targetPort = wvInvalidInputPort;
        };

        struct OutputBinding
        {
            wvNodeId compositeId = wvInvalidNodeId;
            wvOutputPortIndex port = wvInvalidOutputPort;
            wvNodeId sourceId = wvInvalidNodeId;
            wvOutputPortIndex sourcePort = wvInvalidOutputPort;
        };

        class CompositeExpander
        {
        public:
            CompositeExpander(wvPassContext& context, wvGraph const& in, wvGraph& out) noexcept
                : context_(context), in_(in), out_(out), inputs_(context.allocator()), outputs_(context.allocator()),
                  expanded_(context.allocator()), typeStack_(context.allocator()), innerEdges_(context.allocator())
            {
            }

            void run();

        private:
            bool isComposite(wvNodeTypeId typeId, wvCompositeMeta& out_meta) const noexcept;
            bool expand(wvNodeId compositeId, wvNodeTypeId typeId, wvNodeId anchorId, uint32_t depth);
            bool fail(wvCompositeErrorKind kind, wvNodeId nodeId, wvNodeTypeId typeId);

            bool isExpanded(wvNodeId nodeId) const noexcept;
            bool hasPort(wvNodeTypeId typeId, wvInputPortIndex port) const noexcept;
            bool hasPort(wvNodeTypeId typeId, wvOutputPortIndex port) const noexcept;

            // follows an edge end through expanded composites; false when the end was dropped
            bool resolveSource(wvNodeId& inout_nodeId, wvOutputPortIndex& inout_port) const noexcept;

            // appends one edge per resolved target of the given edge
            void pushResolved(wvGraphEdge const& edge, wvArray<wvGraphEdge>& out_edges);

            wvPassContext& context_;
            wvGraph const& in_;
            wvGraph& out_;
            wvArray<InputBinding> inputs_;
            wvArray<OutputBinding> outputs_;
            wvArray<wvNodeId> expanded_;
            wvArray<wvNodeTypeId> typeStack_;
            wvArray<wvGraphEdge> innerEdges_;
            uint32_t budget_ = 0;
            uint32_t nextOrder_ = 0;
        };

        void CompositeExpander::run()
        {
            out_.clear();
            nextOrder_ = in_.edges.size();

            for (wvGraphNode const& node : in_.nodes)
            {
                wvCompositeMeta meta;
                if (isComposite(node.typeId, meta))
                {
                    budget_ = 0;
                    if (expand(node.nodeId, node.typeId, node.nodeId, 1))
                        expanded_.pushBack(node.nodeId);
                    continue;
                }

                out_.nodes.pushBack(node);
                out_.copyParams(in_, node.nodeId, node.nodeId);
            }

            wvArray<wvGraphEdge> outerEdges(context_.allocator());
            for (wvGraphEdge const& edge : in_.edges)
                pushResolved(edge, outerEdges);

            for (wvGraphEdge const& edge : outerEdges)
                out_.edges.pushBack(edge);
            for (wvGraphEdge const& edge : innerEdges_)
                out_.edges.pushBack(edge);
        }

        bool CompositeExpander::isComposite(wvNodeTypeId typeId, wvCompositeMeta& out_meta) const noexcept
        {
            wvNodeCompileMeta nodeMeta;
            if (context_.lookupNode(typeId, nodeMeta))
                return false;
            return context_.lookupComposite(typeId, out_meta);
        }

        bool CompositeExpander::expand(wvNodeId compositeId, wvNodeTypeId typeId, wvNodeId anchorId, uint32_t depth)
        {
            wvCompositeMeta meta;
            if (!isComposite(typeId, meta))
                return false;

            for (wvNodeTypeId const active : typeStack_)
                if (active == typeId)
                    return fail(wvCompositeErrorKind::SelfReference, anchorId, typeId);

            if (depth > context_.options().maxCompositeDepth)
                return fail(wvCompositeErrorKind::DepthExceeded, anchorId, typeId);

            budget_ += meta.nodeCount;
            if (budget_ > context_.options().maxCompositeNodes)
                return fail(wvCompositeErrorKind::SizeExceeded, anchorId, typeId);

            auto findInner = [&meta](uint64_t innerId) -> wvCompositeNode const* {
                for (uint32_t index = 0; index != meta.nodeCount; ++index)
                    if (meta.nodes[index].innerId == innerId)
                        return &meta.nodes[index];
                return nullptr;
            };

            // check the whole declaration before emitting anything
            for (uint32_t index = 0; index != meta.nodeCount; ++index)
            {
                wvCompositeNode const& inner = meta.nodes[index];
                if (findInner(inner.innerId) != &inner)
                    return fail(wvCompositeErrorKind::IdCollision, anchorId, typeId);

                wvNodeId const innerNodeId{wvHashCombine(compositeId.value(), inner.innerId)};
                if (out_.hasNode(innerNodeId) || in_.hasNode(innerNodeId))
                    return fail(wvCompositeErrorKind::IdCollision, anchorId, typeId);

                wvNodeCompileMeta innerMeta;
                wvCompositeMeta innerComposite;
                if (!context_.lookupNode(inner.typeId, innerMeta) && !context_.lookupComposite(inner.typeId, innerComposite))
                    return fail(wvCompositeErrorKind::InterfaceMismatch, anchorId, inner.typeId);
            }

            for (uint32_t index = 0; index != meta.edgeCount; ++index)
            {
                wvCompositeEdge const& edge = meta.edges[index];
                wvCompositeNode const* const from = findInner(edge.fromInner);
                wvCompositeNode const* const to = findInner(edge.toInner);
                if (from == nullptr || to == nullptr || !hasPort(from->typeId, edge.fromPort) || !hasPort(to->typeId, edge.toPort))
                    return fail(wvCompositeErrorKind::InterfaceMismatch, anchorId, typeId);
            }

            for (uint32_t index = 0; index != meta.inputCount; ++index)
            {
                wvCompositeInput const& input = meta.inputs[index];
                wvCompositeNode const* const target = findInner(input.innerId);
                if (target == nullptr || !hasPort(target->typeId, input.innerPort))
                    return fail(wvCompositeErrorKind::InterfaceMismatch, anchorId, typeId);
            }

            for (uint32_t index = 0; index != meta.outputCount; ++index)
            {
                wvCompositeOutput const& output = meta.outputs[index];
                wvCompositeNode const* const source = findInner(output.innerId);
                if (source == nullptr || !hasPort(source->typeId, output.innerPort))
                    return fail(wvCompositeErrorKind::InterfaceMismatch, anchorId, typeId);
            }

            typeStack_.pushBack(typeId);

            for (uint32_t index = 0; index != meta.nodeCount; ++index)
            {
                wvCompositeNode const& inner = meta.nodes[index];
                wvNodeId const innerNodeId{wvHashCombine(compositeId.value(), inner.innerId)};

                wvCompositeMeta nested;
                if (isComposite(inner.typeId, nested))
                {
                    if (expand(innerNodeId, inner.typeId, anchorId, depth + 1))
                        expanded_.pushBack(innerNodeId);
                    continue;
                }

                out_.nodes.pushBack(wvGraphNode{
                    .nodeId = innerNodeId,
                    .typeId = inner.typeId,
                    .role = wvNodeRole::Derived,
                    .derivedKind = wvDerivedKind::CompositeExpansion,
                    .anchorNodeId = anchorId,
                });

                for (uint32_t paramIndex = 0; paramIndex != inner.paramCount; ++paramIndex)
                {
                    wvParam const& param = inner.params[paramIndex];
                    out_.setParam(innerNodeId, wvHashName(param.name), param.value.values, param.value.count, param.value.text,
                        param.value.textEnd);
                }
            }

            typeStack_.popBack();

            for (uint32_t index = 0; index != meta.edgeCount; ++index)
            {
                wvCompositeEdge const& edge = meta.edges[index];
                pushResolved(
                    wvGraphEdge{
                        .fromNodeId = wvNodeId{wvHashCombine(compositeId.value(), edge.fromInner)},
                        .fromPort = edge.fromPort,
                        .toNodeId = wvNodeId{wvHashCombine(compositeId.value(), edge.toInner)},
                        .toPort = edge.toPort,
                        .role = wvEdgeRole::AutoInserted,
                        .order = nextOrder_++,
                    },
                    innerEdges_);
            }

            // bindings are recorded flattened, so nested composites resolve in one step
            for (uint32_t index = 0; index != meta.inputCount; ++index)
            {
                wvCompositeInput const& input = meta.inputs[index];
                wvNodeId const targetId{wvHashCombine(compositeId.value(), input.innerId)};

                if (!isExpanded(targetId))
                {
                    inputs_.pushBack(
                        InputBinding{.compositeId = compositeId, .port = input.port, .targetId = targetId, .targetPort = input.innerPort});
                    continue;
                }

                for (uint32_t bindingIndex = 0, count = inputs_.size(); bindingIndex != count; ++bindingIndex)
                {
                    InputBinding const binding = inputs_[bindingIndex];
                    if (binding.compositeId == targetId && binding.port == input.innerPort)
                    {
                        inputs_.pushBack(InputBinding{
                            .compositeId = compositeId,
                            .port = input.port,
                            .targetId = binding.targetId,
                            .targetPort = binding.targetPort,
                        });
                    }
                }
            }

            for (uint32_t index = 0; index != meta.outputCount; ++index)
            {
                wvCompositeOutput const& output = meta.outputs[index];
                wvNodeId sourceId{wvHashCombine(compositeId.value(), output.innerId)};
                wvOutputPortIndex sourcePort = output.innerPort;
                if (!resolveSource(sourceId, sourcePort))
                    continue;

                outputs_.pushBack(OutputBinding{.compositeId = compositeId, .port = output.port, .sourceId = sourceId, .sourcePort = sourcePort});
            }

            return true;
        }

        bool CompositeExpander::fail(wvCompositeErrorKind kind, wvNodeId nodeId, wvNodeTypeId typeId)
        {
            return context_.error({
                .code = wvCompileErrorCode::CompositeExpansionError,
                .nodeId = nodeId,
                .composite = kind,
                .typeId = typeId,
            });
        }

        bool CompositeExpander::isExpanded(wvNodeId nodeId) const noexcept
        {
            for (wvNodeId const expanded : expanded_)
                if (expanded == nodeId)
                    return true;
            return false;
        }

        bool CompositeExpander::hasPort(wvNodeTypeId typeId, wvInputPortIndex port) const noexcept
        {
            wvNodeCompileMeta meta;
            if (context_.lookupNode(typeId, meta))
                return wvFindInput(meta, port) != nullptr;

            wvCompositeMeta composite;
            if (context_.lookupComposite(typeId, composite))
            {
                for (uint32_t index = 0; index != composite.inputCount; ++index)
                    if (composite.inputs[index].port == port)
                        return true;
            }
            return false;
        }

        bool CompositeExpander::hasPort(wvNodeTypeId typeId, wvOutputPortIndex port) const noexcept
        {
            wvNodeCompileMeta meta;
            if (context_.lookupNode(typeId, meta))
                return wvFindOutput(meta, port) != nullptr;

            wvCompositeMeta composite;
            if (context_.lookupComposite(typeId, composite))
            {
                for (uint32_t index = 0; index != composite.outputCount; ++index)
                    if (composite.outputs[index].port == port)
                        return true;
            }
            return false;
        }

        bool CompositeExpander::resolveSource(wvNodeId& inout_nodeId, wvOutputPortIndex& inout_port) const noexcept
        {
            if (!isExpanded(inout_nodeId))
                return out_.hasNode(inout_nodeId);

            for (OutputBinding const& binding : outputs_)
            {
                if (binding.compositeId == inout_nodeId && binding.port == inout_port)
                {
                    inout_nodeId = binding.sourceId;
                    inout_port = binding.sourcePort;
                    return true;
                }
            }
            return false;
        }

        void CompositeExpander::pushResolved(wvGraphEdge const& edge, wvArray<wvGraphEdge>& out_edges)
        {
            wvGraphEdge resolved = edge;
            if (!resolveSource(resolved.fromNodeId, resolved.fromPort))
                return;

            if (!isExpanded(edge.toNodeId))
            {
                if (out_.hasNode(edge.toNodeId))
                    out_edges.pushBack(resolved);
                return;
            }

            // fan out to every inner target bound to the port
            for (InputBinding const& binding : inputs_)
            {
                if (binding.compositeId != edge.toNodeId || binding.port != edge.toPort)
                    continue;

                resolved.toNodeId = binding.targetId;
                resolved.toPort = binding.targetPort;
                out_edges.pushBack(resolved);
            }
        }
    } // namespace

    void wvExpandComposites(wvPassContext& context, wvGraph const& in, wvGraph& out)
    {
        CompositeExpander expander(context, in, out);
        expander.run();
    }
} // namespace weave
