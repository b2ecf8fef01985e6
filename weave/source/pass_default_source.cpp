// weave

#include "weave/hash.hh"

#include "passes.hh"
#include "utility.hh"

namespace weave {
    static wvNodeId defaultSourceId(wvNodeId nodeId, wvInputPortIndex port) noexcept
    {
        uint64_t hash = wvHashCombine(wvFnvOffsetBasis, nodeId.value());
        hash = wvHashCombine(hash, port.value());
        return wvNodeId{wvHashFnv1a64("default", nullptr, hash)};
    }

    static wvNodeId wireStateId(wvGraphEdge const& edge) noexcept
    {
        uint64_t hash = wvHashCombine(wvFnvOffsetBasis, edge.fromNodeId.value());
        hash = wvHashCombine(hash, edge.fromPort.value());
        hash = wvHashCombine(hash, edge.toNodeId.value());
        hash = wvHashCombine(hash, edge.toPort.value());
        return wvNodeId{wvHashFnv1a64("wire", nullptr, hash)};
    }

    void wvMaterializeDefaults(wvPassContext& context, wvGraph const& in, wvGraph& out)
    {
        out.copyFrom(in);
        out.edges.clear();

        uint32_t nextOrder = 0;
        for (wvGraphEdge const& edge : in.edges)
            nextOrder = edge.order >= nextOrder ? edge.order + 1 : nextOrder;

        uint64_t const valueHash = wvHashName("value");
        uint64_t const initialHash = wvHashName("initial");

        // stateful edges become a unit delay spliced into the wire
        for (wvGraphEdge const& edge : in.edges)
        {
            if (!edge.stateful)
            {
                out.edges.pushBack(edge);
                continue;
            }

            wvGraphNode const& target = in.nodes[in.findNode(edge.toNodeId)];
            wvNodeId const stateId = wireStateId(edge);

            float initial[4] = {};
            wvNodeCompileMeta targetMeta;
            if (context.lookupNode(target.typeId, targetMeta))
            {
                if (wvPortMeta const* const port = wvFindInput(targetMeta, edge.toPort))
                    wvCopyFloats(initial, port->defaultValue, 4);
            }

            out.nodes.pushBack(wvGraphNode{
                .nodeId = stateId,
                .typeId = wvWireStateTypeId,
                .role = wvNodeRole::Derived,
                .derivedKind = wvDerivedKind::WireState,
                .anchorNodeId = edge.toNodeId,
                .anchorPort = edge.toPort,
            });
            out.setParam(stateId, initialHash, initial, 4);

            wvGraphEdge into = edge;
            into.toNodeId = stateId;
            into.toPort = wvInputPortIndex{0};
            into.toElement = 0;
            into.role = wvEdgeRole::AutoInserted;
            into.stateful = false;
            into.order = nextOrder++;
            out.edges.pushBack(into);

            wvGraphEdge from = edge;
            from.fromNodeId = stateId;
            from.fromPort = wvOutputPortIndex{0};
            from.stateful = false;
            out.edges.pushBack(from);
        }

        // every unconnected single input gets an explicit source; inserted
        // sources are visited too, so their own inputs are materialized
        wvArray<uint32_t> depth(context.allocator());
        depth.resize(out.nodes.size(), 0);
        for (uint32_t nodeIndex = 0; nodeIndex != out.nodes.size(); ++nodeIndex)
        {
            wvGraphNode const node = out.nodes[nodeIndex];
            uint32_t const nodeDepth = depth[nodeIndex];

            wvNodeCompileMeta meta;
            if (!context.lookupNode(node.typeId, meta))
            {
                if (node.derivedKind == wvDerivedKind::DefaultSource)
                    context.error({.code = wvCompileErrorCode::UnknownNodeType, .nodeId = node.anchorNodeId, .port = node.anchorPort, .typeId = node.typeId});
                continue;
            }

            for (uint32_t portIndex = 0; portIndex != meta.inputCount; ++portIndex)
            {
                wvPortMeta const& port = meta.inputs[portIndex];
                wvInputPortIndex const portKey{static_cast<uint8_t>(portIndex)};

                if (port.vararg || out.isConnected(node.nodeId, portKey))
                    continue;

                if (nodeDepth == wvMaxDefaultSourceDepth)
                {
                    context.error({
                        .code = wvCompileErrorCode::LoweringFailed,
                        .nodeId = node.anchorNodeId,
                        .port = node.anchorPort,
                        .count = nodeDepth,
                        .typeId = node.typeId,
                    });
                    break;
                }

                wvNodeId const sourceId = defaultSourceId(node.nodeId, portKey);
                wvNodeTypeId const sourceType = port.defaultSource != wvInvalidNodeTypeId ? port.defaultSource : wvDefaultSourceTypeId;

                out.nodes.pushBack(wvGraphNode{
                    .nodeId = sourceId,
                    .typeId = sourceType,
                    .role = wvNodeRole::Derived,
                    .derivedKind = wvDerivedKind::DefaultSource,
                    .anchorNodeId = node.nodeId,
                    .anchorPort = portKey,
                });
                depth.pushBack(nodeDepth + 1);

                // a node parameter named after the port overrides the declared default
                bool const authored = nodeIndex < in.nodes.size();
                wvGraphParam const* const named = authored && port.name != nullptr ? in.findParam(node.nodeId, wvHashName(port.name)) : nullptr;
                if (named != nullptr)
                {
                    char const* const text = named->textLength != 0 ? in.text.data() + named->textStart : nullptr;
                    out.setParam(sourceId, valueHash, named->values, named->count, text, text != nullptr ? text + named->textLength : nullptr);
                }
                else
                {
                    out.setParam(sourceId, valueHash, port.defaultValue, 4);
                }

                out.edges.pushBack(wvGraphEdge{
                    .fromNodeId = sourceId,
                    .fromPort = wvOutputPortIndex{0},
                    .toNodeId = node.nodeId,
                    .toPort = portKey,
                    .role = wvEdgeRole::Default,
                    .order = nextOrder++,
                });
            }
        }
    }
} // namespace weave
