// weave

#include "passes.hh"

namespace weave {
    namespace {
        bool edgeLess(wvGraphEdge const& left, wvGraphEdge const& right) noexcept
        {
            if (left.sortKey != right.sortKey)
                return left.sortKey < right.sortKey;
            return left.order < right.order;
        }
    } // namespace

    void wvResolveVarargs(wvPassContext& context, wvGraph const& in, wvGraph& out)
    {
        out.copyFrom(in);

        wvArray<uint32_t> connected(context.allocator());

        for (wvGraphNode const& node : in.nodes)
        {
            wvNodeCompileMeta meta;
            if (!context.lookupNode(node.typeId, meta))
                continue;

            for (uint32_t portIndex = 0; portIndex != meta.inputCount; ++portIndex)
            {
                wvPortMeta const& port = meta.inputs[portIndex];
                if (!port.vararg)
                    continue;

                connected.clear();
                for (uint32_t edgeIndex = 0; edgeIndex != out.edges.size(); ++edgeIndex)
                {
                    wvGraphEdge const& edge = out.edges[edgeIndex];
                    if (edge.toNodeId == node.nodeId && edge.toPort.value() == portIndex)
                        connected.pushBack(edgeIndex);
                }

                // insertion sort, the lists are short and the order must be stable
                for (uint32_t index = 1; index < connected.size(); ++index)
                {
                    uint32_t const edgeIndex = connected[index];
                    uint32_t slot = index;
                    while (slot != 0 && edgeLess(out.edges[edgeIndex], out.edges[connected[slot - 1]]))
                    {
                        connected[slot] = connected[slot - 1];
                        --slot;
                    }
                    connected[slot] = edgeIndex;
                }

                for (uint32_t element = 0; element != connected.size(); ++element)
                    out.edges[connected[element]].toElement = element;

                uint32_t const count = connected.size();
                if (count < port.minConnections || (port.maxConnections != 0 && count > port.maxConnections))
                {
                    context.error({
                        .code = wvCompileErrorCode::VarargConnectionCount,
                        .nodeId = node.nodeId,
                        .port = wvInputPortIndex{static_cast<uint8_t>(portIndex)},
                        .count = count,
                    });
                }
            }
        }
    }
} // namespace weave
