// weave

#include "weave/alloc.hh"

#include "passes.hh"

namespace weave {
    namespace {
        enum class PortStatus
        {
            Missing,
            Single,
            Vararg,
        };

        PortStatus findInputPort(wvPassContext& context, wvNodeTypeId typeId, wvInputPortIndex port) noexcept
        {
            wvNodeCompileMeta meta;
            if (context.lookupNode(typeId, meta))
            {
                wvPortMeta const* const input = wvFindInput(meta, port);
                if (input == nullptr)
                    return PortStatus::Missing;
                return input->vararg ? PortStatus::Vararg : PortStatus::Single;
            }

            wvCompositeMeta composite;
            if (context.lookupComposite(typeId, composite))
            {
                for (uint32_t index = 0; index != composite.inputCount; ++index)
                    if (composite.inputs[index].port == port)
                        return PortStatus::Single;
            }
            return PortStatus::Missing;
        }

        bool containsId(wvArray<wvNodeId> const& ids, wvNodeId nodeId) noexcept
        {
            for (wvNodeId const id : ids)
                if (id == nodeId)
                    return true;
            return false;
        }

        bool hasOutputPort(wvPassContext& context, wvNodeTypeId typeId, wvOutputPortIndex port) noexcept
        {
            wvNodeCompileMeta meta;
            if (context.lookupNode(typeId, meta))
                return wvFindOutput(meta, port) != nullptr;

            wvCompositeMeta composite;
            if (context.lookupComposite(typeId, composite))
            {
                for (uint32_t index = 0; index != composite.outputCount; ++index)
                    if (composite.outputs[index].port == port)
                        return true;
            }
            return false;
        }
    } // namespace

    wvPortMeta const* wvFindInput(wvNodeCompileMeta const& meta, wvInputPortIndex port) noexcept
    {
        if (port.value() >= meta.inputCount)
            return nullptr;
        return &meta.inputs[port.value()];
    }

    wvPortMeta const* wvFindOutput(wvNodeCompileMeta const& meta, wvOutputPortIndex port) noexcept
    {
        if (port.value() >= meta.outputCount)
            return nullptr;
        return &meta.outputs[port.value()];
    }

    void wvValidateGraph(wvPassContext& context, wvGraph const& in, wvGraph& out)
    {
        out.clear();

        // ids of nodes dropped for an unknown type; their edges go silently
        wvArray<wvNodeId> dropped(context.allocator());

        for (wvGraphNode const& node : in.nodes)
        {
            if (out.hasNode(node.nodeId))
            {
                context.error({.code = wvCompileErrorCode::DuplicateNodeId, .nodeId = node.nodeId, .typeId = node.typeId});
                continue;
            }

            wvNodeCompileMeta meta;
            wvCompositeMeta composite;
            if (!context.lookupNode(node.typeId, meta) && !context.lookupComposite(node.typeId, composite))
            {
                context.error({.code = wvCompileErrorCode::UnknownNodeType, .nodeId = node.nodeId, .typeId = node.typeId});
                dropped.pushBack(node.nodeId);
                continue;
            }

            out.nodes.pushBack(node);
        }

        for (wvGraphParam const& param : in.params)
        {
            if (!out.hasNode(param.nodeId))
                continue;
            out.params.pushBack(param);
        }
        out.text.assign(in.text);

        for (uint32_t edgeIndex = 0; edgeIndex != in.edges.size(); ++edgeIndex)
        {
            wvGraphEdge edge = in.edges[edgeIndex];
            edge.order = edgeIndex;

            // a disabled edge reads as no connection at all
            if (!edge.enabled)
                continue;

            uint32_t const fromIndex = out.findNode(edge.fromNodeId);
            uint32_t const toIndex = out.findNode(edge.toNodeId);

            if (fromIndex == ~uint32_t{0} || toIndex == ~uint32_t{0})
            {
                bool const silent = (fromIndex != ~uint32_t{0} || containsId(dropped, edge.fromNodeId)) &&
                                    (toIndex != ~uint32_t{0} || containsId(dropped, edge.toNodeId));
                if (!silent)
                {
                    context.error({
                        .code = wvCompileErrorCode::NodeNotFound,
                        .nodeId = edge.toNodeId,
                        .port = edge.toPort,
                        .otherNodeId = edge.fromNodeId,
                        .otherPort = edge.fromPort,
                    });
                }
                continue;
            }

            if (!hasOutputPort(context, out.nodes[fromIndex].typeId, edge.fromPort))
            {
                context.error({
                    .code = wvCompileErrorCode::PortNotFound,
                    .nodeId = edge.toNodeId,
                    .port = edge.toPort,
                    .otherNodeId = edge.fromNodeId,
                    .otherPort = edge.fromPort,
                });
                continue;
            }

            PortStatus const status = findInputPort(context, out.nodes[toIndex].typeId, edge.toPort);
            if (status == PortStatus::Missing)
            {
                context.error({
                    .code = wvCompileErrorCode::PortNotFound,
                    .nodeId = edge.toNodeId,
                    .port = edge.toPort,
                    .otherNodeId = edge.fromNodeId,
                    .otherPort = edge.fromPort,
                });
                continue;
            }

            if (status == PortStatus::Single && out.isConnected(edge.toNodeId, edge.toPort))
            {
                context.error({
                    .code = wvCompileErrorCode::MultipleWriters,
                    .nodeId = edge.toNodeId,
                    .port = edge.toPort,
                    .otherNodeId = edge.fromNodeId,
                    .otherPort = edge.fromPort,
                });
                continue;
            }

            out.edges.pushBack(edge);
        }
    }
} // namespace weave
