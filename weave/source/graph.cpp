// weave

#include "graph.hh"

#include "utility.hh"

namespace weave {
    void wvGraph::clear() noexcept
    {
        nodes.clear();
        edges.clear();
        params.clear();
        text.clear();
    }

    void wvGraph::copyFrom(wvGraph const& source)
    {
        nodes.assign(source.nodes);
        edges.assign(source.edges);
        params.assign(source.params);
        text.assign(source.text);
    }

    uint32_t wvGraph::findNode(wvNodeId nodeId) const noexcept
    {
        for (uint32_t index = 0; index != nodes.size(); ++index)
            if (nodes[index].nodeId == nodeId)
                return index;
        return ~uint32_t{0};
    }

    wvGraphParam const* wvGraph::findParam(wvNodeId nodeId, uint64_t nameHash) const noexcept
    {
        for (wvGraphParam const& param : params)
            if (param.nodeId == nodeId && param.nameHash == nameHash)
                return &param;
        return nullptr;
    }

    bool wvGraph::paramValue(wvGraphParam const& param, wvParamValue& out_value) const noexcept
    {
        out_value = wvParamValue{};
        wvCopyFloats(out_value.values, param.values, param.count);
        out_value.count = static_cast<uint8_t>(param.count);
        if (param.textLength != 0)
        {
            out_value.text = text.data() + param.textStart;
            out_value.textEnd = out_value.text + param.textLength;
        }
        return true;
    }

    void wvGraph::setParam(wvNodeId nodeId, uint64_t nameHash, float const* values, uint32_t count, char const* textStart,
        char const* textEnd)
    {
        WV_ASSERT(count <= 4);

        wvGraphParam* param = nullptr;
        for (wvGraphParam& existing : params)
        {
            if (existing.nodeId == nodeId && existing.nameHash == nameHash)
            {
                param = &existing;
                break;
            }
        }
        if (param == nullptr)
            param = &params.pushBack(wvGraphParam{.nodeId = nodeId, .nameHash = nameHash});

        param->count = count;
        wvCopyFloats(param->values, values, count);
        param->textStart = 0;
        param->textLength = 0;

        uint32_t const length = wvNameLen(wvName{textStart, textEnd});
        if (length != 0)
        {
            param->textStart = text.size();
            param->textLength = length;
            for (uint32_t index = 0; index != length; ++index)
                text.pushBack(textStart[index]);
        }
    }

    void wvGraph::copyParams(wvGraph const& source, wvNodeId fromNodeId, wvNodeId toNodeId)
    {
        for (wvGraphParam const& param : source.params)
        {
            if (param.nodeId != fromNodeId)
                continue;

            char const* const start = source.text.data() + param.textStart;
            setParam(toNodeId, param.nameHash, param.values, param.count, param.textLength != 0 ? start : nullptr,
                param.textLength != 0 ? start + param.textLength : nullptr);
        }
    }

    bool wvGraph::isConnected(wvNodeId nodeId, wvInputPortIndex port) const noexcept
    {
        for (wvGraphEdge const& edge : edges)
            if (edge.enabled && edge.toNodeId == nodeId && edge.toPort == port)
                return true;
        return false;
    }
} // namespace weave
