// weave

#pragma once

#include "weave/types.hh"

#include "array.hh"

#include <cstdint>

namespace weave {
    struct wvGraphNode
    {
        wvNodeId nodeId = wvInvalidNodeId;
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
        wvNodeRole role = wvNodeRole::User;
        wvDerivedKind derivedKind = wvDerivedKind::None;
        wvNodeId anchorNodeId = wvInvalidNodeId;
        wvInputPortIndex anchorPort = wvInvalidInputPort;
    };

    struct wvGraphEdge
    {
        wvNodeId fromNodeId = wvInvalidNodeId;
        wvOutputPortIndex fromPort = wvInvalidOutputPort;
        wvNodeId toNodeId = wvInvalidNodeId;
        wvInputPortIndex toPort = wvInvalidInputPort;
        uint32_t toElement = 0;
        wvEdgeRole role = wvEdgeRole::User;
        bool enabled = true;
        bool stateful = false;
        bool adapterFailed = false;
        int32_t sortKey = 0;
        uint32_t order = 0; // insertion order, the vararg tie-break
    };

    struct wvGraphParam
    {
        wvNodeId nodeId = wvInvalidNodeId;
        uint64_t nameHash = 0;
        float values[4] = {};
        uint32_t count = 0;
        uint32_t textStart = 0;
        uint32_t textLength = 0;
    };

    /// The graph handed from one pass to the next.
    ///
    /// Passes read one graph and write another; nothing is rewritten in place.
    struct wvGraph
    {
        explicit wvGraph(wvAllocator& alloc) noexcept : nodes(alloc), edges(alloc), params(alloc), text(alloc) {}

        void clear() noexcept;
        void copyFrom(wvGraph const& source);

        uint32_t findNode(wvNodeId nodeId) const noexcept;
        bool hasNode(wvNodeId nodeId) const noexcept { return findNode(nodeId) != ~uint32_t{0}; }

        wvGraphParam const* findParam(wvNodeId nodeId, uint64_t nameHash) const noexcept;
        bool paramValue(wvGraphParam const& param, wvParamValue& out_value) const noexcept;

        // replaces any earlier value of the same name
        void setParam(wvNodeId nodeId, uint64_t nameHash, float const* values, uint32_t count, char const* textStart = nullptr,
            char const* textEnd = nullptr);

        // copies every parameter of one node of another graph onto a node of this graph
        void copyParams(wvGraph const& source, wvNodeId fromNodeId, wvNodeId toNodeId);

        // whether any enabled edge ends at the given input
        bool isConnected(wvNodeId nodeId, wvInputPortIndex port) const noexcept;

        wvArray<wvGraphNode> nodes;
        wvArray<wvGraphEdge> edges;
        wvArray<wvGraphParam> params;
        wvArray<char> text;
    };
} // namespace weave
