// weave

#pragma once

#include "weave/canonical_type.hh"
#include "weave/compile_types.hh"
#include "weave/export.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    class wvAllocator;
    class wvGraphCompiler;

    class wvGraphCompilerHost
    {
    public:
        virtual bool lookupNodeType(wvNodeTypeId typeId, wvNodeCompileMeta& out_nodeMeta) const noexcept = 0;
        virtual bool lookupComposite(wvNodeTypeId typeId, wvCompositeMeta& out_compositeMeta) const noexcept = 0;

        // adapter rules, in priority order
        virtual uint32_t getAdapterCount() const noexcept = 0;
        virtual bool getAdapter(uint32_t index, wvAdapterRule& out_rule) const noexcept = 0;

    protected:
        ~wvGraphCompilerHost() = default;
    };

    class wvGraphCompiler
    {
    public:
        virtual void reset() = 0;

        // the edit counter of the graph being compiled, stamped into the program
        virtual void setGraphVersion(uint64_t version) = 0;

        // begin a node; parameters bind to the most recently begun node
        virtual void beginNode(wvNodeId nodeId, wvNodeTypeId nodeTypeId) = 0;

        virtual void setParam(char const* name, float value) = 0;
        virtual void setParam(char const* name, float const* values, uint32_t count) = 0;
        virtual void setParamText(char const* name, char const* text, char const* textEnd = nullptr) = 0;

        // add an edge between two ports
        virtual void addEdge(wvNodeId fromNodeId, wvOutputPortIndex fromPort, wvNodeId toNodeId, wvInputPortIndex toPort,
            wvEdgeOptions const& options = {}) = 0;

        // runs every pass, collecting all errors
        [[nodiscard]] virtual bool compile() = 0;

        // serializes the program; only allowed after compile() returns true
        [[nodiscard]] virtual bool build() = 0;

        // queries the errors that have occured for the current graph
        [[nodiscard]] virtual uint32_t getErrorCount() const noexcept = 0;
        [[nodiscard]] virtual wvCompileError getError(uint32_t index) const noexcept = 0;

        // frontend results, available after compile() even when later passes failed
        [[nodiscard]] virtual bool isFrontendComplete() const noexcept = 0;
        [[nodiscard]] virtual uint32_t getNodeCount() const noexcept = 0;
        [[nodiscard]] virtual wvNodeInfo getNode(uint32_t index) const noexcept = 0;
        [[nodiscard]] virtual bool getInputType(wvNodeId nodeId, wvInputPortIndex port, uint32_t element,
            wvCanonicalType& out_type) const noexcept = 0;
        [[nodiscard]] virtual bool getOutputType(wvNodeId nodeId, wvOutputPortIndex port, wvCanonicalType& out_type) const noexcept = 0;
        [[nodiscard]] virtual uint32_t getCycleCount() const noexcept = 0;
        [[nodiscard]] virtual wvCycleInfo getCycle(uint32_t index) const noexcept = 0;
        [[nodiscard]] virtual wvNodeId getCycleNode(uint32_t cycleIndex, uint32_t nodeIndex) const noexcept = 0;

        // retrieves the serialized program, only valid after build() returns true
        [[nodiscard]] virtual uint8_t const* programBytes() const noexcept = 0;
        [[nodiscard]] virtual uint32_t programSize() const noexcept = 0;

    protected:
        ~wvGraphCompiler() = default;
    };

    WV_API [[nodiscard]] wvGraphCompiler* wvCreateGraphCompiler(wvAllocator& alloc, wvGraphCompilerHost& host,
        wvCompileOptions const& options = {});
    WV_API void wvDestroyGraphCompiler(wvGraphCompiler* compiler);
} // namespace weave
