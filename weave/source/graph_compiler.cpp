// weave

#include "weave/graph_compiler.hh"

#include "weave/alloc.hh"
#include "weave/diagnostics.hh"
#include "weave/log.hh"

#include "array.hh"
#include "assert.hh"
#include "cycles.hh"
#include "graph.hh"
#include "inference.hh"
#include "ir.hh"
#include "lowering.hh"
#include "passes.hh"
#include "program_internal.hh"
#include "utility.hh"

#include <spdlog/spdlog.h>

#include <cstring>
#include <new>

namespace weave {
    namespace {
        class GraphCompiler final : public wvGraphCompiler
        {
        public:
            GraphCompiler(wvAllocator& alloc, wvGraphCompilerHost& host, wvCompileOptions const& options) noexcept
                : allocator_(alloc), options_(options), errors_(alloc), context_(alloc, host, options_, errors_),
                  source_(alloc), validated_(alloc), expanded_(alloc), defaulted_(alloc), adapted_(alloc), final_(alloc),
                  inference_(context_, final_), cycles_(alloc), ir_(alloc), phase1_(alloc), phase2_(alloc), programBytes_(alloc)
            {
            }

            void reset() override;
            void setGraphVersion(uint64_t version) override;

            void beginNode(wvNodeId nodeId, wvNodeTypeId nodeTypeId) override;

            void setParam(char const* name, float value) override { setParam(name, &value, 1); }
            void setParam(char const* name, float const* values, uint32_t count) override;
            void setParamText(char const* name, char const* text, char const* textEnd = nullptr) override;

            void addEdge(wvNodeId fromNodeId, wvOutputPortIndex fromPort, wvNodeId toNodeId, wvInputPortIndex toPort,
                wvEdgeOptions const& options) override;

            bool compile() override;
            bool build() override;

            uint32_t getErrorCount() const noexcept override { return errors_.size(); }
            wvCompileError getError(uint32_t index) const noexcept override;

            bool isFrontendComplete() const noexcept override { return frontendComplete_; }
            uint32_t getNodeCount() const noexcept override { return frontendComplete_ ? final_.nodes.size() : 0; }
            wvNodeInfo getNode(uint32_t index) const noexcept override;
            bool getInputType(wvNodeId nodeId, wvInputPortIndex port, uint32_t element, wvCanonicalType& out_type) const noexcept override;
            bool getOutputType(wvNodeId nodeId, wvOutputPortIndex port, wvCanonicalType& out_type) const noexcept override;
            uint32_t getCycleCount() const noexcept override { return frontendComplete_ ? cycles_.cycles.size() : 0; }
            wvCycleInfo getCycle(uint32_t index) const noexcept override;
            wvNodeId getCycleNode(uint32_t cycleIndex, uint32_t nodeIndex) const noexcept override;

            uint8_t const* programBytes() const noexcept override { return reinterpret_cast<uint8_t const*>(programBytes_.data()); }
            uint32_t programSize() const noexcept override { return programSize_; }

            wvAllocator& allocator() noexcept { return allocator_; }

        private:
            enum class CompileStatus
            {
                Reset,
                Compiled,
                Errored,
            };

            void logPass(char const* name, wvGraph const& graph) const;
            void logErrors() const;

            wvAllocator& allocator_;
            wvCompileOptions options_;
            wvArray<wvCompileError> errors_;
            wvPassContext context_;

            // one graph per pass boundary, so every pass reads an immutable input
            wvGraph source_;
            wvGraph validated_;
            wvGraph expanded_;
            wvGraph defaulted_;
            wvGraph adapted_;
            wvGraph final_;

            wvTypeInference inference_;
            wvCycleAnalysis cycles_;
            wvIrBuilder ir_;
            wvArray<wvProgramStep> phase1_;
            wvArray<wvProgramStep> phase2_;

            // 8-byte storage keeps every record of the block aligned
            wvArray<uint64_t> programBytes_;
            uint32_t programSize_ = 0;

            uint64_t graphVersion_ = 0;
            wvNodeId openNode_ = wvInvalidNodeId;
            bool frontendComplete_ = false;
            CompileStatus status_ = CompileStatus::Reset;
        };
    } // namespace

    wvGraphCompiler* wvCreateGraphCompiler(wvAllocator& alloc, wvGraphCompilerHost& host, wvCompileOptions const& options)
    {
        return new (alloc.allocate(sizeof(GraphCompiler), alignof(GraphCompiler))) GraphCompiler(alloc, host, options);
    }

    void wvDestroyGraphCompiler(wvGraphCompiler* compiler)
    {
        if (compiler != nullptr)
        {
            GraphCompiler* impl = static_cast<GraphCompiler*>(compiler);
            wvAllocator& alloc = impl->allocator();
            impl->~GraphCompiler();
            alloc.free(impl, sizeof(GraphCompiler), alignof(GraphCompiler));
        }
    }

    void GraphCompiler::reset()
    {
        status_ = CompileStatus::Reset;

        errors_.clear();
        source_.clear();
        validated_.clear();
        expanded_.clear();
        defaulted_.clear();
        adapted_.clear();
        final_.clear();
        cycles_.clear();
        ir_.clear();
        phase1_.clear();
        phase2_.clear();
        programBytes_.clear();
        programSize_ = 0;
        graphVersion_ = 0;
        openNode_ = wvInvalidNodeId;
        frontendComplete_ = false;
    }

    void GraphCompiler::setGraphVersion(uint64_t version)
    {
        WV_GUARD_VOID(status_ == CompileStatus::Reset);
        graphVersion_ = version;
    }

    void GraphCompiler::beginNode(wvNodeId nodeId, wvNodeTypeId nodeTypeId)
    {
        WV_GUARD_VOID(status_ == CompileStatus::Reset);

        source_.nodes.pushBack(wvGraphNode{.nodeId = nodeId, .typeId = nodeTypeId});
        openNode_ = nodeId;
    }

    void GraphCompiler::setParam(char const* name, float const* values, uint32_t count)
    {
        WV_GUARD_VOID(status_ == CompileStatus::Reset);
        WV_GUARD_VOID(openNode_ != wvInvalidNodeId);
        WV_GUARD_VOID(name != nullptr);
        WV_GUARD_VOID(count <= wvMaxStride);

        source_.setParam(openNode_, wvHashName(name), values, count);
    }

    void GraphCompiler::setParamText(char const* name, char const* text, char const* textEnd)
    {
        WV_GUARD_VOID(status_ == CompileStatus::Reset);
        WV_GUARD_VOID(openNode_ != wvInvalidNodeId);
        WV_GUARD_VOID(name != nullptr);

        source_.setParam(openNode_, wvHashName(name), nullptr, 0, text, textEnd);
    }

    void GraphCompiler::addEdge(wvNodeId fromNodeId, wvOutputPortIndex fromPort, wvNodeId toNodeId, wvInputPortIndex toPort,
        wvEdgeOptions const& options)
    {
        WV_GUARD_VOID(status_ == CompileStatus::Reset);

        source_.edges.pushBack(wvGraphEdge{
            .fromNodeId = fromNodeId,
            .fromPort = fromPort,
            .toNodeId = toNodeId,
            .toPort = toPort,
            .role = options.role,
            .enabled = options.enabled,
            .stateful = options.stateful,
            .sortKey = options.sortKey,
            .order = source_.edges.size(),
        });
    }

    bool GraphCompiler::compile()
    {
        WV_GUARD_OR(status_ == CompileStatus::Reset, false);

        openNode_ = wvInvalidNodeId;

        wvValidateGraph(context_, source_, validated_);
        wvExpandComposites(context_, validated_, expanded_);
        logPass("composites", expanded_);
        wvMaterializeDefaults(context_, expanded_, defaulted_);
        logPass("defaults", defaulted_);
        wvInsertAdapters(context_, defaulted_, adapted_);
        logPass("adapters", adapted_);
        wvResolveVarargs(context_, adapted_, final_);
        logPass("varargs", final_);

        inference_.build();
        inference_.solve();

        wvAnalyzeCycles(context_, final_, cycles_);
        frontendComplete_ = true;

        // the backend only runs over a clean frontend
        if (errors_.empty() && wvLowerGraph(context_, final_, inference_, cycles_, ir_))
            wvBuildSchedule(context_, ir_, phase1_, phase2_);

        bool const success = errors_.empty();
        status_ = success ? CompileStatus::Compiled : CompileStatus::Errored;

        if (success)
        {
            SPDLOG_LOGGER_DEBUG(wvLog(), "compiled {} nodes into {} expressions, {} phase 1 steps and {} phase 2 steps",
                final_.nodes.size(), ir_.exprs.size(), phase1_.size(), phase2_.size());
        }
        else
        {
            logErrors();
        }

        return success;
    }

    void GraphCompiler::logPass(char const* name, wvGraph const& graph) const
    {
        spdlog::level::level_enum const level = options_.logPasses ? spdlog::level::info : spdlog::level::debug;
        wvLog()->log(level, "pass {}: {} nodes, {} edges", name, graph.nodes.size(), graph.edges.size());
    }

    void GraphCompiler::logErrors() const
    {
        SPDLOG_LOGGER_ERROR(wvLog(), "compile failed with {} errors", errors_.size());
        for (wvCompileError const& error : errors_)
            SPDLOG_LOGGER_DEBUG(wvLog(), "  {}", wvDescribeError(error));
    }

    bool GraphCompiler::build()
    {
        WV_GUARD_OR(status_ == CompileStatus::Compiled, false);

        using Header = wvProgramHeader;

        uint32_t offset = sizeof(Header);
        uint32_t const exprsOffset = decltype(Header::exprs)::allocate(offset, ir_.exprs.size());
        uint32_t const argsOffset = decltype(Header::args)::allocate(offset, ir_.args.size());
        uint32_t const floatsOffset = decltype(Header::floats)::allocate(offset, ir_.floats.size());
        uint32_t const externalsOffset = decltype(Header::externals)::allocate(offset, ir_.externals.size());
        uint32_t const slotsOffset = decltype(Header::slots)::allocate(offset, ir_.slots.size());
        uint32_t const statesOffset = decltype(Header::states)::allocate(offset, ir_.states.size());
        uint32_t const instancesOffset = decltype(Header::instances)::allocate(offset, ir_.instances.size());
        uint32_t const continuityOffset = decltype(Header::continuity)::allocate(offset, ir_.continuity.size());
        uint32_t const rendersOffset = decltype(Header::renders)::allocate(offset, ir_.renders.size());
        uint32_t const outputsOffset = decltype(Header::outputs)::allocate(offset, ir_.outputs.size());
        uint32_t const phase1Offset = decltype(Header::phase1)::allocate(offset, phase1_.size());
        uint32_t const phase2Offset = decltype(Header::phase2)::allocate(offset, phase2_.size());

        uint32_t const size = wvAlign(offset, alignof(uint64_t));

        programBytes_.resize(size / sizeof(uint64_t));
        std::memset(programBytes_.data(), 0, size);
        programSize_ = size;

        Header* const header = new (programBytes_.data()) Header;
        uintptr_t const base = reinterpret_cast<uintptr_t>(header);

        header->version = wvProgramVersion;
        header->size = size;
        header->hash = 0;
        header->graphVersion = graphVersion_;
        header->exprs.assign(base, exprsOffset, ir_.exprs.size());
        header->args.assign(base, argsOffset, ir_.args.size());
        header->floats.assign(base, floatsOffset, ir_.floats.size());
        header->externals.assign(base, externalsOffset, ir_.externals.size());
        header->slots.assign(base, slotsOffset, ir_.slots.size());
        header->states.assign(base, statesOffset, ir_.states.size());
        header->instances.assign(base, instancesOffset, ir_.instances.size());
        header->continuity.assign(base, continuityOffset, ir_.continuity.size());
        header->renders.assign(base, rendersOffset, ir_.renders.size());
        header->outputs.assign(base, outputsOffset, ir_.outputs.size());
        header->phase1.assign(base, phase1Offset, phase1_.size());
        header->phase2.assign(base, phase2Offset, phase2_.size());

        auto const copy = [](auto& out_array, auto const& source) noexcept {
            if (source.size() != 0)
                std::memcpy(out_array.data(), source.data(), source.size() * sizeof(*source.data()));
        };

        copy(header->exprs, ir_.exprs);
        copy(header->args, ir_.args);
        copy(header->floats, ir_.floats);
        copy(header->externals, ir_.externals);
        copy(header->slots, ir_.slots);
        copy(header->states, ir_.states);
        copy(header->instances, ir_.instances);
        copy(header->continuity, ir_.continuity);
        copy(header->renders, ir_.renders);
        copy(header->outputs, ir_.outputs);
        copy(header->phase1, phase1_);
        copy(header->phase2, phase2_);

        header->hash = wvHashProgram(header);

        WV_ASSERT(wvValidateProgram(programBytes(), programSize_));

        SPDLOG_LOGGER_DEBUG(wvLog(), "built program of {} bytes, hash {:016x}", size, header->hash);
        return true;
    }

    wvCompileError GraphCompiler::getError(uint32_t index) const noexcept
    {
        WV_GUARD_OR(index < errors_.size(), wvCompileError{});
        return errors_[index];
    }

    wvNodeInfo GraphCompiler::getNode(uint32_t index) const noexcept
    {
        WV_GUARD_OR(index < getNodeCount(), wvNodeInfo{});

        wvGraphNode const& node = final_.nodes[index];
        return {
            .nodeId = node.nodeId,
            .typeId = node.typeId,
            .role = node.role,
            .derivedKind = node.derivedKind,
            .anchorNodeId = node.anchorNodeId,
            .anchorPort = node.anchorPort,
        };
    }

    bool GraphCompiler::getInputType(wvNodeId nodeId, wvInputPortIndex port, uint32_t element, wvCanonicalType& out_type) const noexcept
    {
        if (!frontendComplete_)
            return false;

        uint32_t const nodeIndex = final_.findNode(nodeId);
        return nodeIndex != ~uint32_t{0} && inference_.inputType(nodeIndex, port, element, out_type);
    }

    bool GraphCompiler::getOutputType(wvNodeId nodeId, wvOutputPortIndex port, wvCanonicalType& out_type) const noexcept
    {
        if (!frontendComplete_)
            return false;

        uint32_t const nodeIndex = final_.findNode(nodeId);
        return nodeIndex != ~uint32_t{0} && inference_.outputType(nodeIndex, port, out_type);
    }

    wvCycleInfo GraphCompiler::getCycle(uint32_t index) const noexcept
    {
        WV_GUARD_OR(index < getCycleCount(), wvCycleInfo{});
        return cycles_.cycles[index];
    }

    wvNodeId GraphCompiler::getCycleNode(uint32_t cycleIndex, uint32_t nodeIndex) const noexcept
    {
        WV_GUARD_OR(cycleIndex < getCycleCount(), wvInvalidNodeId);
        WV_GUARD_OR(nodeIndex < cycles_.cycles[cycleIndex].nodeCount, wvInvalidNodeId);

        return final_.nodes[cycles_.cycleNodes[cycles_.cycleFirst[cycleIndex] + nodeIndex]].nodeId;
    }
} // namespace weave
