// weave

#pragma once

#include "weave/compile_types.hh"
#include "weave/graph_compiler.hh"

#include "array.hh"
#include "graph.hh"

#include <cstdint>

namespace weave {
    // built-in node types the passes insert on their own
    inline constexpr char const wvDefaultSourceTypeName[] = "weave.DefaultSource";
    inline constexpr char const wvWireStateTypeName[] = "weave.WireState";

    inline constexpr wvNodeTypeId wvDefaultSourceTypeId{wvHashName(wvDefaultSourceTypeName)};
    inline constexpr wvNodeTypeId wvWireStateTypeId{wvHashName(wvWireStateTypeName)};

    bool wvLookupBuiltinNode(wvNodeTypeId typeId, wvNodeCompileMeta& out_meta) noexcept;

    /// Shared state of one compile: host lookups, options and the error list.
    class wvPassContext
    {
    public:
        wvPassContext(wvAllocator& alloc, wvGraphCompilerHost& host, wvCompileOptions const& options,
            wvArray<wvCompileError>& errors) noexcept
            : allocator_(alloc), host_(host), options_(options), errors_(errors)
        {
        }

        wvAllocator& allocator() const noexcept { return allocator_; }
        wvGraphCompilerHost& host() const noexcept { return host_; }
        wvCompileOptions const& options() const noexcept { return options_; }

        // built-in types shadow host types
        bool lookupNode(wvNodeTypeId typeId, wvNodeCompileMeta& out_meta) const noexcept;
        bool lookupComposite(wvNodeTypeId typeId, wvCompositeMeta& out_meta) const noexcept;

        // return false, for convenience
        bool error(wvCompileError const& error);

        uint32_t errorCount() const noexcept { return errors_.size(); }

    private:
        wvAllocator& allocator_;
        wvGraphCompilerHost& host_;
        wvCompileOptions const& options_;
        wvArray<wvCompileError>& errors_;
    };

    // the input port of a node type, or nullptr
    wvPortMeta const* wvFindInput(wvNodeCompileMeta const& meta, wvInputPortIndex port) noexcept;
    wvPortMeta const* wvFindOutput(wvNodeCompileMeta const& meta, wvOutputPortIndex port) noexcept;

    // drops broken edges and duplicate nodes, reporting each problem
    void wvValidateGraph(wvPassContext& context, wvGraph const& in, wvGraph& out);

    // pass 1: replaces composite nodes with their expanded subgraphs
    void wvExpandComposites(wvPassContext& context, wvGraph const& in, wvGraph& out);

    // longest chain of default sources feeding default sources
    static constexpr uint32_t wvMaxDefaultSourceDepth = 8;

    // pass 2: gives every unconnected input an explicit source, splices wire state into stateful edges
    void wvMaterializeDefaults(wvPassContext& context, wvGraph const& in, wvGraph& out);

    // pass 3: bridges incompatible edges with adapter chains from the host rules
    void wvInsertAdapters(wvPassContext& context, wvGraph const& in, wvGraph& out);

    // pass 4: numbers the elements of vararg ports and checks their counts
    void wvResolveVarargs(wvPassContext& context, wvGraph const& in, wvGraph& out);
} // namespace weave
