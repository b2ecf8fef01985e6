// weave

#include "weave/blocks.hh"

#include "blocks_internal.hh"

#include <initializer_list>

namespace weave {
    wvStandardCatalog::wvStandardCatalog(wvAllocator& alloc) : allocator_(alloc)
    {
        for (wvBlockTable const table : {wvSourceBlocks(), wvMathBlocks(), wvStateBlocks(), wvFieldBlocks(), wvAdapterBlocks()})
        {
            for (uint32_t index = 0; index != table.count; ++index)
            {
                wvNodeCompileMeta meta = table.blocks[index];
                // lowering functions that need the catalog find it through userData
                if (meta.userData == nullptr)
                    meta.userData = this;
                nodeTypes_.push_back(meta);
            }
        }

        uint32_t ruleCount = 0;
        wvAdapterRule const* const rules = wvStandardAdapterRules(ruleCount);
        adapters_.assign(rules, rules + ruleCount);
    }

    bool wvStandardCatalog::lookupNodeType(wvNodeTypeId typeId, wvNodeCompileMeta& out_nodeMeta) const noexcept
    {
        // newest registration wins
        for (auto it = nodeTypes_.rbegin(); it != nodeTypes_.rend(); ++it)
        {
            if (it->typeId == typeId)
            {
                out_nodeMeta = *it;
                return true;
            }
        }
        return false;
    }

    bool wvStandardCatalog::lookupComposite(wvNodeTypeId typeId, wvCompositeMeta& out_compositeMeta) const noexcept
    {
        for (auto it = composites_.rbegin(); it != composites_.rend(); ++it)
        {
            if (it->typeId == typeId)
            {
                out_compositeMeta = *it;
                return true;
            }
        }
        return false;
    }

    uint32_t wvStandardCatalog::getAdapterCount() const noexcept { return static_cast<uint32_t>(adapters_.size()); }

    bool wvStandardCatalog::getAdapter(uint32_t index, wvAdapterRule& out_rule) const noexcept
    {
        if (index >= adapters_.size())
            return false;
        out_rule = adapters_[index];
        return true;
    }

    void wvStandardCatalog::registerNodeType(wvNodeCompileMeta const& meta) { nodeTypes_.push_back(meta); }

    void wvStandardCatalog::registerComposite(wvCompositeMeta const& meta) { composites_.push_back(meta); }

    void wvStandardCatalog::registerAdapter(wvAdapterRule const& rule) { adapters_.push_back(rule); }
} // namespace weave
