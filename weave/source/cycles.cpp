// weave

#include "cycles.hh"

#include "passes.hh"

namespace weave {
    namespace {
        constexpr uint32_t unvisited = ~uint32_t{0};

        class TarjanWalker
        {
        public:
            TarjanWalker(wvAllocator& alloc, wvGraph const& graph, wvArray<bool> const* cutInputs = nullptr) noexcept
                : graph_(graph), cutInputs_(cutInputs), adjacencyStart_(alloc), adjacency_(alloc), index_(alloc), low_(alloc), onStack_(alloc), stack_(alloc),
                  calls_(alloc), components_(alloc), componentFirst_(alloc)
            {
            }

            void run();

            uint32_t componentCount() const noexcept { return componentFirst_.size(); }
            uint32_t const* component(uint32_t index, uint32_t& out_count) const noexcept
            {
                uint32_t const first = componentFirst_[index];
                uint32_t const last = index + 1 < componentFirst_.size() ? componentFirst_[index + 1] : components_.size();
                out_count = last - first;
                return components_.data() + first;
            }

            bool hasSelfLoop(uint32_t nodeIndex) const noexcept
            {
                for (uint32_t edge = adjacencyStart_[nodeIndex]; edge != adjacencyStart_[nodeIndex + 1]; ++edge)
                    if (adjacency_[edge] == nodeIndex)
                        return true;
                return false;
            }

        private:
            struct Call
            {
                uint32_t node = 0;
                uint32_t next = 0;
            };

            void buildAdjacency();
            void visit(uint32_t node);
            void emitComponent(uint32_t root);

            wvGraph const& graph_;
            wvArray<bool> const* cutInputs_ = nullptr;
            wvArray<uint32_t> adjacencyStart_;
            wvArray<uint32_t> adjacency_;
            wvArray<uint32_t> index_;
            wvArray<uint32_t> low_;
            wvArray<bool> onStack_;
            wvArray<uint32_t> stack_;
            wvArray<Call> calls_;
            wvArray<uint32_t> components_;
            wvArray<uint32_t> componentFirst_;
            uint32_t nextIndex_ = 0;
        };

        void TarjanWalker::buildAdjacency()
        {
            uint32_t const nodeCount = graph_.nodes.size();
            adjacencyStart_.resize(nodeCount + 1, 0);

            wvArray<uint32_t> edgeFrom(adjacency_.allocator());
            wvArray<uint32_t> edgeTo(adjacency_.allocator());
            for (wvGraphEdge const& edge : graph_.edges)
            {
                uint32_t const from = graph_.findNode(edge.fromNodeId);
                uint32_t const to = graph_.findNode(edge.toNodeId);
                if (from == unvisited || to == unvisited)
                    continue;
                if (cutInputs_ != nullptr && (*cutInputs_)[to])
                    continue;
                edgeFrom.pushBack(from);
                edgeTo.pushBack(to);
                ++adjacencyStart_[from + 1];
            }

            for (uint32_t node = 0; node != nodeCount; ++node)
                adjacencyStart_[node + 1] += adjacencyStart_[node];

            // successors keep edge order
            wvArray<uint32_t> cursor(adjacency_.allocator());
            cursor.assign(adjacencyStart_.data(), nodeCount);
            adjacency_.resize(edgeFrom.size());
            for (uint32_t edge = 0; edge != edgeFrom.size(); ++edge)
                adjacency_[cursor[edgeFrom[edge]]++] = edgeTo[edge];
        }

        void TarjanWalker::run()
        {
            buildAdjacency();

            uint32_t const nodeCount = graph_.nodes.size();
            index_.resize(nodeCount, unvisited);
            low_.resize(nodeCount, unvisited);
            onStack_.resize(nodeCount, false);

            for (uint32_t node = 0; node != nodeCount; ++node)
            {
                if (index_[node] == unvisited)
                    visit(node);
            }
        }

        void TarjanWalker::visit(uint32_t root)
        {
            auto enter = [this](uint32_t node) {
                index_[node] = low_[node] = nextIndex_++;
                stack_.pushBack(node);
                onStack_[node] = true;
                calls_.pushBack(Call{.node = node, .next = adjacencyStart_[node]});
            };

            enter(root);

            while (!calls_.empty())
            {
                uint32_t const top = calls_.size() - 1;
                uint32_t const node = calls_[top].node;

                if (calls_[top].next != adjacencyStart_[node + 1])
                {
                    uint32_t const successor = adjacency_[calls_[top].next++];
                    if (index_[successor] == unvisited)
                        enter(successor);
                    else if (onStack_[successor] && index_[successor] < low_[node])
                        low_[node] = index_[successor];
                    continue;
                }

                calls_.popBack();
                if (!calls_.empty())
                {
                    uint32_t const parent = calls_.back().node;
                    if (low_[node] < low_[parent])
                        low_[parent] = low_[node];
                }

                if (low_[node] == index_[node])
                    emitComponent(node);
            }
        }

        void TarjanWalker::emitComponent(uint32_t root)
        {
            uint32_t const first = components_.size();
            componentFirst_.pushBack(first);

            uint32_t member = 0;
            do
            {
                member = stack_.popBack();
                onStack_[member] = false;
                components_.pushBack(member);
            } while (member != root);

            // ascending node index
            for (uint32_t index = first + 1; index < components_.size(); ++index)
            {
                uint32_t const value = components_[index];
                uint32_t slot = index;
                while (slot != first && components_[slot - 1] > value)
                {
                    components_[slot] = components_[slot - 1];
                    --slot;
                }
                components_[slot] = value;
            }
        }
    } // namespace

    void wvAnalyzeCycles(wvPassContext& context, wvGraph const& graph, wvCycleAnalysis& out_analysis)
    {
        out_analysis.clear();

        TarjanWalker walker(context.allocator(), graph);
        walker.run();

        wvArray<bool> stateful(context.allocator());
        stateful.resize(graph.nodes.size(), false);
        for (uint32_t nodeIndex = 0; nodeIndex != graph.nodes.size(); ++nodeIndex)
        {
            wvNodeCompileMeta meta;
            stateful[nodeIndex] = context.lookupNode(graph.nodes[nodeIndex].typeId, meta) && meta.stateful;
        }

        wvArray<uint32_t> componentOf(context.allocator());
        componentOf.resize(graph.nodes.size(), unvisited);
        for (uint32_t component = 0; component != walker.componentCount(); ++component)
        {
            uint32_t count = 0;
            uint32_t const* const members = walker.component(component, count);
            for (uint32_t member = 0; member != count; ++member)
                componentOf[members[member]] = component;
        }

        // with the inputs of stateful nodes cut, any cycle left has no state on it
        TarjanWalker residual(context.allocator(), graph, &stateful);
        residual.run();

        wvArray<uint32_t> combinatorial(context.allocator());
        for (uint32_t component = 0; component != residual.componentCount(); ++component)
        {
            uint32_t count = 0;
            uint32_t const* const members = residual.component(component, count);
            if (count > 1 || residual.hasSelfLoop(members[0]))
                combinatorial.pushBack(component);
        }

        wvArray<bool> illegal(context.allocator());
        illegal.resize(walker.componentCount(), false);
        for (uint32_t const component : combinatorial)
        {
            uint32_t count = 0;
            uint32_t const* const members = residual.component(component, count);
            illegal[componentOf[members[0]]] = true;
        }

        // Tarjan finishes sinks first
        for (uint32_t component = walker.componentCount(); component-- != 0;)
        {
            uint32_t count = 0;
            uint32_t const* const members = walker.component(component, count);

            for (uint32_t member = 0; member != count; ++member)
                if (stateful[members[member]])
                    out_analysis.order.pushBack(members[member]);
            for (uint32_t member = 0; member != count; ++member)
                if (!stateful[members[member]])
                    out_analysis.order.pushBack(members[member]);

            bool const selfLoop = count == 1 && walker.hasSelfLoop(members[0]);
            if (count == 1 && !selfLoop)
                continue;

            wvCycleInfo const info{
                .classification = selfLoop ? wvCycleClassification::TrivialSelfLoop : wvCycleClassification::Cyclic,
                .legality = illegal[component] ? wvCycleLegality::IllegalCombinatorial : wvCycleLegality::LegalFeedback,
                .suggestedFix = illegal[component] ? wvCycleFix::InsertDelay : wvCycleFix::None,
                .nodeCount = count,
            };
            out_analysis.cycles.pushBack(info);
            out_analysis.cycleFirst.pushBack(out_analysis.cycleNodes.size());
            for (uint32_t member = 0; member != count; ++member)
                out_analysis.cycleNodes.pushBack(members[member]);
        }

        // one error per stateless loop, naming two of its nodes
        for (uint32_t const component : combinatorial)
        {
            uint32_t count = 0;
            uint32_t const* const members = residual.component(component, count);
            wvNodeId const second = count > 1 ? graph.nodes[members[1]].nodeId : graph.nodes[members[0]].nodeId;
            context.error({
                .code = wvCompileErrorCode::IllegalCombinatorialCycle,
                .nodeId = graph.nodes[members[0]].nodeId,
                .otherNodeId = second,
                .count = count,
            });
        }
    }
} // namespace weave
