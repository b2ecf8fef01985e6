// weave

#include "weave/alloc.hh"
#include "weave/hash.hh"

#include "inference.hh"
#include "passes.hh"

#include <cstring>

namespace weave {
    namespace {
        // what the probe solve knows about one end of an edge
        struct ProbeType
        {
            bool hasPayload = false;
            wvPayload payload = wvPayload::Float;
            bool hasCardinality = false;
            wvCardinalityKind cardinality = wvCardinalityKind::One;
            bool hasTemporality = false;
            wvTemporality temporality = wvTemporality::Continuous;
        };

        ProbeType probe(wvTypeSolver& solver, wvPortVars const& vars) noexcept
        {
            ProbeType type;
            if (solver.payload().isBound(vars.payload))
            {
                type.hasPayload = true;
                type.payload = solver.payload().value(vars.payload);
            }
            if (solver.cardinality().isBound(vars.cardinality))
            {
                type.hasCardinality = true;
                type.cardinality = solver.cardinality().value(vars.cardinality).kind;
            }
            if (solver.temporality().isBound(vars.temporality))
            {
                type.hasTemporality = true;
                type.temporality = solver.temporality().value(vars.temporality);
            }
            return type;
        }

        bool matches(wvTypePattern const& pattern, ProbeType const& type) noexcept
        {
            if (pattern.matchPayload && (!type.hasPayload || type.payload != pattern.payload))
                return false;
            if (pattern.matchCardinality && (!type.hasCardinality || type.cardinality != pattern.cardinality))
                return false;
            if (pattern.matchTemporality && (!type.hasTemporality || type.temporality != pattern.temporality))
                return false;
            return true;
        }

        ProbeType convert(wvTypePattern const& pattern, ProbeType type) noexcept
        {
            if (pattern.matchPayload)
            {
                type.hasPayload = true;
                type.payload = pattern.payload;
            }
            if (pattern.matchCardinality)
            {
                type.hasCardinality = true;
                type.cardinality = pattern.cardinality;
            }
            if (pattern.matchTemporality)
            {
                type.hasTemporality = true;
                type.temporality = pattern.temporality;
            }
            return type;
        }

        // an axis known on both sides must agree; an unknown side is left to the solver
        bool accepts(ProbeType const& target, ProbeType const& type) noexcept
        {
            if (target.hasPayload && type.hasPayload && target.payload != type.payload)
                return false;
            if (target.hasCardinality && type.hasCardinality && target.cardinality != type.cardinality)
                return false;
            if (target.hasTemporality && type.hasTemporality && target.temporality != type.temporality)
                return false;
            return true;
        }

        int compareNames(char const* left, char const* right) noexcept
        {
            if (left == nullptr || right == nullptr)
                return left == right ? 0 : (left == nullptr ? -1 : 1);
            return std::strcmp(left, right);
        }

        constexpr uint32_t maxChain = 4;

        struct Chain
        {
            uint32_t rules[maxChain] = {};
            uint32_t length = 0;
        };

        class AdapterSearch
        {
        public:
            AdapterSearch(wvPassContext& context, wvArray<wvAdapterRule> const& rules) noexcept : context_(context), rules_(rules) {}

            // the best chain, shortest first, then lexicographic by rule names
            bool find(ProbeType const& source, ProbeType const& target, Chain& out_chain) const noexcept
            {
                uint32_t limit = context_.options().maxAdapterChain;
                if (limit > maxChain)
                    limit = maxChain;

                for (uint32_t length = 1; length <= limit; ++length)
                {
                    bool found = false;
                    Chain current;
                    current.length = length;
                    search(source, target, current, 0, out_chain, found);
                    if (found)
                        return true;
                }
                return false;
            }

        private:
            void search(ProbeType const& type, ProbeType const& target, Chain& current, uint32_t depth, Chain& best, bool& found) const noexcept
            {
                if (depth == current.length)
                {
                    if (!accepts(target, type))
                        return;
                    if (!found || less(current, best))
                    {
                        best = current;
                        found = true;
                    }
                    return;
                }

                for (uint32_t ruleIndex = 0; ruleIndex != rules_.size(); ++ruleIndex)
                {
                    wvAdapterRule const& rule = rules_[ruleIndex];
                    if (!matches(rule.from, type))
                        continue;

                    current.rules[depth] = ruleIndex;
                    search(convert(rule.to, type), target, current, depth + 1, best, found);
                }
            }

            bool less(Chain const& left, Chain const& right) const noexcept
            {
                for (uint32_t index = 0; index != left.length; ++index)
                {
                    int const order = compareNames(rules_[left.rules[index]].name, rules_[right.rules[index]].name);
                    if (order != 0)
                        return order < 0;
                }
                return false;
            }

            wvPassContext& context_;
            wvArray<wvAdapterRule> const& rules_;
        };

        wvNodeId adapterId(wvGraphEdge const& edge, uint32_t step) noexcept
        {
            uint64_t hash = wvHashCombine(wvFnvOffsetBasis, edge.fromNodeId.value());
            hash = wvHashCombine(hash, edge.fromPort.value());
            hash = wvHashCombine(hash, edge.toNodeId.value());
            hash = wvHashCombine(hash, edge.toPort.value());
            hash = wvHashCombine(hash, edge.order);
            hash = wvHashFnv1a64("adapter", nullptr, hash);
            return wvNodeId{wvHashCombine(hash, step)};
        }
    } // namespace

    void wvInsertAdapters(wvPassContext& context, wvGraph const& in, wvGraph& out)
    {
        out.copyFrom(in);
        out.edges.clear();

        wvArray<wvAdapterRule> rules(context.allocator());
        uint32_t const ruleCount = context.host().getAdapterCount();
        for (uint32_t index = 0; index != ruleCount; ++index)
        {
            wvAdapterRule rule;
            if (context.host().getAdapter(index, rule))
                rules.pushBack(rule);
        }

        // probe solve: node constraints are in the variables, edges join in order
        wvTypeInference inference(context, in);
        inference.build();

        AdapterSearch const search(context, rules);

        for (uint32_t edgeIndex = 0; edgeIndex != in.edges.size(); ++edgeIndex)
        {
            wvGraphEdge const& edge = in.edges[edgeIndex];

            wvAxisConflict conflict;
            if (inference.unifyEdge(edgeIndex, &conflict))
            {
                out.edges.pushBack(edge);
                continue;
            }

            ProbeType const source = probe(inference.solver(), inference.outputVars(edgeIndex));
            ProbeType const target = probe(inference.solver(), inference.inputVars(edgeIndex));

            Chain chain;
            if (!search.find(source, target, chain))
            {
                context.error({
                    .code = wvCompileErrorCode::NoAdapterFound,
                    .nodeId = edge.toNodeId,
                    .port = edge.toPort,
                    .otherNodeId = edge.fromNodeId,
                    .otherPort = edge.fromPort,
                    .element = edge.toElement,
                    .conflict = conflict,
                });

                wvGraphEdge failed = edge;
                failed.adapterFailed = true;
                out.edges.pushBack(failed);
                continue;
            }

            wvNodeId previousId = edge.fromNodeId;
            wvOutputPortIndex previousPort = edge.fromPort;

            for (uint32_t step = 0; step != chain.length; ++step)
            {
                wvNodeId const nodeId = adapterId(edge, step);
                out.nodes.pushBack(wvGraphNode{
                    .nodeId = nodeId,
                    .typeId = rules[chain.rules[step]].adapterTypeId,
                    .role = wvNodeRole::Derived,
                    .derivedKind = wvDerivedKind::Adapter,
                    .anchorNodeId = edge.toNodeId,
                    .anchorPort = edge.toPort,
                });

                out.edges.pushBack(wvGraphEdge{
                    .fromNodeId = previousId,
                    .fromPort = previousPort,
                    .toNodeId = nodeId,
                    .toPort = wvInputPortIndex{0},
                    .role = wvEdgeRole::AutoInserted,
                    .order = edge.order,
                });

                previousId = nodeId;
                previousPort = wvOutputPortIndex{0};
            }

            wvGraphEdge adapted = edge;
            adapted.fromNodeId = previousId;
            adapted.fromPort = previousPort;
            out.edges.pushBack(adapted);
        }
    }
} // namespace weave
