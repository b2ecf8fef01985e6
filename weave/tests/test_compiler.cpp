// weave

#include <catch2/catch_test_macros.hpp>

#include "weave/blocks.hh"
#include "weave/graph_compiler.hh"
#include "weave/lower.hh"

#include "ir.hh"
#include "leak_alloc.hh"
#include "lowering.hh"
#include "passes.hh"
#include "patch_runner.hh"

#include <vector>

using namespace weave;

namespace {
    constexpr wvOutputPortIndex out0{0};
    constexpr wvOutputPortIndex out1{1};
    constexpr wvInputPortIndex in0{0};

    uint32_t countDerived(wvGraphCompiler const& compiler, wvDerivedKind kind)
    {
        uint32_t count = 0;
        for (uint32_t index = 0; index != compiler.getNodeCount(); ++index)
        {
            wvNodeInfo const node = compiler.getNode(index);
            if (node.role == wvNodeRole::Derived && node.derivedKind == kind)
                ++count;
        }
        return count;
    }

    bool lowerPassThrough(wvLowerContext& context, void*)
    {
        wvExprId const value = context.input(in0);
        context.setOutput(out0, value);
        return value != wvInvalidExprId;
    }

    // Wobble(in = 2) passes its input through; Consumer.in defaults to a Wobble
    constexpr wvNodeTypeId wobbleTypeId = wvBlockTypeId("Wobble");
    constexpr wvNodeTypeId consumerTypeId = wvBlockTypeId("Consumer");

    constexpr wvPortMeta passOutputs[] = {
        {.name = "out"},
    };
    constexpr wvPortMeta wobbleInputs[] = {
        {.name = "in", .defaultValue = {2.f}},
    };
    constexpr wvPortMeta consumerInputs[] = {
        {.name = "in", .defaultSource = wobbleTypeId},
    };

    void registerDeclaredSources(wvStandardCatalog& catalog)
    {
        catalog.registerNodeType({
            .typeId = wobbleTypeId,
            .name = "Wobble",
            .inputs = wobbleInputs,
            .inputCount = 1,
            .outputs = passOutputs,
            .outputCount = 1,
            .lower = lowerPassThrough,
        });
        catalog.registerNodeType({
            .typeId = consumerTypeId,
            .name = "Consumer",
            .inputs = consumerInputs,
            .inputCount = 1,
            .outputs = passOutputs,
            .outputCount = 1,
            .lower = lowerPassThrough,
        });
    }
} // namespace

TEST_CASE("Graph validation", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId constNode{1};
    constexpr wvNodeId sinNode{2};

    SECTION("Unknown node type")
    {
        compiler.beginNode(constNode, wvBlockTypeId("NoSuchBlock"));

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::UnknownNodeType));
    }

    SECTION("Duplicate node id")
    {
        compiler.beginNode(constNode, wvConstBlockId);
        compiler.beginNode(constNode, wvConstBlockId);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::DuplicateNodeId));
    }

    SECTION("Edge to a missing node")
    {
        compiler.beginNode(constNode, wvConstBlockId);
        compiler.addEdge(constNode, out0, sinNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::NodeNotFound));
    }

    SECTION("Edge to a missing port")
    {
        compiler.beginNode(constNode, wvConstBlockId);
        compiler.beginNode(sinNode, wvSinBlockId);
        compiler.addEdge(constNode, out0, sinNode, wvInputPortIndex{5});

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::PortNotFound));
    }

    SECTION("Two writers on one input")
    {
        constexpr wvNodeId otherNode{3};

        compiler.beginNode(constNode, wvConstBlockId);
        compiler.beginNode(otherNode, wvConstBlockId);
        compiler.beginNode(sinNode, wvSinBlockId);
        compiler.addEdge(constNode, out0, sinNode, in0);
        compiler.addEdge(otherNode, out0, sinNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::MultipleWriters));
    }

    SECTION("Disabled edges are ignored")
    {
        constexpr wvNodeId otherNode{3};

        compiler.beginNode(constNode, wvConstBlockId);
        compiler.beginNode(otherNode, wvConstBlockId);
        compiler.beginNode(sinNode, wvSinBlockId);
        compiler.addEdge(constNode, out0, sinNode, in0);
        compiler.addEdge(otherNode, out0, sinNode, in0, {.enabled = false});

        CHECK(compiler.compile());
        CHECK(compiler.getErrorCount() == 0);
    }

    SECTION("Empty vararg input")
    {
        compiler.beginNode(constNode, wvAddBlockId);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::VarargConnectionCount));
    }

    SECTION("All errors are collected")
    {
        compiler.beginNode(constNode, wvBlockTypeId("NoSuchBlock"));
        compiler.beginNode(sinNode, wvAddBlockId);
        compiler.addEdge(wvNodeId{99}, out0, sinNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::UnknownNodeType));
        CHECK(runner.hasError(wvCompileErrorCode::NodeNotFound));
    }
}

TEST_CASE("Default sources", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId divideNode{1};
    constexpr wvNodeId probeNode{2};

    auto const describe = [&compiler, divideNode, probeNode] {
        compiler.reset();
        compiler.beginNode(divideNode, wvDivideBlockId);
        compiler.setParam("a", 6.f);
        compiler.beginNode(probeNode, wvProbeBlockId);
        compiler.setParamText("name", "quotient");
        compiler.addEdge(divideNode, out0, probeNode, in0);
    };

    describe();
    REQUIRE(runner.compile());

    // a and b each get a source; b keeps its declared default of 1
    CHECK(countDerived(compiler, wvDerivedKind::DefaultSource) == 2);

    std::vector<uint8_t> const first = runner.blob();
    describe();
    REQUIRE(runner.compile());
    CHECK(runner.blob() == first);
    CHECK(countDerived(compiler, wvDerivedKind::DefaultSource) == 2);

    REQUIRE(runner.install());
    REQUIRE(runner.advance(0.0));
    CHECK(runner.output("quotient") == 6.f);
}

TEST_CASE("Declared default sources", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    registerDeclaredSources(runner.catalog());

    constexpr wvNodeId consumerNode{1};
    constexpr wvNodeId probeNode{2};

    SECTION("Inserted sources get their own inputs")
    {
        wvGraphCompiler& compiler = runner.compiler();
        compiler.beginNode(consumerNode, consumerTypeId);
        compiler.beginNode(probeNode, wvProbeBlockId);
        compiler.setParamText("name", "out");
        compiler.addEdge(consumerNode, out0, probeNode, in0);

        REQUIRE(runner.compileAndInstall());
        CHECK(countDerived(compiler, wvDerivedKind::DefaultSource) == 2);

        REQUIRE(runner.advance(0.0));
        CHECK(runner.output("out") == 2.f);
    }

    SECTION("Materializing twice changes nothing")
    {
        wvCompileOptions const options{};
        wvArray<wvCompileError> errors(alloc);
        wvPassContext context(alloc, runner.catalog(), options, errors);

        wvGraph authored(alloc);
        authored.nodes.pushBack(wvGraphNode{.nodeId = consumerNode, .typeId = consumerTypeId});

        wvGraph once(alloc);
        wvGraph twice(alloc);
        wvMaterializeDefaults(context, authored, once);
        wvMaterializeDefaults(context, once, twice);

        CHECK(errors.empty());
        CHECK(once.nodes.size() == 3);
        CHECK(once.edges.size() == 2);
        CHECK(twice.nodes.size() == once.nodes.size());
        CHECK(twice.edges.size() == once.edges.size());
    }

    SECTION("Sources that default to themselves stop at the depth limit")
    {
        constexpr wvNodeTypeId loopTypeId = wvBlockTypeId("Recurse");
        static constexpr wvPortMeta loopInputs[] = {
            {.name = "in", .defaultSource = loopTypeId},
        };
        runner.catalog().registerNodeType({
            .typeId = loopTypeId,
            .name = "Recurse",
            .inputs = loopInputs,
            .inputCount = 1,
            .outputs = passOutputs,
            .outputCount = 1,
            .lower = lowerPassThrough,
        });

        wvGraphCompiler& compiler = runner.compiler();
        compiler.beginNode(consumerNode, loopTypeId);

        CHECK_FALSE(runner.compile());
        CHECK(runner.hasError(wvCompileErrorCode::LoweringFailed));
        CHECK(countDerived(compiler, wvDerivedKind::DefaultSource) == wvMaxDefaultSourceDepth);
    }
}

TEST_CASE("Adapters", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId arrayNode{1};
    constexpr wvNodeId indexNode{2};
    constexpr wvNodeId consumerNode{3};
    constexpr wvNodeId probeNode{4};
    constexpr wvNodeId inputNode{5};

    compiler.beginNode(arrayNode, wvArrayBlockId);
    compiler.setParam("count", 4.f);
    compiler.beginNode(probeNode, wvProbeBlockId);
    compiler.setParamText("name", "out");

    SECTION("Int to float")
    {
        compiler.beginNode(consumerNode, wvSinBlockId);
        compiler.addEdge(arrayNode, out1, consumerNode, in0);
        compiler.addEdge(consumerNode, out0, probeNode, in0);

        REQUIRE(runner.compile());
        CHECK(countDerived(compiler, wvDerivedKind::Adapter) == 1);

        wvCanonicalType type;
        REQUIRE(compiler.getInputType(consumerNode, in0, 0, type));
        CHECK(type.payload == wvPayload::Float);
    }

    SECTION("Signals are broadcast onto fields")
    {
        compiler.beginNode(indexNode, wvElementIndexBlockId);
        compiler.beginNode(inputNode, wvExternalInputBlockId);
        compiler.setParamText("name", "offset");
        compiler.beginNode(consumerNode, wvAddBlockId);

        compiler.addEdge(arrayNode, out0, indexNode, in0);
        compiler.addEdge(indexNode, out1, consumerNode, in0);
        compiler.addEdge(inputNode, out0, consumerNode, in0);
        compiler.addEdge(consumerNode, out0, probeNode, in0);

        REQUIRE(runner.compileAndInstall());
        CHECK(countDerived(compiler, wvDerivedKind::Adapter) == 1);

        wvExternalValue const offset{.nameHash = wvHashName("offset"), .values = {10.f}};
        REQUIRE(runner.advance(0.0, {.values = &offset, .count = 1}));
        REQUIRE(runner.outputCount("out") == 4);
        CHECK(runner.output("out", 0) == 10.f);
        CHECK(runner.output("out", 3) == 11.f);
    }

    SECTION("No adapter bridges a vec2 into a float")
    {
        constexpr wvNodeId gridNode{6};

        compiler.beginNode(gridNode, wvGridLayoutBlockId);
        compiler.beginNode(consumerNode, wvSinBlockId);
        compiler.addEdge(arrayNode, out0, gridNode, in0);
        compiler.addEdge(gridNode, out0, consumerNode, in0);

        CHECK_FALSE(runner.compile());
        CHECK(runner.hasError(wvCompileErrorCode::NoAdapterFound));
    }
}

TEST_CASE("Type inference", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId arrayNode{1};
    constexpr wvNodeId gridNode{2};
    constexpr wvNodeId constNode{3};

    compiler.beginNode(arrayNode, wvArrayBlockId);
    compiler.beginNode(gridNode, wvGridLayoutBlockId);
    compiler.beginNode(constNode, wvConstBlockId);
    compiler.addEdge(arrayNode, out0, gridNode, in0);

    REQUIRE(runner.compile());

    wvCanonicalType position;
    REQUIRE(compiler.getOutputType(gridNode, out0, position));
    CHECK(position.payload == wvPayload::Vec2);
    REQUIRE(position.extent.cardinality.isResolved());
    CHECK(position.extent.cardinality.value().kind == wvCardinalityKind::Many);

    wvCanonicalType elements;
    REQUIRE(compiler.getOutputType(arrayNode, out0, elements));
    CHECK(elements.extent.cardinality.value() == position.extent.cardinality.value());

    // an unconnected generic block falls back to its default payload
    wvCanonicalType constant;
    REQUIRE(compiler.getOutputType(constNode, out0, constant));
    CHECK(constant.payload == wvPayload::Float);
    CHECK(constant.extent.cardinality.value() == wvCardinality::one());
}

TEST_CASE("Composites", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeTypeId offsetTypeId = wvBlockTypeId("Offset");

    static constexpr wvParam constParams[] = {
        {.name = "value", .value = {.values = {5.f}, .count = 1}},
    };
    static constexpr wvCompositeNode nodes[] = {
        {.innerId = 1, .typeId = wvAddBlockId},
        {.innerId = 2, .typeId = wvConstBlockId, .params = constParams, .paramCount = 1},
    };
    static constexpr wvCompositeEdge edges[] = {
        {.fromInner = 2, .fromPort = wvOutputPortIndex{0}, .toInner = 1, .toPort = wvInputPortIndex{0}},
    };
    static constexpr wvCompositeInput inputs[] = {
        {.port = wvInputPortIndex{0}, .innerId = 1, .innerPort = wvInputPortIndex{0}},
    };
    static constexpr wvCompositeOutput outputs[] = {
        {.port = wvOutputPortIndex{0}, .innerId = 1, .innerPort = wvOutputPortIndex{0}},
    };

    runner.catalog().registerComposite({
        .typeId = offsetTypeId,
        .name = "Offset",
        .nodes = nodes,
        .nodeCount = 2,
        .edges = edges,
        .edgeCount = 1,
        .inputs = inputs,
        .inputCount = 1,
        .outputs = outputs,
        .outputCount = 1,
    });

    constexpr wvNodeId inputNode{1};
    constexpr wvNodeId offsetNode{2};
    constexpr wvNodeId probeNode{3};

    compiler.beginNode(inputNode, wvExternalInputBlockId);
    compiler.setParamText("name", "x");
    compiler.beginNode(offsetNode, offsetTypeId);
    compiler.beginNode(probeNode, wvProbeBlockId);
    compiler.setParamText("name", "shifted");
    compiler.addEdge(inputNode, out0, offsetNode, in0);
    compiler.addEdge(offsetNode, out0, probeNode, in0);

    REQUIRE(runner.compileAndInstall());
    CHECK(countDerived(compiler, wvDerivedKind::CompositeExpansion) == 2);

    wvExternalValue const x{.nameHash = wvHashName("x"), .values = {2.f}};
    REQUIRE(runner.advance(0.0, {.values = &x, .count = 1}));
    CHECK(runner.output("shifted") == 7.f);
}

TEST_CASE("Composite expansion limits", "[compiler]")
{
    test::LeakTestAllocator alloc;

    // every composite table outlives the catalog that refers to it
    constexpr uint32_t nestDepth = 6;
    std::vector<wvCompositeNode> nested(nestDepth);
    std::vector<wvCompositeNode> wide(501);

    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    auto const hasCompositeError = [&compiler](wvCompositeErrorKind kind) {
        for (uint32_t index = 0; index != compiler.getErrorCount(); ++index)
        {
            wvCompileError const error = compiler.getError(index);
            if (error.code == wvCompileErrorCode::CompositeExpansionError && error.composite == kind)
                return true;
        }
        return false;
    };

    constexpr wvNodeId userNode{1};

    SECTION("A composite may not contain itself")
    {
        constexpr wvNodeTypeId loopTypeId = wvBlockTypeId("Ouroboros");
        static constexpr wvCompositeNode inner[] = {
            {.innerId = 1, .typeId = loopTypeId},
        };
        runner.catalog().registerComposite({.typeId = loopTypeId, .name = "Ouroboros", .nodes = inner, .nodeCount = 1});

        compiler.beginNode(userNode, loopTypeId);
        CHECK_FALSE(compiler.compile());
        CHECK(hasCompositeError(wvCompositeErrorKind::SelfReference));
    }

    SECTION("Nesting stops at the depth limit")
    {
        // Nest0 holds Nest1 and so on; the innermost holds a constant
        char const* const names[nestDepth] = {"Nest0", "Nest1", "Nest2", "Nest3", "Nest4", "Nest5"};
        for (uint32_t level = 0; level != nestDepth; ++level)
        {
            nested[level] = {
                .innerId = 1,
                .typeId = level + 1 == nestDepth ? wvConstBlockId : wvBlockTypeId(names[level + 1]),
            };
            runner.catalog().registerComposite({.typeId = wvBlockTypeId(names[level]), .name = names[level], .nodes = &nested[level], .nodeCount = 1});
        }

        compiler.beginNode(userNode, wvBlockTypeId("Nest0"));
        CHECK_FALSE(compiler.compile());
        CHECK(hasCompositeError(wvCompositeErrorKind::DepthExceeded));
    }

    SECTION("Expansion stops at the node limit")
    {
        for (uint32_t index = 0; index != wide.size(); ++index)
            wide[index] = {.innerId = index + 1, .typeId = wvConstBlockId};
        runner.catalog().registerComposite({
            .typeId = wvBlockTypeId("Crowd"),
            .name = "Crowd",
            .nodes = wide.data(),
            .nodeCount = static_cast<uint32_t>(wide.size()),
        });

        compiler.beginNode(userNode, wvBlockTypeId("Crowd"));
        CHECK_FALSE(compiler.compile());
        CHECK(hasCompositeError(wvCompositeErrorKind::SizeExceeded));
    }
}

TEST_CASE("Type errors", "[compiler]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    SECTION("An adapter whose output disagrees with the consumer")
    {
        // converts the payload as promised, but emits an event
        constexpr wvNodeTypeId flattenTypeId = wvBlockTypeId("Flatten");
        static constexpr wvPortMeta flattenInputs[] = {
            {.name = "in", .type = {.payload = wvPayload::Vec2}},
        };
        static constexpr wvPortMeta flattenOutputs[] = {
            {.name = "out", .type = {.temporality = wvTemporality::Discrete}},
        };
        runner.catalog().registerNodeType({
            .typeId = flattenTypeId,
            .name = "Flatten",
            .inputs = flattenInputs,
            .inputCount = 1,
            .outputs = flattenOutputs,
            .outputCount = 1,
            .lower = lowerPassThrough,
        });
        runner.catalog().registerAdapter({
            .name = "flatten",
            .from = {.matchPayload = true, .payload = wvPayload::Vec2},
            .to = {.matchPayload = true, .payload = wvPayload::Float},
            .adapterTypeId = flattenTypeId,
        });

        constexpr wvNodeId arrayNode{1};
        constexpr wvNodeId gridNode{2};
        constexpr wvNodeId sinNode{3};

        compiler.beginNode(arrayNode, wvArrayBlockId);
        compiler.beginNode(gridNode, wvGridLayoutBlockId);
        compiler.beginNode(sinNode, wvSinBlockId);
        compiler.addEdge(arrayNode, out0, gridNode, in0);
        compiler.addEdge(gridNode, out0, sinNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(countDerived(compiler, wvDerivedKind::Adapter) == 1);
        CHECK_FALSE(runner.hasError(wvCompileErrorCode::NoAdapterFound));

        bool temporalityConflict = false;
        for (uint32_t index = 0; index != compiler.getErrorCount(); ++index)
        {
            wvCompileError const error = compiler.getError(index);
            if (error.code == wvCompileErrorCode::AxisConflict && error.nodeId == sinNode)
                temporalityConflict = error.conflict.axis == wvAxisName::Temporality;
        }
        CHECK(temporalityConflict);
    }

    SECTION("A payload nothing decides")
    {
        constexpr wvNodeTypeId wildcardTypeId = wvBlockTypeId("Wildcard");
        static constexpr wvPortMeta wildcardOutputs[] = {
            {.name = "out", .type = {.payloadMode = wvAxisMode::Generic}},
        };
        runner.catalog().registerNodeType({
            .typeId = wildcardTypeId,
            .name = "Wildcard",
            .outputs = wildcardOutputs,
            .outputCount = 1,
            .lower = lowerPassThrough,
        });

        constexpr wvNodeId wildcardNode{1};
        compiler.beginNode(wildcardNode, wildcardTypeId);

        CHECK_FALSE(compiler.compile());
        REQUIRE(runner.hasError(wvCompileErrorCode::UnresolvedRequiredAxis));
        CHECK(compiler.getError(0).nodeId == wildcardNode);
        CHECK(compiler.getError(0).conflict.axis == wvAxisName::Payload);
    }
}

TEST_CASE("Cycles", "[compiler][cycles]")
{
    test::LeakTestAllocator alloc;
    test::PatchRunner runner(alloc);
    wvGraphCompiler& compiler = runner.compiler();

    constexpr wvNodeId addNode{1};
    constexpr wvNodeId loopNode{2};
    constexpr wvNodeId stepNode{3};
    constexpr wvNodeId probeNode{4};

    compiler.beginNode(addNode, wvAddBlockId);
    compiler.beginNode(stepNode, wvConstBlockId);
    compiler.setParam("value", 1.f);
    compiler.beginNode(probeNode, wvProbeBlockId);
    compiler.setParamText("name", "count");
    compiler.addEdge(stepNode, out0, addNode, in0);

    SECTION("Feedback through a delay is legal")
    {
        compiler.beginNode(loopNode, wvUnitDelayBlockId);
        compiler.addEdge(addNode, out0, loopNode, in0);
        compiler.addEdge(loopNode, out0, addNode, in0);
        compiler.addEdge(loopNode, out0, probeNode, in0);

        REQUIRE(runner.compileAndInstall());
        REQUIRE(compiler.getCycleCount() == 1);
        CHECK(compiler.getCycle(0).legality == wvCycleLegality::LegalFeedback);
        CHECK(compiler.getCycle(0).nodeCount == 2);

        float const expected[] = {0.f, 1.f, 2.f, 3.f};
        for (uint32_t frame = 0; frame != 4; ++frame)
        {
            REQUIRE(runner.advance(frame * 16.0));
            CHECK(runner.output("count") == expected[frame]);
        }
    }

    SECTION("Instant feedback is rejected")
    {
        compiler.beginNode(loopNode, wvSinBlockId);
        compiler.addEdge(addNode, out0, loopNode, in0);
        compiler.addEdge(loopNode, out0, addNode, in0);
        compiler.addEdge(loopNode, out0, probeNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::IllegalCombinatorialCycle));
        REQUIRE(compiler.getCycleCount() == 1);

        wvCycleInfo const cycle = compiler.getCycle(0);
        CHECK(cycle.legality == wvCycleLegality::IllegalCombinatorial);
        CHECK(cycle.suggestedFix == wvCycleFix::InsertDelay);

        bool const hasAdd = compiler.getCycleNode(0, 0) == addNode || compiler.getCycleNode(0, 1) == addNode;
        CHECK(hasAdd);
    }

    SECTION("A delay elsewhere in the component does not excuse an instant loop")
    {
        constexpr wvNodeId sinNode{5};

        // add -> sin -> add has no state; the delay only closes a second, outer loop
        compiler.beginNode(loopNode, wvUnitDelayBlockId);
        compiler.beginNode(sinNode, wvSinBlockId);
        compiler.addEdge(loopNode, out0, addNode, in0);
        compiler.addEdge(sinNode, out0, addNode, in0);
        compiler.addEdge(addNode, out0, sinNode, in0);
        compiler.addEdge(sinNode, out0, loopNode, in0);
        compiler.addEdge(sinNode, out0, probeNode, in0);

        CHECK_FALSE(compiler.compile());
        CHECK(runner.hasError(wvCompileErrorCode::IllegalCombinatorialCycle));
        REQUIRE(compiler.getCycleCount() == 1);
        CHECK(compiler.getCycle(0).nodeCount == 3);
        CHECK(compiler.getCycle(0).legality == wvCycleLegality::IllegalCombinatorial);
        CHECK(compiler.getCycle(0).suggestedFix == wvCycleFix::InsertDelay);

        bool namesLoopMember = false;
        for (uint32_t index = 0; index != compiler.getErrorCount(); ++index)
        {
            wvCompileError const error = compiler.getError(index);
            if (error.code == wvCompileErrorCode::IllegalCombinatorialCycle)
                namesLoopMember = error.nodeId == addNode || error.nodeId == sinNode;
        }
        CHECK(namesLoopMember);
    }

    SECTION("A stateful edge breaks the loop")
    {
        compiler.beginNode(loopNode, wvSinBlockId);
        compiler.addEdge(addNode, out0, loopNode, in0);
        compiler.addEdge(loopNode, out0, addNode, in0, {.stateful = true});
        compiler.addEdge(loopNode, out0, probeNode, in0);

        REQUIRE(runner.compile());
        CHECK(countDerived(compiler, wvDerivedKind::WireState) == 1);
        REQUIRE(compiler.getCycleCount() == 1);
        CHECK(compiler.getCycle(0).legality == wvCycleLegality::LegalFeedback);
    }

    SECTION("A self loop through a delay")
    {
        compiler.beginNode(loopNode, wvUnitDelayBlockId);
        compiler.addEdge(loopNode, out0, loopNode, in0);
        compiler.addEdge(loopNode, out0, probeNode, in0);

        REQUIRE(runner.compile());
        REQUIRE(compiler.getCycleCount() == 1);
        CHECK(compiler.getCycle(0).classification == wvCycleClassification::TrivialSelfLoop);
    }
}

TEST_CASE("Scheduling", "[compiler][cycles]")
{
    test::LeakTestAllocator alloc;
    wvStandardCatalog catalog(alloc);
    wvCompileOptions const options{};
    wvArray<wvCompileError> errors(alloc);
    wvPassContext context(alloc, catalog, options, errors);

    wvIrBuilder ir(alloc);
    wvArray<wvProgramStep> phase1(alloc);
    wvArray<wvProgramStep> phase2(alloc);

    float const one = 1.f;
    uint32_t const constant = ir.addConstant(&one, 1);
    uint32_t const first = ir.addSlot(1, wvInvalidIndex);
    uint32_t const second = ir.addSlot(1, wvInvalidIndex);
    uint32_t const readFirst = ir.addExpr({.kind = wvExprKind::SlotRead, .immediate = first}, nullptr, 0);

    SECTION("Readers follow writers")
    {
        ir.addStep({.kind = wvStepKind::EvalSignal, .expr = wvProgramExprIndex{readFirst}, .slot = wvProgramSlotIndex{second}}, false);
        ir.addStep({.kind = wvStepKind::EvalSignal, .expr = wvProgramExprIndex{constant}, .slot = wvProgramSlotIndex{first}}, false);

        REQUIRE(wvBuildSchedule(context, ir, phase1, phase2));
        REQUIRE(phase1.size() == 2);
        CHECK(phase1[0].slot == wvProgramSlotIndex{first});
        CHECK(phase1[1].slot == wvProgramSlotIndex{second});
    }

    SECTION("A step reading its own slot never runs")
    {
        ir.addStep({.kind = wvStepKind::EvalSignal, .expr = wvProgramExprIndex{readFirst}, .slot = wvProgramSlotIndex{first}}, false);

        CHECK_FALSE(wvBuildSchedule(context, ir, phase1, phase2));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].code == wvCompileErrorCode::ScheduleCycle);
        CHECK(errors[0].count == 1);
    }
}
