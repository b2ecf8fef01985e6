// weave

#pragma once

#include "weave/canonical_type.hh"
#include "weave/types.hh"

#include <cstdint>

namespace weave {
    enum class wvCompileErrorCode : uint8_t
    {
        Unknown,
        UnknownNodeType,
        DuplicateNodeId,
        NodeNotFound,
        PortNotFound,
        MultipleWriters,
        AxisConflict,
        UnresolvedRequiredAxis,
        NoAdapterFound,
        IllegalCombinatorialCycle,
        CompositeExpansionError,
        VarargConnectionCount,
        LoweringFailed,
        DuplicateStateKey,
        ExpressionCompileError,
        ScheduleCycle,
    };

    enum class wvCompositeErrorKind : uint8_t
    {
        None,
        SelfReference,
        DepthExceeded,
        SizeExceeded,
        IdCollision,
        InterfaceMismatch,
    };

    /// A single compile problem, attributed to the node and port it concerns.
    ///
    /// Edge-related errors name the consuming node and input port in nodeId
    /// and port, and the producing node and output port in otherNodeId and
    /// otherPort.
    struct wvCompileError final
    {
        wvCompileErrorCode code = wvCompileErrorCode::Unknown;
        wvNodeId nodeId = wvInvalidNodeId;
        wvInputPortIndex port = wvInvalidInputPort;
        wvNodeId otherNodeId = wvInvalidNodeId;
        wvOutputPortIndex otherPort = wvInvalidOutputPort;
        uint32_t element = 0;
        uint32_t count = 0;
        wvAxisConflict conflict;
        wvCompositeErrorKind composite = wvCompositeErrorKind::None;
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
    };

    enum class wvAxisMode : uint8_t
    {
        Fixed,   // resolved to the declared value
        Generic, // shared with every other generic port of the node
        Free,    // a fresh variable owned by the port alone
    };

    struct wvPortType
    {
        wvAxisMode payloadMode = wvAxisMode::Fixed;
        wvPayload payload = wvPayload::Float;
        wvAxisMode cardinalityMode = wvAxisMode::Generic;
        // Fixed Many resolves to the instance created by the declaring node
        wvCardinalityKind cardinality = wvCardinalityKind::One;
        wvAxisMode temporalityMode = wvAxisMode::Fixed;
        wvTemporality temporality = wvTemporality::Continuous;
    };

    struct wvPortMeta
    {
        char const* name = nullptr;
        wvPortType type;
        bool vararg = false;
        uint8_t minConnections = 0;
        uint8_t maxConnections = 0; // 0 is unbounded
        float defaultValue[4] = {};
        wvNodeTypeId defaultSource = wvInvalidNodeTypeId;
    };

    struct wvNodeCompileMeta
    {
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
        char const* name = nullptr;
        wvPortMeta const* inputs = nullptr;
        uint32_t inputCount = 0;
        wvPortMeta const* outputs = nullptr;
        uint32_t outputCount = 0;
        bool hasDefaultPayload = false;
        wvPayload defaultPayload = wvPayload::Float;
        bool stateful = false;
        bool createsInstance = false;
        wvLowerFunction lower = nullptr;
        void* userData = nullptr;
    };

    struct wvCompositeNode
    {
        uint64_t innerId = 0;
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
        wvParam const* params = nullptr;
        uint32_t paramCount = 0;
    };

    struct wvCompositeEdge
    {
        uint64_t fromInner = 0;
        wvOutputPortIndex fromPort{0};
        uint64_t toInner = 0;
        wvInputPortIndex toPort{0};
    };

    // several bindings of the same port fan the input out to every listed target
    struct wvCompositeInput
    {
        wvInputPortIndex port{0};
        uint64_t innerId = 0;
        wvInputPortIndex innerPort{0};
    };

    struct wvCompositeOutput
    {
        wvOutputPortIndex port{0};
        uint64_t innerId = 0;
        wvOutputPortIndex innerPort{0};
    };

    struct wvCompositeMeta
    {
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
        char const* name = nullptr;
        wvCompositeNode const* nodes = nullptr;
        uint32_t nodeCount = 0;
        wvCompositeEdge const* edges = nullptr;
        uint32_t edgeCount = 0;
        wvCompositeInput const* inputs = nullptr;
        uint32_t inputCount = 0;
        wvCompositeOutput const* outputs = nullptr;
        uint32_t outputCount = 0;
    };

    // unset axes match anything and are left untouched by the conversion
    struct wvTypePattern
    {
        bool matchPayload = false;
        wvPayload payload = wvPayload::Float;
        bool matchCardinality = false;
        wvCardinalityKind cardinality = wvCardinalityKind::One;
        bool matchTemporality = false;
        wvTemporality temporality = wvTemporality::Continuous;
    };

    struct wvAdapterRule
    {
        char const* name = nullptr;
        wvTypePattern from;
        wvTypePattern to;
        wvNodeTypeId adapterTypeId = wvInvalidNodeTypeId;
    };

    enum class wvCycleClassification : uint8_t
    {
        TrivialSelfLoop,
        Cyclic,
    };

    enum class wvCycleLegality : uint8_t
    {
        LegalFeedback,
        IllegalCombinatorial,
    };

    enum class wvCycleFix : uint8_t
    {
        None,
        InsertDelay,
    };

    struct wvCycleInfo
    {
        wvCycleClassification classification = wvCycleClassification::Cyclic;
        wvCycleLegality legality = wvCycleLegality::LegalFeedback;
        wvCycleFix suggestedFix = wvCycleFix::None;
        uint32_t nodeCount = 0;
    };

    // a node of the normalized graph
    struct wvNodeInfo
    {
        wvNodeId nodeId = wvInvalidNodeId;
        wvNodeTypeId typeId = wvInvalidNodeTypeId;
        wvNodeRole role = wvNodeRole::User;
        wvDerivedKind derivedKind = wvDerivedKind::None;
        wvNodeId anchorNodeId = wvInvalidNodeId;
        wvInputPortIndex anchorPort = wvInvalidInputPort;
    };

    struct wvCompileOptions
    {
        uint32_t maxCompositeDepth = 5;
        uint32_t maxCompositeNodes = 500;
        uint32_t maxAdapterChain = 2;
        bool logPasses = false;
    };
} // namespace weave
