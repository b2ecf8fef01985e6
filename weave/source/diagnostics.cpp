// weave

#include "weave/diagnostics.hh"

#include <fmt/format.h>

#include <iterator>
#include <string>

namespace weave {
    char const* wvPayloadName(wvPayload payload) noexcept
    {
        switch (payload)
        {
        case wvPayload::Float: return "float";
        case wvPayload::Int: return "int";
        case wvPayload::Bool: return "bool";
        case wvPayload::Vec2: return "vec2";
        case wvPayload::Vec3: return "vec3";
        case wvPayload::Color: return "color";
        case wvPayload::Shape: return "shape";
        case wvPayload::Token: return "token";
        case wvPayload::CameraProjection: return "camera";
        }
        return "?";
    }

    char const* wvAxisNameString(wvAxisName axis) noexcept
    {
        switch (axis)
        {
        case wvAxisName::Payload: return "payload";
        case wvAxisName::Cardinality: return "cardinality";
        case wvAxisName::Temporality: return "temporality";
        case wvAxisName::Binding: return "binding";
        case wvAxisName::Perspective: return "perspective";
        case wvAxisName::Branch: return "branch";
        }
        return "?";
    }

    char const* wvCompileErrorName(wvCompileErrorCode code) noexcept
    {
        switch (code)
        {
        case wvCompileErrorCode::Unknown: return "Unknown";
        case wvCompileErrorCode::UnknownNodeType: return "UnknownNodeType";
        case wvCompileErrorCode::DuplicateNodeId: return "DuplicateNodeId";
        case wvCompileErrorCode::NodeNotFound: return "NodeNotFound";
        case wvCompileErrorCode::PortNotFound: return "PortNotFound";
        case wvCompileErrorCode::MultipleWriters: return "MultipleWriters";
        case wvCompileErrorCode::AxisConflict: return "AxisConflict";
        case wvCompileErrorCode::UnresolvedRequiredAxis: return "UnresolvedRequiredAxis";
        case wvCompileErrorCode::NoAdapterFound: return "NoAdapterFound";
        case wvCompileErrorCode::IllegalCombinatorialCycle: return "IllegalCombinatorialCycle";
        case wvCompileErrorCode::CompositeExpansionError: return "CompositeExpansionError";
        case wvCompileErrorCode::VarargConnectionCount: return "VarargConnectionCount";
        case wvCompileErrorCode::LoweringFailed: return "LoweringFailed";
        case wvCompileErrorCode::DuplicateStateKey: return "DuplicateStateKey";
        case wvCompileErrorCode::ExpressionCompileError: return "ExpressionCompileError";
        case wvCompileErrorCode::ScheduleCycle: return "ScheduleCycle";
        }
        return "?";
    }

    char const* wvRuntimeErrorName(wvRuntimeErrorCode code) noexcept
    {
        switch (code)
        {
        case wvRuntimeErrorCode::None: return "None";
        case wvRuntimeErrorCode::NoProgram: return "NoProgram";
        case wvRuntimeErrorCode::NonMonotonicTime: return "NonMonotonicTime";
        case wvRuntimeErrorCode::StaleProgram: return "StaleProgram";
        case wvRuntimeErrorCode::MigrationAmbiguity: return "MigrationAmbiguity";
        case wvRuntimeErrorCode::InvalidProgram: return "InvalidProgram";
        case wvRuntimeErrorCode::PhaseViolation: return "PhaseViolation";
        }
        return "?";
    }

    static char const* compositeKindName(wvCompositeErrorKind kind) noexcept
    {
        switch (kind)
        {
        case wvCompositeErrorKind::None: return "none";
        case wvCompositeErrorKind::SelfReference: return "self reference";
        case wvCompositeErrorKind::DepthExceeded: return "depth exceeded";
        case wvCompositeErrorKind::SizeExceeded: return "size exceeded";
        case wvCompositeErrorKind::IdCollision: return "id collision";
        case wvCompositeErrorKind::InterfaceMismatch: return "interface mismatch";
        }
        return "?";
    }

    static std::string describeCardinality(wvAxis<wvCardinality> const& axis)
    {
        if (axis.isVariable())
            return fmt::format("?c{}", axis.var().value());

        wvCardinality const& value = axis.value();
        switch (value.kind)
        {
        case wvCardinalityKind::Zero: return "zero";
        case wvCardinalityKind::One: return "one";
        case wvCardinalityKind::Many: return fmt::format("many({:016x})", value.instance.value());
        }
        return "?";
    }

    static std::string describeAxisValue(wvAxisName axis, wvAxisValue const& value)
    {
        switch (axis)
        {
        case wvAxisName::Payload: return wvPayloadName(value.payload);
        case wvAxisName::Cardinality: return describeCardinality(wvAxis<wvCardinality>::resolved(value.cardinality));
        case wvAxisName::Temporality: return value.temporality == wvTemporality::Continuous ? "continuous" : "discrete";
        case wvAxisName::Binding:
            switch (value.binding.kind)
            {
            case wvBindingKind::Unbound: return "unbound";
            case wvBindingKind::Weak: return fmt::format("weak({:016x})", value.binding.referent.value());
            case wvBindingKind::Strong: return fmt::format("strong({:016x})", value.binding.referent.value());
            case wvBindingKind::Identity: return fmt::format("identity({:016x})", value.binding.referent.value());
            }
            return "?";
        case wvAxisName::Perspective: return fmt::format("{}", value.perspective.value());
        case wvAxisName::Branch: return fmt::format("{}", value.branch.value());
        }
        return "?";
    }

    std::string wvDescribeType(wvCanonicalType const& type)
    {
        std::string result = fmt::format("{}<{}", wvPayloadName(type.payload), describeCardinality(type.extent.cardinality));

        if (type.extent.temporality.isVariable())
            fmt::format_to(std::back_inserter(result), ", ?t{}", type.extent.temporality.var().value());
        else if (type.extent.temporality.value() == wvTemporality::Discrete)
            result += ", discrete";

        if (type.extent.binding.isResolved() && type.extent.binding.value().kind != wvBindingKind::Unbound)
        {
            wvAxisValue value;
            value.binding = type.extent.binding.value();
            fmt::format_to(std::back_inserter(result), ", {}", describeAxisValue(wvAxisName::Binding, value));
        }

        result += '>';
        return result;
    }

    std::string wvDescribeError(wvCompileError const& error)
    {
        std::string result = fmt::format("{}: node {:016x}", wvCompileErrorName(error.code), error.nodeId.value());

        if (error.port != wvInvalidInputPort)
            fmt::format_to(std::back_inserter(result), " port {}", error.port.value());

        if (error.otherNodeId != wvInvalidNodeId)
        {
            fmt::format_to(std::back_inserter(result), ", from node {:016x}", error.otherNodeId.value());
            if (error.otherPort != wvInvalidOutputPort)
                fmt::format_to(std::back_inserter(result), " port {}", error.otherPort.value());
        }

        switch (error.code)
        {
        case wvCompileErrorCode::AxisConflict:
        case wvCompileErrorCode::NoAdapterFound:
            fmt::format_to(std::back_inserter(result), " ({}: {} vs {})", wvAxisNameString(error.conflict.axis),
                describeAxisValue(error.conflict.axis, error.conflict.left), describeAxisValue(error.conflict.axis, error.conflict.right));
            break;
        case wvCompileErrorCode::UnresolvedRequiredAxis:
            fmt::format_to(std::back_inserter(result), " ({})", wvAxisNameString(error.conflict.axis));
            break;
        case wvCompileErrorCode::CompositeExpansionError:
            fmt::format_to(std::back_inserter(result), " ({}, type {:016x})", compositeKindName(error.composite), error.typeId.value());
            break;
        case wvCompileErrorCode::VarargConnectionCount:
            fmt::format_to(std::back_inserter(result), " ({} connections)", error.count);
            break;
        case wvCompileErrorCode::UnknownNodeType:
            fmt::format_to(std::back_inserter(result), " (type {:016x})", error.typeId.value());
            break;
        default: break;
        }

        return result;
    }
} // namespace weave
