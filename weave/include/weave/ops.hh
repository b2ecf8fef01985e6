// weave

#pragma once

#include <cstdint>

namespace weave {
    // kernel operations applied component-wise over float lanes
    enum class wvOpCode : uint8_t
    {
        Nop = 0,

        // unary operators
        Neg,
        Not,
        Abs,
        Floor,
        Fract,
        Sin,
        Cos,
        Sqrt,
        ToInt,

        // binary operators
        Add,
        Sub,
        Mul,
        Div,
        Mod,
        Min,
        Max,
        Pow,
        And,
        Or,
        Xor,
        Less,
        Greater,
        Equal,

        // ternary operators
        Clamp,
        Mix,
        Select,

        // shape operators
        Pack,      // concatenates the components of all arguments
        Component, // extracts the component named by the immediate
        HsvToRgb,  // hue, saturation, value -> color with alpha 1

        Last,
    };

    enum class wvReduceOp : uint8_t
    {
        Sum,
        Min,
        Max,
        Mean,
    };

    // number of arguments, or 0 for operators taking any count
    constexpr uint32_t wvOpArity(wvOpCode op) noexcept
    {
        switch (op)
        {
        case wvOpCode::Neg:
        case wvOpCode::Not:
        case wvOpCode::Abs:
        case wvOpCode::Floor:
        case wvOpCode::Fract:
        case wvOpCode::Sin:
        case wvOpCode::Cos:
        case wvOpCode::Sqrt:
        case wvOpCode::ToInt:
        case wvOpCode::Component: return 1;
        case wvOpCode::Add:
        case wvOpCode::Sub:
        case wvOpCode::Mul:
        case wvOpCode::Div:
        case wvOpCode::Mod:
        case wvOpCode::Min:
        case wvOpCode::Max:
        case wvOpCode::Pow:
        case wvOpCode::And:
        case wvOpCode::Or:
        case wvOpCode::Xor:
        case wvOpCode::Less:
        case wvOpCode::Greater:
        case wvOpCode::Equal: return 2;
        case wvOpCode::Clamp:
        case wvOpCode::Mix:
        case wvOpCode::Select:
        case wvOpCode::HsvToRgb: return 3;
        case wvOpCode::Nop:
        case wvOpCode::Pack:
        case wvOpCode::Last: return 0;
        }
        return 0;
    }
} // namespace weave
