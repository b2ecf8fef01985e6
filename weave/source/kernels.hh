// weave

#pragma once

#include "weave/ops.hh"

#include <cmath>
#include <cstdint>

namespace weave {
    constexpr bool wvTruthy(float value) noexcept { return value != 0.f; }
    constexpr float wvFromBool(bool value) noexcept { return value ? 1.f : 0.f; }

    // one lane of a component-wise operator; unused operands are ignored
    inline float wvApplyOp(wvOpCode op, float a, float b = 0.f, float c = 0.f) noexcept
    {
        switch (op)
        {
        case wvOpCode::Neg: return -a;
        case wvOpCode::Not: return wvFromBool(!wvTruthy(a));
        case wvOpCode::Abs: return std::fabs(a);
        case wvOpCode::Floor: return std::floor(a);
        case wvOpCode::Fract: return a - std::floor(a);
        case wvOpCode::Sin: return std::sin(a);
        case wvOpCode::Cos: return std::cos(a);
        case wvOpCode::Sqrt: return std::sqrt(a);
        case wvOpCode::ToInt: return std::trunc(a);
        case wvOpCode::Add: return a + b;
        case wvOpCode::Sub: return a - b;
        case wvOpCode::Mul: return a * b;
        case wvOpCode::Div: return b != 0.f ? a / b : 0.f;
        case wvOpCode::Mod: return b != 0.f ? a - b * std::floor(a / b) : 0.f;
        case wvOpCode::Min: return a < b ? a : b;
        case wvOpCode::Max: return a > b ? a : b;
        case wvOpCode::Pow: return std::pow(a, b);
        case wvOpCode::And: return wvFromBool(wvTruthy(a) && wvTruthy(b));
        case wvOpCode::Or: return wvFromBool(wvTruthy(a) || wvTruthy(b));
        case wvOpCode::Xor: return wvFromBool(wvTruthy(a) != wvTruthy(b));
        case wvOpCode::Less: return wvFromBool(a < b);
        case wvOpCode::Greater: return wvFromBool(a > b);
        case wvOpCode::Equal: return wvFromBool(a == b);
        case wvOpCode::Clamp: return a < b ? b : (a > c ? c : a);
        case wvOpCode::Mix: return a + (b - a) * c;
        case wvOpCode::Select: return wvTruthy(a) ? b : c;
        case wvOpCode::Nop:
        case wvOpCode::Pack:
        case wvOpCode::Component:
        case wvOpCode::HsvToRgb:
        case wvOpCode::Last: break;
        }
        return 0.f;
    }

    // hue wraps at 1; saturation and value are clamped to [0, 1]
    inline void wvHsvToRgb(float hue, float saturation, float value, float* out_rgba) noexcept
    {
        // a hue that is not finite reads as red
        float const wrapped = std::isfinite(hue) ? hue - std::floor(hue) : 0.f;
        float const h = wrapped * 6.f;
        float const s = saturation < 0.f ? 0.f : (saturation > 1.f ? 1.f : saturation);
        float const v = value < 0.f ? 0.f : (value > 1.f ? 1.f : value);

        float const chroma = v * s;
        float const x = chroma * (1.f - std::fabs(std::fmod(h, 2.f) - 1.f));
        float const m = v - chroma;

        float r = 0.f;
        float g = 0.f;
        float b = 0.f;
        switch (static_cast<int>(h) % 6)
        {
        case 0: r = chroma, g = x; break;
        case 1: r = x, g = chroma; break;
        case 2: g = chroma, b = x; break;
        case 3: g = x, b = chroma; break;
        case 4: r = x, b = chroma; break;
        default: r = chroma, b = x; break;
        }

        out_rgba[0] = r + m;
        out_rgba[1] = g + m;
        out_rgba[2] = b + m;
        out_rgba[3] = 1.f;
    }
} // namespace weave
