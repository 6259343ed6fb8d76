#include "core/shader_table.h"

#include "core/console.h"

namespace crt
{
namespace
{
// Console layers: pos is in render-cell space, mapped to clip space by push constants.
const char* kConsoleVs = R"(#version 450
layout(location = 0) in vec2 in_pos;
layout(location = 1) in vec2 in_uv;
layout(location = 2) in vec4 in_color;

layout(push_constant) uniform Push
{
    vec2 scale;
    vec2 bias;
    vec2 texel;
    float textured;
    float pad;
} pc;

layout(location = 0) out vec2 v_uv;
layout(location = 1) out vec4 v_color;

void main()
{
    v_uv = in_uv;
    v_color = in_color;
    gl_Position = vec4(in_pos * pc.scale + pc.bias, 0.0, 1.0);
}
)";

const char* kConsoleWithBgFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D atlas;

layout(push_constant) uniform Push
{
    vec2 scale;
    vec2 bias;
    vec2 texel;
    float textured;
    float pad;
} pc;

layout(location = 0) in vec2 v_uv;
layout(location = 1) in vec4 v_color;
layout(location = 0) out vec4 out_color;

void main()
{
    if (pc.textured < 0.5)
    {
        out_color = v_color;
        return;
    }
    vec4 t = texture(atlas, v_uv);
    float cover = t.a * max(t.r, max(t.g, t.b));
    if (cover < 0.1)
        discard;
    out_color = vec4(v_color.rgb * t.rgb, 1.0);
}
)";

const char* kConsoleNoBgFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D atlas;

layout(push_constant) uniform Push
{
    vec2 scale;
    vec2 bias;
    vec2 texel;
    float textured;
    float pad;
} pc;

layout(location = 0) in vec2 v_uv;
layout(location = 1) in vec4 v_color;
layout(location = 0) out vec4 out_color;

// Glyph pass only: the background quads of this shader are never drawn.
void main()
{
    vec4 t = texture(atlas, v_uv);
    float cover = t.a * max(t.r, max(t.g, t.b));
    if (cover <= 0.0)
        discard;
    out_color = vec4(v_color.rgb, cover);
}
)";

const char* kFancyConsoleFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D atlas;

layout(push_constant) uniform Push
{
    vec2 scale;
    vec2 bias;
    vec2 texel;
    float textured;
    float pad;
} pc;

layout(location = 0) in vec2 v_uv;
layout(location = 1) in vec4 v_color;
layout(location = 0) out vec4 out_color;

float Cover(vec2 uv)
{
    vec4 t = texture(atlas, uv);
    return t.a * max(t.r, max(t.g, t.b));
}

void main()
{
    if (pc.textured < 0.5)
    {
        out_color = v_color;
        return;
    }
    float core = Cover(v_uv);
    float halo = 0.0;
    halo += Cover(v_uv + vec2(pc.texel.x, 0.0));
    halo += Cover(v_uv - vec2(pc.texel.x, 0.0));
    halo += Cover(v_uv + vec2(0.0, pc.texel.y));
    halo += Cover(v_uv - vec2(0.0, pc.texel.y));
    float a = max(core, halo * 0.15);
    if (a <= 0.0)
        discard;
    out_color = vec4(v_color.rgb * (0.6 + 0.4 * core), a);
}
)";

const char* kSpriteConsoleFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D atlas;

layout(push_constant) uniform Push
{
    vec2 scale;
    vec2 bias;
    vec2 texel;
    float textured;
    float pad;
} pc;

layout(location = 0) in vec2 v_uv;
layout(location = 1) in vec4 v_color;
layout(location = 0) out vec4 out_color;

void main()
{
    if (pc.textured < 0.5)
    {
        out_color = v_color;
        return;
    }
    vec4 t = texture(atlas, v_uv);
    if (t.a <= 0.0)
        discard;
    out_color = vec4(t.rgb * v_color.rgb, t.a);
}
)";

// Full-screen quad: pos in clip space, uv over the backing image.
const char* kQuadVs = R"(#version 450
layout(location = 0) in vec2 in_pos;
layout(location = 1) in vec2 in_uv;
layout(location = 0) out vec2 v_uv;

void main()
{
    v_uv = in_uv;
    gl_Position = vec4(in_pos, 0.0, 1.0);
}
)";

const char* kBackingFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D backing;
layout(location = 0) in vec2 v_uv;
layout(location = 0) out vec4 out_color;

void main()
{
    out_color = vec4(texture(backing, v_uv).rgb, 1.0);
}
)";

const char* kScanlinesFs = R"(#version 450
layout(set = 0, binding = 0) uniform sampler2D backing;

layout(push_constant) uniform Push
{
    vec4 burn;
    vec2 screen;
    float scanlines;
    float pad;
} pc;

layout(location = 0) in vec2 v_uv;
layout(location = 0) out vec4 out_color;

void main()
{
    vec3 col = texture(backing, v_uv).rgb;
    float scan = (pc.scanlines > 0.5) ? mod(gl_FragCoord.y, 2.0) * 0.25 : 0.0;
    if (col.r < 0.1 && col.g < 0.1 && col.b < 0.1)
    {
        if (pc.burn.w > 0.5)
        {
            vec2 p = gl_FragCoord.xy / max(pc.screen, vec2(1.0));
            float dist = (1.0 - distance(p, vec2(0.5, 0.5))) * 0.2;
            out_color = vec4(pc.burn.rgb * dist, 1.0);
        }
        else
        {
            out_color = vec4(0.0, 0.0, 0.0, 1.0);
        }
        return;
    }
    out_color = vec4(max(col - vec3(scan), vec3(0.0)), 1.0);
}
)";

const ShaderSource kShaders[kShaderCount] = {
    {"console_with_bg", kConsoleVs, kConsoleWithBgFs},
    {"console_no_bg", kConsoleVs, kConsoleNoBgFs},
    {"backing", kQuadVs, kBackingFs},
    {"scanlines", kQuadVs, kScanlinesFs},
    {"fancy_console", kConsoleVs, kFancyConsoleFs},
    {"sprite_console", kConsoleVs, kSpriteConsoleFs},
};
} // namespace

const ShaderSource& GetShaderSource(ShaderId id)
{
    std::size_t idx = (std::size_t)id;
    if (idx >= kShaderCount)
        idx = 0;
    return kShaders[idx];
}

ShaderId ShaderForConsole(ConsoleKind kind, LayerStyle style)
{
    switch (style)
    {
    case LayerStyle::Glow:   return ShaderId::FancyConsole;
    case LayerStyle::Sprite: return ShaderId::SpriteConsole;
    case LayerStyle::Standard:
        break;
    }
    return (kind == ConsoleKind::Dense) ? ShaderId::ConsoleWithBg : ShaderId::ConsoleNoBg;
}

bool ShaderDrawsBackground(ShaderId id)
{
    switch (id)
    {
    case ShaderId::ConsoleWithBg:
    case ShaderId::FancyConsole:
    case ShaderId::SpriteConsole:
        return true;
    default:
        return false;
    }
}
} // namespace crt
