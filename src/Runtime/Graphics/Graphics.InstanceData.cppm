module;

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <glm/glm.hpp>

export module Graphics:InstanceData;

export namespace Graphics
{
    // Selects the signed-distance function the fragment stage evaluates.
    enum class ShapeKind : uint32_t
    {
        Rect = 0,
        RoundedRect = 1,
        Circle = 2,
        Ring = 3,
        Line = 4,
        Sprite = 5
    };

    [[nodiscard]] constexpr std::string_view ShapeKindName(ShapeKind kind)
    {
        switch (kind)
        {
            case ShapeKind::Rect:        return "Rect";
            case ShapeKind::RoundedRect: return "RoundedRect";
            case ShapeKind::Circle:      return "Circle";
            case ShapeKind::Ring:        return "Ring";
            case ShapeKind::Line:        return "Line";
            case ShapeKind::Sprite:      return "Sprite";
        }
        return "Unknown";
    }

    // -------------------------------------------------------------------------
    // ShapeInstance - one record per logical draw, read by the vertex stage
    // -------------------------------------------------------------------------
    // GPU layout (5 x vec4, 80 bytes):
    //   [Position.xy, Scale.xy]
    //   [Rotation, Kind, TextureIndex, pad]
    //   [Color.rgba]
    //   [Params.xyzw]  shape-specific: corner radius, ring thickness, edge softness
    //   [UVRect.xyzw]  (u0, v0, u1, v1) sub-rectangle of the bound texture
    //
    // TextureIndex is an Argument Table slot, not a texture handle. Slot 0 is
    // the opaque white fallback, so untextured shapes sample white.
    // -------------------------------------------------------------------------
    struct alignas(16) ShapeInstance
    {
        glm::vec2 Position{0.0f};
        glm::vec2 Scale{1.0f};
        float Rotation = 0.0f; // radians
        uint32_t Kind = static_cast<uint32_t>(ShapeKind::Rect);
        uint32_t TextureIndex = 0;
        float Padding = 0.0f;
        glm::vec4 Color{1.0f};
        glm::vec4 Params{0.0f};
        glm::vec4 UVRect{0.0f, 0.0f, 1.0f, 1.0f};
    };
    static_assert(sizeof(ShapeInstance) == 80, "ShapeInstance must be 80 bytes (5 x vec4)");
    static_assert(alignof(ShapeInstance) == 16, "ShapeInstance must be 16-byte aligned");
    static_assert(offsetof(ShapeInstance, Color) == 32, "Color must start the third vec4");
    static_assert(offsetof(ShapeInstance, Params) == 48, "Params must start the fourth vec4");
    static_assert(offsetof(ShapeInstance, UVRect) == 64, "UVRect must start the fifth vec4");

    constexpr size_t kShapeInstanceSize = sizeof(ShapeInstance);

    // Shared unit quad, centered on the origin. Instances scale and place it.
    struct QuadVertex
    {
        glm::vec2 Position;
        glm::vec2 UV;
    };
    static_assert(sizeof(QuadVertex) == 16, "QuadVertex must be tightly packed");

    inline const std::array<QuadVertex, 4> kQuadVertices = {{
        {{-0.5f, -0.5f}, {0.0f, 1.0f}},
        {{ 0.5f, -0.5f}, {1.0f, 1.0f}},
        {{ 0.5f,  0.5f}, {1.0f, 0.0f}},
        {{-0.5f,  0.5f}, {0.0f, 0.0f}},
    }};

    inline constexpr std::array<uint16_t, 6> kQuadIndices = {0, 1, 2, 2, 3, 0};
}
