#ifndef VERTEX_FORMAT_HPP_INCLUDED
#define VERTEX_FORMAT_HPP_INCLUDED

/**
 * @brief Vertex attributes a tessellation must produce.
 *
 * Appearances dictate the format; the tessellator skips attributes that are
 * not requested. Position is always produced.
 */
struct VertexFormat
{
    bool position = true;
    bool normal   = false;
    bool st       = false;
    bool tangent  = false;
    bool binormal = false;

    [[nodiscard]] static constexpr VertexFormat positionOnly() noexcept
    {
        return {};
    }

    [[nodiscard]] static constexpr VertexFormat positionAndSt() noexcept
    {
        return {true, false, true, false, false};
    }

    [[nodiscard]] static constexpr VertexFormat positionNormalAndSt() noexcept
    {
        return {true, true, true, false, false};
    }

    [[nodiscard]] static constexpr VertexFormat all() noexcept
    {
        return {true, true, true, true, true};
    }

    [[nodiscard]] constexpr bool operator==(const VertexFormat&) const noexcept = default;
};

#endif // VERTEX_FORMAT_HPP_INCLUDED
