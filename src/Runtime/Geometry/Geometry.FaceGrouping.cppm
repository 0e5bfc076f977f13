module;

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Geometry:FaceGrouping;

import :PlaneMath;

export namespace Geometry::FaceGrouping
{
    // =========================================================================
    // Plane Keys
    // =========================================================================
    //
    // A plane is keyed by its normal components quantized by normalTol and
    // its offset quantized by distTol. Triangles whose keys collide are
    // treated as coplanar when merging.

    struct PlaneKey
    {
        int64_t Nx{0}, Ny{0}, Nz{0}, D{0};

        bool operator==(const PlaneKey&) const = default;
    };

    struct PlaneKeyHash
    {
        std::size_t operator()(const PlaneKey& k) const noexcept;
    };

    // round(value / tol); 0 when either input is not usable.
    [[nodiscard]] int64_t Quantize(double value, double tol);

    [[nodiscard]] PlaneKey MakePlaneKey(const glm::dvec3& normal, double d,
                                        double normalTol, double distTol);

    // =========================================================================
    // Tolerances
    // =========================================================================

    inline constexpr double DefaultNormalTolerance = 1e-5;

    struct Tolerances
    {
        double Normal{DefaultNormalTolerance};
        double Distance{1e-6};
    };

    // normalTol defaults to 1e-5 and distTol to max(1e-6, diagonal * 1e-6).
    // Non-positive or non-finite overrides fall back to the defaults.
    [[nodiscard]] Tolerances ResolveTolerances(std::optional<double> normalTol,
                                               std::optional<double> distTol,
                                               double boundingDiagonal);

    // =========================================================================
    // Groups
    // =========================================================================

    struct FaceGroup
    {
        // Face id for authoritative groups, running plane index otherwise.
        uint32_t Label{0};

        // Source triangle indices in ascending order.
        std::vector<uint32_t> Triangles;
    };

    // Groups valid triangles by face id, in order of first occurrence.
    [[nodiscard]] std::vector<FaceGroup> GroupByFaceId(const PlaneMath::TriangleTable& table,
                                                       std::span<const uint32_t> faceIds);

    // Groups valid triangles by plane key when merge is set, one group per
    // triangle otherwise. Labels are the group's position in the result.
    [[nodiscard]] std::vector<FaceGroup> GroupByPlane(const PlaneMath::TriangleTable& table,
                                                      double normalTol, double distTol, bool merge);

    // Edge-connected components of a group. Two triangles are connected
    // when they share an undirected edge.
    [[nodiscard]] std::vector<std::vector<uint32_t>> SplitComponents(std::span<const uint32_t> group,
                                                                     const PlaneMath::TriangleTable& table);

    // True when every triangle lies on the first triangle's plane. Normals
    // match up to sign; the offset is compared after the same flip.
    [[nodiscard]] bool IsCoplanarGroup(std::span<const uint32_t> group,
                                       const PlaneMath::TriangleTable& table,
                                       double normalTol, double distTol);

    // Re-splits a group by exact plane key, in order of first occurrence.
    [[nodiscard]] std::vector<std::vector<uint32_t>> SplitByPlaneKey(std::span<const uint32_t> group,
                                                                     const PlaneMath::TriangleTable& table,
                                                                     double normalTol, double distTol);

    // Per-triangle group label, parallel to the table. Triangles outside
    // every group keep 0; callers only read labels of valid triangles.
    [[nodiscard]] std::vector<uint32_t> LabelTriangles(std::span<const FaceGroup> groups,
                                                       std::size_t triangleCount);
}
