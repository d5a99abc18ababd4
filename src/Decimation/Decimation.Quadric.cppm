module;

#include <optional>

#include <glm/glm.hpp>

export module Decimation:Quadric;

export namespace Decimation
{
    // =========================================================================
    // Symmetric 4x4 matrix for quadric error representation
    // =========================================================================
    //
    // The quadric Q represents the error function:
    //   E(v) = v^T Q v
    // where v is the homogeneous position [x, y, z, 1].
    //
    // Since Q is symmetric, we store only the upper triangle (10 elements).

    struct Quadric
    {
        double A[10]{};
        //  0: a00  1: a01  2: a02  3: a03
        //          4: a11  5: a12  6: a13
        //                  7: a22  8: a23
        //                          9: a33

        Quadric() = default;

        // Fundamental error quadric K = k k^T of the plane ax + by + cz + d = 0
        [[nodiscard]] static Quadric FromPlane(double a, double b, double c, double d);
        [[nodiscard]] static Quadric FromPlane(const glm::dvec4& plane);

        Quadric& operator+=(const Quadric& rhs);
        [[nodiscard]] Quadric operator+(const Quadric& rhs) const;
        Quadric& operator*=(double s);
        [[nodiscard]] bool operator==(const Quadric& rhs) const;

        // v^T Q v at (x, y, z, 1)
        [[nodiscard]] double Evaluate(double x, double y, double z) const;
        [[nodiscard]] double Evaluate(glm::vec3 v) const;

        [[nodiscard]] bool IsZero() const;
        [[nodiscard]] double Trace3x3() const;
        [[nodiscard]] double Determinant3x3() const;

        // Stationary point of v^T Q v: solves Q_3x3 * v = -[a03, a13, a23]^T.
        // Returns nullopt if the 3x3 block is singular or ill-conditioned
        // (|det| <= kConditionEpsilon * trace^3).
        [[nodiscard]] std::optional<glm::vec3> OptimalPosition() const;

        static constexpr double kConditionEpsilon = 1e-10;
    };

    // Unit-normal homogeneous plane (a, b, c, d), a^2 + b^2 + c^2 = 1, through
    // the triangle. Returns nullopt for zero-area (collinear or coincident)
    // triangles.
    [[nodiscard]] std::optional<glm::dvec4> TrianglePlane(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2);

    // Non-normalized face normal, cross(p1 - p0, p2 - p0).
    [[nodiscard]] glm::vec3 TriangleNormal(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2);
}
