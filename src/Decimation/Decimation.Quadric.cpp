module;

#include <cmath>
#include <optional>

#include <glm/glm.hpp>
#include <glm/geometric.hpp>

module Decimation:Quadric.Impl;

import :Quadric;

namespace Decimation
{
    namespace
    {
        // Squared sine of the smallest triangle angle below which a triangle
        // is treated as zero-area.
        constexpr double kDegenerateSin2 = 1e-12;
    }

    Quadric Quadric::FromPlane(double a, double b, double c, double d)
    {
        Quadric q;
        q.A[0] = a * a;  q.A[1] = a * b;  q.A[2] = a * c;  q.A[3] = a * d;
                         q.A[4] = b * b;  q.A[5] = b * c;  q.A[6] = b * d;
                                          q.A[7] = c * c;  q.A[8] = c * d;
                                                           q.A[9] = d * d;
        return q;
    }

    Quadric Quadric::FromPlane(const glm::dvec4& plane)
    {
        return FromPlane(plane.x, plane.y, plane.z, plane.w);
    }

    Quadric& Quadric::operator+=(const Quadric& rhs)
    {
        for (int i = 0; i < 10; ++i) A[i] += rhs.A[i];
        return *this;
    }

    Quadric Quadric::operator+(const Quadric& rhs) const
    {
        Quadric result = *this;
        result += rhs;
        return result;
    }

    Quadric& Quadric::operator*=(double s)
    {
        for (int i = 0; i < 10; ++i) A[i] *= s;
        return *this;
    }

    bool Quadric::operator==(const Quadric& rhs) const
    {
        for (int i = 0; i < 10; ++i)
        {
            if (A[i] != rhs.A[i]) return false;
        }
        return true;
    }

    double Quadric::Evaluate(double x, double y, double z) const
    {
        return A[0]*x*x + 2.0*A[1]*x*y + 2.0*A[2]*x*z + 2.0*A[3]*x
                        +     A[4]*y*y + 2.0*A[5]*y*z + 2.0*A[6]*y
                                       +     A[7]*z*z + 2.0*A[8]*z
                                                       +     A[9];
    }

    double Quadric::Evaluate(glm::vec3 v) const
    {
        return Evaluate(static_cast<double>(v.x),
                        static_cast<double>(v.y),
                        static_cast<double>(v.z));
    }

    bool Quadric::IsZero() const
    {
        for (int i = 0; i < 10; ++i)
        {
            if (A[i] != 0.0) return false;
        }
        return true;
    }

    double Quadric::Trace3x3() const
    {
        return A[0] + A[4] + A[7];
    }

    double Quadric::Determinant3x3() const
    {
        const double a00 = A[0], a01 = A[1], a02 = A[2];
        const double             a11 = A[4], a12 = A[5];
        const double                         a22 = A[7];

        return a00 * (a11 * a22 - a12 * a12)
             - a01 * (a01 * a22 - a12 * a02)
             + a02 * (a01 * a12 - a11 * a02);
    }

    std::optional<glm::vec3> Quadric::OptimalPosition() const
    {
        // Solve the 3x3 linear system using Cramer's rule
        const double a00 = A[0], a01 = A[1], a02 = A[2], a03 = A[3];
        const double             a11 = A[4], a12 = A[5], a13 = A[6];
        const double                         a22 = A[7], a23 = A[8];

        const double det = Determinant3x3();
        const double trace = Trace3x3();

        // The block is positive semi-definite, so trace^3 >= 27 det bounds the
        // scale of a well-conditioned determinant.
        if (!(trace > 0.0) || std::abs(det) <= kConditionEpsilon * trace * trace * trace)
            return std::nullopt;

        const double invDet = 1.0 / det;

        const double x = -invDet * (
            a03 * (a11 * a22 - a12 * a12) +
            a13 * (a02 * a12 - a01 * a22) +
            a23 * (a01 * a12 - a02 * a11));

        const double y = -invDet * (
            a03 * (a12 * a02 - a01 * a22) +
            a13 * (a00 * a22 - a02 * a02) +
            a23 * (a02 * a01 - a00 * a12));

        const double z = -invDet * (
            a03 * (a01 * a12 - a11 * a02) +
            a13 * (a01 * a02 - a00 * a12) +
            a23 * (a00 * a11 - a01 * a01));

        if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z))
            return std::nullopt;

        return glm::vec3(static_cast<float>(x),
                         static_cast<float>(y),
                         static_cast<float>(z));
    }

    glm::vec3 TriangleNormal(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2)
    {
        return glm::cross(p1 - p0, p2 - p0);
    }

    std::optional<glm::dvec4> TrianglePlane(glm::vec3 p0, glm::vec3 p1, glm::vec3 p2)
    {
        const glm::dvec3 a(p0);
        const glm::dvec3 e1 = glm::dvec3(p1) - a;
        const glm::dvec3 e2 = glm::dvec3(p2) - a;

        const glm::dvec3 n = glm::cross(e1, e2);
        const double len2 = glm::dot(n, n);
        const double scale2 = glm::dot(e1, e1) * glm::dot(e2, e2);

        // |e1 x e2|^2 = |e1|^2 |e2|^2 sin^2(angle)
        if (len2 <= 0.0 || len2 <= kDegenerateSin2 * scale2) return std::nullopt;

        const glm::dvec3 unit = n / std::sqrt(len2);
        return glm::dvec4(unit, -glm::dot(unit, a));
    }
}
