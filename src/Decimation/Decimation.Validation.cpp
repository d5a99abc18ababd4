module;

#include <cmath>
#include <cstddef>
#include <optional>
#include <span>

#include <glm/glm.hpp>

module Decimation:Validation.Impl;

import Core.Error;
import Core.Logging;
import :Validation;
import :IndexedMesh;

namespace Decimation::Validation
{
    bool IsFinite(const glm::vec3& v)
    {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    bool IsWellFormed(const Triangle& t, std::size_t vertexCount)
    {
        if (t[0] >= vertexCount || t[1] >= vertexCount || t[2] >= vertexCount) return false;
        return t[0] != t[1] && t[1] != t[2] && t[0] != t[2];
    }

    Core::Result ValidateInput(std::span<const glm::vec3> positions,
                               std::span<const Triangle> faces,
                               std::size_t targetVertexCount,
                               std::optional<float> threshold)
    {
        if (faces.empty())
        {
            Core::Log::Error("Simplify: face list is empty.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        for (std::size_t vi = 0; vi < positions.size(); ++vi)
        {
            if (!IsFinite(positions[vi]))
            {
                Core::Log::Error("Simplify: position {} is not finite.", vi);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
        }

        for (std::size_t fi = 0; fi < faces.size(); ++fi)
        {
            if (!IsWellFormed(faces[fi], positions.size()))
            {
                const Triangle& t = faces[fi];
                Core::Log::Error("Simplify: face {} ({}, {}, {}) is out of range or repeats a vertex ({} vertices).",
                                 fi, t[0], t[1], t[2], positions.size());
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }
        }

        if (threshold.has_value() && (!std::isfinite(*threshold) || *threshold < 0.0f))
        {
            Core::Log::Error("Simplify: threshold {} must be finite and non-negative.", *threshold);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (targetVertexCount < 1 || targetVertexCount > positions.size())
        {
            Core::Log::Error("Simplify: target vertex count {} outside [1, {}].",
                             targetVertexCount, positions.size());
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        return Core::Ok();
    }
}
