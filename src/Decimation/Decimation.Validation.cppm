module;

#include <cstddef>
#include <optional>
#include <span>

#include <glm/glm.hpp>

export module Decimation:Validation;

import Core.Error;
import :IndexedMesh;

export namespace Decimation::Validation
{
    // Checks run before the engine touches any state:
    //   - positions are finite, faces are non-empty;
    //   - every face index is in [0, positions.size()) and the three are distinct;
    //   - 1 <= targetVertexCount <= positions.size();
    //   - the threshold, if present, is finite and non-negative.
    // InvalidArgument for malformed geometry or threshold, OutOfRange for the target.
    [[nodiscard]] Core::Result ValidateInput(std::span<const glm::vec3> positions,
                                             std::span<const Triangle> faces,
                                             std::size_t targetVertexCount,
                                             std::optional<float> threshold);

    [[nodiscard]] bool IsFinite(const glm::vec3& v);
    [[nodiscard]] bool IsWellFormed(const Triangle& t, std::size_t vertexCount);
}
