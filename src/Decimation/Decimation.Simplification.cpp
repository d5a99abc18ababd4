module;

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

module Decimation:Simplification.Impl;

import Core.Error;
import Core.Logging;
import :Simplification;
import :IndexedMesh;
import :Quadric;
import :ConnectivityMesh;
import :CostModel;
import :CollapseHeap;
import :ProximityPairs;
import :Validation;

namespace Decimation::Simplification
{
    namespace
    {
        void InsertSorted(std::vector<VertexIndex>& list, VertexIndex v)
        {
            auto it = std::lower_bound(list.begin(), list.end(), v);
            if (it == list.end() || *it != v) list.insert(it, v);
        }

        void EraseSorted(std::vector<VertexIndex>& list, VertexIndex v)
        {
            auto it = std::lower_bound(list.begin(), list.end(), v);
            if (it != list.end() && *it == v) list.erase(it);
        }

        // Proximity partners follow the survivor of every merge, so a pair
        // that was within threshold keeps competing after either endpoint moves.
        void InheritPartners(std::vector<std::vector<VertexIndex>>& partners,
                             VertexIndex keep, VertexIndex drop)
        {
            std::vector<VertexIndex> dropped = std::move(partners[drop]);
            partners[drop].clear();

            for (VertexIndex p : dropped)
            {
                EraseSorted(partners[p], drop);
                if (p == keep) continue;
                InsertSorted(partners[p], keep);
                InsertSorted(partners[keep], p);
            }
            EraseSorted(partners[keep], drop);
        }
    }

    Core::Expected<SimplificationOutput> Simplify(
        std::span<const glm::vec3> positions,
        std::span<const Triangle> faces,
        const SimplificationParams& params)
    {
        Stage stage = Stage::Init;
        auto enter = [&stage](Stage next)
        {
            stage = next;
            Core::Log::Debug("Simplify: stage {}", StageToString(stage));
        };
        enter(Stage::Init);

        if (auto valid = Validation::ValidateInput(positions, faces, params.TargetVertexCount, params.Threshold);
            !valid.has_value())
        {
            return std::unexpected(valid.error());
        }

        const std::size_t n = positions.size();
        const std::size_t target = params.TargetVertexCount;

        Connectivity::Mesh mesh = Connectivity::Mesh::Build(positions, faces);

        SimplificationResult result;
        result.InitialVertexCount = n;
        result.InitialFaceCount = faces.size();
        result.DuplicateFacesDropped = mesh.DuplicateFacesDropped();

        if (result.DuplicateFacesDropped > 0)
        {
            Core::Log::Warn("Simplify: dropped {} face(s) repeating an earlier face up to rotation.",
                            result.DuplicateFacesDropped);
        }

        // =====================================================================
        // Per-vertex quadrics
        // =====================================================================

        CostModel::QuadricStats quadricStats;
        std::vector<Quadric> quadrics = CostModel::ComputeVertexQuadrics(mesh, &quadricStats);
        result.DegenerateFacesSkipped = quadricStats.DegenerateFaces;

        if (quadricStats.DegenerateFaces > 0)
        {
            Core::Log::Debug("Simplify: {} zero-area face(s) contribute no quadric.", quadricStats.DegenerateFaces);
        }

        // Generation counters: bumped whenever a vertex takes part in a merge
        std::vector<std::uint32_t> generation(n, 0);
        std::vector<std::vector<VertexIndex>> partners(n);
        CollapseHeap heap;

        auto pushPair = [&](VertexIndex a, VertexIndex b, PairKind kind)
        {
            const VertexIndex lo = std::min(a, b);
            const VertexIndex hi = std::max(a, b);
            const CostModel::CollapseEstimate estimate = CostModel::EvaluatePair(
                quadrics[lo], quadrics[hi], mesh.Position(lo), mesh.Position(hi));

            heap.Push({
                .Lo = lo,
                .Hi = hi,
                .Cost = estimate.Cost,
                .Position = estimate.Position,
                .GenerationLo = generation[lo],
                .GenerationHi = generation[hi],
                .Kind = kind,
            });
        };

        const bool needsCollapses = mesh.VertexCount() > target;

        if (needsCollapses)
        {
            // =================================================================
            // Candidate pairs
            // =================================================================

            for (std::size_t vi = 0; vi < n; ++vi)
            {
                const auto v = static_cast<VertexIndex>(vi);
                for (VertexIndex u : mesh.Neighbors(v))
                {
                    if (u > v) pushPair(v, u, PairKind::Edge);
                }
            }

            if (params.Threshold.has_value())
            {
                enter(Stage::Clustering);

                Clustering::ProximityStats proximityStats;
                auto pairs = Clustering::FindProximityPairs(positions, *params.Threshold, &proximityStats);
                if (!pairs)
                {
                    Core::Log::Error("Simplify: proximity search failed for threshold {}.", *params.Threshold);
                    return std::unexpected(Core::ErrorCode::InvalidArgument);
                }

                for (const Clustering::ProximityPair& pair : *pairs)
                {
                    InsertSorted(partners[pair.Lo], pair.Hi);
                    InsertSorted(partners[pair.Hi], pair.Lo);

                    // Edges are already queued; only face-less pairs are new candidates
                    if (!mesh.SharesFace(pair.Lo, pair.Hi))
                    {
                        pushPair(pair.Lo, pair.Hi, PairKind::Proximity);
                        ++result.ProximityCandidates;
                    }
                }

                Core::Log::Debug("Simplify: {} vertex pair(s) within {} ({} distance evaluations).",
                                 proximityStats.PairCount, *params.Threshold, proximityStats.DistanceEvaluations);
            }

            // =================================================================
            // Collapse loop
            // =================================================================

            enter(Stage::Collapsing);

            while (mesh.VertexCount() > target && !heap.Empty())
            {
                const CollapseCandidate top = heap.Pop();

                if (mesh.IsDeleted(top.Lo) || mesh.IsDeleted(top.Hi) || IsStale(top, generation))
                {
                    ++result.StaleEntriesSkipped;
                    continue;
                }

                if (top.Cost > params.MaxError)
                {
                    result.StoppedByMaxError = true;
                    break;
                }

                if (mesh.IsCollapseOk(top.Lo, top.Hi, top.Position) != Connectivity::CollapseCheck::Ok)
                {
                    ++result.RejectedCollapses;
                    continue;
                }

                const VertexIndex keep = CostModel::ChooseSurvivor(
                    top.Lo, top.Hi, quadrics[top.Lo], quadrics[top.Hi], top.Position);
                const VertexIndex drop = (keep == top.Lo) ? top.Hi : top.Lo;

                const Quadric merged = quadrics[keep] + quadrics[drop];
                const Connectivity::MergeResult merge = mesh.Merge(keep, drop, top.Position);

                quadrics[keep] = merged;
                quadrics[drop] = Quadric{};
                ++generation[keep];
                ++generation[drop];
                InheritPartners(partners, keep, drop);

                ++result.CollapseCount;
                if (top.Kind == PairKind::Edge) ++result.EdgeCollapseCount;
                else ++result.ProximityMergeCount;
                result.MaxCollapseError = std::max(result.MaxCollapseError, top.Cost);
                if (params.RecordCollapseCosts) result.CollapseCosts.push_back(top.Cost);

                if (merge.DuplicateFacesRemoved > 0)
                {
                    Core::Log::Debug("Simplify: merge {} <- {} removed {} duplicate face(s).",
                                     keep, drop, merge.DuplicateFacesRemoved);
                }

                // Re-score every pair touching the survivor. A vertex that lost
                // its last shared face with keep only stays a candidate as a
                // proximity partner.
                std::vector<VertexIndex> around = merge.AffectedVertices;
                for (VertexIndex p : partners[keep]) InsertSorted(around, p);

                for (VertexIndex u : around)
                {
                    if (u == keep || mesh.IsDeleted(u)) continue;

                    if (mesh.SharesFace(keep, u))
                        pushPair(keep, u, PairKind::Edge);
                    else if (std::binary_search(partners[keep].begin(), partners[keep].end(), u))
                        pushPair(keep, u, PairKind::Proximity);
                }
            }
        }

        result.TargetReached = mesh.VertexCount() <= target;

        if (!result.TargetReached)
        {
            if (result.StoppedByMaxError)
            {
                Core::Log::Info("Simplify: stopped at {} vertices, next collapse exceeds max error {}.",
                                mesh.VertexCount(), params.MaxError);
            }
            else
            {
                Core::Log::Warn("Simplify: target {} unreachable, no valid collapse left at {} vertices.",
                                target, mesh.VertexCount());
            }
        }

        // =====================================================================
        // Compaction
        // =====================================================================

        enter(Stage::Compacting);

        SimplificationOutput output;
        output.Mesh = mesh.Compact();

        result.FinalVertexCount = output.Mesh.VertexCount();
        result.FinalFaceCount = output.Mesh.FaceCount();
        output.Report = std::move(result);

        enter(Stage::Done);

        Core::Log::Debug("Simplify: {} -> {} vertices, {} -> {} faces ({} collapses, {} rejected, {} stale).",
                         output.Report.InitialVertexCount, output.Report.FinalVertexCount,
                         output.Report.InitialFaceCount, output.Report.FinalFaceCount,
                         output.Report.CollapseCount, output.Report.RejectedCollapses,
                         output.Report.StaleEntriesSkipped);

        return output;
    }

    Core::Expected<SimplificationOutput> Simplify(const IndexedMesh& mesh, const SimplificationParams& params)
    {
        return Simplify(std::span<const glm::vec3>(mesh.Positions), std::span<const Triangle>(mesh.Faces), params);
    }
}
