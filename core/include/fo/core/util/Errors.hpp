#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace fo {

// ============================================================================
// Exception taxonomy
// ============================================================================

/// Invalid tiling, scale or filter parameters. Raised before any tile runs.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Unreadable/corrupt storage, or access to a closed volume.
class IOError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A region's rank, channel count or bounds disagree with the target map.
class ShapeMismatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief One tile that could not be brought to the Merged state.
 */
struct TileFailure {
    std::size_t tileId = 0;
    std::string state;    ///< Terminal state name (FailedLoad, FailedCompute)
    int attempts = 0;     ///< Number of attempts made, including the first
    std::string message;  ///< Last error reported for the tile
};

/**
 * @brief Fatal pipeline failure.
 *
 * Raised when a tile exhausts its retry budget or hits a non-retryable
 * error. No output maps are published once this is thrown.
 */
class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& msg);
    explicit PipelineError(std::vector<TileFailure> failures);

    const std::vector<TileFailure>& failures() const noexcept { return failures_; }

private:
    static std::string describe(const std::vector<TileFailure>& failures);

    std::vector<TileFailure> failures_;
};

/// Cooperative cancellation observed between tile dispatches.
class PipelineCancelled : public PipelineError {
public:
    PipelineCancelled(std::size_t mergedTiles, std::size_t totalTiles);
};

/**
 * @brief Recoverable data problem found inside a tile.
 *
 * Non-finite voxels and voxels outside the expected intensity range.
 * Not an exception: the affected voxels get a zero response and the
 * run continues.
 */
struct DataQualityWarning {
    std::size_t tileId = 0;
    std::size_t nonFiniteVoxels = 0;
    std::size_t outOfRangeVoxels = 0;
    std::string message;
};

}  // namespace fo
