#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "fo/core/io/OutputTarget.hpp"
#include "fo/core/orientation/OrientationAggregator.hpp"
#include "fo/core/orientation/OrientationEstimator.hpp"

namespace fo {

namespace maps {
inline constexpr const char* Orientation = "orientation";
inline constexpr const char* Coherence = "coherence";
inline constexpr const char* Anisotropy = "fractional_anisotropy";
inline constexpr const char* Response = "response";
inline constexpr const char* Scale = "scale";
inline constexpr const char* Odf = "odf";
inline constexpr const char* OdfSh = "odf_sh";
inline constexpr const char* BlockEnergy = "block_energy";
inline constexpr const char* BlockQuality = "block_quality";
inline constexpr const char* BlockCount = "block_count";
inline constexpr const char* BlockEmpty = "block_empty";

/// Name of a block map of one ODF resolution: "odf" or "odf_25um".
std::string blockMapName(const char* base, const std::string& label);
}  // namespace maps

/// Block maps of one ODF resolution.
struct OdfLayer {
    std::string label;
    Shape3 blockShape{16, 16, 16};
    Shape3 blockGrid{0, 0, 0};
};

struct OutputLayout {
    Shape3 volumeShape{0, 0, 0};
    std::array<double, 3> spacing{1.0, 1.0, 1.0};
    std::vector<OdfLayer> layers;
    std::size_t bins = 0;
    std::size_t shCoefficients = 0;
    bool voxelMaps = true;           ///< false: only block maps (vector input)
};

/**
 * @brief The global output map set of one run.
 *
 * Creates every map on the target up front and merges tile results into
 * them. Writes from different tiles touch disjoint regions; the caller
 * serializes the storage calls.
 */
class OutputMaps {
public:
    OutputMaps(OutputTarget& target, const OutputLayout& layout);

    const OutputLayout& layout() const { return layout_; }

    /// Names of all maps, in creation order.
    const std::vector<std::string>& names() const { return names_; }

    /**
     * @param blocks One grid per layer, in layout order
     * @throws ShapeMismatchError if the grid count does not match the layout
     */
    void writeTile(const Box3& core, const OrientationField& field,
                   const std::vector<OdfBlockGrid>& blocks);

private:
    struct LayerMaps {
        VolumeAccessor* odf = nullptr;
        VolumeAccessor* odfSh = nullptr;
        VolumeAccessor* energy = nullptr;
        VolumeAccessor* quality = nullptr;
        VolumeAccessor* count = nullptr;
        VolumeAccessor* empty = nullptr;
    };

    VolumeAccessor& create(OutputTarget& target, const std::string& name, const VolumeInfo& info);
    void writeBlocks(const LayerMaps& dst, const OdfBlockGrid& blocks);

    OutputLayout layout_;
    std::vector<std::string> names_;
    VolumeAccessor* orientation_ = nullptr;
    VolumeAccessor* coherence_ = nullptr;
    VolumeAccessor* anisotropy_ = nullptr;
    VolumeAccessor* response_ = nullptr;
    VolumeAccessor* scale_ = nullptr;
    std::vector<LayerMaps> layers_;
};

}  // namespace fo
