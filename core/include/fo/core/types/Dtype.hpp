#pragma once

#include <cstddef>
#include <string>

namespace fo {

enum class Dtype { UInt8, UInt16, Float32, Unknown };

std::string dtypeToString(Dtype dtype);
Dtype dtypeFromString(const std::string& s);
std::size_t dtypeSize(Dtype dtype);

// Full-scale intensity of a voxel type (255, 65535, 1.0 for float data).
double dtypeNominalRange(Dtype dtype);

}  // namespace fo
