#include "fo/core/types/Dtype.hpp"

namespace fo {

std::string dtypeToString(Dtype dtype)
{
    switch (dtype) {
        case Dtype::UInt8:
            return "|u1";
        case Dtype::UInt16:
            return "<u2";
        case Dtype::Float32:
            return "<f4";
        default:
            return "";
    }
}

Dtype dtypeFromString(const std::string& s)
{
    if (s == "<u1" || s == "|u1" || s == "uint8") {
        return Dtype::UInt8;
    }
    if (s == "<u2" || s == "uint16") {
        return Dtype::UInt16;
    }
    if (s == "<f4" || s == "float32") {
        return Dtype::Float32;
    }
    return Dtype::Unknown;
}

std::size_t dtypeSize(Dtype dtype)
{
    switch (dtype) {
        case Dtype::UInt8:
            return 1;
        case Dtype::UInt16:
            return 2;
        case Dtype::Float32:
            return 4;
        default:
            return 0;
    }
}

double dtypeNominalRange(Dtype dtype)
{
    switch (dtype) {
        case Dtype::UInt8:
            return 255.0;
        case Dtype::UInt16:
            return 65535.0;
        default:
            return 1.0;
    }
}

}  // namespace fo
