#include "core/MixMatrix.hpp"

namespace fmodpp {

Result<> MixMatrixView::validate() const {
    if (out_channels < 0 || in_channels < 0 ||
        out_channels > MAX_CHANNEL_WIDTH || in_channels > MAX_CHANNEL_WIDTH) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    if (out_channels == 0 || in_channels == 0) {
        return {};
    }
    // The engine reads a hop of 0 as in_channels
    int hop = in_channel_hop == 0 ? in_channels : in_channel_hop;
    if (hop < in_channels) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    size_t extent = static_cast<size_t>(out_channels - 1) * static_cast<size_t>(hop) +
                    static_cast<size_t>(in_channels);
    if (data.size() < extent) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return {};
}

float* MixMatrixView::native_data() const {
    if (data.empty()) {
        return nullptr;
    }
    // The native setters take a non-const pointer but only read through it.
    return const_cast<float*>(data.data());
}

namespace {

size_t element_count(int out_channels, int in_channels) {
    if (out_channels < 0 || in_channels < 0) {
        throw ContractViolation("MixMatrix: negative dimension");
    }
    return static_cast<size_t>(out_channels) * static_cast<size_t>(in_channels);
}

} // namespace

MixMatrix::MixMatrix(int out_channels, int in_channels)
    : out_channels_(out_channels),
      in_channels_(in_channels),
      values_(element_count(out_channels, in_channels), 0.0f) {}

MixMatrix MixMatrix::identity(int channels) {
    MixMatrix matrix(channels, channels);
    for (int i = 0; i < channels; ++i) {
        matrix.at(i, i) = 1.0f;
    }
    return matrix;
}

} // namespace fmodpp
