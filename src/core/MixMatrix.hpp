/**
 * @file MixMatrix.hpp
 * @brief Speaker mix matrices exchanged with the engine.
 *
 * A mix matrix has one row per output channel and one column per input
 * channel, stored row-major with a row stride ("hop") of at least the column
 * count. Reading one takes two native calls: a query with a null matrix that
 * reports the dimensions, then a fill.
 */

#ifndef FMODPP_CORE_MIX_MATRIX_HPP
#define FMODPP_CORE_MIX_MATRIX_HPP

#include "core/Error.hpp"

#include <fmod_common.h>
#include <algorithm>
#include <array>
#include <span>
#include <utility>
#include <vector>

namespace fmodpp {

constexpr int MAX_CHANNEL_WIDTH = FMOD_MAX_CHANNEL_WIDTH;

/**
 * @brief Borrowed matrix passed to the engine's setters.
 */
struct MixMatrixView {
    int out_channels = 0;
    int in_channels = 0;
    int in_channel_hop = 0;  // 0 means densely packed
    std::span<const float> data;

    /**
     * @brief Check dimensions, hop and extent before any native call.
     * @return FMOD_ERR_INVALID_PARAM on any violation.
     */
    Result<> validate() const;

    /**
     * @brief Pointer handed to the native setter; null for an empty matrix.
     */
    float* native_data() const;
};

/**
 * @brief Owned, densely packed mix matrix.
 */
class MixMatrix {
public:
    MixMatrix() = default;
    MixMatrix(int out_channels, int in_channels);

    static MixMatrix identity(int channels);

    int out_channels() const { return out_channels_; }
    int in_channels() const { return in_channels_; }
    bool empty() const { return values_.empty(); }

    float& at(int out, int in) { return values_[index(out, in)]; }
    float at(int out, int in) const { return values_[index(out, in)]; }

    std::span<const float> values() const { return values_; }
    std::span<float> values() { return values_; }

    MixMatrixView view() const {
        return MixMatrixView{out_channels_, in_channels_, in_channels_, values_};
    }

    friend bool operator==(const MixMatrix&, const MixMatrix&) = default;

private:
    size_t index(int out, int in) const {
        return static_cast<size_t>(out) * static_cast<size_t>(in_channels_) + static_cast<size_t>(in);
    }

    int out_channels_ = 0;
    int in_channels_ = 0;
    std::vector<float> values_;
};

/**
 * @brief Read a matrix into a caller-owned destination.
 *
 * @param fill FMOD_RESULT(float* matrix, int* out, int* in, int hop). With a
 *        null matrix it only reports the dimensions.
 *
 * The fill writes into a staging area of the engine's maximum matrix size,
 * so it stays in bounds whatever the engine reports. If the dimensions seen
 * at fill time differ from the queried ones the read fails with
 * FMOD_ERR_DSP_FORMAT and destination is left untouched.
 */
template <typename Fill>
Result<> read_mix_matrix(Fill&& fill, MixMatrix& destination) {
    int out_channels = 0;
    int in_channels = 0;
    FMOD_RESULT result = fill(nullptr, &out_channels, &in_channels, 0);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    if (out_channels < 0 || in_channels < 0 ||
        out_channels > MAX_CHANNEL_WIDTH || in_channels > MAX_CHANNEL_WIDTH) {
        return std::unexpected(Error(FMOD_ERR_DSP_FORMAT));
    }

    MixMatrix matrix(out_channels, in_channels);
    if (!matrix.empty()) {
        std::array<float, MAX_CHANNEL_WIDTH * MAX_CHANNEL_WIDTH> staging{};
        int filled_out = out_channels;
        int filled_in = in_channels;
        result = fill(staging.data(), &filled_out, &filled_in, MAX_CHANNEL_WIDTH);
        if (result != FMOD_OK) {
            return std::unexpected(Error(result));
        }
        if (filled_out != out_channels || filled_in != in_channels) {
            return std::unexpected(Error(FMOD_ERR_DSP_FORMAT));
        }
        for (int out = 0; out < out_channels; ++out) {
            const float* row = staging.data() + static_cast<size_t>(out) * MAX_CHANNEL_WIDTH;
            std::copy(row, row + in_channels, &matrix.at(out, 0));
        }
    }

    destination = std::move(matrix);
    return {};
}

template <typename Fill>
Result<MixMatrix> read_mix_matrix(Fill&& fill) {
    MixMatrix matrix;
    auto result = read_mix_matrix(std::forward<Fill>(fill), matrix);
    if (!result) {
        return std::unexpected(result.error());
    }
    return matrix;
}

} // namespace fmodpp

#endif // FMODPP_CORE_MIX_MATRIX_HPP
