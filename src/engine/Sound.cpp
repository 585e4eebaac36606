#include "engine/Sound.hpp"
#include "core/Buffer.hpp"
#include "core/Handle.hpp"

namespace fmodpp {

Result<std::string> Sound::name() const {
    Raw* sound = raw_;
    return query_string(with_doubled_size_hint([sound](char* buffer, int capacity) {
        return FMOD_Sound_GetName(sound, buffer, capacity);
    }));
}

Result<unsigned int> Sound::length(FMOD_TIMEUNIT unit) const {
    unsigned int length = 0;
    FMOD_RESULT result = FMOD_Sound_GetLength(raw_, &length, unit);
    return check(result, length);
}

Result<OpenState> Sound::open_state() const {
    OpenState state;
    FMOD_BOOL starving = 0;
    FMOD_BOOL disk_busy = 0;
    FMOD_RESULT result = FMOD_Sound_GetOpenState(raw_, &state.state, &state.percent_buffered, &starving, &disk_busy);
    state.starving = starving != 0;
    state.disk_busy = disk_busy != 0;
    return check(result, state);
}

Result<int> Sound::num_sync_points() const {
    int count = 0;
    FMOD_RESULT result = FMOD_Sound_GetNumSyncPoints(raw_, &count);
    return check(result, count);
}

Result<FMOD_SYNCPOINT*> Sound::sync_point(int index) const {
    FMOD_SYNCPOINT* point = nullptr;
    FMOD_RESULT result = FMOD_Sound_GetSyncPoint(raw_, index, &point);
    return check(result, point);
}

Result<std::string> Sound::sync_point_name(int index) const {
    auto point = sync_point(index);
    if (!point) {
        return std::unexpected(point.error());
    }
    Raw* sound = raw_;
    FMOD_SYNCPOINT* raw_point = *point;
    return query_string(with_doubled_size_hint([sound, raw_point](char* buffer, int capacity) {
        return FMOD_Sound_GetSyncPointInfo(sound, raw_point, buffer, capacity, nullptr, FMOD_TIMEUNIT_MS);
    }));
}

Result<unsigned int> Sound::sync_point_offset(int index, FMOD_TIMEUNIT unit) const {
    auto point = sync_point(index);
    if (!point) {
        return std::unexpected(point.error());
    }
    unsigned int offset = 0;
    FMOD_RESULT result = FMOD_Sound_GetSyncPointInfo(raw_, *point, nullptr, 0, &offset, unit);
    return check(result, offset);
}

Result<SampleDataLock> Sound::lock(unsigned int offset, unsigned int length) const {
    void* first = nullptr;
    void* second = nullptr;
    unsigned int first_length = 0;
    unsigned int second_length = 0;
    FMOD_RESULT result = FMOD_Sound_Lock(raw_, offset, length, &first, &second, &first_length, &second_length);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    std::span<uint8_t> head;
    std::span<uint8_t> wrapped;
    if (first != nullptr) {
        head = std::span<uint8_t>(static_cast<uint8_t*>(first), first_length);
    }
    if (second != nullptr) {
        wrapped = std::span<uint8_t>(static_cast<uint8_t*>(second), second_length);
    }
    return Result<SampleDataLock>(SampleDataLock(raw_, head, wrapped));
}

namespace {

FMOD_RESULT unlock_sample_data(FMOD_SOUND* sound, std::span<uint8_t> first, std::span<uint8_t> second) noexcept {
    return FMOD_Sound_Unlock(sound, first.data(), second.data(),
                             static_cast<unsigned int>(first.size()), static_cast<unsigned int>(second.size()));
}

} // namespace

Result<> SampleDataLock::unlock() && {
    FMOD_SOUND* sound = std::exchange(sound_, nullptr);
    if (sound == nullptr) {
        return {};
    }
    return check(unlock_sample_data(sound, first_, second_));
}

void SampleDataLock::reset() noexcept {
    FMOD_SOUND* sound = std::exchange(sound_, nullptr);
    if (sound == nullptr) {
        return;
    }
    FMOD_RESULT result = unlock_sample_data(sound, first_, second_);
    if (result != FMOD_OK) {
        detail::log_release_failure("SampleDataLock", "unlocking sample data of sound", sound, result);
    }
}

} // namespace fmodpp
