/**
 * @file Sound.hpp
 * @brief Loaded or streamed audio data.
 */

#ifndef FMODPP_ENGINE_SOUND_HPP
#define FMODPP_ENGINE_SOUND_HPP

#include "core/Error.hpp"
#include "core/Types.hpp"

#include <fmod.h>
#include <cstdint>
#include <span>
#include <string>
#include <utility>

namespace fmodpp {

class SampleDataLock;

/**
 * @brief View of a sound. Owned through Handle<Sound>.
 *
 * A sound opened with FMOD_NONBLOCKING loads in the background; poll
 * open_state() until it reports FMOD_OPENSTATE_READY before using it.
 */
class Sound {
public:
    using Raw = FMOD_SOUND;
    static constexpr const char* TYPE_NAME = "Sound";

    static Sound from_raw(Raw* raw) noexcept { return Sound(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    static FMOD_RESULT raw_release(Raw* raw) noexcept { return FMOD_Sound_Release(raw); }

    /// Names longer than MAX_HINTED_STRING_LENGTH fail with FMOD_ERR_TRUNCATED.
    Result<std::string> name() const;
    Result<unsigned int> length(FMOD_TIMEUNIT unit = FMOD_TIMEUNIT_MS) const;
    Result<OpenState> open_state() const;

    // Sync points
    Result<int> num_sync_points() const;
    /// Same length limit as name().
    Result<std::string> sync_point_name(int index) const;
    Result<unsigned int> sync_point_offset(int index, FMOD_TIMEUNIT unit = FMOD_TIMEUNIT_MS) const;

    /**
     * @brief Map length bytes of sample data starting at offset.
     *
     * Fails with FMOD_ERR_BADCOMMAND for streams and FMOD_ERR_SUBSOUNDS for a
     * parent sound. The data is handed back to the sound when the lock ends.
     */
    Result<SampleDataLock> lock(unsigned int offset, unsigned int length) const;

    friend bool operator==(const Sound& lhs, const Sound& rhs) noexcept {
        return lhs.raw_ == rhs.raw_;
    }

private:
    explicit Sound(Raw* raw) noexcept : raw_(raw) {}

    Result<FMOD_SYNCPOINT*> sync_point(int index) const;

    Raw* raw_;
};

/**
 * @brief Scoped access to a sound's sample data.
 *
 * Unlocks exactly once: explicitly through unlock(), or from the destructor,
 * which logs an unlock failure instead of reporting it. Several locks on the
 * same sound may coexist. The sound must outlive the lock.
 */
class SampleDataLock {
public:
    SampleDataLock(const SampleDataLock&) = delete;
    SampleDataLock& operator=(const SampleDataLock&) = delete;

    SampleDataLock(SampleDataLock&& other) noexcept
        : sound_(std::exchange(other.sound_, nullptr)), first_(other.first_), second_(other.second_) {}

    SampleDataLock& operator=(SampleDataLock&& other) noexcept {
        if (this != &other) {
            reset();
            sound_ = std::exchange(other.sound_, nullptr);
            first_ = other.first_;
            second_ = other.second_;
        }
        return *this;
    }

    ~SampleDataLock() { reset(); }

    Sound sound() const noexcept { return Sound::from_raw(sound_); }

    /**
     * @brief Bytes inside the sample buffer.
     */
    std::span<uint8_t> first() const noexcept { return first_; }

    /**
     * @brief Bytes wrapped around to the start of the buffer when the range
     * runs past its end; empty otherwise.
     */
    std::span<uint8_t> second() const noexcept { return second_; }

    size_t size() const noexcept { return first_.size() + second_.size(); }

    /**
     * @brief Hand the data back now and report the native result.
     */
    Result<> unlock() &&;

private:
    friend class Sound;

    SampleDataLock(FMOD_SOUND* sound, std::span<uint8_t> first, std::span<uint8_t> second) noexcept
        : sound_(sound), first_(first), second_(second) {}

    void reset() noexcept;

    FMOD_SOUND* sound_ = nullptr;
    std::span<uint8_t> first_;
    std::span<uint8_t> second_;
};

} // namespace fmodpp

#endif // FMODPP_ENGINE_SOUND_HPP
