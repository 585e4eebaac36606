/**
 * @file Handle.hpp
 * @brief Exclusive ownership of a native engine object.
 *
 * A view type T (Sound, Dsp, System, ...) describes one native kind:
 *   - T::Raw               the opaque native struct
 *   - T::TYPE_NAME         name used in diagnostics
 *   - T::from_raw(Raw*)    construct a non-owning view
 *   - T::as_raw()          recover the pointer
 *   - T::raw_release(Raw*) the kind's native release function
 *
 * Handle<T> holds the pointer plus the responsibility to release it exactly
 * once. Views obtained from a handle, or from borrow(), never release.
 */

#ifndef FMODPP_CORE_HANDLE_HPP
#define FMODPP_CORE_HANDLE_HPP

#include "core/Error.hpp"
#include "core/Logger.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace fmodpp {

namespace detail {

/**
 * @brief Record a release-style failure that has no caller to report to.
 */
inline void log_release_failure(const char* tag, const char* action, const void* object,
                                FMOD_RESULT result) noexcept {
    Logger::instance().log_messagef(tag, "%s %p failed (%s): %s", action, object,
                                    kind_name(classify(result)), Error(result).what());
}

} // namespace detail

template <typename T>
class Handle {
public:
    using Raw = typename T::Raw;

    /**
     * @brief Take ownership of a native pointer.
     *
     * The pointer must come from a successful native creation call and must
     * not be owned by any other handle.
     * @throws ContractViolation if raw is null.
     */
    static Handle acquire(Raw* raw) {
        if (raw == nullptr) {
            throw ContractViolation(std::string("Handle<") + T::TYPE_NAME + ">::acquire: null pointer");
        }
        return Handle(raw);
    }

    /**
     * @brief Re-take ownership of an object previously given up with leak().
     */
    static Handle unleak(T view) {
        return acquire(view.as_raw());
    }

    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Handle(Handle&& other) noexcept : raw_(std::exchange(other.raw_, nullptr)) {}

    Handle& operator=(Handle&& other) noexcept {
        if (this != &other) {
            reset();
            raw_ = std::exchange(other.raw_, nullptr);
        }
        return *this;
    }

    ~Handle() { reset(); }

    T get() const noexcept { return T::from_raw(raw_); }
    T operator*() const noexcept { return get(); }

    /**
     * @brief Member access through a temporary view.
     */
    struct Arrow {
        T view;
        const T* operator->() const noexcept { return &view; }
    };
    Arrow operator->() const noexcept { return Arrow{get()}; }

    Raw* as_raw() const noexcept { return raw_; }

    /**
     * @brief Give up release responsibility and hand back the pointer.
     */
    Raw* leak() && noexcept { return std::exchange(raw_, nullptr); }

    /**
     * @brief Release now and report the native result.
     *
     * On failure the object is considered leaked; it is never released twice.
     */
    Result<> try_release() && {
        Raw* raw = std::exchange(raw_, nullptr);
        if (raw == nullptr) {
            return {};
        }
        return check(T::raw_release(raw));
    }

private:
    explicit Handle(Raw* raw) noexcept : raw_(raw) {}

    void reset() noexcept {
        static_assert(noexcept(T::raw_release(static_cast<Raw*>(nullptr))),
                      "raw_release runs from destructors and must not throw");
        Raw* raw = std::exchange(raw_, nullptr);
        if (raw == nullptr) {
            return;
        }
        FMOD_RESULT result = T::raw_release(raw);
        if (result != FMOD_OK) {
            char action[48];
            std::snprintf(action, sizeof(action), "releasing %s", T::TYPE_NAME);
            detail::log_release_failure("Handle", action, raw, result);
        }
    }

    Raw* raw_ = nullptr;
};

/**
 * @brief Non-owning view of a native object owned elsewhere.
 * @throws ContractViolation if raw is null.
 */
template <typename T>
T borrow(typename T::Raw* raw) {
    if (raw == nullptr) {
        throw ContractViolation(std::string("borrow<") + T::TYPE_NAME + ">: null pointer");
    }
    return T::from_raw(raw);
}

/**
 * @brief Wrap the outcome of a native creation call.
 *
 * A failed creation never yields a handle.
 */
template <typename T>
Result<Handle<T>> adopt(FMOD_RESULT result, typename T::Raw* raw) {
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    return Handle<T>::acquire(raw);
}

} // namespace fmodpp

#endif // FMODPP_CORE_HANDLE_HPP
