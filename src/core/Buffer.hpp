/**
 * @file Buffer.hpp
 * @brief Caller-owned buffers for native calls that write variable-size data.
 *
 * Strings: the engine writes into (buffer, capacity) and answers
 * FMOD_ERR_TRUNCATED when the buffer is too small. Blobs: a first call with a
 * null buffer reports the size, a second call fills it.
 */

#ifndef FMODPP_CORE_BUFFER_HPP
#define FMODPP_CORE_BUFFER_HPP

#include "core/Error.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace fmodpp {

constexpr int DEFAULT_STRING_CAPACITY = 256;

/**
 * @brief Longest string readable through with_doubled_size_hint() with the
 * default capacity. Longer names fail with FMOD_ERR_TRUNCATED.
 */
constexpr int MAX_HINTED_STRING_LENGTH = DEFAULT_STRING_CAPACITY * 2 - 1;

/**
 * @brief Read a string through a growable buffer.
 *
 * @param fill FMOD_RESULT(char* buffer, int capacity, int* required). On
 *        truncation it sets *required to the capacity it needs.
 * @param initial_capacity Size of the first attempt.
 *
 * At most two native calls are made: the second one with exactly the
 * reported size. A truncated string is never returned.
 */
template <typename Fill>
Result<std::string> query_string(Fill&& fill, int initial_capacity = DEFAULT_STRING_CAPACITY) {
    if (initial_capacity < 1) {
        throw ContractViolation("query_string: capacity must be positive");
    }

    std::string buffer(static_cast<size_t>(initial_capacity), '\0');
    int required = 0;
    FMOD_RESULT result = fill(buffer.data(), initial_capacity, &required);

    if (result == FMOD_ERR_TRUNCATED) {
        if (required <= initial_capacity) {
            return std::unexpected(Error(FMOD_ERR_TRUNCATED));
        }
        buffer.assign(static_cast<size_t>(required), '\0');
        int capacity = required;
        result = fill(buffer.data(), capacity, &required);
    }

    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }

    buffer.resize(std::strlen(buffer.c_str()));
    return buffer;
}

/**
 * @brief Adapt a native string call that reports truncation but no size.
 *
 * @param call FMOD_RESULT(char* buffer, int capacity)
 * @return A fill function for query_string() that asks for twice the
 *         current capacity when the call truncates.
 */
template <typename Call>
auto with_doubled_size_hint(Call call) {
    return [call = std::move(call)](char* buffer, int capacity, int* required) {
        FMOD_RESULT result = call(buffer, capacity);
        if (result == FMOD_ERR_TRUNCATED) {
            *required = capacity * 2;
        }
        return result;
    };
}

/**
 * @brief Read a binary blob with the size-query protocol.
 *
 * @param fill FMOD_RESULT(void* data, int* size). With data null it reports
 *        the size; otherwise it fills data and reports the bytes written.
 */
template <typename Fill>
Result<std::vector<uint8_t>> read_blob(Fill&& fill) {
    int size = 0;
    FMOD_RESULT result = fill(nullptr, &size);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    if (size < 0) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size == 0) {
        return data;
    }

    int written = size;
    result = fill(data.data(), &written);
    if (result != FMOD_OK) {
        return std::unexpected(Error(result));
    }
    if (written != size) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return data;
}

} // namespace fmodpp

#endif // FMODPP_CORE_BUFFER_HPP
