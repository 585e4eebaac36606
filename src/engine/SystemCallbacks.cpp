#include "engine/SystemCallbacks.hpp"
#include "core/Logger.hpp"

#include <atomic>

namespace fmodpp {

namespace {

std::atomic<uint64_t> underruns{0};

} // namespace

void SystemLog::memory_allocation_failed(System, std::string_view location, int size) {
    Logger::instance().log_messagef("fmod.system", "allocation of %d bytes failed at %.*s",
                                    size, static_cast<int>(location.size()), location.data());
}

void SystemLog::error(System, const ErrorInfo& info) {
    Logger::instance().log_messagef("fmod.system", "%.*s(%.*s) failed (%s): %s",
                                    static_cast<int>(info.function_name.size()), info.function_name.data(),
                                    static_cast<int>(info.function_params.size()), info.function_params.data(),
                                    kind_name(info.error.kind()), info.error.what());
}

void SystemLog::output_underrun(System) {
    // Value is the running underrun count
    uint64_t count = underruns.fetch_add(1, std::memory_order_relaxed) + 1;
    Logger::instance().log_event("fmod.underrun", static_cast<float>(count));
}

} // namespace fmodpp
