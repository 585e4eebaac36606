/**
 * @file Error.cpp
 * @brief Native result code classification.
 */

#include "core/Error.hpp"

#include <fmod_errors.h>

namespace fmodpp {

ErrorKind classify(FMOD_RESULT code) noexcept {
    switch (code) {
        case FMOD_OK:
            return ErrorKind::Success;

        case FMOD_ERR_BADCOMMAND:
        case FMOD_ERR_CHANNEL_STOLEN:
        case FMOD_ERR_DSP_CONNECTION:
        case FMOD_ERR_DSP_FORMAT:
        case FMOD_ERR_DSP_INUSE:
        case FMOD_ERR_DSP_NOTFOUND:
        case FMOD_ERR_DSP_RESERVED:
        case FMOD_ERR_DSP_TYPE:
        case FMOD_ERR_INITIALIZATION:
        case FMOD_ERR_INITIALIZED:
        case FMOD_ERR_INVALID_FLOAT:
        case FMOD_ERR_INVALID_HANDLE:
        case FMOD_ERR_INVALID_PARAM:
        case FMOD_ERR_INVALID_POSITION:
        case FMOD_ERR_INVALID_SPEAKER:
        case FMOD_ERR_INVALID_SYNCPOINT:
        case FMOD_ERR_INVALID_THREAD:
        case FMOD_ERR_INVALID_VECTOR:
        case FMOD_ERR_INVALID_STRING:
        case FMOD_ERR_NEEDS3D:
        case FMOD_ERR_REVERB_CHANNELGROUP:
        case FMOD_ERR_REVERB_INSTANCE:
        case FMOD_ERR_SUBSOUNDS:
        case FMOD_ERR_SUBSOUND_ALLOCATED:
        case FMOD_ERR_SUBSOUND_CANTMOVE:
        case FMOD_ERR_TAGNOTFOUND:
        case FMOD_ERR_UNINITIALIZED:
        case FMOD_ERR_EVENT_ALREADY_LOADED:
        case FMOD_ERR_EVENT_NOTFOUND:
        case FMOD_ERR_STUDIO_UNINITIALIZED:
        case FMOD_ERR_ALREADY_LOCKED:
        case FMOD_ERR_NOT_LOCKED:
            return ErrorKind::Configuration;

        case FMOD_ERR_CHANNEL_ALLOC:
        case FMOD_ERR_MAXAUDIBLE:
        case FMOD_ERR_MEMORY:
        case FMOD_ERR_MEMORY_CANTPOINT:
        case FMOD_ERR_OUTPUT_ALLOCATED:
        case FMOD_ERR_OUTPUT_CREATEBUFFER:
        case FMOD_ERR_PLUGIN_RESOURCE:
        case FMOD_ERR_TOOMANYCHANNELS:
        case FMOD_ERR_TOOMANYSAMPLES:
        case FMOD_ERR_TRUNCATED:
            return ErrorKind::Resource;

        case FMOD_ERR_DMA:
        case FMOD_ERR_FORMAT:
        case FMOD_ERR_HEADER_MISMATCH:
        case FMOD_ERR_NEEDSHARDWARE:
        case FMOD_ERR_OUTPUT_DRIVERCALL:
        case FMOD_ERR_OUTPUT_FORMAT:
        case FMOD_ERR_OUTPUT_INIT:
        case FMOD_ERR_OUTPUT_NODRIVERS:
        case FMOD_ERR_PLUGIN:
        case FMOD_ERR_PLUGIN_MISSING:
        case FMOD_ERR_PLUGIN_VERSION:
        case FMOD_ERR_RECORD:
        case FMOD_ERR_RECORD_DISCONNECTED:
        case FMOD_ERR_UNIMPLEMENTED:
        case FMOD_ERR_UNSUPPORTED:
        case FMOD_ERR_VERSION:
        case FMOD_ERR_EVENT_LIVEUPDATE_MISMATCH:
            return ErrorKind::Unavailable;

        case FMOD_ERR_NOTREADY:
        case FMOD_ERR_NET_WOULD_BLOCK:
        case FMOD_ERR_STUDIO_NOT_LOADED:
        case FMOD_ERR_EVENT_LIVEUPDATE_BUSY:
            return ErrorKind::NotReady;

        case FMOD_ERR_FILE_BAD:
        case FMOD_ERR_FILE_COULDNOTSEEK:
        case FMOD_ERR_FILE_DISKEJECTED:
        case FMOD_ERR_FILE_EOF:
        case FMOD_ERR_FILE_ENDOFDATA:
        case FMOD_ERR_FILE_NOTFOUND:
        case FMOD_ERR_HTTP:
        case FMOD_ERR_HTTP_ACCESS:
        case FMOD_ERR_HTTP_PROXY_AUTH:
        case FMOD_ERR_HTTP_SERVER_ERROR:
        case FMOD_ERR_HTTP_TIMEOUT:
        case FMOD_ERR_NET_CONNECT:
        case FMOD_ERR_NET_SOCKET_ERROR:
        case FMOD_ERR_NET_URL:
        case FMOD_ERR_EVENT_LIVEUPDATE_TIMEOUT:
            return ErrorKind::IO;

        case FMOD_ERR_INTERNAL:
        case FMOD_ERR_DSP_DONTPROCESS:
        case FMOD_ERR_DSP_SILENCE:
        default:
            return ErrorKind::Internal;
    }
}

const char* kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Success: return "Success";
        case ErrorKind::Configuration: return "Configuration";
        case ErrorKind::Resource: return "Resource";
        case ErrorKind::Unavailable: return "Unavailable";
        case ErrorKind::NotReady: return "NotReady";
        case ErrorKind::IO: return "IO";
        case ErrorKind::Internal: return "Internal";
        case ErrorKind::ContractViolation: return "ContractViolation";
    }
    return "Unknown";
}

const char* Error::what() const noexcept {
    return FMOD_ErrorString(code_);
}

} // namespace fmodpp
