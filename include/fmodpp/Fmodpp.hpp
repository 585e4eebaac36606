/**
 * @file Fmodpp.hpp
 * @brief Public entry point of the fmodpp library.
 *
 * Ownership-checked, error-translated access to the FMOD Core C API:
 * Handle<T> owns engine objects, views borrow them, Result<T> carries native
 * failures, and callback trampolines keep exceptions out of engine threads.
 */

#ifndef FMODPP_FMODPP_HPP
#define FMODPP_FMODPP_HPP

#include "core/Buffer.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "core/Handle.hpp"
#include "core/Logger.hpp"
#include "core/MixMatrix.hpp"
#include "core/Types.hpp"
#include "core/Version.hpp"

#include "control/Callbacks.hpp"
#include "control/Channel.hpp"
#include "control/ChannelControl.hpp"
#include "control/ChannelGroup.hpp"

#include "engine/Debug.hpp"
#include "engine/Dsp.hpp"
#include "engine/DspConnection.hpp"
#include "engine/Geometry.hpp"
#include "engine/Runtime.hpp"
#include "engine/Sound.hpp"
#include "engine/System.hpp"
#include "engine/SystemCallbacks.hpp"

#endif // FMODPP_FMODPP_HPP
