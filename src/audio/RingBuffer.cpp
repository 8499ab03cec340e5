/**
 * RingBuffer.cpp - Explicit instantiation for the PCM16 speaker ring
 */

#include "vsp/audio/RingBuffer.hpp"

namespace vsp::audio {

template class RingBuffer<int16_t>;

} // namespace vsp::audio
