// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation, including its WAV/MP3/FLAC decoders and the
// WAV encoder. Compiled exactly once; AudioCapture, AudioPlayback and ClipReader include <miniaudio.h> without the
// IMPLEMENTATION define.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
