// SPDX-License-Identifier: Apache-2.0
#include "ClipReader.hpp"

#include <algorithm>

namespace parley
{

auto ClipReader::read(float* output, ma_uint32 frameCount, ma_uint32 channels) -> Step
{
    auto framesRead = ma_uint64 { 0 };
    auto result = MA_AT_END;
    if (!_drained)
        result = ma_decoder_read_pcm_frames(&_decoder, output, frameCount, &framesRead);
    _lastResult = result;

    if (framesRead < frameCount)
        std::fill_n(output + framesRead * channels, (frameCount - framesRead) * channels, 0.0f);

    if (result != MA_SUCCESS && result != MA_AT_END)
        return Step::Failed;

    if (framesRead > 0)
    {
        _drained = result == MA_AT_END;
        return Step::Playing;
    }

    _drained = true;
    return Step::Finished;
}

auto ClipReader::rewind() -> bool
{
    _drained = false;
    _lastResult = MA_SUCCESS;
    return ma_decoder_seek_to_pcm_frame(&_decoder, 0) == MA_SUCCESS;
}

} // namespace parley
