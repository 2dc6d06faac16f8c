#pragma once
#include "mscan/status.hpp"
#include "mscan/types.hpp"

namespace mscan
{
    // Normalized cross-correlation (TM_CCOEFF_NORMED) of two frames of the same
    // size, compared in gray at reduced resolution. 1.0 means identical pictures.
    // InvalidRegion if a frame is empty or the sizes differ.
    Status frame_similarity(const Frame &before, const Frame &after, double &out);
}
