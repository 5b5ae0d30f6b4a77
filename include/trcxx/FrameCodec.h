// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Framed tribble: one frame trit on each side of a 6-trit tribble.
//
// The frame trits are the synchronisation marker. On receive, a frame trit
// that does not match the configured constant means the stream has drifted
// or the unit boundary was corrupted. Corruption confined to the interior
// trits is not detected here.

#pragma once

#include "Errors.h"
#include "Numerology.h"
#include "TribbleCodec.h"
#include "Trit.h"

#include <algorithm>
#include <array>
#include <cstddef>

namespace trcxx
{

using FramedTribble = std::array<Trit, frame_trits>;

class FrameCodec
{
public:
    explicit FrameCodec(Trit frame = Trit::Zero)
    : frame_(frame)
    {}

    Trit frame_trit() const { return frame_; }

    FramedTribble frame(const Tribble& tribble) const
    {
        FramedTribble result;
        result[frame_head] = frame_;
        std::copy(tribble.begin(), tribble.end(), result.begin() + 1);
        result[frame_tail] = frame_;
        return result;
    }

    /**
     * Strip the frame trits.
     *
     * offset is the stream position of framed[0] and is carried into the
     * SyncLossError so the caller can report which frame lost sync.
     */
    Tribble unframe(const FramedTribble& framed, size_t offset = 0) const
    {
        if (framed[frame_head] != frame_)
        {
            throw SyncLossError("leading frame trit mismatch", offset + frame_head);
        }
        if (framed[frame_tail] != frame_)
        {
            throw SyncLossError("trailing frame trit mismatch", offset + frame_tail);
        }

        Tribble result;
        std::copy(framed.begin() + 1, framed.begin() + 1 + tribble_trits, result.begin());
        return result;
    }

    /// Variable-length form; anything other than 8 trits is a FrameLengthError.
    Tribble unframe(const TritSequence& trits, size_t offset = 0) const
    {
        if (trits.size() != frame_trits)
        {
            throw FrameLengthError(frame_trits, trits.size(), offset);
        }
        FramedTribble framed;
        std::copy(trits.begin(), trits.end(), framed.begin());
        return unframe(framed, offset);
    }

private:
    Trit frame_;
};

} // namespace trcxx
