// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "Numerology.h"
#include "Trit.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>

namespace trcxx
{

using CoreTrits = std::array<Trit, core_trits>;
using Tribble = std::array<Trit, tribble_trits>;

/**
 * Convert a signed value in [-40, 40] to four balanced trits,
 * most-significant digit first.
 *
 * Digits are produced least-significant first with
 *   r = ((n + 1) mod 3) - 1;  n = (n - r) / 3
 * using floor modulo, then stored in reverse so that the wire reads
 * d3 d2 d1 d0.
 */
inline CoreTrits to_core_trits(int signed_value)
{
    if (signed_value < core_signed_min || signed_value > core_signed_max)
    {
        throw RangeError("signed core value " + std::to_string(signed_value)
            + " outside [" + std::to_string(core_signed_min) + ", "
            + std::to_string(core_signed_max) + "]");
    }

    CoreTrits result;
    int n = signed_value;
    for (size_t i = 0; i != core_trits; ++i)
    {
        int m = (n + 1) % trit_radix;
        if (m < 0) m += trit_radix;
        int remainder = m - 1;
        n = (n - remainder) / trit_radix;
        result[core_trits - 1 - i] = static_cast<Trit>(remainder);
    }
    return result;
}

/// Sum of d_i * 3^i over the four core trits (most-significant first).
inline int from_core_trits(const CoreTrits& trits)
{
    int acc = 0;
    for (auto t : trits)
    {
        acc = acc * trit_radix + value(t);
    }
    return acc;
}


/**
 * Tribble codec: core value [0, 80] <-> 6-trit tribble.
 *
 * Layout: [pad, d3, d2, d1, d0, pad]. The pad trit is fixed for the codec
 * instance; a tribble whose boundary trits differ from it is rejected with
 * PaddingMismatchError. Nothing is corrected.
 */
class TribbleCodec
{
public:
    explicit TribbleCodec(Trit pad = Trit::Zero)
    : pad_(pad)
    {}

    Trit pad() const { return pad_; }

    Tribble encode_core(int value) const
    {
        if (value < core_min || value > core_max)
        {
            throw RangeError("core value " + std::to_string(value)
                + " outside [" + std::to_string(core_min) + ", "
                + std::to_string(core_max) + "]");
        }

        auto core = to_core_trits(value - core_offset);

        Tribble result;
        result[tribble_pad_head] = pad_;
        std::copy(core.begin(), core.end(), result.begin() + 1);
        result[tribble_pad_tail] = pad_;
        return result;
    }

    /**
     * Decode a tribble to its core value.
     *
     * offset is the stream position of tribble[0]; it is only used to
     * report where a bad pad trit was seen.
     */
    int decode_core(const Tribble& tribble, size_t offset = 0) const
    {
        if (tribble[tribble_pad_head] != pad_)
        {
            throw PaddingMismatchError("leading pad trit mismatch",
                offset + tribble_pad_head);
        }
        if (tribble[tribble_pad_tail] != pad_)
        {
            throw PaddingMismatchError("trailing pad trit mismatch",
                offset + tribble_pad_tail);
        }

        CoreTrits core;
        std::copy(tribble.begin() + 1, tribble.begin() + 1 + core_trits, core.begin());
        return from_core_trits(core) + core_offset;
    }

    /// Variable-length form; anything other than 6 trits is a FrameLengthError.
    int decode_core(const TritSequence& trits, size_t offset = 0) const
    {
        if (trits.size() != tribble_trits)
        {
            throw FrameLengthError(tribble_trits, trits.size(), offset);
        }
        Tribble tribble;
        std::copy(trits.begin(), trits.end(), tribble.begin());
        return decode_core(tribble, offset);
    }

private:
    Trit pad_;
};

} // namespace trcxx
