// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>

namespace trcxx
{
    // =========================================================================
    // TRIT ARITHMETIC
    // =========================================================================

    const int trit_radix = 3;                       // balanced digits {-1, 0, +1}
    const int trit_min = -1;
    const int trit_max = 1;

    // =========================================================================
    // CORE VALUE (4 balanced trits)
    // =========================================================================

    const size_t core_trits = 4;                    // payload trits per tribble
    const int core_states = 81;                     // 3^4 representable values
    const int core_offset = 40;                     // unsigned = signed + 40
    const int core_min = 0;
    const int core_max = core_states - 1;           // 80
    const int core_signed_min = core_min - core_offset;     // -40
    const int core_signed_max = core_max - core_offset;     // +40

    // =========================================================================
    // UNIT LAYOUT
    // =========================================================================

    // Tribble: pad + 4 core + pad
    const size_t tribble_trits = core_trits + 2;    // 6
    const size_t tribble_pad_head = 0;
    const size_t tribble_pad_tail = tribble_trits - 1;

    // Framed tribble: frame + tribble + frame
    const size_t frame_trits = tribble_trits + 2;   // 8
    const size_t frame_head = 0;
    const size_t frame_tail = frame_trits - 1;

    // =========================================================================
    // BYTE SPLIT (byte = high * 81 + low, high digit first on the wire)
    // =========================================================================

    const size_t frames_per_byte = 2;
    const size_t trits_per_byte = frames_per_byte * frame_trits;   // 16
    const int byte_high_max = 255 / core_states;    // 3

    // --- Static assertions ---
    static_assert(core_states == trit_radix * trit_radix * trit_radix * trit_radix,
                  "Core states must equal 3^core_trits");
    static_assert(core_offset == (core_states - 1) / 2,
                  "Core offset must centre the balanced range on zero");
    static_assert(frame_trits == 8, "Framed tribble must be 8 trits");
    static_assert(byte_high_max * core_states + core_max >= 255,
                  "Two core digits must cover every byte value");
}
