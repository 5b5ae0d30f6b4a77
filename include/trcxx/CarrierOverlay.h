// Copyright 2020 Mobilinkd LLC.
// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "Numerology.h"
#include "Trit.h"

#include <cstddef>
#include <string>
#include <utility>

namespace trcxx
{

/**
 * Repeating carrier pattern.
 *
 * A finite, non-empty trit sequence that is cycled to the length of the
 * stream it is applied to. Construction rejects an empty pattern, so every
 * CarrierPattern instance is usable as a modulus.
 *
 * Default pattern: "+=-=" (period 4).
 */
class CarrierPattern
{
public:
    static constexpr const char* DEFAULT_SPELLING = "+=-=";

    explicit CarrierPattern(TritSequence trits)
    : trits_(std::move(trits))
    {
        if (trits_.empty()) throw EmptyPatternError();
    }

    static CarrierPattern parse(const std::string& spelling,
        const SymbolAlphabet& alphabet = SymbolAlphabet())
    {
        return CarrierPattern(parse_trits(spelling, alphabet));
    }

    static CarrierPattern default_pattern()
    {
        return parse(DEFAULT_SPELLING);
    }

    size_t size() const { return trits_.size(); }

    /// Pattern trit at stream position i (the pattern repeats).
    Trit operator[](size_t i) const { return trits_[i % trits_.size()]; }

    const TritSequence& trits() const { return trits_; }

    std::string spelling(const SymbolAlphabet& alphabet = SymbolAlphabet()) const
    {
        return to_string(trits_, alphabet);
    }

    bool operator==(const CarrierPattern& other) const { return trits_ == other.trits_; }
    bool operator!=(const CarrierPattern& other) const { return !(*this == other); }

private:
    TritSequence trits_;
};

/**
 * How the pattern phase advances over a stream.
 *
 *   Continuous - pattern index = stream position (one cycle over the stream)
 *   PerFrame   - pattern index = position within the 8-trit frame, so the
 *                pattern restarts at every frame boundary
 */
enum class CarrierMode
{
    Continuous,
    PerFrame
};


/**
 * Carrier overlay for a trit stream.
 *
 * apply() adds the pattern trit to each stream trit mod 3 and remove()
 * subtracts it, so remove(apply(s)) == s for every stream, including the
 * empty one. The overlay holds no state between calls; a caller working on
 * a slice of a longer stream passes the slice's stream position as phase.
 *
 * Usage:
 *   CarrierOverlay overlay(CarrierPattern::default_pattern());
 *   auto wire = overlay.apply(plain);
 *   ...
 *   auto plain = overlay.remove(wire);
 */
class CarrierOverlay
{
public:
    explicit CarrierOverlay(CarrierPattern pattern, CarrierMode mode = CarrierMode::Continuous)
    : pattern_(std::move(pattern))
    , mode_(mode)
    {}

    const CarrierPattern& pattern() const { return pattern_; }

    CarrierMode mode() const { return mode_; }

    /// Pattern trit that overlays stream position pos.
    Trit carrier_at(size_t pos) const
    {
        if (mode_ == CarrierMode::PerFrame) pos %= frame_trits;
        return pattern_[pos];
    }

    TritSequence apply(const TritSequence& stream, size_t phase = 0) const
    {
        TritSequence result(stream);
        apply_in_place(result, phase);
        return result;
    }

    TritSequence remove(const TritSequence& stream, size_t phase = 0) const
    {
        TritSequence result(stream);
        remove_in_place(result, phase);
        return result;
    }

    void apply_in_place(TritSequence& stream, size_t phase = 0) const
    {
        for (size_t i = 0; i != stream.size(); ++i)
        {
            stream[i] = add_mod3(stream[i], carrier_at(phase + i));
        }
    }

    void remove_in_place(TritSequence& stream, size_t phase = 0) const
    {
        for (size_t i = 0; i != stream.size(); ++i)
        {
            stream[i] = sub_mod3(stream[i], carrier_at(phase + i));
        }
    }

private:
    CarrierPattern pattern_;
    CarrierMode mode_;
};


/**
 * Overlay a raw pattern on a stream (continuous phase from position 0).
 * Throws EmptyPatternError when the pattern has no trits.
 */
inline TritSequence apply_carrier(const TritSequence& stream, const TritSequence& pattern)
{
    return CarrierOverlay(CarrierPattern(pattern)).apply(stream);
}

inline TritSequence remove_carrier(const TritSequence& stream, const TritSequence& pattern)
{
    return CarrierOverlay(CarrierPattern(pattern)).remove(stream);
}

/**
 * First n trits of the cycled carrier.
 *
 * Equivalent to overlaying the pattern on an all-zero stream:
 *   carrier_sequence(parse("+=-="), 6) == "+=-=+="
 */
inline TritSequence carrier_sequence(const CarrierPattern& pattern, size_t n,
    CarrierMode mode = CarrierMode::Continuous)
{
    return CarrierOverlay(pattern, mode).apply(TritSequence(n, Trit::Zero));
}

} // namespace trcxx
