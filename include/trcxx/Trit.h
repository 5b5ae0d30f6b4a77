// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "Errors.h"
#include "Numerology.h"

#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace trcxx
{

/**
 * Balanced ternary digit.
 *
 * The underlying value is the digit itself, so static_cast<int> gives
 * -1, 0 or +1 directly.
 */
enum class Trit : int8_t
{
    Minus = -1,
    Zero = 0,
    Plus = 1
};

/// Ordered trit stream; index 0 is the first trit on the wire.
using TritSequence = std::vector<Trit>;

constexpr int value(Trit t)
{
    return static_cast<int>(t);
}

/// Build a trit from an integer, rejecting anything outside {-1, 0, +1}.
inline Trit make_trit(int v)
{
    if (v < trit_min || v > trit_max)
    {
        throw RangeError("trit value " + std::to_string(v) + " outside [-1, 1]");
    }
    return static_cast<Trit>(v);
}

constexpr Trit negate(Trit t)
{
    return static_cast<Trit>(-value(t));
}

/**
 * Balanced-ternary modular addition.
 *
 * The raw sum lies in [-2, 2]; it is folded back into [-1, 1] by a single
 * correction of 3 in either direction.
 */
constexpr Trit add_mod3(Trit a, Trit b)
{
    int sum = value(a) + value(b);
    if (sum > trit_max) sum -= trit_radix;
    else if (sum < trit_min) sum += trit_radix;
    return static_cast<Trit>(sum);
}

/// Inverse of add_mod3 for a fixed b: sub_mod3(add_mod3(a, b), b) == a.
constexpr Trit sub_mod3(Trit a, Trit b)
{
    return add_mod3(a, negate(b));
}


/**
 * Three-character symbol alphabet.
 *
 * The alphabet is part of the wire format: encoder and decoder must agree
 * on it. Symbols are stored in trit order (-1, 0, +1). The default is the
 * '-', '=', '+' set.
 */
class SymbolAlphabet
{
public:
    static constexpr char DEFAULT_MINUS = '-';
    static constexpr char DEFAULT_ZERO = '=';
    static constexpr char DEFAULT_PLUS = '+';

    SymbolAlphabet()
    : symbols_{{DEFAULT_MINUS, DEFAULT_ZERO, DEFAULT_PLUS}}
    {}

    SymbolAlphabet(char minus, char zero, char plus)
    : symbols_{{minus, zero, plus}}
    {
        if (minus == zero || zero == plus || minus == plus)
        {
            throw InvalidSymbolError("alphabet symbols must be distinct");
        }
        for (char c : symbols_)
        {
            // Whitespace is layout in a received stream, never a trit.
            if (std::isspace(static_cast<unsigned char>(c)))
            {
                throw InvalidSymbolError("alphabet symbols must not be whitespace");
            }
        }
    }

    /// Parse a three-character spelling such as "-=+" (minus, zero, plus).
    static SymbolAlphabet parse(const std::string& spelling)
    {
        if (spelling.size() != 3)
        {
            throw InvalidSymbolError("alphabet must be exactly 3 characters, got \""
                + spelling + "\"");
        }
        return SymbolAlphabet(spelling[0], spelling[1], spelling[2]);
    }

    char to_symbol(Trit t) const
    {
        return symbols_[value(t) + 1];
    }

    /// Throws InvalidSymbolError for characters outside the alphabet.
    Trit from_symbol(char c, size_t offset = CodecError::npos) const
    {
        for (size_t i = 0; i != symbols_.size(); ++i)
        {
            if (symbols_[i] == c) return static_cast<Trit>(static_cast<int>(i) - 1);
        }
        throw InvalidSymbolError(c, offset);
    }

    bool contains(char c) const
    {
        return c == symbols_[0] || c == symbols_[1] || c == symbols_[2];
    }

    /// Spelling in trit order, e.g. "-=+".
    std::string spelling() const
    {
        return std::string(symbols_.begin(), symbols_.end());
    }

    bool operator==(const SymbolAlphabet& other) const { return symbols_ == other.symbols_; }
    bool operator!=(const SymbolAlphabet& other) const { return !(*this == other); }

private:
    std::array<char, 3> symbols_;
};

/// Symbol mapping with the default alphabet.
inline char to_symbol(Trit t)
{
    return SymbolAlphabet().to_symbol(t);
}

inline Trit from_symbol(char c)
{
    return SymbolAlphabet().from_symbol(c);
}

/// Serialize trits to symbols.
inline std::string to_string(const TritSequence& trits,
    const SymbolAlphabet& alphabet = SymbolAlphabet())
{
    std::string result;
    result.reserve(trits.size());
    for (auto t : trits) result.push_back(alphabet.to_symbol(t));
    return result;
}

/**
 * Parse symbols to trits. Fails on the first character outside the
 * alphabet, reporting its index (plus base_offset) as the trit offset.
 */
inline TritSequence parse_trits(const std::string& symbols,
    const SymbolAlphabet& alphabet = SymbolAlphabet(), size_t base_offset = 0)
{
    TritSequence result;
    result.reserve(symbols.size());
    for (size_t i = 0; i != symbols.size(); ++i)
    {
        result.push_back(alphabet.from_symbol(symbols[i], base_offset + i));
    }
    return result;
}

} // namespace trcxx
