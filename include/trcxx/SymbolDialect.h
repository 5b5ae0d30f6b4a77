// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Human-facing spellings of a trit stream.
//
// LED glyphs are for display only and are never emitted on the wire. On
// receive, normalize_dialect() folds the alternative spellings a person is
// likely to paste back in onto the canonical alphabet before parsing.

#pragma once

#include "Trit.h"

#include <array>
#include <cctype>
#include <cstring>
#include <string>
#include <utility>

namespace trcxx
{

// UTF-8 glyphs in trit order (-1, 0, +1).
constexpr const char* LED_GREEN = "\xF0\x9F\x9F\xA2";  // U+1F7E2, -1
constexpr const char* LED_BLACK = "\xE2\x9A\xAB";      // U+26AB,   0
constexpr const char* LED_RED = "\xF0\x9F\x94\xB4";    // U+1F534, +1

inline const char* led_glyph(Trit t)
{
    switch (t)
    {
        case Trit::Minus: return LED_GREEN;
        case Trit::Zero: return LED_BLACK;
        case Trit::Plus: return LED_RED;
    }
    return LED_BLACK;
}

/**
 * Render a symbol stream as LED glyphs.
 *
 * Characters outside the alphabet are copied through unchanged so that
 * a partly damaged stream can still be displayed.
 */
inline std::string to_led(const std::string& symbols,
    const SymbolAlphabet& alphabet = SymbolAlphabet())
{
    std::string result;
    result.reserve(symbols.size() * 4);
    for (char c : symbols)
    {
        if (alphabet.contains(c)) result += led_glyph(alphabet.from_symbol(c));
        else result.push_back(c);
    }
    return result;
}

/**
 * Fold alternative trit spellings onto the alphabet.
 *
 *   LED glyphs    green / black / red  ->  -1 / 0 / +1
 *   arrows        '<' / '>'            ->  -1 / +1
 *   digits        '2' / '0' / '1'      ->  -1 / 0 / +1
 *
 * Whitespace is dropped. A single-character alias is only applied when the
 * character is not already an alphabet symbol. Anything else is passed
 * through so that the parser reports it.
 */
inline std::string normalize_dialect(const std::string& input,
    const SymbolAlphabet& alphabet = SymbolAlphabet())
{
    static const std::array<std::pair<const char*, Trit>, 3> glyphs{{
        {LED_GREEN, Trit::Minus},
        {LED_BLACK, Trit::Zero},
        {LED_RED, Trit::Plus},
    }};
    static const std::array<std::pair<char, Trit>, 5> aliases{{
        {'<', Trit::Minus},
        {'>', Trit::Plus},
        {'2', Trit::Minus},
        {'0', Trit::Zero},
        {'1', Trit::Plus},
    }};

    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size())
    {
        bool matched = false;
        for (const auto& glyph : glyphs)
        {
            size_t len = std::strlen(glyph.first);
            if (input.compare(i, len, glyph.first) == 0)
            {
                result.push_back(alphabet.to_symbol(glyph.second));
                i += len;
                matched = true;
                break;
            }
        }
        if (matched) continue;

        char c = input[i++];
        if (std::isspace(static_cast<unsigned char>(c))) continue;

        if (!alphabet.contains(c))
        {
            for (const auto& alias : aliases)
            {
                if (alias.first == c)
                {
                    c = alphabet.to_symbol(alias.second);
                    break;
                }
            }
        }
        result.push_back(c);
    }
    return result;
}

} // namespace trcxx
