// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trcxx/StreamAssembler.h"
#include "trcxx/SymbolDialect.h"

#include "gtest/gtest.h"

#include <string>

using namespace trcxx;

TEST(symbol_dialect, led_rendering)
{
    EXPECT_EQ(to_led("+=-"), std::string(LED_RED) + LED_BLACK + LED_GREEN);
    EXPECT_EQ(to_led(""), "");
}

TEST(symbol_dialect, led_rendering_passes_foreign_characters)
{
    EXPECT_EQ(to_led("+ x"), std::string(LED_RED) + " x");
}

TEST(symbol_dialect, led_round_trip)
{
    std::string wire = "+=+-=--=+=+-=--=";
    EXPECT_EQ(normalize_dialect(to_led(wire)), wire);
}

TEST(symbol_dialect, digit_and_arrow_aliases)
{
    EXPECT_EQ(normalize_dialect("1 0 2"), "+=-");
    EXPECT_EQ(normalize_dialect("><"), "+-");
    EXPECT_EQ(normalize_dialect("+=\n-=\t"), "+=-=");
}

TEST(symbol_dialect, unknown_characters_reach_the_parser)
{
    auto normalized = normalize_dialect("+=x");
    EXPECT_EQ(normalized, "+=x");
    EXPECT_THROW(parse_trits(normalized), InvalidSymbolError);
}

TEST(symbol_dialect, alphabet_symbols_win_over_aliases)
{
    auto alphabet = SymbolAlphabet::parse("201");
    // '2', '0', '1' are alphabet symbols here and must not be remapped.
    EXPECT_EQ(normalize_dialect("201", alphabet), "201");
    EXPECT_EQ(normalize_dialect("<>", alphabet), "21");
    EXPECT_EQ(to_led("1", alphabet), LED_RED);
}

TEST(symbol_dialect, decode_led_stream)
{
    StreamAssembler assembler(CodecConfig::with_default_carrier());
    bytes_t data = {'L', 'E', 'D'};
    auto shown = to_led(assembler.encode(data));
    EXPECT_EQ(assembler.decode(normalize_dialect(shown)), data);
}
