// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trcxx/StreamAssembler.h"

#include "gtest/gtest.h"

#include <optional>
#include <random>
#include <string>
#include <utility>

using namespace trcxx;

namespace
{
bytes_t bytes_of(const std::string& text)
{
    return bytes_t(text.begin(), text.end());
}

bytes_t random_bytes(std::mt19937& gen, size_t n)
{
    std::uniform_int_distribution<int> d(0, 255);
    bytes_t result(n);
    for (auto& b : result) b = static_cast<uint8_t>(d(gen));
    return result;
}

// Replace the symbol at pos with a different one.
std::string flip(std::string symbols, size_t pos)
{
    symbols[pos] = symbols[pos] == '+' ? '-' : '+';
    return symbols;
}

const std::optional<CarrierPattern> no_carrier;
}

TEST(stream_assembler, zero_byte_without_carrier)
{
    StreamAssembler assembler;
    auto wire = assembler.encode({0x00}, no_carrier);
    EXPECT_EQ(wire, "==----====----==");
    EXPECT_EQ(assembler.decode(wire, no_carrier), bytes_t{0x00});
}

TEST(stream_assembler, known_vectors)
{
    StreamAssembler assembler;
    EXPECT_EQ(assembler.encode(bytes_of("A")), "==----====+=-+==");
    EXPECT_EQ(assembler.encode({0xFF}), "==--=-====-==-==");
    EXPECT_EQ(assembler.encode({0x00}, CarrierPattern::default_pattern()), "+=+-=--=+=+-=--=");
    EXPECT_EQ(assembler.encode(bytes_of("Hi"), CarrierPattern::default_pattern()),
        "+=+-=--=+==+=--=+=+-==-=+=++---=");
}

TEST(stream_assembler, split_byte_convention)
{
    EXPECT_EQ(StreamAssembler::split_byte(0), std::make_pair(0, 0));
    EXPECT_EQ(StreamAssembler::split_byte(80), std::make_pair(0, 80));
    EXPECT_EQ(StreamAssembler::split_byte(81), std::make_pair(1, 0));
    EXPECT_EQ(StreamAssembler::split_byte(255), std::make_pair(3, 12));
    for (int b = 0; b <= 255; ++b)
    {
        auto digits = StreamAssembler::split_byte(static_cast<uint8_t>(b));
        EXPECT_EQ(StreamAssembler::join_byte(digits.first, digits.second), b);
    }
}

TEST(stream_assembler, join_byte_rejects_impossible_pairs)
{
    EXPECT_THROW(StreamAssembler::join_byte(4, 0), RangeError);
    EXPECT_THROW(StreamAssembler::join_byte(3, 13), RangeError);
}

TEST(stream_assembler, round_trip_without_carrier)
{
    StreamAssembler assembler;
    std::mt19937 gen(42);
    for (size_t n : {0, 1, 2, 7, 64, 300})
    {
        auto data = random_bytes(gen, n);
        auto wire = assembler.encode(data, no_carrier);
        EXPECT_EQ(wire.size(), n * trits_per_byte);
        EXPECT_EQ(assembler.decode(wire, no_carrier), data);
    }
}

TEST(stream_assembler, round_trip_with_carriers)
{
    StreamAssembler assembler;
    std::mt19937 gen(43);
    for (auto spelling : {"+=-=", "-", "+-=++-=", "=-+"})
    {
        auto carrier = CarrierPattern::parse(spelling);
        for (size_t n : {0, 1, 5, 128})
        {
            auto data = random_bytes(gen, n);
            EXPECT_EQ(assembler.decode(assembler.encode(data, carrier), carrier), data)
                << "carrier " << spelling << " length " << n;
        }
    }
}

TEST(stream_assembler, every_byte_value_round_trips)
{
    StreamAssembler assembler(CodecConfig::with_default_carrier());
    bytes_t data;
    for (int b = 0; b <= 255; ++b) data.push_back(static_cast<uint8_t>(b));
    auto wire = assembler.encode(data);
    EXPECT_EQ(wire.size() % frame_trits, 0u);
    EXPECT_EQ(assembler.decode(wire), data);
}

TEST(stream_assembler, configured_carrier_is_used_by_default)
{
    StreamAssembler plain;
    StreamAssembler carried(CodecConfig::with_default_carrier());
    auto data = bytes_of("tribble");
    EXPECT_NE(carried.encode(data), plain.encode(data));
    EXPECT_EQ(carried.encode(data), plain.encode(data, CarrierPattern::default_pattern()));
    EXPECT_EQ(carried.decode(carried.encode(data)), data);
}

TEST(stream_assembler, wrong_carrier_does_not_decode_silently)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("ok"), CarrierPattern::default_pattern());
    EXPECT_THROW(assembler.decode(wire, no_carrier), CodecError);
}

TEST(stream_assembler, frame_boundary_corruption_is_sync_loss)
{
    StreamAssembler assembler;
    std::mt19937 gen(5);
    auto data = random_bytes(gen, 4);

    for (auto carrier : {no_carrier, std::optional<CarrierPattern>(CarrierPattern::default_pattern())})
    {
        auto wire = assembler.encode(data, carrier);
        for (size_t frame = 0; frame != wire.size() / frame_trits; ++frame)
        {
            size_t head = frame * frame_trits + frame_head;
            size_t tail = frame * frame_trits + frame_tail;
            EXPECT_THROW(assembler.decode(flip(wire, head), carrier), SyncLossError);
            EXPECT_THROW(assembler.decode(flip(wire, tail), carrier), SyncLossError);
        }
    }
}

TEST(stream_assembler, pad_corruption_is_padding_mismatch)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("pad"), no_carrier);

    for (size_t frame = 0; frame != wire.size() / frame_trits; ++frame)
    {
        // Tribble positions 0 and 5 sit at frame positions 1 and 6.
        size_t lead = frame * frame_trits + 1 + tribble_pad_head;
        size_t trail = frame * frame_trits + 1 + tribble_pad_tail;
        EXPECT_THROW(assembler.decode(flip(wire, lead), no_carrier), PaddingMismatchError);
        EXPECT_THROW(assembler.decode(flip(wire, trail), no_carrier), PaddingMismatchError);
    }
}

TEST(stream_assembler, error_reports_first_bad_offset)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("abc"), no_carrier);
    auto bad = flip(flip(wire, 23), 40);

    try
    {
        assembler.decode(bad, no_carrier);
        FAIL() << "expected SyncLossError";
    }
    catch (const SyncLossError& ex)
    {
        EXPECT_EQ(ex.offset(), 23u);
    }
}

TEST(stream_assembler, earlier_frame_error_wins_over_later_symbol)
{
    StreamAssembler assembler(CodecConfig::with_default_carrier());
    auto wire = assembler.encode(bytes_of("ab"));
    wire = flip(wire, 0);       // frame trit, frame 0
    wire[27] = '*';             // frame 3

    try
    {
        assembler.decode(wire);
        FAIL() << "expected SyncLossError";
    }
    catch (const SyncLossError& ex)
    {
        EXPECT_EQ(ex.offset(), 0u);
    }
}

TEST(stream_assembler, padding_error_wins_over_later_symbol)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("ab"), no_carrier);
    wire = flip(wire, frame_trits + 1);     // pad trit, frame 1
    wire[16] = '*';                         // frame 2

    try
    {
        assembler.decode(wire, no_carrier);
        FAIL() << "expected PaddingMismatchError";
    }
    catch (const PaddingMismatchError& ex)
    {
        EXPECT_EQ(ex.offset(), frame_trits + 1);
    }
}

TEST(stream_assembler, misaligned_length_is_alignment_error)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("xy"), no_carrier);

    EXPECT_THROW(assembler.decode(wire.substr(0, wire.size() - 1), no_carrier), AlignmentError);
    EXPECT_THROW(assembler.decode(wire + "=", no_carrier), AlignmentError);
    EXPECT_THROW(assembler.decode(wire.substr(1), no_carrier), FrameLengthError);
}

TEST(stream_assembler, unpaired_frame_is_alignment_error)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("z"), no_carrier);
    try
    {
        assembler.decode(wire.substr(0, frame_trits), no_carrier);
        FAIL() << "expected AlignmentError";
    }
    catch (const AlignmentError& ex)
    {
        EXPECT_EQ(ex.offset(), 0u);
    }
}

TEST(stream_assembler, invalid_symbol_is_reported)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("q"), no_carrier);
    wire[11] = '*';
    try
    {
        assembler.decode(wire, no_carrier);
        FAIL() << "expected InvalidSymbolError";
    }
    catch (const InvalidSymbolError& ex)
    {
        EXPECT_EQ(ex.offset(), 11u);
        EXPECT_EQ(ex.symbol(), '*');
    }
}

TEST(stream_assembler, digit_pair_beyond_byte_range)
{
    StreamAssembler assembler;
    TribbleCodec tribbles;
    FrameCodec frames;

    auto spell = [&](int core) {
        auto framed = frames.frame(tribbles.encode_core(core));
        return to_string(TritSequence(framed.begin(), framed.end()));
    };

    EXPECT_THROW(assembler.decode(spell(4) + spell(0), no_carrier), RangeError);
    EXPECT_THROW(assembler.decode(spell(3) + spell(13), no_carrier), RangeError);
    EXPECT_EQ(assembler.decode(spell(3) + spell(12), no_carrier), bytes_t{0xFF});

    // A bad high digit is reported before its low frame is read.
    try
    {
        assembler.decode(spell(4) + "==*-==-=", no_carrier);
        FAIL() << "expected RangeError";
    }
    catch (const RangeError& ex)
    {
        EXPECT_EQ(ex.offset(), 0u);
    }
}

TEST(stream_assembler, empty_input)
{
    StreamAssembler assembler(CodecConfig::with_default_carrier());
    EXPECT_EQ(assembler.encode(bytes_t()), "");
    EXPECT_TRUE(assembler.decode("").empty());
}

TEST(stream_assembler, custom_configuration)
{
    CodecConfig cfg;
    cfg.alphabet = SymbolAlphabet::parse("NZP");
    cfg.pad = Trit::Minus;
    cfg.frame = Trit::Plus;
    cfg.carrier = CarrierPattern::parse("PZNZ", cfg.alphabet);
    cfg.carrier_mode = CarrierMode::PerFrame;

    StreamAssembler assembler(cfg);
    auto data = bytes_of("config");
    auto wire = assembler.encode(data);
    EXPECT_EQ(wire.find_first_not_of("NZP"), std::string::npos);
    EXPECT_EQ(assembler.decode(wire), data);

    // Same payload under the default configuration is not readable here.
    EXPECT_THROW(assembler.decode(StreamAssembler().encode(data)), InvalidSymbolError);
}

TEST(stream_assembler, independent_configurations_coexist)
{
    CodecConfig a;
    a.frame = Trit::Plus;
    CodecConfig b;
    b.frame = Trit::Minus;

    StreamAssembler first(a);
    StreamAssembler second(b);
    auto data = bytes_of("two");
    EXPECT_EQ(first.decode(first.encode(data)), data);
    EXPECT_EQ(second.decode(second.encode(data)), data);
    EXPECT_THROW(second.decode(first.encode(data)), SyncLossError);
}

TEST(stream_assembler, inspect_reports_each_frame)
{
    StreamAssembler assembler(CodecConfig::with_default_carrier());
    auto wire = assembler.encode(bytes_of("Hi"));
    auto bad = flip(wire, frame_trits * 2);   // frame trit of frame 2
    bad.push_back('=');                       // trailing partial frame

    auto records = assembler.inspect(bad);
    ASSERT_EQ(records.size(), 5u);

    EXPECT_EQ(records[0].status, FrameRecord::Status::OK);
    EXPECT_EQ(records[0].core_value, 0);            // 'H' = 0 * 81 + 72
    EXPECT_EQ(records[0].clean, "==----==");
    EXPECT_EQ(records[1].status, FrameRecord::Status::OK);
    EXPECT_EQ(records[1].core_value, 72);
    EXPECT_EQ(records[2].status, FrameRecord::Status::SYNC_LOSS);
    EXPECT_EQ(records[2].offset, 16u);
    EXPECT_EQ(records[3].status, FrameRecord::Status::OK);
    EXPECT_EQ(records[3].core_value, 24);           // 'i' = 1 * 81 + 24
    EXPECT_EQ(records[4].status, FrameRecord::Status::TRUNCATED);
    EXPECT_EQ(records[4].signal, "=");
}

TEST(stream_assembler, inspect_reports_padding_and_symbols)
{
    StreamAssembler assembler;
    auto wire = assembler.encode(bytes_of("m"));
    wire = flip(wire, 1);       // pad trit, frame 0
    wire[12] = '?';             // frame 1

    auto records = assembler.inspect(wire);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].status, FrameRecord::Status::PADDING_MISMATCH);
    EXPECT_EQ(records[0].core_value, -1);
    EXPECT_EQ(records[1].status, FrameRecord::Status::INVALID_SYMBOL);
    EXPECT_TRUE(records[1].clean.empty());
    EXPECT_STREQ(status_name(records[1].status), "SYMBOL");
}
