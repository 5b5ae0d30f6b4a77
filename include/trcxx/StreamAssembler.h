// Copyright 2021 Mobilinkd LLC.
// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later
//
// Stream assembler
//
// Encode: bytes → core digit pairs → tribbles → framed tribbles → carrier → symbols
// Decode: symbols → trits → carrier removal → frames → tribbles → core digit pairs → bytes

#pragma once

#include "CarrierOverlay.h"
#include "CodecConfig.h"
#include "Errors.h"
#include "FrameCodec.h"
#include "Numerology.h"
#include "TribbleCodec.h"
#include "Trit.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trcxx
{

using bytes_t = std::vector<uint8_t>;

/**
 * Diagnostic view of one 8-trit unit of a received stream.
 */
struct FrameRecord
{
    enum class Status { OK, INVALID_SYMBOL, SYNC_LOSS, PADDING_MISMATCH, TRUNCATED };

    size_t index = 0;           // frame number in the stream
    size_t offset = 0;          // trit offset of the frame's first trit
    std::string signal;         // symbols as received
    std::string clean;          // symbols after carrier removal (empty if unparseable)
    int core_value = -1;        // decoded core value, -1 unless status is OK
    Status status = Status::OK;
    std::string detail;         // error text for a failed frame
};

inline const char* status_name(FrameRecord::Status status)
{
    switch (status)
    {
        case FrameRecord::Status::OK: return "OK";
        case FrameRecord::Status::INVALID_SYMBOL: return "SYMBOL";
        case FrameRecord::Status::SYNC_LOSS: return "SYNC";
        case FrameRecord::Status::PADDING_MISMATCH: return "PAD";
        case FrameRecord::Status::TRUNCATED: return "SHORT";
        default: return "?";
    }
}


class StreamAssembler
{
public:
    explicit StreamAssembler(CodecConfig config = CodecConfig())
    : config_(std::move(config))
    , tribble_codec_(config_.pad)
    , frame_codec_(config_.frame)
    {}

    const CodecConfig& config() const { return config_; }

    /**
     * Split a byte into its two core digits.
     *
     * byte = high * 81 + low, high in [0, 3], low in [0, 80].
     * The high digit goes on the wire first.
     */
    static std::pair<int, int> split_byte(uint8_t byte)
    {
        return {byte / core_states, byte % core_states};
    }

    /**
     * Inverse of split_byte. Pairs that name no byte (high > 3, or a value
     * above 255) fail with RangeError at the offending frame's offset.
     */
    static uint8_t join_byte(int high, int low,
        size_t high_offset = CodecError::npos, size_t low_offset = CodecError::npos)
    {
        check_high_digit(high, high_offset);
        int result = high * core_states + low;
        if (low < core_min || result > 255)
        {
            throw RangeError("byte value " + std::to_string(result)
                + " outside [0, 255]", low_offset);
        }
        return static_cast<uint8_t>(result);
    }

    /// Framed trits for data, before any carrier.
    TritSequence encode_trits(const bytes_t& data) const
    {
        TritSequence result;
        result.reserve(data.size() * trits_per_byte);
        for (auto byte : data)
        {
            auto digits = split_byte(byte);
            append_frame(result, digits.first);
            append_frame(result, digits.second);
        }
        return result;
    }

    /// Encode with the configured carrier (if any).
    std::string encode(const bytes_t& data) const
    {
        return encode(data, config_.carrier);
    }

    std::string encode(const bytes_t& data, const std::optional<CarrierPattern>& carrier) const
    {
        auto trits = encode_trits(data);
        if (carrier)
        {
            CarrierOverlay(*carrier, config_.carrier_mode).apply_in_place(trits);
        }
        return to_string(trits, config_.alphabet);
    }

    /// Decode with the configured carrier (if any).
    bytes_t decode(const std::string& symbols) const
    {
        return decode(symbols, config_.carrier);
    }

    /**
     * Decode a symbol stream.
     *
     * The stream shape is checked first: length is a multiple of 8, then
     * the frame count is even (AlignmentError). Frames are then taken in
     * stream order, each one parsed (InvalidSymbolError), stripped of the
     * carrier, unframed (SyncLossError) and unpadded (PaddingMismatchError)
     * before the next is looked at. A digit pair that names no byte fails
     * with RangeError. The first failure is thrown as is; no partial output
     * is returned.
     */
    bytes_t decode(const std::string& symbols, const std::optional<CarrierPattern>& carrier) const
    {
        check_alignment(symbols.size());

        std::optional<CarrierOverlay> overlay;
        if (carrier) overlay.emplace(*carrier, config_.carrier_mode);

        bytes_t result;
        result.reserve(symbols.size() / trits_per_byte);
        for (size_t offset = 0; offset != symbols.size(); offset += trits_per_byte)
        {
            int high = decode_frame(parse_frame(symbols, offset, overlay), offset);
            check_high_digit(high, offset);
            int low = decode_frame(parse_frame(symbols, offset + frame_trits, overlay),
                offset + frame_trits);
            result.push_back(join_byte(high, low, offset, offset + frame_trits));
        }
        return result;
    }

    /// Decode framed trits that have already had the carrier removed.
    bytes_t decode_trits(const TritSequence& trits) const
    {
        check_alignment(trits.size());

        bytes_t result;
        result.reserve(trits.size() / trits_per_byte);
        for (size_t offset = 0; offset != trits.size(); offset += trits_per_byte)
        {
            int high = decode_frame(frame_at(trits, offset), offset);
            check_high_digit(high, offset);
            int low = decode_frame(frame_at(trits, offset + frame_trits), offset + frame_trits);
            result.push_back(join_byte(high, low, offset, offset + frame_trits));
        }
        return result;
    }

    /// Inspect with the configured carrier (if any).
    std::vector<FrameRecord> inspect(const std::string& symbols) const
    {
        return inspect(symbols, config_.carrier);
    }

    /**
     * Per-frame diagnostic decode.
     *
     * Unlike decode(), a failed frame does not stop the walk: each frame is
     * reported with its own status. Frames are never repaired.
     */
    std::vector<FrameRecord> inspect(const std::string& symbols,
        const std::optional<CarrierPattern>& carrier) const
    {
        std::optional<CarrierOverlay> overlay;
        if (carrier) overlay.emplace(*carrier, config_.carrier_mode);

        std::vector<FrameRecord> result;
        for (size_t offset = 0; offset < symbols.size(); offset += frame_trits)
        {
            FrameRecord record;
            record.index = offset / frame_trits;
            record.offset = offset;
            record.signal = symbols.substr(offset, frame_trits);

            try
            {
                auto trits = parse_trits(record.signal, config_.alphabet, offset);
                if (overlay) overlay->remove_in_place(trits, offset);
                record.clean = to_string(trits, config_.alphabet);

                if (trits.size() != frame_trits)
                {
                    record.status = FrameRecord::Status::TRUNCATED;
                    record.detail = FrameLengthError(frame_trits, trits.size(), offset).what();
                }
                else
                {
                    auto tribble = frame_codec_.unframe(trits, offset);
                    record.core_value = tribble_codec_.decode_core(tribble, offset + 1);
                }
            }
            catch (const InvalidSymbolError& ex)
            {
                record.status = FrameRecord::Status::INVALID_SYMBOL;
                record.detail = ex.what();
            }
            catch (const SyncLossError& ex)
            {
                record.status = FrameRecord::Status::SYNC_LOSS;
                record.detail = ex.what();
            }
            catch (const PaddingMismatchError& ex)
            {
                record.status = FrameRecord::Status::PADDING_MISMATCH;
                record.detail = ex.what();
            }

            result.push_back(std::move(record));
        }
        return result;
    }

private:
    void append_frame(TritSequence& out, int core_value) const
    {
        auto framed = frame_codec_.frame(tribble_codec_.encode_core(core_value));
        out.insert(out.end(), framed.begin(), framed.end());
    }

    static void check_high_digit(int high, size_t offset)
    {
        if (high < core_min || high > byte_high_max)
        {
            throw RangeError("high byte digit " + std::to_string(high)
                + " outside [0, " + std::to_string(byte_high_max) + "]", offset);
        }
    }

    static void check_alignment(size_t length)
    {
        if (length % frame_trits != 0)
        {
            throw AlignmentError("stream length " + std::to_string(length)
                + " is not a multiple of " + std::to_string(frame_trits),
                length - length % frame_trits);
        }
        if (length % trits_per_byte != 0)
        {
            throw AlignmentError("unpaired frame", length - frame_trits);
        }
    }

    static FramedTribble frame_at(const TritSequence& trits, size_t offset)
    {
        FramedTribble framed;
        std::copy(trits.begin() + offset, trits.begin() + offset + frame_trits, framed.begin());
        return framed;
    }

    // One frame of symbols, parsed and with the carrier removed at its stream phase.
    FramedTribble parse_frame(const std::string& symbols, size_t offset,
        const std::optional<CarrierOverlay>& overlay) const
    {
        auto trits = parse_trits(symbols.substr(offset, frame_trits), config_.alphabet, offset);
        if (overlay) overlay->remove_in_place(trits, offset);
        return frame_at(trits, 0);
    }

    int decode_frame(const FramedTribble& framed, size_t offset) const
    {
        auto tribble = frame_codec_.unframe(framed, offset);
        return tribble_codec_.decode_core(tribble, offset + 1);
    }

    CodecConfig config_;
    TribbleCodec tribble_codec_;
    FrameCodec frame_codec_;
};

} // namespace trcxx
