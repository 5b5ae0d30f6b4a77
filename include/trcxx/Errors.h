// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace trcxx
{

/**
 * Base of every codec failure.
 *
 * offset() is the trit position in the stream at which the failure was
 * observed, or npos when the failure is not tied to a stream position
 * (an out-of-range value on encode, an empty carrier pattern).
 */
class CodecError : public std::runtime_error
{
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    explicit CodecError(const std::string& what, size_t offset = npos)
    : std::runtime_error(offset == npos ? what : what + " at trit " + std::to_string(offset))
    , offset_(offset)
    {}

    size_t offset() const { return offset_; }

    bool has_offset() const { return offset_ != npos; }

private:
    size_t offset_;
};

/// Character outside the symbol alphabet.
class InvalidSymbolError : public CodecError
{
public:
    explicit InvalidSymbolError(char symbol, size_t offset = npos)
    : CodecError(describe(symbol), offset)
    , symbol_(symbol)
    {}

    explicit InvalidSymbolError(const std::string& what, size_t offset = npos)
    : CodecError(what, offset)
    , symbol_('\0')
    {}

    char symbol() const { return symbol_; }

private:
    static std::string describe(char symbol)
    {
        unsigned code = static_cast<unsigned char>(symbol);
        if (code >= 0x20 && code < 0x7F)
        {
            return std::string("invalid symbol '") + symbol + "'";
        }
        return "invalid symbol 0x" + std::to_string(code);
    }

    char symbol_;
};

/// Core value or core digit outside its representable range.
class RangeError : public CodecError
{
public:
    using CodecError::CodecError;
};

/// Sequence is not exactly the width a unit requires.
class FrameLengthError : public CodecError
{
public:
    FrameLengthError(size_t expected, size_t actual, size_t offset = npos)
    : CodecError("expected " + std::to_string(expected) + " trits, got "
        + std::to_string(actual), offset)
    {}

protected:
    FrameLengthError(const std::string& what, size_t offset)
    : CodecError(what, offset)
    {}
};

/// Stream length is not a whole number of units.
class AlignmentError : public FrameLengthError
{
public:
    explicit AlignmentError(const std::string& what, size_t offset = npos)
    : FrameLengthError(what, offset)
    {}
};

/// Tribble boundary trit differs from the pad constant.
class PaddingMismatchError : public CodecError
{
public:
    using CodecError::CodecError;
};

/// Frame boundary trit differs from the frame constant.
class SyncLossError : public CodecError
{
public:
    using CodecError::CodecError;
};

/// Carrier pattern with no trits.
class EmptyPatternError : public CodecError
{
public:
    EmptyPatternError()
    : CodecError("carrier pattern is empty")
    {}
};

} // namespace trcxx
