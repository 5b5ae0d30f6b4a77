// Copyright 2022-2026 Open Research Institute, Inc.
//
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "CarrierOverlay.h"
#include "Trit.h"

#include <optional>
#include <utility>

namespace trcxx
{

/**
 * Wire-format configuration for one codec instance.
 *
 * Every constant the encoder and decoder must agree on lives here, so two
 * configurations can be used side by side. Defaults:
 *   alphabet  '-' '=' '+'
 *   pad trit  0
 *   frame trit 0
 *   carrier   none
 *   mode      Continuous
 *
 * The config is built once and then only read; share it by const reference.
 */
struct CodecConfig
{
    SymbolAlphabet alphabet;
    Trit pad = Trit::Zero;
    Trit frame = Trit::Zero;
    std::optional<CarrierPattern> carrier;
    CarrierMode carrier_mode = CarrierMode::Continuous;

    /// Default layout with the "+=-=" carrier overlaid.
    static CodecConfig with_default_carrier()
    {
        CodecConfig result;
        result.carrier = CarrierPattern::default_pattern();
        return result;
    }
};

} // namespace trcxx
