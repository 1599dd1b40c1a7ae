//
//  version.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

namespace birdit {

/// @brief Return the BirdIt version display string.
///
/// Mirrors CLI version output (for example: `v0.3.0` or `v0.3.0+abcd123`).
std::string version_string();

} // namespace birdit
