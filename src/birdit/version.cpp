//
//  version.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/version.h"
#include "birdit_version.hpp"

namespace birdit {

std::string version_string() {
    return BIRDIT_VERSION_DISPLAY;
}

} // namespace birdit
