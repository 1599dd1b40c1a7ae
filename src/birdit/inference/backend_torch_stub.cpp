//
//  backend_torch_stub.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/inference.h"
#include "birdit/logging.hpp"

namespace birdit {

std::unique_ptr<InferenceBackend> make_torch_inference_backend(const BirditConfig&,
                                                               std::string* error) {
    BIRDIT_LOG_ERROR("Torch backend not enabled in this build.");
    if (error) {
        *error = "Torch backend not enabled in this build";
    }
    return nullptr;
}

} // namespace birdit
