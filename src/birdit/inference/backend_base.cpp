//
//  backend_base.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/inference.h"

namespace birdit {

bool InferenceBackend::infer_windows(const std::vector<std::vector<float>>& windows,
                                     const BirditConfig& config,
                                     std::vector<std::vector<float>>* scores,
                                     InferenceTiming* timing) {
    if (!scores) {
        return false;
    }

    scores->clear();
    scores->reserve(windows.size());

    for (const auto& window : windows) {
        std::vector<float> window_scores;
        if (!infer_window(window, config, &window_scores, timing)) {
            return false;
        }
        scores->push_back(std::move(window_scores));
    }

    return true;
}

} // namespace birdit
