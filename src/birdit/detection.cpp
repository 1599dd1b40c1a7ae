//
//  detection.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/detection.h"

#include "birdit/logging.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace birdit {

float sigmoid(float score) {
    return 1.0f / (1.0f + std::exp(-score));
}

bool decode_detections(const std::vector<std::vector<float>>& scores,
                       const std::vector<AudioWindow>& windows,
                       const LabelCatalog& labels,
                       float min_confidence,
                       std::vector<Detection>* out_detections,
                       std::string* error) {
    if (!out_detections) {
        return false;
    }
    out_detections->clear();

    if (scores.size() != windows.size()) {
        if (error) {
            std::ostringstream message;
            message << "Got " << scores.size() << " score vectors for " << windows.size()
                    << " windows.";
            *error = message.str();
        }
        return false;
    }

    for (std::size_t w = 0; w < windows.size(); ++w) {
        const AudioWindow& window = windows[w];
        const std::vector<float>& window_scores = scores[w];
        for (std::size_t c = 0; c < window_scores.size(); ++c) {
            const float confidence = sigmoid(window_scores[c]);
            if (!(confidence >= min_confidence)) {
                continue;
            }
            Detection detection;
            detection.species = label_for_index(labels, c);
            detection.confidence = confidence;
            detection.start_time = window.start_seconds;
            detection.end_time = window.end_seconds;
            detection.duration = window.end_seconds - window.start_seconds;
            out_detections->push_back(std::move(detection));
        }
    }

    BIRDIT_LOG_DEBUG("Decoder: " << out_detections->size() << " detections from "
                     << windows.size() << " windows at min_confidence=" << min_confidence);
    return true;
}

} // namespace birdit
