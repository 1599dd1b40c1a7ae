//
//  detection_decode_test.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/detection.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

birdit::AudioWindow make_window(double start, double end) {
    birdit::AudioWindow window;
    window.start_seconds = start;
    window.end_seconds = end;
    return window;
}

birdit::LabelCatalog make_catalog() {
    birdit::LabelCatalog catalog;
    catalog.labels = {"amerob", "norcar", "blujay"};
    catalog.source = "test";
    return catalog;
}

bool test_sigmoid_is_squashing() {
    if (birdit::sigmoid(0.0f) != 0.5f) {
        std::cerr << "Decode test failed: sigmoid(0) must be exactly 0.5.\n";
        return false;
    }
    const float hi = birdit::sigmoid(30.0f);
    const float lo = birdit::sigmoid(-30.0f);
    if (!(hi > 0.99f && hi <= 1.0f) || !(lo >= 0.0f && lo < 0.01f)) {
        std::cerr << "Decode test failed: sigmoid saturation out of range.\n";
        return false;
    }
    return true;
}

bool test_threshold_is_inclusive() {
    const std::vector<std::vector<float>> scores{{0.0f}};
    const std::vector<birdit::AudioWindow> windows{make_window(0.0, 5.0)};
    std::vector<birdit::Detection> detections;
    std::string error;
    if (!birdit::decode_detections(scores, windows, make_catalog(), 0.5f, &detections, &error)) {
        std::cerr << "Decode test failed: " << error << "\n";
        return false;
    }
    if (detections.size() != 1 || detections[0].confidence != 0.5f ||
        detections[0].species != "amerob") {
        std::cerr << "Decode test failed: confidence equal to threshold must be kept.\n";
        return false;
    }
    return true;
}

bool test_ordering_and_fields() {
    const std::vector<std::vector<float>> scores{
        {3.0f, -6.0f, 2.0f},
        {-6.0f, -6.0f, -6.0f},
        {-6.0f, 1.0f, -6.0f},
    };
    const std::vector<birdit::AudioWindow> windows{
        make_window(0.0, 5.0),
        make_window(5.0, 10.0),
        make_window(10.0, 15.0),
    };
    std::vector<birdit::Detection> detections;
    std::string error;
    if (!birdit::decode_detections(scores, windows, make_catalog(), 0.6f, &detections, &error)) {
        std::cerr << "Decode test failed: " << error << "\n";
        return false;
    }
    if (detections.size() != 3) {
        std::cerr << "Decode test failed: expected 3 detections, got " << detections.size()
                  << ".\n";
        return false;
    }
    if (detections[0].species != "amerob" || detections[1].species != "blujay" ||
        detections[2].species != "norcar") {
        std::cerr << "Decode test failed: detections not ordered by window then class.\n";
        return false;
    }
    if (detections[2].start_time != 10.0 || detections[2].end_time != 15.0 ||
        detections[2].duration != 5.0) {
        std::cerr << "Decode test failed: detection did not inherit window bounds.\n";
        return false;
    }
    if (std::fabs(detections[0].confidence - birdit::sigmoid(3.0f)) > 1e-7f) {
        std::cerr << "Decode test failed: confidence is not the squashed score.\n";
        return false;
    }
    return true;
}

bool test_duration_from_window_bounds() {
    const std::vector<std::vector<float>> scores{{5.0f}};
    const std::vector<birdit::AudioWindow> windows{make_window(2.0, 7.0)};
    std::vector<birdit::Detection> detections;
    std::string error;
    if (!birdit::decode_detections(scores, windows, make_catalog(), 0.1f, &detections, &error) ||
        detections.size() != 1 || detections[0].duration != 5.0) {
        std::cerr << "Decode test failed: 2.0..7.0 s should report duration 5.0.\n";
        return false;
    }
    return true;
}

bool test_out_of_catalog_index_uses_number() {
    const std::vector<std::vector<float>> scores{{-9.0f, -9.0f, -9.0f, -9.0f, 4.0f}};
    const std::vector<birdit::AudioWindow> windows{make_window(0.0, 5.0)};
    std::vector<birdit::Detection> detections;
    std::string error;
    if (!birdit::decode_detections(scores, windows, make_catalog(), 0.5f, &detections, &error) ||
        detections.size() != 1 || detections[0].species != "4") {
        std::cerr << "Decode test failed: index beyond catalog should be labelled \"4\".\n";
        return false;
    }
    return true;
}

bool test_silent_windows_and_mismatch() {
    const std::vector<std::vector<float>> scores{{-9.0f, -9.0f}};
    const std::vector<birdit::AudioWindow> windows{make_window(0.0, 5.0)};
    std::vector<birdit::Detection> detections;
    std::string error;
    if (!birdit::decode_detections(scores, windows, make_catalog(), 0.1f, &detections, &error) ||
        !detections.empty()) {
        std::cerr << "Decode test failed: window below threshold should add nothing.\n";
        return false;
    }

    const std::vector<birdit::AudioWindow> two_windows{make_window(0.0, 5.0), make_window(5.0, 10.0)};
    if (birdit::decode_detections(scores, two_windows, make_catalog(), 0.1f, &detections, &error)) {
        std::cerr << "Decode test failed: score/window count mismatch must be rejected.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_sigmoid_is_squashing()) {
        return 1;
    }
    if (!test_threshold_is_inclusive()) {
        return 1;
    }
    if (!test_ordering_and_fields()) {
        return 1;
    }
    if (!test_duration_from_window_bounds()) {
        return 1;
    }
    if (!test_out_of_catalog_index_uses_number()) {
        return 1;
    }
    if (!test_silent_windows_and_mismatch()) {
        return 1;
    }

    std::cout << "Detection decode test passed.\n";
    return 0;
}
