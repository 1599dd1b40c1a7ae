//
//  label_catalog_test.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/labels.h"

#include "synthetic_audio_test_utils.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

namespace fs = std::filesystem;

void write_text(const fs::path& path, const std::string& text) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << text;
}

bool test_loads_named_column() {
    const auto dir = birdit::tests::synthetic_audio::make_temp_dir("birdit_label_column");
    const auto path = dir / "perch_labels.csv";
    write_text(path,
               "inat2021,ebird2021\r\n"
               "Turdus migratorius,amerob\r\n"
               "\"Cardinalis cardinalis, northern\",norcar\r\n"
               "\"Say \"\"Phoebe\"\"\",\"saypho\"\r\n");

    birdit::BirditConfig config;
    config.labels_path = path.string();
    const auto catalog = birdit::load_label_catalog(config, 3);
    if (catalog.degraded || catalog.labels.size() != 3) {
        std::cerr << "Label test failed: expected three labels from " << path << ".\n";
        return false;
    }
    if (catalog.labels[0] != "amerob" || catalog.labels[1] != "norcar" ||
        catalog.labels[2] != "saypho") {
        std::cerr << "Label test failed: wrong labels read from the ebird2021 column.\n";
        return false;
    }
    if (catalog.source != path.string()) {
        std::cerr << "Label test failed: catalog source should be the label path.\n";
        return false;
    }
    if (birdit::label_for_index(catalog, 1) != "norcar" ||
        birdit::label_for_index(catalog, 7) != "7") {
        std::cerr << "Label test failed: label_for_index lookup or fallback is wrong.\n";
        return false;
    }
    return true;
}

bool test_missing_column_degrades_to_indices() {
    const auto dir = birdit::tests::synthetic_audio::make_temp_dir("birdit_label_missing_column");
    const auto path = dir / "labels.csv";
    write_text(path, "name\nrobin\n");

    birdit::BirditConfig config;
    config.labels_path = path.string();
    const auto catalog = birdit::load_label_catalog(config, 5);
    if (!catalog.degraded || catalog.labels.size() != 5 || catalog.labels[4] != "4") {
        std::cerr << "Label test failed: missing column should give five index labels.\n";
        return false;
    }
    return true;
}

bool test_missing_file_uses_configured_count() {
    birdit::BirditConfig config;
    config.labels_path = "/nonexistent/birdit/labels.csv";
    config.class_count = 11000;
    const auto catalog = birdit::load_label_catalog(config);
    if (!catalog.degraded || catalog.labels.size() != 11000 || catalog.labels[0] != "0" ||
        catalog.labels[10999] != "10999" || catalog.source != "fallback") {
        std::cerr << "Label test failed: missing file should give 11000 index labels.\n";
        return false;
    }
    return true;
}

bool test_search_dir_finds_label_csv() {
    const auto dir = birdit::tests::synthetic_audio::make_temp_dir("birdit_label_search");
    write_text(dir / "a" / "label.csv", "other\nx\n");
    write_text(dir / "b" / "nested" / "label.csv", "ebird2021\nhoufin\nmoudov\n");

    const std::string found = birdit::find_label_file(dir.string(), "ebird2021");
    if (fs::path(found) != dir / "b" / "nested" / "label.csv") {
        std::cerr << "Label test failed: search found '" << found << "'.\n";
        return false;
    }

    birdit::BirditConfig config;
    config.labels_path.clear();
    config.labels_search_dir = dir.string();
    const auto catalog = birdit::load_label_catalog(config, 2);
    if (catalog.degraded || catalog.labels.size() != 2 || catalog.labels[1] != "moudov") {
        std::cerr << "Label test failed: catalog should come from the searched label.csv.\n";
        return false;
    }
    return true;
}

bool test_header_only_file_is_rejected() {
    const auto dir = birdit::tests::synthetic_audio::make_temp_dir("birdit_label_header_only");
    const auto path = dir / "labels.csv";
    write_text(path, "ebird2021\n");

    std::vector<std::string> labels;
    std::string error;
    if (birdit::read_label_column(path.string(), "ebird2021", &labels, &error) || error.empty()) {
        std::cerr << "Label test failed: header-only file should be rejected with a message.\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_loads_named_column()) {
        return 1;
    }
    if (!test_missing_column_degrades_to_indices()) {
        return 1;
    }
    if (!test_missing_file_uses_configured_count()) {
        return 1;
    }
    if (!test_search_dir_finds_label_csv()) {
        return 1;
    }
    if (!test_header_only_file_is_rejected()) {
        return 1;
    }

    std::cout << "Label catalog test passed.\n";
    return 0;
}
