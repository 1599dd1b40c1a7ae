//
//  labels.h
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "birdit/config.h"

#include <cstddef>
#include <string>
#include <vector>

namespace birdit {

/**
 * @brief Ordered species lookup; position `i` names classifier output channel `i`.
 *
 * `degraded == true` means the labels are synthetic decimal indices because no
 * usable label file was found.
 */
struct LabelCatalog {
    std::vector<std::string> labels;
    std::string source;
    bool degraded = false;
};

/**
 * @brief Load the label catalog named by the configuration.
 *
 * Never fails: any read problem degrades to `"0".."N-1"` where `N` is
 * `expected_class_count` when non-zero and `config.class_count` otherwise.
 */
LabelCatalog load_label_catalog(const BirditConfig& config,
                                std::size_t expected_class_count = 0);

/**
 * @brief Read one column of a CSV label file.
 *
 * @return `false` with `error` set when the file cannot be read, the column is
 *         missing, or the column holds no rows.
 */
bool read_label_column(const std::string& path,
                       const std::string& column,
                       std::vector<std::string>* labels,
                       std::string* error);

/// @brief Recursively search `directory` for a `label.csv` that carries `column`.
std::string find_label_file(const std::string& directory, const std::string& column);

/// @brief Synthetic catalog of stringified indices.
LabelCatalog make_index_catalog(std::size_t count);

/// @brief Label for `index`, or its decimal form when outside the catalog.
std::string label_for_index(const LabelCatalog& catalog, std::size_t index);

} // namespace birdit
