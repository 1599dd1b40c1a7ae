//
//  labels.cpp
//  BirdIt
//
//  Created by Till Toenshoff on 2026-10-19.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "birdit/labels.h"

#include "birdit/logging.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace birdit {
namespace {

namespace fs = std::filesystem;

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field += ch;
            }
            continue;
        }
        if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (ch != '\r') {
            field += ch;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

bool find_column(const std::string& header_line, const std::string& column, std::size_t* index) {
    const auto header = split_csv_line(header_line);
    for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == column) {
            *index = i;
            return true;
        }
    }
    return false;
}

bool file_has_column(const fs::path& path, const std::string& column) {
    std::ifstream in(path);
    std::string header_line;
    if (!in || !std::getline(in, header_line)) {
        return false;
    }
    std::size_t index = 0;
    return find_column(header_line, column, &index);
}

} // namespace

bool read_label_column(const std::string& path,
                       const std::string& column,
                       std::vector<std::string>* labels,
                       std::string* error) {
    if (!labels) {
        return false;
    }
    labels->clear();

    std::ifstream in(path);
    if (!in) {
        if (error) {
            *error = "cannot open label file " + path;
        }
        return false;
    }

    std::string line;
    if (!std::getline(in, line)) {
        if (error) {
            *error = "label file " + path + " is empty";
        }
        return false;
    }
    std::size_t column_index = 0;
    if (!find_column(line, column, &column_index)) {
        if (error) {
            *error = "label file " + path + " has no '" + column + "' column";
        }
        return false;
    }

    while (std::getline(in, line)) {
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_csv_line(line);
        labels->push_back(column_index < fields.size() ? std::move(fields[column_index])
                                                       : std::string());
    }

    if (labels->empty()) {
        if (error) {
            *error = "label file " + path + " has no label rows";
        }
        return false;
    }
    return true;
}

std::string find_label_file(const std::string& directory, const std::string& column) {
    if (directory.empty()) {
        return {};
    }
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return {};
    }

    fs::recursive_directory_iterator it(
        directory, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        const fs::directory_entry& entry = *it;
        if (entry.path().filename() == "label.csv" && entry.is_regular_file(ec) &&
            file_has_column(entry.path(), column)) {
            return entry.path().string();
        }
        it.increment(ec);
    }
    if (ec) {
        BIRDIT_LOG_DEBUG("Label search stopped in " << directory << ": " << ec.message());
    }
    return {};
}

LabelCatalog make_index_catalog(std::size_t count) {
    LabelCatalog catalog;
    catalog.labels.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        catalog.labels.push_back(std::to_string(i));
    }
    catalog.source = "fallback";
    catalog.degraded = true;
    return catalog;
}

LabelCatalog load_label_catalog(const BirditConfig& config, std::size_t expected_class_count) {
    const std::size_t fallback_count =
        expected_class_count > 0 ? expected_class_count : config.class_count;

    std::string path;
    std::error_code ec;
    if (!config.labels_path.empty() && fs::is_regular_file(config.labels_path, ec)) {
        path = config.labels_path;
    } else {
        path = find_label_file(config.labels_search_dir, config.label_column);
    }

    if (path.empty()) {
        BIRDIT_LOG_WARN("Could not find a label file; labels will be indices ("
                        << error_kind_name(ErrorKind::LabelLoadDegraded) << ").");
        return make_index_catalog(fallback_count);
    }

    LabelCatalog catalog;
    std::string error;
    if (!read_label_column(path, config.label_column, &catalog.labels, &error)) {
        BIRDIT_LOG_WARN("Error loading labels: " << error << " ("
                        << error_kind_name(ErrorKind::LabelLoadDegraded) << ").");
        return make_index_catalog(fallback_count);
    }

    catalog.source = path;
    if (expected_class_count > 0 && catalog.labels.size() != expected_class_count) {
        BIRDIT_LOG_WARN("Label count " << catalog.labels.size() << " differs from model width "
                        << expected_class_count << "; missing entries use indices.");
    }
    BIRDIT_LOG_INFO("Loaded " << catalog.labels.size() << " labels from " << path);
    return catalog;
}

std::string label_for_index(const LabelCatalog& catalog, std::size_t index) {
    if (index < catalog.labels.size()) {
        return catalog.labels[index];
    }
    return std::to_string(index);
}

} // namespace birdit
