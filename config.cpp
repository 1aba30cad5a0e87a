/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <config.hpp>

#include <nlohmann/json.hpp>

#include <climits>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

[[noreturn]] void config_error(const char *key, const char *what) {
    std::string msg{"Config entry "};
    msg += key;
    msg += ' ';
    msg += what;
    msg += '.';
    throw std::runtime_error(msg);
}

void read_double(const json &data, const char *key, double &out) {
    auto it = data.find(key);
    if(it == data.end()) {
        return;
    }
    if(!it->is_number()) {
        config_error(key, "is not a number");
    }
    out = it->get<double>();
}

void read_int(const json &data, const char *key, int &out) {
    auto it = data.find(key);
    if(it == data.end()) {
        return;
    }
    if(!it->is_number_integer()) {
        config_error(key, "is not an integer");
    }
    if(it->is_number_unsigned()) {
        if(it->get<uint64_t>() > uint64_t(INT_MAX)) {
            config_error(key, "is too large");
        }
    } else {
        const auto v = it->get<int64_t>();
        if(v < INT_MIN || v > INT_MAX) {
            config_error(key, "is out of range");
        }
    }
    out = it->get<int>();
}

void read_bool(const json &data, const char *key, bool &out) {
    auto it = data.find(key);
    if(it == data.end()) {
        return;
    }
    if(!it->is_boolean()) {
        config_error(key, "is not a boolean");
    }
    out = it->get<bool>();
}

void read_string(const json &data, const char *key, std::string &out) {
    auto it = data.find(key);
    if(it == data.end()) {
        return;
    }
    if(!it->is_string()) {
        config_error(key, "is not a string");
    }
    out = it->get<std::string>();
}

const json *get_section(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end()) {
        return nullptr;
    }
    if(!it->is_object()) {
        config_error(key, "is not an object");
    }
    return &(*it);
}

} // namespace

void validate_config(const CompareConfig &config) {
    const auto &a = config.alignment;
    if(a.similarity_threshold < 0 || a.similarity_threshold > 1) {
        config_error("similarity_threshold", "must be between 0 and 1");
    }
    if(a.lookahead_window < 1) {
        config_error("lookahead_window", "must be at least 1");
    }
    const auto &l = config.layout;
    if(l.margin < 0) {
        config_error("margin", "must not be negative");
    }
    if(l.gap < 0) {
        config_error("gap", "must not be negative");
    }
    if(l.label_height < 0) {
        config_error("label_height", "must not be negative");
    }
    if(l.dpi < 0 || l.dpi > 2400) {
        config_error("dpi", "must be between 0 and 2400");
    }
    if(config.report.label_size <= 0) {
        config_error("label_size", "must be positive");
    }
}

CompareConfig parse_config(const json &data) {
    CompareConfig config;
    if(!data.is_object()) {
        throw std::runtime_error("Config file top level must be an object.");
    }
    if(auto *alignment = get_section(data, "alignment")) {
        read_double(*alignment, "similarity_threshold", config.alignment.similarity_threshold);
        read_int(*alignment, "lookahead_window", config.alignment.lookahead_window);
        read_bool(*alignment, "autojunk", config.alignment.autojunk);
    }
    if(auto *layout = get_section(data, "layout")) {
        read_double(*layout, "margin", config.layout.margin);
        read_double(*layout, "gap", config.layout.gap);
        read_double(*layout, "label_height", config.layout.label_height);
        read_double(*layout, "dpi", config.layout.dpi);
    }
    if(auto *report = get_section(data, "report")) {
        read_string(*report, "label_font", config.report.label_font);
        read_double(*report, "label_size", config.report.label_size);
        read_bool(*report, "skip_identical", config.report.skip_identical);
    }
    validate_config(config);
    return config;
}

CompareConfig load_config(const char *path) {
    std::ifstream ifile(path);
    if(ifile.fail()) {
        std::string msg{"Could not open config file "};
        msg += path;
        msg += '.';
        throw std::runtime_error(msg);
    }
    json data = json::parse(ifile, nullptr, false);
    if(data.is_discarded()) {
        std::string msg{"Config file "};
        msg += path;
        msg += " is not valid JSON.";
        throw std::runtime_error(msg);
    }
    return parse_config(data);
}

void apply_overrides(CompareConfig &config, const ConfigOverrides &overrides) {
    if(overrides.dpi) {
        config.layout.dpi = *overrides.dpi;
    }
    if(overrides.threshold) {
        config.alignment.similarity_threshold = *overrides.threshold;
    }
    if(overrides.lookahead) {
        config.alignment.lookahead_window = *overrides.lookahead;
    }
    if(overrides.skip_identical) {
        config.report.skip_identical = true;
    }
    validate_config(config);
}
