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

#pragma once

#include <pagealigner.hpp>
#include <reportlayout.hpp>

#include <nlohmann/json_fwd.hpp>

#include <optional>

struct CompareConfig {
    AlignmentParameters alignment;
    LayoutParameters layout;
    ReportStyle report;
};

// Command line values. Unset ones leave the config untouched.
struct ConfigOverrides {
    std::optional<double> dpi;
    std::optional<double> threshold;
    std::optional<int> lookahead;
    bool skip_identical = false;
};

// Missing keys keep their defaults. Bad values throw std::runtime_error.
CompareConfig parse_config(const nlohmann::json &data);

CompareConfig load_config(const char *path);

void validate_config(const CompareConfig &config);

// Applies the overrides and validates the result.
void apply_overrides(CompareConfig &config, const ConfigOverrides &overrides);
