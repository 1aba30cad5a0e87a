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

#include <string>
#include <string_view>
#include <vector>

// Ratcliff-Obershelp similarity in [0, 1]. Two empty sequences are identical.
// Strings are compared character by character and must be valid UTF-8,
// otherwise std::runtime_error is thrown.
double similarity_ratio(std::string_view a, std::string_view b, bool autojunk = false);

double similarity_ratio(const std::vector<std::string> &a,
                        const std::vector<std::string> &b,
                        bool autojunk = false);
