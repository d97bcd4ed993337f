// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "fallback.h"

#include <double-conversion/double-conversion.h>

#include <limits>

using double_conversion::StringToDoubleConverter;

static StringToDoubleConverter const& Converter()
{
    // Whitespace and the alternate minus sign are handled by the caller.
    static const StringToDoubleConverter converter(
        StringToDoubleConverter::ALLOW_TRAILING_JUNK,
        /*empty_string_value*/ 0.0,
        /*junk_string_value*/ std::numeric_limits<double>::quiet_NaN(),
        "inf",
        "nan");

    return converter;
}

bool numscan::DecimalToFloat(char const* first, int length, double& value, int& processed_characters_count)
{
    processed_characters_count = 0;

    double const d = Converter().StringToDouble(first, length, &processed_characters_count);
    if (processed_characters_count <= 0)
        return false;

    value = d;
    return true;
}

bool numscan::DecimalToFloat(char const* first, int length, float& value, int& processed_characters_count)
{
    processed_characters_count = 0;

    float const f = Converter().StringToFloat(first, length, &processed_characters_count);
    if (processed_characters_count <= 0)
        return false;

    value = f;
    return true;
}
