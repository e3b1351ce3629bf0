/* constants.hpp - application-wide constants.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <string_view>
#include <wx/string.h>

inline const wxString APP_NAME = "Slidenotes";
inline const wxString APP_VERSION = "0.1";
inline const wxString APP_COPYRIGHT = "Copyright (C) 2025 Quin Gillespie. All rights reserved.";
inline constexpr int CONFIG_VERSION_CURRENT = 1;

inline constexpr std::string_view NO_NOTES_PLACEHOLDER = "[No notes]";
inline constexpr std::string_view MARKDOWN_NO_NOTES_PLACEHOLDER = "*[No notes]*";
inline constexpr std::string_view MARKDOWN_DOCUMENT_TITLE = "# Speaker Notes";
inline constexpr std::string_view MARKDOWN_HEADER_MARKER = "##";
inline constexpr std::string_view MARKDOWN_RULE = "---";
// U+2500 and U+2550, UTF-8 encoded.
inline constexpr std::string_view LIGHT_RULE_GLYPH = "\xE2\x94\x80";
inline constexpr std::string_view HEAVY_RULE_GLYPH = "\xE2\x95\x90";
inline constexpr int RULE_WIDTH = 50;
inline constexpr int MIN_RULE_WIDTH = 10;

inline constexpr size_t MAX_FALLBACK_TITLE_LENGTH = 100;

inline constexpr int EXIT_USAGE_ERROR = 64;
inline constexpr int EXIT_FATAL_ERROR = 2;
