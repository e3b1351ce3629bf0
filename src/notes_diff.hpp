/* notes_diff.hpp - comparison of an original notes snapshot against an edited one.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "notes.hpp"
#include <string>
#include <vector>

/* Returns one change per slide whose trimmed notes differ, ordered by slide number.
 * Only slides named in the edited snapshot are considered; a slide it omits is left alone.
 * When the edited snapshot repeats a slide number, its last occurrence wins.
 */
[[nodiscard]] std::vector<change_record> compare_notes(const notes_snapshot& original, const notes_snapshot& edited);
[[nodiscard]] change_type classify_change(const std::string& original_notes, const std::string& edited_notes) noexcept;
