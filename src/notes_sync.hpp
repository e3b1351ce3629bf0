/* notes_sync.hpp - the export, preview and import pipelines over an open deck.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "deck_backend.hpp"
#include "notes.hpp"
#include "notes_format.hpp"
#include <optional>
#include <set>
#include <vector>
#include <wx/string.h>

struct import_result {
	std::vector<change_record> changes;
	apply_outcome outcome;
};

// Reads every slide's title and notes, sanitized and trimmed, in slide order.
[[nodiscard]] notes_snapshot extract_notes(const deck_backend& deck);
// The output format is chosen by the extension of output_path before the deck is read.
void export_notes(const deck_backend& deck, const wxString& output_path, const format_options& options = {});
[[nodiscard]] std::vector<change_record> preview_notes(const deck_backend& deck, const wxString& edited_path);
[[nodiscard]] import_result import_notes(deck_backend& deck, const wxString& edited_path, const std::optional<std::set<int>>& allowed_slides = std::nullopt);
