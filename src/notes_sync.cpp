/* notes_sync.cpp - the export, preview and import pipelines over an open deck.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_sync.hpp"
#include "notes_applier.hpp"
#include "notes_diff.hpp"
#include "utils.hpp"
#include <optional>
#include <set>
#include <utility>
#include <vector>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

notes_snapshot extract_notes(const deck_backend& deck) {
	const int slide_count = deck.slide_count();
	wxLogMessage(_("Extracting notes from %d slides..."), slide_count);
	notes_snapshot notes;
	notes.reserve(static_cast<size_t>(slide_count));
	for (int slide = 1; slide <= slide_count; ++slide) {
		notes_record record;
		record.slide_number = slide;
		record.slide_title = trim_string(sanitize_text(deck.get_title(slide)));
		record.notes_text = trim_string(sanitize_text(deck.get_notes(slide)));
		if (record.notes_text.empty()) {
			wxLogVerbose("  Slide %d: (no notes)", slide);
		} else {
			wxLogVerbose("  Slide %d: %zu chars", slide, record.notes_text.size());
		}
		notes.push_back(std::move(record));
	}
	wxLogMessage(_("Extracted notes from %zu of %d slides"), count_slides_with_notes(notes), slide_count);
	return notes;
}

void export_notes(const deck_backend& deck, const wxString& output_path, const format_options& options) {
	const notes_format& format = format_for_path(output_path);
	const notes_snapshot notes = extract_notes(deck);
	format.save(notes, output_path, options);
	wxLogMessage(_("Exported %zu slides with notes to %s"), count_slides_with_notes(notes), output_path);
}

std::vector<change_record> preview_notes(const deck_backend& deck, const wxString& edited_path) {
	const notes_format& format = format_for_path(edited_path);
	const notes_snapshot edited = format.load(edited_path);
	wxLogMessage(_("Parsed %zu slide(s) from %s"), edited.size(), edited_path);
	return compare_notes(extract_notes(deck), edited);
}

import_result import_notes(deck_backend& deck, const wxString& edited_path, const std::optional<std::set<int>>& allowed_slides) {
	import_result result;
	result.changes = preview_notes(deck, edited_path);
	if (result.changes.empty()) {
		wxLogMessage(_("No changes detected"));
		return result;
	}
	result.outcome = apply_notes(deck, result.changes, allowed_slides);
	return result;
}
