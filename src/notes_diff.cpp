/* notes_diff.cpp - comparison of an original notes snapshot against an edited one.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_diff.hpp"
#include "utils.hpp"
#include <map>
#include <string>
#include <vector>
#include <wx/log.h>

change_type classify_change(const std::string& original_notes, const std::string& edited_notes) noexcept {
	if (original_notes.empty() && !edited_notes.empty()) {
		return change_type::added;
	}
	if (!original_notes.empty() && edited_notes.empty()) {
		return change_type::removed;
	}
	return change_type::modified;
}

std::vector<change_record> compare_notes(const notes_snapshot& original, const notes_snapshot& edited) {
	std::map<int, const notes_record*> original_by_slide;
	for (const auto& record : original) {
		original_by_slide[record.slide_number] = &record;
	}
	std::map<int, const notes_record*> edited_by_slide;
	for (const auto& record : edited) {
		edited_by_slide[record.slide_number] = &record;
	}
	std::vector<change_record> changes;
	for (const auto& [slide_number, edited_record] : edited_by_slide) {
		const std::string edited_notes = trim_string(edited_record->notes_text);
		const auto it = original_by_slide.find(slide_number);
		if (it == original_by_slide.end()) {
			if (!edited_notes.empty()) {
				changes.push_back({slide_number, edited_record->slide_title, "", edited_notes, change_type::added});
			}
			continue;
		}
		const std::string original_notes = trim_string(it->second->notes_text);
		if (original_notes == edited_notes) {
			continue;
		}
		changes.push_back({slide_number, it->second->slide_title, original_notes, edited_notes, classify_change(original_notes, edited_notes)});
	}
	wxLogVerbose("Found %zu changed slide(s)", changes.size());
	return changes;
}
