/* notes.cpp - helpers for the notes value types.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes.hpp"
#include <algorithm>
#include <cstddef>
#include <wx/string.h>

wxString change_type_name(change_type type) {
	switch (type) {
		case change_type::added:
			return "added";
		case change_type::removed:
			return "removed";
		case change_type::modified:
			return "modified";
	}
	return wxEmptyString;
}

size_t count_slides_with_notes(const notes_snapshot& notes) noexcept {
	return static_cast<size_t>(std::ranges::count_if(notes, [](const notes_record& record) {
		return !record.notes_text.empty();
	}));
}
