/* notes.hpp - value types describing slide notes, detected changes and apply results.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <wx/string.h>

struct notes_record {
	int slide_number{0};
	std::string slide_title;
	std::string notes_text;

	bool operator==(const notes_record& other) const = default;
};

// Ordered by slide number when produced by an extractor, in file order when produced by a parser.
using notes_snapshot = std::vector<notes_record>;

enum class change_type {
	added,
	removed,
	modified,
};

struct change_record {
	int slide_number{0};
	std::string slide_title;
	std::string original_notes;
	std::string edited_notes;
	change_type type{change_type::modified};

	bool operator==(const change_record& other) const = default;
};

struct apply_error {
	int slide_number{0};
	wxString message;
};

struct apply_outcome {
	std::vector<int> applied;
	std::vector<int> skipped;
	std::vector<apply_error> errors;

	[[nodiscard]] bool has_errors() const noexcept {
		return !errors.empty();
	}
};

[[nodiscard]] wxString change_type_name(change_type type);
[[nodiscard]] size_t count_slides_with_notes(const notes_snapshot& notes) noexcept;
