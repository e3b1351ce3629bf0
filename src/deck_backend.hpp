/* deck_backend.hpp - the interface the notes round trip uses to reach a presentation.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <string>

/* A live presentation whose slides carry speaker notes.
 * Slides are numbered from 1. Failures are reported by throwing sync_exception with collaborator_failure.
 */
class deck_backend {
public:
	virtual ~deck_backend() = default;
	[[nodiscard]] virtual int slide_count() const = 0;
	// Empty when the slide has no notes.
	[[nodiscard]] virtual std::string get_notes(int slide_number) const = 0;
	virtual void set_notes(int slide_number, const std::string& text) = 0;
	// Empty when the slide has no title.
	[[nodiscard]] virtual std::string get_title(int slide_number) const = 0;
	// Commits every pending set_notes.
	virtual void persist() = 0;
};
