/* slide_header.hpp - the slide header grammar and notes accumulation shared by every notes format.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "notes.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct slide_header {
	int number{0};
	std::string title;
};

// Renders "<marker> Slide <n>[: <title>]"; the marker is omitted when empty.
[[nodiscard]] std::string format_slide_header(const notes_record& record, std::string_view marker = {});
[[nodiscard]] std::optional<slide_header> parse_slide_header(std::string_view line, std::string_view marker = {});
[[nodiscard]] std::string make_rule(std::string_view glyph, int width);
// True for a line made only of at least MIN_RULE_WIDTH box-drawing rule glyphs.
[[nodiscard]] bool is_rule_line(std::string_view line);

/* Rebuilds a notes snapshot from a stream of classified units.
 * Each header closes the slide before it. Body lines before the first header are dropped,
 * and a body made only of placeholder text becomes empty notes.
 */
class notes_collector {
public:
	explicit notes_collector(std::vector<std::string_view> placeholders);
	~notes_collector() = default;
	notes_collector(const notes_collector&) = delete;
	notes_collector& operator=(const notes_collector&) = delete;
	notes_collector(notes_collector&&) = default;
	notes_collector& operator=(notes_collector&&) = default;

	void begin_slide(slide_header header);
	void add_line(std::string_view line);
	[[nodiscard]] bool has_open_slide() const noexcept {
		return current.has_value();
	}
	[[nodiscard]] notes_snapshot finish();

private:
	std::vector<std::string_view> placeholders;
	std::optional<slide_header> current;
	std::vector<std::string> lines;
	notes_snapshot records;

	void flush();
	[[nodiscard]] bool is_placeholder(const std::string& text) const;
};
