/* slide_header.cpp - slide header grammar and notes accumulation.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "slide_header.hpp"
#include "constants.hpp"
#include "notes.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {
const std::regex& slide_header_pattern() {
	static const std::regex pattern(R"(^slide\s+(\d+)(?:\s*:\s*(.*))?$)", std::regex_constants::ECMAScript | std::regex_constants::icase);
	return pattern;
}
} // namespace

std::string format_slide_header(const notes_record& record, std::string_view marker) {
	std::string header;
	if (!marker.empty()) {
		header += marker;
		header += ' ';
	}
	header += "Slide " + std::to_string(record.slide_number);
	const std::string title = trim_string(collapse_whitespace(sanitize_text(record.slide_title)));
	if (!title.empty()) {
		header += ": " + title;
	}
	return header;
}

std::optional<slide_header> parse_slide_header(std::string_view line, std::string_view marker) {
	std::string text = trim_string(std::string(line));
	if (!marker.empty()) {
		if (!text.starts_with(marker)) {
			return std::nullopt;
		}
		text.erase(0, marker.size());
		if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())) == 0) {
			return std::nullopt;
		}
		text = trim_string(text);
	}
	std::smatch match;
	if (!std::regex_match(text, match, slide_header_pattern())) {
		return std::nullopt;
	}
	const std::string digits = match[1].str();
	int number{0};
	const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
	if (ec != std::errc{} || number < 1) {
		return std::nullopt;
	}
	slide_header header;
	header.number = number;
	if (match[2].matched) {
		header.title = trim_string(match[2].str());
	}
	return header;
}

std::string make_rule(std::string_view glyph, int width) {
	std::string rule;
	rule.reserve(glyph.size() * static_cast<size_t>(std::max(width, 0)));
	for (int i = 0; i < width; ++i) {
		rule += glyph;
	}
	return rule;
}

bool is_rule_line(std::string_view line) {
	const std::string text = trim_string(std::string(line));
	const size_t glyph_size = LIGHT_RULE_GLYPH.size();
	if (text.empty() || text.size() % glyph_size != 0) {
		return false;
	}
	const size_t glyph_count = text.size() / glyph_size;
	if (glyph_count < static_cast<size_t>(MIN_RULE_WIDTH)) {
		return false;
	}
	for (size_t i = 0; i < glyph_count; ++i) {
		const std::string_view glyph = std::string_view(text).substr(i * glyph_size, glyph_size);
		if (glyph != LIGHT_RULE_GLYPH && glyph != HEAVY_RULE_GLYPH) {
			return false;
		}
	}
	return true;
}

notes_collector::notes_collector(std::vector<std::string_view> placeholder_texts) : placeholders{std::move(placeholder_texts)} {
}

void notes_collector::begin_slide(slide_header header) {
	flush();
	current = std::move(header);
}

void notes_collector::add_line(std::string_view line) {
	if (!current) {
		return;
	}
	std::string text = trim_right(line);
	if (is_placeholder(trim_string(text))) {
		return;
	}
	lines.push_back(std::move(text));
}

notes_snapshot notes_collector::finish() {
	flush();
	notes_snapshot result = std::move(records);
	records.clear();
	return result;
}

void notes_collector::flush() {
	if (!current) {
		return;
	}
	std::string notes = trim_string(join_lines(lines));
	if (is_placeholder(notes)) {
		notes.clear();
	}
	notes_record record;
	record.slide_number = current->number;
	record.slide_title = sanitize_text(current->title);
	record.notes_text = sanitize_text(notes);
	records.push_back(std::move(record));
	current.reset();
	lines.clear();
}

bool notes_collector::is_placeholder(const std::string& text) const {
	return std::ranges::find(placeholders, std::string_view(text)) != placeholders.end();
}
