/* markdown_format.cpp - reading and writing of Markdown notes files.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "markdown_format.hpp"
#include "constants.hpp"
#include "slide_header.hpp"
#include "utils.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

std::string markdown_format::serialize(const notes_snapshot& notes, const format_options& /*options*/) const {
	std::vector<std::string> lines;
	lines.emplace_back(MARKDOWN_DOCUMENT_TITLE);
	lines.emplace_back();
	for (const auto& record : notes) {
		lines.push_back(format_slide_header(record, MARKDOWN_HEADER_MARKER));
		lines.emplace_back();
		const std::string body = trim_string(sanitize_text(record.notes_text));
		if (body.empty()) {
			lines.emplace_back(MARKDOWN_NO_NOTES_PLACEHOLDER);
		} else {
			for (auto& line : split_lines(body)) {
				lines.push_back(std::move(line));
			}
		}
		lines.emplace_back();
		lines.emplace_back(MARKDOWN_RULE);
		lines.emplace_back();
	}
	return join_lines(lines);
}

notes_snapshot markdown_format::parse(std::string_view content) const {
	const std::string text = convert_to_utf8(std::string(content));
	// Editors tend to retype the italic marker, so both emphasis spellings and the bare text count.
	notes_collector collector({MARKDOWN_NO_NOTES_PLACEHOLDER, "_[No notes]_", NO_NOTES_PLACEHOLDER});
	for (const auto& line : split_lines(text)) {
		if (is_decoration(line)) {
			continue;
		}
		if (auto header = parse_slide_header(line, MARKDOWN_HEADER_MARKER)) {
			collector.begin_slide(std::move(*header));
			continue;
		}
		collector.add_line(line);
	}
	return collector.finish();
}

// Level one headings and the slide break frame the slides but never belong to them.
bool markdown_format::is_decoration(const std::string& line) {
	const std::string text = trim_string(line);
	return text.starts_with("# ") || text == MARKDOWN_RULE;
}
