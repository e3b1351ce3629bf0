/* text_format.cpp - reading and writing of plain text notes files.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "text_format.hpp"
#include "constants.hpp"
#include "slide_header.hpp"
#include "utils.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

std::string text_format::serialize(const notes_snapshot& notes, const format_options& /*options*/) const {
	std::vector<std::string> lines;
	for (const auto& record : notes) {
		lines.push_back(format_slide_header(record));
		lines.push_back(make_rule(LIGHT_RULE_GLYPH, RULE_WIDTH));
		lines.emplace_back();
		const std::string body = trim_string(sanitize_text(record.notes_text));
		if (body.empty()) {
			lines.emplace_back(NO_NOTES_PLACEHOLDER);
		} else {
			for (auto& line : split_lines(body)) {
				lines.push_back(std::move(line));
			}
		}
		lines.emplace_back();
		lines.push_back(make_rule(HEAVY_RULE_GLYPH, RULE_WIDTH));
		lines.emplace_back();
	}
	return join_lines(lines);
}

notes_snapshot text_format::parse(std::string_view content) const {
	const std::string text = convert_to_utf8(std::string(content));
	notes_collector collector({NO_NOTES_PLACEHOLDER});
	for (const auto& line : split_lines(text)) {
		if (is_rule_line(line)) {
			continue;
		}
		if (auto header = parse_slide_header(line)) {
			collector.begin_slide(std::move(*header));
			continue;
		}
		collector.add_line(line);
	}
	return collector.finish();
}
