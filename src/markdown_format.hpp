/* markdown_format.hpp - header file for the Markdown notes format.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "notes_format.hpp"

class markdown_format : public notes_format {
public:
	markdown_format() = default;
	~markdown_format() = default;
	markdown_format(const markdown_format&) = delete;
	markdown_format& operator=(const markdown_format&) = delete;
	markdown_format(markdown_format&&) = delete;
	markdown_format& operator=(markdown_format&&) = delete;
	[[nodiscard]] wxString name() const override { return "Markdown Documents"; }
	[[nodiscard]] std::span<const wxString> extensions() const override {
		static const wxString exts[] = {"md", "markdown"};
		return exts;
	}
	[[nodiscard]] std::string serialize(const notes_snapshot& notes, const format_options& options) const override;
	[[nodiscard]] notes_snapshot parse(std::string_view content) const override;

private:
	[[nodiscard]] static bool is_decoration(const std::string& line);
};
