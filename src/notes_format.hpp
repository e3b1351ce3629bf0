/* notes_format.hpp - base interface for the notes file formats.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "notes.hpp"
#include <span>
#include <string>
#include <string_view>
#include <wx/string.h>

struct format_options {
	wxString font_name{"Calibri"};
	int font_size{14};
};

/* One editable file encoding of a notes snapshot.
 * serialize and parse work on raw file bytes; save and load add the file I/O.
 */
class notes_format {
public:
	virtual ~notes_format() = default;
	[[nodiscard]] virtual wxString name() const = 0;
	[[nodiscard]] virtual std::span<const wxString> extensions() const = 0;
	[[nodiscard]] virtual std::string serialize(const notes_snapshot& notes, const format_options& options) const = 0;
	[[nodiscard]] virtual notes_snapshot parse(std::string_view content) const = 0;

	void save(const notes_snapshot& notes, const wxString& path, const format_options& options = {}) const;
	[[nodiscard]] notes_snapshot load(const wxString& path) const;
};

class notes_format_registry {
public:
	[[nodiscard]] static std::span<const notes_format* const> get_all();
};

[[nodiscard]] const notes_format* find_format_by_extension(const wxString& extension) noexcept;
// Looks up the format for a path by its extension, throwing unsupported_format when none matches.
[[nodiscard]] const notes_format& format_for_path(const wxString& path);
[[nodiscard]] wxString get_supported_extensions();
