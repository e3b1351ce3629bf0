/* notes_format.cpp - notes format logic not specific to any given format.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_format.hpp"
#include "docx_format.hpp"
#include "markdown_format.hpp"
#include "sync_exception.hpp"
#include "text_format.hpp"
#include "utils.hpp"
#include <array>
#include <span>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

void notes_format::save(const notes_snapshot& notes, const wxString& path, const format_options& options) const {
	write_file_bytes(path, serialize(notes, options));
	wxLogVerbose("Wrote %zu slide(s) to %s", notes.size(), path);
}

notes_snapshot notes_format::load(const wxString& path) const {
	const std::string content = read_file_bytes(path);
	try {
		notes_snapshot notes = parse(content);
		wxLogVerbose("Parsed %zu slide(s) from %s", notes.size(), path);
		return notes;
	} catch (const sync_exception& e) {
		if (!e.get_file_path().IsEmpty()) {
			throw;
		}
		throw sync_exception(e.get_message(), path, e.get_error_code());
	}
}

std::span<const notes_format* const> notes_format_registry::get_all() {
	static const text_format text;
	static const markdown_format markdown;
	static const docx_format docx;
	static const std::array<const notes_format*, 3> formats{&text, &markdown, &docx};
	return formats;
}

const notes_format* find_format_by_extension(const wxString& extension) noexcept {
	const wxString normalized = extension.Lower();
	for (const auto* format : notes_format_registry::get_all()) {
		for (const auto& ext : format->extensions()) {
			if (ext.Lower() == normalized) {
				return format;
			}
		}
	}
	return nullptr;
}

const notes_format& format_for_path(const wxString& path) {
	const wxString extension = wxFileName(path).GetExt();
	const auto* format = find_format_by_extension(extension);
	if (format == nullptr) {
		throw sync_exception(wxString::Format(_("Unknown notes file format '%s'. Use %s."), extension, get_supported_extensions()), path, sync_error_code::unsupported_format);
	}
	return *format;
}

wxString get_supported_extensions() {
	wxString result;
	for (const auto* format : notes_format_registry::get_all()) {
		for (const auto& ext : format->extensions()) {
			if (!result.IsEmpty()) {
				result += ", ";
			}
			result += "." + ext;
		}
	}
	return result;
}
