/* deck_session.cpp - explicit lifetime for one open presentation.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "deck_session.hpp"
#include "sync_exception.hpp"
#include <algorithm>
#include <memory>
#include <span>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

deck_session::deck_session(const wxString& deck_path, const retry_policy& policy) : path{deck_path}, policy{policy} {
}

deck_session::~deck_session() {
	close();
}

void deck_session::open() {
	if (is_open()) {
		return;
	}
	if (!is_supported_deck(path)) {
		throw sync_exception(_("Only PowerPoint presentations (.pptx, .pptm) are supported"), path, sync_error_code::unsupported_format);
	}
	backend = pptx_deck::open(path, policy);
}

void deck_session::close() {
	if (!backend) {
		return;
	}
	if (backend->is_modified()) {
		wxLogWarning(_("Closing %s with unsaved notes changes"), path);
	}
	backend.reset();
}

deck_backend& deck_session::deck() const {
	if (!backend) {
		throw sync_exception(_("The presentation is not open"), path, sync_error_code::collaborator_failure);
	}
	return *backend;
}

std::span<const wxString> deck_session::extensions() {
	static const wxString exts[] = {"pptx", "pptm"};
	return exts;
}

bool deck_session::is_supported_deck(const wxString& deck_path) {
	const wxString extension = wxFileName(deck_path).GetExt().Lower();
	return std::ranges::any_of(extensions(), [&](const wxString& ext) {
		return ext == extension;
	});
}
