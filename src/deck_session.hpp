/* deck_session.hpp - explicit lifetime for one open presentation.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "deck_backend.hpp"
#include "pptx_deck.hpp"
#include <memory>
#include <span>
#include <wx/string.h>

/* Owns the deck backend for one presentation file between open() and close().
 * Destroying an open session closes it.
 */
class deck_session {
public:
	explicit deck_session(const wxString& deck_path, const retry_policy& policy = {});
	~deck_session();
	deck_session(const deck_session&) = delete;
	deck_session& operator=(const deck_session&) = delete;
	deck_session(deck_session&&) = default;
	deck_session& operator=(deck_session&&) = default;

	void open();
	void close();

	[[nodiscard]] bool is_open() const noexcept {
		return backend != nullptr;
	}

	// Throws collaborator_failure when the session is not open.
	[[nodiscard]] deck_backend& deck() const;

	[[nodiscard]] const wxString& get_path() const noexcept {
		return path;
	}

	[[nodiscard]] static std::span<const wxString> extensions();
	[[nodiscard]] static bool is_supported_deck(const wxString& deck_path);

private:
	wxString path;
	retry_policy policy;
	std::unique_ptr<pptx_deck> backend;
};
