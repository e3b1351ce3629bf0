/* test_helpers.hpp - shared fixtures for the unit tests.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "deck_backend.hpp"
#include "sync_exception.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/string.h>

inline wxString make_temp_path(const wxString& extension) {
	const wxString base = wxFileName::CreateTempFileName("slidenotes");
	wxRemoveFile(base);
	return base + "." + extension;
}

// Deletes the file at its path, if one was created, when it goes out of scope.
class temp_file {
public:
	explicit temp_file(const wxString& extension) : path{make_temp_path(extension)} {
	}

	~temp_file() {
		if (wxFileName::FileExists(path)) {
			wxRemoveFile(path);
		}
	}

	temp_file(const temp_file&) = delete;
	temp_file& operator=(const temp_file&) = delete;

	[[nodiscard]] const wxString& get_path() const noexcept {
		return path;
	}

private:
	wxString path;
};

struct fake_slide {
	std::string title;
	std::string notes;
};

// In-memory deck that records how it was driven.
class fake_deck : public deck_backend {
public:
	explicit fake_deck(std::vector<fake_slide> initial_slides) : slides{std::move(initial_slides)} {
	}

	[[nodiscard]] int slide_count() const override {
		return static_cast<int>(slides.size());
	}

	[[nodiscard]] std::string get_notes(int slide_number) const override {
		++reads;
		return slides.at(static_cast<size_t>(slide_number - 1)).notes;
	}

	void set_notes(int slide_number, const std::string& text) override {
		set_calls.push_back(slide_number);
		if (failing_slides.contains(slide_number)) {
			throw sync_exception("slide is locked", sync_error_code::collaborator_failure);
		}
		slides.at(static_cast<size_t>(slide_number - 1)).notes = text;
	}

	[[nodiscard]] std::string get_title(int slide_number) const override {
		++reads;
		return slides.at(static_cast<size_t>(slide_number - 1)).title;
	}

	void persist() override {
		++persist_calls;
		if (fail_persist) {
			throw sync_exception("disk full", sync_error_code::collaborator_failure);
		}
	}

	std::vector<fake_slide> slides;
	std::set<int> failing_slides;
	bool fail_persist{false};
	std::vector<int> set_calls;
	int persist_calls{0};
	mutable int reads{0};
};
