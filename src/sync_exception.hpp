/* sync_exception.hpp - the exception type shared by every stage of the notes round trip.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <stdexcept>
#include <string>
#include <wx/string.h>

enum class sync_error_code {
	not_found,
	unsupported_format,
	malformed_input,
	collaborator_failure,
	write_failure,
};

class sync_exception : public std::runtime_error {
public:
	sync_exception(const wxString& msg, sync_error_code code) : std::runtime_error(msg.ToStdString()), message{msg}, error_code{code} {
	}
	sync_exception(const wxString& msg, const wxString& fp, sync_error_code code) : std::runtime_error(msg.ToStdString()), message{msg}, file_path{fp}, error_code{code} {
	}

	[[nodiscard]] sync_error_code get_error_code() const noexcept {
		return error_code;
	}

	[[nodiscard]] const wxString& get_file_path() const noexcept {
		return file_path;
	}

	[[nodiscard]] const wxString& get_message() const noexcept {
		return message;
	}

	[[nodiscard]] wxString get_display_message() const {
		if (file_path.IsEmpty()) {
			return message;
		}
		return wxString::Format("%s: %s", file_path, message);
	}

private:
	wxString message;
	wxString file_path;
	sync_error_code error_code;
};
