/* utils.hpp - miscellaneous helpers shared across Slidenotes.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include <optional>
#include <pugixml.hpp>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include <wx/stream.h>
#include <wx/string.h>
#include <wx/zipstrm.h>

struct zip_part {
	std::string name;
	std::string data;
};

[[nodiscard]] std::string sanitize_text(std::string_view input);
[[nodiscard]] std::string collapse_whitespace(std::string_view input);
[[nodiscard]] std::string trim_string(const std::string& str);
[[nodiscard]] std::string trim_right(std::string_view str);
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);
[[nodiscard]] std::string join_lines(const std::vector<std::string>& lines);
[[nodiscard]] std::string convert_to_utf8(const std::string& input);
[[nodiscard]] std::string get_local_name(const char* qname);
[[nodiscard]] std::string read_file_bytes(const wxString& path);
void write_file_bytes(const wxString& path, std::string_view bytes);
[[nodiscard]] std::string read_zip_entry(wxZipInputStream& zip);
[[nodiscard]] std::vector<zip_part> read_zip_parts(wxInputStream& stream);
[[nodiscard]] bool write_zip_parts(wxOutputStream& stream, const std::vector<zip_part>& parts);
[[nodiscard]] std::string xml_to_string(const pugi::xml_document& doc);
[[nodiscard]] std::optional<std::set<int>> parse_slide_list(const wxString& list);
