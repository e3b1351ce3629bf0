/* utils.cpp - miscellaneous helpers shared across Slidenotes.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "utils.hpp"
#include "sync_exception.hpp"
#include <cctype>
#include <climits>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <pugixml.hpp>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <wx/defs.h>
#include <wx/filename.h>
#include <wx/strconv.h>
#include <wx/string.h>
#include <wx/tokenzr.h>
#include <wx/translation.h>
#include <wx/wfstream.h>
#include <wx/zipstrm.h>

namespace {
constexpr unsigned char UTF8_NBSP_FIRST = 0xC2;
constexpr unsigned char UTF8_NBSP_SECOND = 0xA0;
constexpr unsigned char FIRST_PRINTABLE = 0x20;
constexpr unsigned char ASCII_DELETE = 0x7F;
} // namespace

std::string sanitize_text(std::string_view input) {
	std::string result;
	result.reserve(input.size());
	for (const char ch : input) {
		const auto byte = static_cast<unsigned char>(ch);
		// Bytes of multi-byte UTF-8 sequences are all >= 0x80, so a bytewise filter is safe.
		const bool is_control = byte < FIRST_PRINTABLE && ch != '\t' && ch != '\n' && ch != '\r';
		if (!is_control && byte != ASCII_DELETE) {
			result.push_back(ch);
		}
	}
	return result;
}

std::string collapse_whitespace(std::string_view input) {
	auto result = std::ostringstream{};
	bool prev_was_space = false;
	for (size_t i = 0; i < input.size(); ++i) {
		const auto ch = static_cast<unsigned char>(input[i]);
		// Check for non-breaking space (UTF-8: 0xC2A0)
		const bool is_nbsp = (i + 1 < input.size() && ch == UTF8_NBSP_FIRST && static_cast<unsigned char>(input[i + 1]) == UTF8_NBSP_SECOND);
		if ((std::isspace(ch) != 0) || is_nbsp) {
			if (!prev_was_space) {
				result << ' ';
				prev_was_space = true;
			}
			if (is_nbsp) {
				++i; // Skip the second byte of the UTF-8 sequence.
			}
		} else {
			result << input[i];
			prev_was_space = false;
		}
	}
	return result.str();
}

std::string trim_string(const std::string& str) {
	auto start = str.begin();
	auto end = str.end();
	auto is_nbsp = [&](std::string::const_iterator it) -> bool {
		return it != str.end() && std::next(it) != str.end() && static_cast<unsigned char>(*it) == UTF8_NBSP_FIRST && static_cast<unsigned char>(*std::next(it)) == UTF8_NBSP_SECOND;
	};
	while (start != end && ((std::isspace(static_cast<unsigned char>(*start)) != 0) || is_nbsp(start))) {
		if (is_nbsp(start)) {
			start += 2;
		} else {
			++start;
		}
	}
	while (start != end) {
		auto prev = std::prev(end);
		if (std::isspace(static_cast<unsigned char>(*prev)) != 0) {
			end = prev;
		} else if (prev != start && std::prev(prev) != start && is_nbsp(std::prev(prev))) {
			end = std::prev(prev);
		} else {
			break;
		}
	}
	return {start, end};
}

std::string trim_right(std::string_view str) {
	size_t end = str.size();
	while (end > 0 && std::isspace(static_cast<unsigned char>(str[end - 1])) != 0) {
		--end;
	}
	return std::string(str.substr(0, end));
}

std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	size_t start = 0;
	while (true) {
		const size_t pos = text.find('\n', start);
		std::string_view line = text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
		if (!line.empty() && line.back() == '\r') {
			line.remove_suffix(1);
		}
		lines.emplace_back(line);
		if (pos == std::string_view::npos) {
			break;
		}
		start = pos + 1;
	}
	return lines;
}

std::string join_lines(const std::vector<std::string>& lines) {
	std::string result;
	for (size_t i = 0; i < lines.size(); ++i) {
		if (i > 0) {
			result += '\n';
		}
		result += lines[i];
	}
	return result;
}

std::string convert_to_utf8(const std::string& input) {
	if (input.empty()) {
		return input;
	}
	const auto* data = reinterpret_cast<const unsigned char*>(input.data());
	const size_t len = input.length();
	auto try_convert = [&](size_t bom_size, wxMBConv& conv) -> std::optional<std::string> {
		const wxString content(input.data() + bom_size, conv, len - bom_size);
		if (!content.empty()) {
			return std::string(content.ToUTF8());
		}
		return std::nullopt;
	};
	if (len >= 4 && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
		wxMBConvUTF32LE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
		wxMBConvUTF32BE conv;
		if (auto result = try_convert(4, conv)) {
			return *result;
		}
	}
	size_t offset = 0;
	if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
		offset = 3;
	} else {
		if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
			wxMBConvUTF16LE conv;
			if (auto result = try_convert(2, conv)) {
				return *result;
			}
		}
		if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
			wxMBConvUTF16BE conv;
			if (auto result = try_convert(2, conv)) {
				return *result;
			}
		}
	}
	if (offset == len) {
		return {};
	}
	// Without a UTF-16 or UTF-32 BOM the bytes must be valid UTF-8.
	if (wxString::FromUTF8(input.data() + offset, len - offset).empty()) {
		throw sync_exception(_("The notes file is not valid UTF-8 text"), sync_error_code::malformed_input);
	}
	return input.substr(offset);
}

std::string get_local_name(const char* qname) {
	if (qname == nullptr) {
		return {};
	}
	std::string s(qname);
	size_t pos{s.find(':')};
	return pos == std::string::npos ? s : s.substr(pos + 1);
}

std::string read_file_bytes(const wxString& path) {
	if (!wxFileName::FileExists(path)) {
		throw sync_exception(_("File not found"), path, sync_error_code::not_found);
	}
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		throw sync_exception(_("Failed to open file"), path, sync_error_code::malformed_input);
	}
	const auto file_size = static_cast<size_t>(file_stream.GetLength());
	std::string buffer(file_size, '\0');
	if (file_size > 0) {
		file_stream.Read(buffer.data(), file_size);
		if (file_stream.LastRead() != file_size) {
			throw sync_exception(_("Failed to read file"), path, sync_error_code::malformed_input);
		}
	}
	return buffer;
}

void write_file_bytes(const wxString& path, std::string_view bytes) {
	wxFileOutputStream out(path);
	if (!out.IsOk()) {
		throw sync_exception(_("Failed to create file"), path, sync_error_code::write_failure);
	}
	out.Write(bytes.data(), bytes.size());
	if (!out.IsOk() || !out.Close()) {
		throw sync_exception(_("Failed to write file"), path, sync_error_code::write_failure);
	}
}

std::string read_zip_entry(wxZipInputStream& zip) {
	constexpr int buffer_size = 4096;
	std::ostringstream buffer;
	char buf[buffer_size];
	while (zip.Read(buf, sizeof(buf)).LastRead() > 0) {
		buffer.write(buf, static_cast<std::streamsize>(zip.LastRead()));
	}
	return buffer.str();
}

std::vector<zip_part> read_zip_parts(wxInputStream& stream) {
	std::vector<zip_part> parts;
	wxZipInputStream zip(stream);
	if (!zip.IsOk()) {
		return parts;
	}
	std::unique_ptr<wxZipEntry> entry;
	while ((entry.reset(zip.GetNextEntry())), entry != nullptr) {
		if (entry->IsDir()) {
			continue;
		}
		zip_part part;
		part.name = entry->GetInternalName().ToStdString();
		part.data = read_zip_entry(zip);
		parts.push_back(std::move(part));
	}
	return parts;
}

bool write_zip_parts(wxOutputStream& stream, const std::vector<zip_part>& parts) {
	wxZipOutputStream zip(stream);
	for (const auto& part : parts) {
		if (!zip.PutNextEntry(wxString::FromUTF8(part.name))) {
			return false;
		}
		if (!part.data.empty()) {
			zip.Write(part.data.data(), part.data.size());
		}
		if (!zip.IsOk()) {
			return false;
		}
	}
	return zip.Close();
}

std::string xml_to_string(const pugi::xml_document& doc) {
	std::ostringstream oss;
	doc.save(oss, "", pugi::format_raw);
	return oss.str();
}

std::optional<std::set<int>> parse_slide_list(const wxString& list) {
	std::set<int> slides;
	wxStringTokenizer tokenizer(list, ", ", wxTOKEN_STRTOK);
	while (tokenizer.HasMoreTokens()) {
		long value{0};
		if (!tokenizer.GetNextToken().ToLong(&value) || value < 1 || value > INT_MAX) {
			return std::nullopt;
		}
		slides.insert(static_cast<int>(value));
	}
	if (slides.empty()) {
		return std::nullopt;
	}
	return slides;
}
