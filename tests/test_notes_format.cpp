/* test_notes_format.cpp - tests for format lookup and the file-level save and load.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_format.hpp"
#include "sync_exception.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <wx/string.h>

TEST(NotesFormatRegistry, FindsFormatsByExtensionIgnoringCase) {
	ASSERT_NE(find_format_by_extension("TXT"), nullptr);
	EXPECT_EQ(find_format_by_extension("txt")->name(), "Text Files");
	EXPECT_EQ(find_format_by_extension("markdown")->name(), "Markdown Documents");
	EXPECT_EQ(find_format_by_extension("Md"), find_format_by_extension("markdown"));
	EXPECT_EQ(find_format_by_extension("docx")->name(), "Word Documents");
	EXPECT_EQ(find_format_by_extension("pdf"), nullptr);
	EXPECT_EQ(find_format_by_extension(""), nullptr);
}

TEST(NotesFormatRegistry, ListsEverySupportedExtension) {
	EXPECT_EQ(get_supported_extensions(), ".txt, .md, .markdown, .docx");
}

TEST(NotesFormatRegistry, UnknownExtensionIsAnUnsupportedFormat) {
	try {
		static_cast<void>(format_for_path("/tmp/notes.rtf"));
		FAIL() << "expected an unsupported_format error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::unsupported_format);
		EXPECT_EQ(e.get_file_path(), "/tmp/notes.rtf");
	}
}

TEST(NotesFormat, SavesAndLoadsThroughTheFileSystem) {
	const temp_file file("md");
	const notes_format& format = format_for_path(file.get_path());
	const notes_snapshot notes{{1, "Title", "Body"}};
	format.save(notes, file.get_path());
	EXPECT_EQ(format.load(file.get_path()), notes);
}

TEST(NotesFormat, MissingFileIsNotFound) {
	const notes_format& format = format_for_path("missing.txt");
	try {
		static_cast<void>(format.load(make_temp_path("txt")));
		FAIL() << "expected a not_found error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::not_found);
	}
}

TEST(NotesFormat, LoadAttachesThePathToParseErrors) {
	const temp_file file("docx");
	write_file_bytes(file.get_path(), "not a zip");
	const notes_format& format = format_for_path(file.get_path());
	try {
		static_cast<void>(format.load(file.get_path()));
		FAIL() << "expected a malformed_input error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::malformed_input);
		EXPECT_EQ(e.get_file_path(), file.get_path());
	}
}

TEST(NotesFormat, EveryFormatRoundTripsTabsBlankLinesAndNonAscii) {
	const std::vector<std::string> bodies{
		"Column\tvalue\tunit",
		"First\n\n\nAfter two blank lines",
		"caf\xC3\xA9 \xE2\x80\x94 na\xC3\xAFve \xF0\x9F\x8E\xA4 \xE6\x97\xA5\xE6\x9C\xAC",
		"Intro\n-----\nMore",
	};
	notes_snapshot notes;
	int slide = 1;
	for (const auto& body : bodies) {
		notes.push_back({slide++, "R\xC3\xA9sum\xC3\xA9", body});
	}
	notes.push_back({slide, "", ""});
	for (const char* extension : {"txt", "md", "docx"}) {
		const notes_format* format = find_format_by_extension(extension);
		ASSERT_NE(format, nullptr) << extension;
		EXPECT_EQ(format->parse(format->serialize(notes, {})), notes) << extension;
	}
}
