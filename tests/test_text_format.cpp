/* test_text_format.cpp - tests for the plain text notes format.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "constants.hpp"
#include "slide_header.hpp"
#include "sync_exception.hpp"
#include "text_format.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {
const notes_snapshot sample_notes{
	{1, "Welcome", "Say hello.\n\nIntroduce the team."},
	{2, "", ""},
	{3, "Wrap up", "Questions?"},
};
} // namespace

TEST(TextFormat, WritesTheDocumentedLayout) {
	const text_format format;
	const std::string light = make_rule(LIGHT_RULE_GLYPH, RULE_WIDTH);
	const std::string heavy = make_rule(HEAVY_RULE_GLYPH, RULE_WIDTH);
	const std::string expected = "Slide 2\n" + light + "\n\n[No notes]\n\n" + heavy + "\n";
	EXPECT_EQ(format.serialize({{2, "", ""}}, {}), expected);
}

TEST(TextFormat, RoundTripsPlainNotes) {
	const text_format format;
	EXPECT_EQ(format.parse(format.serialize(sample_notes, {})), sample_notes);
}

TEST(TextFormat, ToleratesHandEditedFiles) {
	const text_format format;
	const std::string edited =
		"\xEF\xBB\xBF"
		"slide 1 : Welcome\r\n"
		"Good morning, everyone.   \r\n"
		"\r\n"
		"SLIDE 3\r\n"
		"  [No notes]\r\n";
	const auto notes = format.parse(edited);
	ASSERT_EQ(notes.size(), 2U);
	EXPECT_EQ(notes[0], (notes_record{1, "Welcome", "Good morning, everyone."}));
	EXPECT_EQ(notes[1], (notes_record{3, "", ""}));
}

TEST(TextFormat, FileWithoutHeadersYieldsNoSlides) {
	const text_format format;
	EXPECT_TRUE(format.parse("Just some prose.\nNothing else.").empty());
}

TEST(TextFormat, AcceptsUtf8WithoutByteOrderMark) {
	const text_format format;
	const auto notes = format.parse("Slide 1\ncaf\xC3\xA9 \xE2\x80\x94 ok\n");
	ASSERT_EQ(notes.size(), 1U);
	EXPECT_EQ(notes[0].notes_text, "caf\xC3\xA9 \xE2\x80\x94 ok");
}

TEST(TextFormat, MixedEncodingIsMalformedInput) {
	const text_format format;
	// Valid UTF-8 apart from one windows-1252 curly quote.
	const std::string edited = "Slide 1\ncaf\xC3\xA9 \x92ok\n";
	try {
		static_cast<void>(format.parse(edited));
		FAIL() << "expected a malformed_input error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::malformed_input);
	}
}
