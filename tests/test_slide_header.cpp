/* test_slide_header.cpp - tests for the slide header grammar and notes collector.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "constants.hpp"
#include "slide_header.hpp"
#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>

TEST(SlideHeader, FormatsWithAndWithoutTitle) {
	EXPECT_EQ(format_slide_header({3, "Intro", ""}), "Slide 3: Intro");
	EXPECT_EQ(format_slide_header({4, "", "notes"}), "Slide 4");
	EXPECT_EQ(format_slide_header({5, "Two\nlines", ""}, "##"), "## Slide 5: Two lines");
}

TEST(SlideHeader, ParsesLooseSpellings) {
	auto header = parse_slide_header("  slide 12 :  Wrap up  ");
	ASSERT_TRUE(header.has_value());
	EXPECT_EQ(header->number, 12);
	EXPECT_EQ(header->title, "Wrap up");

	header = parse_slide_header("SLIDE 2");
	ASSERT_TRUE(header.has_value());
	EXPECT_EQ(header->number, 2);
	EXPECT_TRUE(header->title.empty());
}

TEST(SlideHeader, RejectsZeroOverflowAndPlainProse) {
	EXPECT_FALSE(parse_slide_header("Slide 0: Nothing").has_value());
	EXPECT_FALSE(parse_slide_header("Slide 99999999999: Huge").has_value());
	EXPECT_FALSE(parse_slide_header("See slide 4 for details").has_value());
	EXPECT_FALSE(parse_slide_header("Slides 4").has_value());
}

TEST(SlideHeader, RequiresTheMarkerWhenGiven) {
	EXPECT_TRUE(parse_slide_header("## Slide 1: Title", "##").has_value());
	EXPECT_FALSE(parse_slide_header("Slide 1: Title", "##").has_value());
	EXPECT_FALSE(parse_slide_header("### Slide 1: Title", "##").has_value());
}

TEST(RuleLine, RecognizesRulesOfEitherWeight) {
	EXPECT_TRUE(is_rule_line(make_rule(LIGHT_RULE_GLYPH, RULE_WIDTH)));
	EXPECT_TRUE(is_rule_line("  " + make_rule(HEAVY_RULE_GLYPH, MIN_RULE_WIDTH)));
	EXPECT_FALSE(is_rule_line(make_rule(LIGHT_RULE_GLYPH, MIN_RULE_WIDTH - 1)));
	EXPECT_FALSE(is_rule_line(make_rule(LIGHT_RULE_GLYPH, 20) + "x"));
	EXPECT_FALSE(is_rule_line(""));
}

TEST(NotesCollector, DropsContentBeforeTheFirstHeader) {
	notes_collector collector({NO_NOTES_PLACEHOLDER});
	collector.add_line("stray preamble");
	EXPECT_FALSE(collector.has_open_slide());
	collector.begin_slide({1, "One"});
	collector.add_line("body");
	const auto notes = collector.finish();
	ASSERT_EQ(notes.size(), 1U);
	EXPECT_EQ(notes[0], (notes_record{1, "One", "body"}));
}

TEST(NotesCollector, CollapsesPlaceholderBodiesToEmptyNotes) {
	notes_collector collector({NO_NOTES_PLACEHOLDER});
	collector.begin_slide({1, ""});
	collector.add_line("   [No notes]  ");
	collector.begin_slide({2, ""});
	collector.add_line("");
	collector.add_line("kept   ");
	collector.add_line("");
	const auto notes = collector.finish();
	ASSERT_EQ(notes.size(), 2U);
	EXPECT_EQ(notes[0].notes_text, "");
	EXPECT_EQ(notes[1].notes_text, "kept");
}

TEST(NotesCollector, KeepsRepeatedSlideNumbers) {
	notes_collector collector(std::vector<std::string_view>{});
	collector.begin_slide({2, ""});
	collector.add_line("first");
	collector.begin_slide({2, ""});
	collector.add_line("second");
	const auto notes = collector.finish();
	ASSERT_EQ(notes.size(), 2U);
	EXPECT_EQ(notes[0].notes_text, "first");
	EXPECT_EQ(notes[1].notes_text, "second");
}
