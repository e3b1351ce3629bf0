/* test_pptx_deck.cpp - tests for the PowerPoint deck backend and its session.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "deck_session.hpp"
#include "pptx_deck.hpp"
#include "sync_exception.hpp"
#include "test_helpers.hpp"
#include "utils.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <wx/wfstream.h>

namespace {
const std::string XML_DECLARATION = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)";
const std::string PML_NAMESPACES = R"( xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main")"
								   R"( xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships")"
								   R"( xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main")";
const std::string REL_TYPE_BASE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/";

std::string make_shape(const std::string& placeholder_type, const std::vector<std::string>& paragraphs) {
	std::string shape = R"(<p:sp><p:nvSpPr><p:cNvPr id="2" name="Shape"/><p:cNvSpPr/><p:nvPr>)";
	if (!placeholder_type.empty()) {
		shape += R"(<p:ph type=")" + placeholder_type + R"("/>)";
	}
	shape += R"(</p:nvPr></p:nvSpPr><p:spPr/><p:txBody><a:bodyPr/><a:lstStyle/>)";
	for (const auto& paragraph : paragraphs) {
		shape += paragraph.empty() ? std::string("<a:p/>") : "<a:p><a:r><a:t>" + paragraph + "</a:t></a:r></a:p>";
	}
	return shape + "</p:txBody></p:sp>";
}

std::string make_tree(const std::string& root, const std::string& shapes) {
	return XML_DECLARATION + "<p:" + root + PML_NAMESPACES + "><p:cSld><p:spTree>" + shapes + "</p:spTree></p:cSld></p:" + root + ">";
}

std::string make_relationships(const std::vector<std::vector<std::string>>& rels) {
	std::string xml = XML_DECLARATION + R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">)";
	for (const auto& rel : rels) {
		xml += R"(<Relationship Id=")" + rel[0] + R"(" Type=")" + REL_TYPE_BASE + rel[1] + R"(" Target=")" + rel[2] + R"("/>)";
	}
	return xml + "</Relationships>";
}

struct deck_layout {
	bool reversed_order{false};
	bool with_notes_master{true};
};

/* Two slides. Slide 1 has a centered title and two lines of notes; slide 2 has no title
 * placeholder and no notes page.
 */
void write_sample_deck(const wxString& path, const deck_layout& layout = {}) {
	std::vector<zip_part> parts;
	parts.push_back({"[Content_Types].xml", XML_DECLARATION + R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
															  R"(<Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>)"
															  R"(<Default Extension="xml" ContentType="application/xml"/>)"
															  R"(</Types>)"});
	parts.push_back({"_rels/.rels", make_relationships({{"rId1", "officeDocument", "ppt/presentation.xml"}})});
	const std::string id_list = layout.reversed_order ? R"(<p:sldId id="256" r:id="rId3"/><p:sldId id="257" r:id="rId2"/>)" : R"(<p:sldId id="256" r:id="rId2"/><p:sldId id="257" r:id="rId3"/>)";
	parts.push_back({"ppt/presentation.xml", XML_DECLARATION + "<p:presentation" + PML_NAMESPACES + "><p:sldIdLst>" + id_list + "</p:sldIdLst></p:presentation>"});
	std::vector<std::vector<std::string>> presentation_rels{{"rId2", "slide", "slides/slide1.xml"}, {"rId3", "slide", "slides/slide2.xml"}};
	if (layout.with_notes_master) {
		presentation_rels.push_back({"rId1", "notesMaster", "notesMasters/notesMaster1.xml"});
		parts.push_back({"ppt/notesMasters/notesMaster1.xml", make_tree("notesMaster", make_shape("body", {"Master text"}))});
	}
	parts.push_back({"ppt/_rels/presentation.xml.rels", make_relationships(presentation_rels)});
	parts.push_back({"ppt/slides/slide1.xml", make_tree("sld", make_shape("ctrTitle", {"Welcome"}) + make_shape("body", {"Agenda"}))});
	parts.push_back({"ppt/slides/_rels/slide1.xml.rels", make_relationships({{"rId1", "slideLayout", "../slideLayouts/slideLayout1.xml"}, {"rId2", "notesSlide", "../notesSlides/notesSlide1.xml"}})});
	const std::string long_text(120, 'x');
	parts.push_back({"ppt/slides/slide2.xml", make_tree("sld", make_shape("", {long_text}) + make_shape("", {"Agenda", "overview"}))});
	parts.push_back({"ppt/notesSlides/notesSlide1.xml", make_tree("notes", make_shape("sldImg", {}) + make_shape("body", {"Hello", "", "World"}))});
	wxFileOutputStream out(path);
	ASSERT_TRUE(out.IsOk());
	ASSERT_TRUE(write_zip_parts(out, parts));
	ASSERT_TRUE(out.Close());
}

const retry_policy no_wait{1, std::chrono::milliseconds(0)};
} // namespace

TEST(PptxDeck, MissingFileIsNotFound) {
	try {
		static_cast<void>(pptx_deck::open(make_temp_path("pptx"), no_wait));
		FAIL() << "expected a not_found error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::not_found);
	}
}

TEST(PptxDeck, UnreadablePackageFailsAfterRetrying) {
	const temp_file file("pptx");
	write_file_bytes(file.get_path(), "definitely not a zip archive");
	try {
		static_cast<void>(pptx_deck::open(file.get_path(), {2, std::chrono::milliseconds(0)}));
		FAIL() << "expected a collaborator_failure error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::collaborator_failure);
	}
}

TEST(PptxDeck, ReadsTitlesAndNotes) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path());
	const auto deck = pptx_deck::open(file.get_path(), no_wait);
	ASSERT_EQ(deck->slide_count(), 2);
	EXPECT_EQ(deck->get_title(1), "Welcome");
	EXPECT_EQ(deck->get_title(2), "Agenda overview");
	EXPECT_EQ(deck->get_notes(1), "Hello\n\nWorld");
	EXPECT_EQ(deck->get_notes(2), "");
	EXPECT_FALSE(deck->is_modified());
}

TEST(PptxDeck, FollowsThePresentationSlideOrder) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path(), {true, true});
	const auto deck = pptx_deck::open(file.get_path(), no_wait);
	ASSERT_EQ(deck->slide_count(), 2);
	EXPECT_EQ(deck->get_title(1), "Agenda overview");
	EXPECT_EQ(deck->get_title(2), "Welcome");
}

TEST(PptxDeck, ReplacedNotesSurviveReopening) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path());
	{
		const auto deck = pptx_deck::open(file.get_path(), no_wait);
		deck->set_notes(1, "Updated line\n\nSecond line");
		EXPECT_TRUE(deck->is_modified());
		deck->persist();
		EXPECT_FALSE(deck->is_modified());
	}
	const auto reopened = pptx_deck::open(file.get_path(), no_wait);
	EXPECT_EQ(reopened->get_notes(1), "Updated line\n\nSecond line");
	EXPECT_EQ(reopened->get_title(1), "Welcome");
}

TEST(PptxDeck, CreatesANotesPageWhenASlideHasNone) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path());
	{
		const auto deck = pptx_deck::open(file.get_path(), no_wait);
		deck->set_notes(2, "Brand new notes");
		deck->persist();
	}
	const auto reopened = pptx_deck::open(file.get_path(), no_wait);
	EXPECT_EQ(reopened->get_notes(2), "Brand new notes");
	EXPECT_EQ(reopened->get_notes(1), "Hello\n\nWorld");
}

TEST(PptxDeck, ClearingNotesLeavesAnEmptyBody) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path());
	const auto deck = pptx_deck::open(file.get_path(), no_wait);
	deck->set_notes(1, "");
	EXPECT_EQ(deck->get_notes(1), "");
}

TEST(PptxDeck, AddingNotesWithoutANotesMasterFails) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path(), {false, false});
	const auto deck = pptx_deck::open(file.get_path(), no_wait);
	try {
		deck->set_notes(2, "Cannot land anywhere");
		FAIL() << "expected a collaborator_failure error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::collaborator_failure);
	}
	EXPECT_NO_THROW(deck->set_notes(1, "Existing notes page still works"));
}

TEST(PptxDeck, OutOfRangeSlidesAreCollaboratorFailures) {
	const temp_file file("pptx");
	write_sample_deck(file.get_path());
	const auto deck = pptx_deck::open(file.get_path(), no_wait);
	EXPECT_THROW(deck->set_notes(3, "x"), sync_exception);
	EXPECT_THROW(static_cast<void>(deck->get_notes(0)), sync_exception);
}

TEST(DeckSession, RejectsNonPresentationFiles) {
	deck_session session("notes.docx", no_wait);
	try {
		session.open();
		FAIL() << "expected an unsupported_format error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::unsupported_format);
	}
	EXPECT_FALSE(session.is_open());
}

TEST(DeckSession, DeckIsOnlyAvailableWhileOpen) {
	const temp_file file("pptm");
	write_sample_deck(file.get_path());
	deck_session session(file.get_path(), no_wait);
	EXPECT_THROW(static_cast<void>(session.deck()), sync_exception);
	session.open();
	ASSERT_TRUE(session.is_open());
	EXPECT_EQ(session.deck().slide_count(), 2);
	session.close();
	EXPECT_FALSE(session.is_open());
	EXPECT_THROW(static_cast<void>(session.deck()), sync_exception);
}
