/* docx_format.cpp - reading and writing of Word notes documents.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "docx_format.hpp"
#include "constants.hpp"
#include "slide_header.hpp"
#include "sync_exception.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstddef>
#include <pugixml.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <wx/mstream.h>
#include <wx/string.h>
#include <wx/translation.h>

inline const char* WORDML_NS = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";
inline const char* REL_NS = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
inline const char* PACKAGE_REL_NS = "http://schemas.openxmlformats.org/package/2006/relationships";
inline const char* CONTENT_TYPES_NS = "http://schemas.openxmlformats.org/package/2006/content-types";

namespace {
constexpr int TWIPS_PER_POINT = 20;
constexpr int HALF_POINTS_PER_POINT = 2;
constexpr int HEADER_SIZE_BOOST = 2;
constexpr int RULE_FONT_SIZE = 10;
constexpr int LINE_SPACING_ONE_AND_HALF = 360;

struct paragraph_style {
	bool bold{false};
	bool italic{false};
	int font_size{0}; // Points; 0 inherits the Normal style.
	int space_before{-1}; // Points; negative inherits.
	int space_after{-1};
};

void add_declaration(pugi::xml_document& doc) {
	auto decl = doc.append_child(pugi::node_declaration);
	decl.append_attribute("version") = "1.0";
	decl.append_attribute("encoding") = "UTF-8";
	decl.append_attribute("standalone") = "yes";
}

void append_text_runs(pugi::xml_node run, const std::string& text) {
	size_t start = 0;
	while (start <= text.size()) {
		const size_t tab = text.find('\t', start);
		const std::string segment = text.substr(start, tab == std::string::npos ? std::string::npos : tab - start);
		if (!segment.empty()) {
			auto t = run.append_child("w:t");
			t.append_attribute("xml:space") = "preserve";
			t.text().set(segment.c_str());
		}
		if (tab == std::string::npos) {
			break;
		}
		run.append_child("w:tab");
		start = tab + 1;
	}
}

void append_paragraph(pugi::xml_node body, const std::string& text, const paragraph_style& style) {
	auto paragraph = body.append_child("w:p");
	if (style.space_before >= 0 || style.space_after >= 0) {
		auto spacing = paragraph.append_child("w:pPr").append_child("w:spacing");
		if (style.space_before >= 0) {
			spacing.append_attribute("w:before") = style.space_before * TWIPS_PER_POINT;
		}
		if (style.space_after >= 0) {
			spacing.append_attribute("w:after") = style.space_after * TWIPS_PER_POINT;
		}
	}
	if (text.empty()) {
		return;
	}
	auto run = paragraph.append_child("w:r");
	if (style.bold || style.italic || style.font_size > 0) {
		auto props = run.append_child("w:rPr");
		if (style.bold) {
			props.append_child("w:b");
		}
		if (style.italic) {
			props.append_child("w:i");
		}
		if (style.font_size > 0) {
			props.append_child("w:sz").append_attribute("w:val") = style.font_size * HALF_POINTS_PER_POINT;
			props.append_child("w:szCs").append_attribute("w:val") = style.font_size * HALF_POINTS_PER_POINT;
		}
	}
	append_text_runs(run, text);
}

std::string build_document_xml(const notes_snapshot& notes, const format_options& options) {
	pugi::xml_document doc;
	add_declaration(doc);
	auto root = doc.append_child("w:document");
	root.append_attribute("xmlns:w") = WORDML_NS;
	root.append_attribute("xmlns:r") = REL_NS;
	auto body = root.append_child("w:body");
	const paragraph_style header_style{true, false, options.font_size + HEADER_SIZE_BOOST, 18, 6};
	const paragraph_style rule_style{false, false, RULE_FONT_SIZE, -1, 12};
	const paragraph_style placeholder_style{false, true, 0, -1, -1};
	const paragraph_style spacer_style{false, false, 0, -1, 6};
	for (const auto& record : notes) {
		append_paragraph(body, format_slide_header(record), header_style);
		append_paragraph(body, make_rule(LIGHT_RULE_GLYPH, RULE_WIDTH), rule_style);
		const std::string notes_text = trim_string(sanitize_text(record.notes_text));
		if (notes_text.empty()) {
			append_paragraph(body, std::string(NO_NOTES_PLACEHOLDER), placeholder_style);
		} else {
			for (const auto& line : split_lines(notes_text)) {
				append_paragraph(body, line, paragraph_style{});
			}
		}
		append_paragraph(body, "", spacer_style);
	}
	auto section = body.append_child("w:sectPr");
	auto page_size = section.append_child("w:pgSz");
	page_size.append_attribute("w:w") = 12240;
	page_size.append_attribute("w:h") = 15840;
	auto margins = section.append_child("w:pgMar");
	for (const char* side : {"w:top", "w:right", "w:bottom", "w:left"}) {
		margins.append_attribute(side) = 1440;
	}
	margins.append_attribute("w:header") = 720;
	margins.append_attribute("w:footer") = 720;
	margins.append_attribute("w:gutter") = 0;
	return xml_to_string(doc);
}

std::string build_styles_xml(const format_options& options) {
	const std::string font = std::string(options.font_name.utf8_str());
	pugi::xml_document doc;
	add_declaration(doc);
	auto root = doc.append_child("w:styles");
	root.append_attribute("xmlns:w") = WORDML_NS;
	auto defaults = root.append_child("w:docDefaults");
	auto run_props = defaults.append_child("w:rPrDefault").append_child("w:rPr");
	auto fonts = run_props.append_child("w:rFonts");
	for (const char* slot : {"w:ascii", "w:hAnsi", "w:eastAsia", "w:cs"}) {
		fonts.append_attribute(slot) = font.c_str();
	}
	run_props.append_child("w:sz").append_attribute("w:val") = options.font_size * HALF_POINTS_PER_POINT;
	run_props.append_child("w:szCs").append_attribute("w:val") = options.font_size * HALF_POINTS_PER_POINT;
	auto spacing = defaults.append_child("w:pPrDefault").append_child("w:pPr").append_child("w:spacing");
	spacing.append_attribute("w:after") = 12 * TWIPS_PER_POINT;
	spacing.append_attribute("w:line") = LINE_SPACING_ONE_AND_HALF;
	spacing.append_attribute("w:lineRule") = "auto";
	auto normal = root.append_child("w:style");
	normal.append_attribute("w:type") = "paragraph";
	normal.append_attribute("w:default") = "1";
	normal.append_attribute("w:styleId") = "Normal";
	normal.append_child("w:name").append_attribute("w:val") = "Normal";
	normal.append_child("w:qFormat");
	return xml_to_string(doc);
}

std::string build_content_types_xml() {
	pugi::xml_document doc;
	add_declaration(doc);
	auto root = doc.append_child("Types");
	root.append_attribute("xmlns") = CONTENT_TYPES_NS;
	auto add_default = [&](const char* extension, const char* type) {
		auto node = root.append_child("Default");
		node.append_attribute("Extension") = extension;
		node.append_attribute("ContentType") = type;
	};
	auto add_override = [&](const char* part, const char* type) {
		auto node = root.append_child("Override");
		node.append_attribute("PartName") = part;
		node.append_attribute("ContentType") = type;
	};
	add_default("rels", "application/vnd.openxmlformats-package.relationships+xml");
	add_default("xml", "application/xml");
	add_override("/word/document.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml");
	add_override("/word/styles.xml", "application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml");
	return xml_to_string(doc);
}

std::string build_relationships_xml(const char* type, const char* target) {
	pugi::xml_document doc;
	add_declaration(doc);
	auto root = doc.append_child("Relationships");
	root.append_attribute("xmlns") = PACKAGE_REL_NS;
	auto rel = root.append_child("Relationship");
	rel.append_attribute("Id") = "rId1";
	rel.append_attribute("Type") = type;
	rel.append_attribute("Target") = target;
	return xml_to_string(doc);
}
} // namespace

std::string docx_format::serialize(const notes_snapshot& notes, const format_options& options) const {
	std::vector<zip_part> parts;
	parts.push_back({"[Content_Types].xml", build_content_types_xml()});
	parts.push_back({"_rels/.rels", build_relationships_xml("http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument", "word/document.xml")});
	parts.push_back({"word/_rels/document.xml.rels", build_relationships_xml("http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles", "styles.xml")});
	parts.push_back({"word/document.xml", build_document_xml(notes, options)});
	parts.push_back({"word/styles.xml", build_styles_xml(options)});
	wxMemoryOutputStream out;
	if (!write_zip_parts(out, parts)) {
		throw sync_exception(_("Failed to build Word document package"), sync_error_code::write_failure);
	}
	const auto size = static_cast<size_t>(out.GetSize());
	std::string bytes(size, '\0');
	if (size > 0) {
		out.CopyTo(bytes.data(), size);
	}
	return bytes;
}

notes_snapshot docx_format::parse(std::string_view content) const {
	wxMemoryInputStream stream(content.data(), content.size());
	const auto parts = read_zip_parts(stream);
	const auto doc_part = std::ranges::find(parts, std::string("word/document.xml"), &zip_part::name);
	if (doc_part == parts.end()) {
		throw sync_exception(_("Not a Word document: word/document.xml is missing"), sync_error_code::malformed_input);
	}
	pugi::xml_document doc;
	if (!doc.load_buffer(doc_part->data.data(), doc_part->data.size(), pugi::parse_default | pugi::parse_ws_pcdata)) {
		throw sync_exception(_("The Word document body could not be parsed"), sync_error_code::malformed_input);
	}
	std::vector<std::string> paragraphs;
	traverse(doc.document_element(), paragraphs);
	notes_collector collector({NO_NOTES_PLACEHOLDER});
	for (const auto& paragraph : paragraphs) {
		// A soft line break inside a paragraph still starts a new line of notes.
		for (const auto& line : split_lines(paragraph)) {
			if (is_rule_line(line)) {
				continue;
			}
			if (auto header = parse_slide_header(line)) {
				collector.begin_slide(std::move(*header));
				continue;
			}
			collector.add_line(line);
		}
	}
	return collector.finish();
}

void docx_format::traverse(pugi::xml_node node, std::vector<std::string>& paragraphs) {
	if (node == nullptr) {
		return;
	}
	if (node.type() == pugi::node_element && get_local_name(node.name()) == "p") {
		std::string text;
		collect_paragraph_text(node, text);
		paragraphs.push_back(std::move(text));
		return; // collect_paragraph_text handles its children
	}
	for (auto child : node.children()) {
		traverse(child, paragraphs);
	}
}

void docx_format::collect_paragraph_text(pugi::xml_node node, std::string& text) {
	for (auto child : node.children()) {
		if (child.type() != pugi::node_element) {
			continue;
		}
		const std::string local_name = get_local_name(child.name());
		if (local_name == "r") {
			text += get_run_text(child);
		} else if (local_name != "pPr" && local_name != "del") {
			// Hyperlinks, tracked insertions and content controls all wrap ordinary runs.
			collect_paragraph_text(child, text);
		}
	}
}

std::string docx_format::get_run_text(pugi::xml_node run_element) {
	std::string run_text;
	for (auto child : run_element.children()) {
		if (child.type() == pugi::node_element) {
			const std::string local_name = get_local_name(child.name());
			if (local_name == "t") {
				run_text += child.text().as_string();
			} else if (local_name == "tab") {
				run_text += "\t";
			} else if (local_name == "br" || local_name == "cr") {
				run_text += "\n";
			}
		}
	}
	return run_text;
}
