/* pptx_deck.cpp - deck backend over a PowerPoint package on disk.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "pptx_deck.hpp"
#include "constants.hpp"
#include "sync_exception.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <map>
#include <memory>
#include <numeric>
#include <optional>
#include <pugixml.hpp>
#include <ranges>
#include <string>
#include <utility>
#include <vector>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>
#include <wx/utils.h>
#include <wx/wfstream.h>

inline const char* PRESENTATION_PART = "ppt/presentation.xml";
inline const char* CONTENT_TYPES_PART = "[Content_Types].xml";
inline const char* SLIDE_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slide";
inline const char* NOTES_SLIDE_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/notesSlide";
inline const char* NOTES_MASTER_REL_TYPE = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/notesMaster";
inline const char* NOTES_SLIDE_CONTENT_TYPE = "application/vnd.openxmlformats-officedocument.presentationml.notesSlide+xml";

namespace {
constexpr unsigned int XML_LOAD_OPTIONS = pugi::parse_default | pugi::parse_declaration | pugi::parse_ws_pcdata;

const char* EMPTY_RELATIONSHIPS_XML = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
									  R"(<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships"/>)";

const char* EMPTY_NOTES_SLIDE_XML = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
									R"(<p:notes xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" )"
									R"(xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships" )"
									R"(xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main">)"
									R"(<p:cSld><p:spTree>)"
									R"(<p:nvGrpSpPr><p:cNvPr id="1" name=""/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>)"
									R"(<p:grpSpPr/>)"
									R"(<p:sp><p:nvSpPr><p:cNvPr id="2" name="Notes Placeholder 1"/>)"
									R"(<p:cNvSpPr><a:spLocks noGrp="1"/></p:cNvSpPr>)"
									R"(<p:nvPr><p:ph type="body" idx="1"/></p:nvPr></p:nvSpPr>)"
									R"(<p:spPr/><p:txBody><a:bodyPr/><a:lstStyle/><a:p/></p:txBody></p:sp>)"
									R"(</p:spTree></p:cSld>)"
									R"(<p:clrMapOvr><a:masterClrMapping/></p:clrMapOvr></p:notes>)";

std::string get_prefix(const char* qname) {
	const std::string name(qname == nullptr ? "" : qname);
	const size_t pos = name.find(':');
	return pos == std::string::npos ? std::string{} : name.substr(0, pos);
}

std::string qualify(const std::string& prefix, const char* local_name) {
	return prefix.empty() ? std::string(local_name) : prefix + ":" + local_name;
}

pugi::xml_node find_child_by_local_name(pugi::xml_node node, const char* local_name) {
	for (auto child : node.children()) {
		if (child.type() == pugi::node_element && get_local_name(child.name()) == local_name) {
			return child;
		}
	}
	return {};
}

int trailing_number(const std::string& s) {
	constexpr int decimal_base = 10;
	auto start_it = s.rfind('/') == std::string::npos ? s.begin() : s.begin() + static_cast<std::string::difference_type>(s.rfind('/'));
	auto digits_view = std::ranges::subrange(start_it, s.end()) | std::views::filter([](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
	return std::accumulate(digits_view.begin(), digits_view.end(), 0, [](int acc, char c) { return (acc * decimal_base) + (c - '0'); });
}

std::optional<std::vector<zip_part>> try_read_package(const wxString& path) {
	wxFileInputStream file_stream(path);
	if (!file_stream.IsOk()) {
		return std::nullopt;
	}
	auto parts = read_zip_parts(file_stream);
	if (parts.empty()) {
		return std::nullopt;
	}
	return parts;
}
} // namespace

pptx_deck::pptx_deck(const wxString& deck_path, std::vector<zip_part> package_parts) : path{deck_path}, parts{std::move(package_parts)} {
}

std::unique_ptr<pptx_deck> pptx_deck::open(const wxString& path, const retry_policy& policy) {
	if (!wxFileName::FileExists(path)) {
		throw sync_exception(_("Presentation not found"), path, sync_error_code::not_found);
	}
	const int max_attempts = std::max(policy.max_attempts, 1);
	std::optional<std::vector<zip_part>> parts;
	for (int attempt = 1; attempt <= max_attempts; ++attempt) {
		parts = try_read_package(path);
		if (parts) {
			break;
		}
		if (attempt < max_attempts) {
			wxLogWarning(_("Could not open %s (attempt %d of %d), retrying..."), path, attempt, max_attempts);
			wxMilliSleep(static_cast<unsigned long>(policy.delay.count()));
		}
	}
	if (!parts) {
		throw sync_exception(wxString::Format(_("Could not open the presentation after %d attempt(s)"), max_attempts), path, sync_error_code::collaborator_failure);
	}
	std::unique_ptr<pptx_deck> deck(new pptx_deck(path, std::move(*parts)));
	if (deck->find_part(PRESENTATION_PART) == nullptr) {
		throw sync_exception(_("Not a PowerPoint presentation: ppt/presentation.xml is missing"), path, sync_error_code::collaborator_failure);
	}
	deck->resolve_slide_order();
	wxLogVerbose("Opened %s with %d slide(s)", path, deck->slide_count());
	return deck;
}

std::string pptx_deck::get_notes(int slide_number) const {
	const std::string notes_name = find_related_part(slide_part(slide_number), "/notesSlide");
	if (notes_name.empty()) {
		return {};
	}
	pugi::xml_document notes_doc;
	if (!load_part_xml(notes_name, notes_doc)) {
		wxLogWarning(_("Slide %d: notes could not be read"), slide_number);
		return {};
	}
	const auto body = find_placeholder_shape(notes_doc, "body");
	if (!body) {
		return {};
	}
	return extract_text_body(body);
}

void pptx_deck::set_notes(int slide_number, const std::string& text) {
	const std::string& slide_name = slide_part(slide_number);
	std::string notes_name = find_related_part(slide_name, "/notesSlide");
	if (notes_name.empty() || find_part(notes_name) == nullptr) {
		notes_name = create_notes_slide(slide_name);
	}
	pugi::xml_document notes_doc;
	if (!load_part_xml(notes_name, notes_doc)) {
		throw sync_exception(wxString::Format(_("The notes of slide %d could not be parsed"), slide_number), path, sync_error_code::collaborator_failure);
	}
	auto body = find_placeholder_shape(notes_doc, "body");
	if (!body) {
		throw sync_exception(wxString::Format(_("The notes page of slide %d has no notes placeholder"), slide_number), path, sync_error_code::collaborator_failure);
	}
	const std::string shape_prefix = get_prefix(body.name());
	auto text_body = find_child_by_local_name(body, "txBody");
	if (!text_body) {
		text_body = body.append_child(qualify(shape_prefix, "txBody").c_str());
		text_body.append_child("a:bodyPr");
		text_body.append_child("a:lstStyle");
	}
	const auto body_props = find_child_by_local_name(text_body, "bodyPr");
	const std::string drawing_prefix = body_props ? get_prefix(body_props.name()) : std::string("a");
	std::vector<pugi::xml_node> old_paragraphs;
	for (auto child : text_body.children()) {
		if (child.type() == pugi::node_element && get_local_name(child.name()) == "p") {
			old_paragraphs.push_back(child);
		}
	}
	for (auto paragraph : old_paragraphs) {
		text_body.remove_child(paragraph);
	}
	for (const auto& line : split_lines(text)) {
		auto paragraph = text_body.append_child(qualify(drawing_prefix, "p").c_str());
		if (line.empty()) {
			continue;
		}
		auto run = paragraph.append_child(qualify(drawing_prefix, "r").c_str());
		run.append_child(qualify(drawing_prefix, "t").c_str()).text().set(line.c_str());
	}
	store_part_xml(notes_name, notes_doc);
	wxLogVerbose("Slide %d: wrote %zu chars of notes", slide_number, text.size());
}

std::string pptx_deck::get_title(int slide_number) const {
	pugi::xml_document slide_doc;
	if (!load_part_xml(slide_part(slide_number), slide_doc)) {
		wxLogWarning(_("Slide %d could not be parsed, skipping its title"), slide_number);
		return {};
	}
	return extract_slide_title(slide_doc);
}

void pptx_deck::persist() {
	if (!modified) {
		wxLogVerbose("No pending changes for %s", path);
		return;
	}
	const wxString temp_path = path + ".tmp";
	bool written{false};
	{
		wxFileOutputStream out(temp_path);
		written = out.IsOk() && write_zip_parts(out, parts) && out.Close();
	}
	if (!written) {
		wxRemoveFile(temp_path);
		throw sync_exception(_("Failed to write the updated presentation"), path, sync_error_code::collaborator_failure);
	}
	if (!wxRenameFile(temp_path, path, true)) {
		wxRemoveFile(temp_path);
		throw sync_exception(_("Failed to replace the presentation; is it open in another program?"), path, sync_error_code::collaborator_failure);
	}
	modified = false;
	wxLogVerbose("Saved %s", path);
}

void pptx_deck::resolve_slide_order() {
	slide_parts.clear();
	pugi::xml_document presentation;
	if (load_part_xml(PRESENTATION_PART, presentation)) {
		std::map<std::string, std::string> slide_targets;
		for (const auto& rel : read_relationships(PRESENTATION_PART)) {
			if (rel.type == SLIDE_REL_TYPE) {
				slide_targets[rel.id] = rel.target;
			}
		}
		const auto id_list = presentation.select_nodes("//*[local-name()='sldIdLst']/*[local-name()='sldId']");
		for (const auto& node : id_list) {
			for (auto attribute : node.node().attributes()) {
				const std::string name = attribute.name();
				if (name.find(':') == std::string::npos || get_local_name(name.c_str()) != "id") {
					continue;
				}
				const auto it = slide_targets.find(attribute.as_string());
				if (it != slide_targets.end() && find_part(it->second) != nullptr) {
					slide_parts.push_back(it->second);
				}
			}
		}
	}
	if (!slide_parts.empty()) {
		return;
	}
	wxLogVerbose("Falling back to slide file order for %s", path);
	for (const auto& part : parts) {
		if (part.name.starts_with("ppt/slides/slide") && part.name.ends_with(".xml")) {
			slide_parts.push_back(part.name);
		}
	}
	std::ranges::sort(slide_parts, [](const std::string& a, const std::string& b) {
		return trailing_number(a) < trailing_number(b);
	});
}

const std::string& pptx_deck::slide_part(int slide_number) const {
	if (slide_number < 1 || slide_number > slide_count()) {
		throw sync_exception(wxString::Format(_("Slide %d does not exist"), slide_number), path, sync_error_code::collaborator_failure);
	}
	return slide_parts[static_cast<size_t>(slide_number - 1)];
}

const zip_part* pptx_deck::find_part(const std::string& name) const {
	const auto it = std::ranges::find(parts, name, &zip_part::name);
	return it == parts.end() ? nullptr : &*it;
}

zip_part* pptx_deck::find_part(const std::string& name) {
	const auto it = std::ranges::find(parts, name, &zip_part::name);
	return it == parts.end() ? nullptr : &*it;
}

bool pptx_deck::load_part_xml(const std::string& name, pugi::xml_document& doc) const {
	const auto* part = find_part(name);
	if (part == nullptr) {
		return false;
	}
	return static_cast<bool>(doc.load_buffer(part->data.data(), part->data.size(), XML_LOAD_OPTIONS));
}

void pptx_deck::store_part_xml(const std::string& name, const pugi::xml_document& doc) {
	std::string data = xml_to_string(doc);
	if (auto* part = find_part(name)) {
		part->data = std::move(data);
	} else {
		parts.push_back({name, std::move(data)});
	}
	modified = true;
}

std::vector<pptx_deck::relationship> pptx_deck::read_relationships(const std::string& part_name) const {
	std::vector<relationship> result;
	pugi::xml_document rels_doc;
	if (!load_part_xml(rels_part_for(part_name), rels_doc)) {
		return result;
	}
	for (auto rel : rels_doc.child("Relationships").children("Relationship")) {
		if (std::string(rel.attribute("TargetMode").as_string()) == "External") {
			continue;
		}
		result.push_back({rel.attribute("Id").as_string(), rel.attribute("Type").as_string(), resolve_target(part_name, rel.attribute("Target").as_string())});
	}
	return result;
}

std::string pptx_deck::find_related_part(const std::string& part_name, const char* type_suffix) const {
	for (const auto& rel : read_relationships(part_name)) {
		if (rel.type.ends_with(type_suffix)) {
			return rel.target;
		}
	}
	return {};
}

std::string pptx_deck::create_notes_slide(const std::string& slide_name) {
	const std::string master_name = find_related_part(PRESENTATION_PART, "/notesMaster");
	if (master_name.empty() || find_part(master_name) == nullptr) {
		throw sync_exception(_("The presentation has no notes master, so notes cannot be added to a slide without them"), path, sync_error_code::collaborator_failure);
	}
	const std::string notes_name = next_part_name("ppt/notesSlides/notesSlide");
	add_content_type_override("/" + notes_name, NOTES_SLIDE_CONTENT_TYPE);
	pugi::xml_document notes_doc;
	notes_doc.load_string(EMPTY_NOTES_SLIDE_XML, XML_LOAD_OPTIONS);
	store_part_xml(notes_name, notes_doc);
	add_relationship(notes_name, NOTES_MASTER_REL_TYPE, master_name);
	add_relationship(notes_name, SLIDE_REL_TYPE, slide_name);
	add_relationship(slide_name, NOTES_SLIDE_REL_TYPE, notes_name);
	wxLogVerbose("Created %s for %s", notes_name, slide_name);
	return notes_name;
}

std::string pptx_deck::next_part_name(const std::string& prefix) const {
	int highest{0};
	for (const auto& part : parts) {
		if (part.name.starts_with(prefix) && part.name.ends_with(".xml")) {
			highest = std::max(highest, trailing_number(part.name));
		}
	}
	return prefix + std::to_string(highest + 1) + ".xml";
}

void pptx_deck::add_relationship(const std::string& part_name, const char* type, const std::string& target_part) {
	const std::string rels_name = rels_part_for(part_name);
	pugi::xml_document rels_doc;
	if (!load_part_xml(rels_name, rels_doc)) {
		rels_doc.reset();
		rels_doc.load_string(EMPTY_RELATIONSHIPS_XML, XML_LOAD_OPTIONS);
	}
	auto root = rels_doc.child("Relationships");
	int highest{0};
	for (auto rel : root.children("Relationship")) {
		const std::string id = rel.attribute("Id").as_string();
		if (id.starts_with("rId")) {
			highest = std::max(highest, trailing_number(id));
		}
	}
	const std::string id = "rId" + std::to_string(highest + 1);
	const std::string target = make_relative_target(part_name, target_part);
	auto rel = root.append_child("Relationship");
	rel.append_attribute("Id") = id.c_str();
	rel.append_attribute("Type") = type;
	rel.append_attribute("Target") = target.c_str();
	store_part_xml(rels_name, rels_doc);
}

void pptx_deck::add_content_type_override(const std::string& part_name, const char* content_type) {
	pugi::xml_document types_doc;
	if (!load_part_xml(CONTENT_TYPES_PART, types_doc)) {
		throw sync_exception(_("The presentation package has no readable content types"), path, sync_error_code::collaborator_failure);
	}
	auto override_node = types_doc.child("Types").append_child("Override");
	override_node.append_attribute("PartName") = part_name.c_str();
	override_node.append_attribute("ContentType") = content_type;
	store_part_xml(CONTENT_TYPES_PART, types_doc);
}

std::string pptx_deck::rels_part_for(const std::string& part_name) {
	const size_t slash = part_name.rfind('/');
	if (slash == std::string::npos) {
		return "_rels/" + part_name + ".rels";
	}
	return part_name.substr(0, slash) + "/_rels/" + part_name.substr(slash + 1) + ".rels";
}

std::string pptx_deck::resolve_target(const std::string& source_part, const std::string& target) {
	std::string combined;
	if (target.starts_with("/")) {
		combined = target.substr(1);
	} else {
		const size_t slash = source_part.rfind('/');
		combined = slash == std::string::npos ? target : source_part.substr(0, slash + 1) + target;
	}
	std::vector<std::string> segments;
	size_t start = 0;
	while (start <= combined.size()) {
		const size_t slash = combined.find('/', start);
		const std::string segment = combined.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
		if (segment == "..") {
			if (!segments.empty()) {
				segments.pop_back();
			}
		} else if (!segment.empty() && segment != ".") {
			segments.push_back(segment);
		}
		if (slash == std::string::npos) {
			break;
		}
		start = slash + 1;
	}
	std::string resolved;
	for (const auto& segment : segments) {
		if (!resolved.empty()) {
			resolved += '/';
		}
		resolved += segment;
	}
	return resolved;
}

std::string pptx_deck::make_relative_target(const std::string& source_part, const std::string& target_part) {
	auto directory_of = [](const std::string& part) {
		const size_t slash = part.rfind('/');
		return slash == std::string::npos ? std::string{} : part.substr(0, slash + 1);
	};
	const std::string source_dir = directory_of(source_part);
	const std::string target_dir = directory_of(target_part);
	size_t common = 0;
	for (size_t i = 0; i < source_dir.size() && i < target_dir.size() && source_dir[i] == target_dir[i]; ++i) {
		if (source_dir[i] == '/') {
			common = i + 1;
		}
	}
	std::string relative;
	const auto depth = std::ranges::count(source_dir.substr(common), '/');
	for (std::ptrdiff_t i = 0; i < depth; ++i) {
		relative += "../";
	}
	return relative + target_part.substr(common);
}

pugi::xml_node pptx_deck::find_placeholder_shape(pugi::xml_node root, const char* placeholder_type) {
	for (const auto& shape_node : root.select_nodes("//*[local-name()='sp']")) {
		const auto shape = shape_node.node();
		const auto placeholder = shape.find_node([](pugi::xml_node node) {
			return node.type() == pugi::node_element && get_local_name(node.name()) == "ph";
		});
		if (placeholder && std::string(placeholder.attribute("type").as_string()) == placeholder_type) {
			return shape;
		}
	}
	return {};
}

std::string pptx_deck::extract_slide_title(const pugi::xml_document& slide_doc) {
	if (slide_doc.empty()) {
		return {};
	}
	const auto shapes = slide_doc.select_nodes("//*[local-name()='sp']");
	std::string fallback;
	for (const auto& shape_node : shapes) {
		const auto shape = shape_node.node();
		const auto placeholder = shape.find_node([](pugi::xml_node node) {
			return node.type() == pugi::node_element && get_local_name(node.name()) == "ph";
		});
		const std::string type = placeholder ? placeholder.attribute("type").as_string() : "";
		const std::string text = trim_string(collapse_whitespace(extract_text_body(shape)));
		if (text.empty()) {
			continue;
		}
		if (type == "title" || type == "ctrTitle") {
			return text;
		}
		if (fallback.empty() && wxString::FromUTF8(text).length() < MAX_FALLBACK_TITLE_LENGTH) {
			fallback = text;
		}
	}
	return fallback;
}

std::string pptx_deck::extract_text_body(pugi::xml_node shape) {
	const auto text_body = find_child_by_local_name(shape, "txBody");
	if (!text_body) {
		return {};
	}
	std::vector<std::string> paragraphs;
	for (auto paragraph : text_body.children()) {
		if (paragraph.type() != pugi::node_element || get_local_name(paragraph.name()) != "p") {
			continue;
		}
		std::string text;
		for (auto node : paragraph.select_nodes(".//*")) {
			const std::string local_name = get_local_name(node.node().name());
			if (local_name == "t") {
				text += node.node().text().as_string();
			} else if (local_name == "br") {
				text += "\n";
			}
		}
		paragraphs.push_back(std::move(text));
	}
	return join_lines(paragraphs);
}
