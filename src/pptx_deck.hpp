/* pptx_deck.hpp - deck backend over a PowerPoint package on disk.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "deck_backend.hpp"
#include "utils.hpp"
#include <chrono>
#include <memory>
#include <pugixml.hpp>
#include <string>
#include <vector>
#include <wx/string.h>

struct retry_policy {
	int max_attempts{3};
	std::chrono::milliseconds delay{1500};
};

/* Keeps every part of a .pptx/.pptm package in memory.
 * Edits touch only the in-memory parts until persist() rewrites the file.
 */
class pptx_deck : public deck_backend {
public:
	~pptx_deck() override = default;
	pptx_deck(const pptx_deck&) = delete;
	pptx_deck& operator=(const pptx_deck&) = delete;
	pptx_deck(pptx_deck&&) = delete;
	pptx_deck& operator=(pptx_deck&&) = delete;

	[[nodiscard]] static std::unique_ptr<pptx_deck> open(const wxString& path, const retry_policy& policy = {});

	[[nodiscard]] int slide_count() const override {
		return static_cast<int>(slide_parts.size());
	}

	[[nodiscard]] std::string get_notes(int slide_number) const override;
	void set_notes(int slide_number, const std::string& text) override;
	[[nodiscard]] std::string get_title(int slide_number) const override;
	void persist() override;

	[[nodiscard]] const wxString& get_path() const noexcept {
		return path;
	}

	[[nodiscard]] bool is_modified() const noexcept {
		return modified;
	}

private:
	struct relationship {
		std::string id;
		std::string type;
		std::string target; // Resolved to a part name.
	};

	wxString path;
	std::vector<zip_part> parts;
	std::vector<std::string> slide_parts;
	bool modified{false};

	pptx_deck(const wxString& deck_path, std::vector<zip_part> package_parts);

	void resolve_slide_order();
	[[nodiscard]] const std::string& slide_part(int slide_number) const;
	[[nodiscard]] const zip_part* find_part(const std::string& name) const;
	[[nodiscard]] zip_part* find_part(const std::string& name);
	[[nodiscard]] bool load_part_xml(const std::string& name, pugi::xml_document& doc) const;
	void store_part_xml(const std::string& name, const pugi::xml_document& doc);
	[[nodiscard]] std::vector<relationship> read_relationships(const std::string& part_name) const;
	[[nodiscard]] std::string find_related_part(const std::string& part_name, const char* type_suffix) const;
	[[nodiscard]] std::string create_notes_slide(const std::string& slide_name);
	[[nodiscard]] std::string next_part_name(const std::string& prefix) const;
	void add_relationship(const std::string& part_name, const char* type, const std::string& target_part);
	void add_content_type_override(const std::string& part_name, const char* content_type);

	static std::string rels_part_for(const std::string& part_name);
	static std::string resolve_target(const std::string& source_part, const std::string& target);
	static std::string make_relative_target(const std::string& source_part, const std::string& target_part);
	static pugi::xml_node find_placeholder_shape(pugi::xml_node root, const char* placeholder_type);
	static std::string extract_slide_title(const pugi::xml_document& slide_doc);
	static std::string extract_text_body(pugi::xml_node shape);
};
