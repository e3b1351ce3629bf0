/* app.hpp - wxAppConsole implementation header.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#pragma once
#include "config_manager.hpp"
#include "notes_format.hpp"
#include <optional>
#include <set>
#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/string.h>

class app : public wxAppConsole {
public:
	app() = default;
	~app() override = default;
	app(const app&) = delete;
	app& operator=(const app&) = delete;
	app(app&&) = delete;
	app& operator=(app&&) = delete;
	bool OnInit() override;
	int OnRun() override;
	int OnExit() override;

private:
	config_manager config_mgr;

	int run_command(const wxCmdLineParser& parser);
	void run_export(const wxString& deck_path, const wxString& output_path, const format_options& options);
	void run_preview(const wxString& deck_path, const wxString& edited_path);
	void run_import(const wxString& deck_path, const wxString& edited_path, const std::optional<std::set<int>>& allowed_slides);
};

wxDECLARE_APP(app);
