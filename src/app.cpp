/* app.cpp - wxAppConsole implementation code.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "app.hpp"
#include "constants.hpp"
#include "deck_session.hpp"
#include "notes_sync.hpp"
#include "sync_exception.hpp"
#include "utils.hpp"
#include <exception>
#include <optional>
#include <set>
#include <vector>
#include <wx/cmdline.h>
#include <wx/crt.h>
#include <wx/log.h>
#include <wx/string.h>
#include <wx/translation.h>

namespace {
const wxCmdLineEntryDesc command_line_desc[] = {
	{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
	{wxCMD_LINE_SWITCH, "v", "verbose", "log per-slide detail", wxCMD_LINE_VAL_NONE, 0},
	{wxCMD_LINE_OPTION, nullptr, "slides", "only import these slides, e.g. 2,5,7", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, nullptr, "font", "font name for Word exports", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_OPTION, nullptr, "font-size", "font size in points for Word exports", wxCMD_LINE_VAL_NUMBER, 0},
	{wxCMD_LINE_OPTION, nullptr, "config", "use this configuration file", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "export|import|preview", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "deck.pptx", wxCMD_LINE_VAL_STRING, 0},
	{wxCMD_LINE_PARAM, nullptr, nullptr, "notes file (.docx, .txt, .md)", wxCMD_LINE_VAL_STRING, 0},
	wxCMD_LINE_DESC_END,
};

wxString join_slide_numbers(const std::vector<int>& slides) {
	wxString result;
	for (const int slide : slides) {
		if (!result.IsEmpty()) {
			result += ", ";
		}
		result << slide;
	}
	return result.IsEmpty() ? wxString(_("none")) : result;
}
} // namespace

bool app::OnInit() {
	// Command line handling happens in OnRun so usage errors can set the exit code.
	delete wxLog::SetActiveTarget(new wxLogStderr());
	wxLog::DisableTimestamp();
	return true;
}

int app::OnRun() {
	wxCmdLineParser parser(command_line_desc, argc, argv);
	parser.SetLogo(wxString::Format("%s %s\n%s", APP_NAME, APP_VERSION, _("Round-trips PowerPoint speaker notes through an editable document.")));
	switch (parser.Parse()) {
		case -1:
			return 0;
		case 0:
			break;
		default:
			return EXIT_USAGE_ERROR;
	}
	wxString config_path;
	parser.Found("config", &config_path);
	if (!config_mgr.initialize(config_path)) {
		wxLogError(_("Failed to initialize configuration"));
		return EXIT_FATAL_ERROR;
	}
	if (parser.Found("verbose") || config_mgr.get(config_manager::verbose_logging)) {
		wxLog::SetVerbose(true);
	}
	try {
		return run_command(parser);
	} catch (const sync_exception& e) {
		wxLogError("%s", e.get_display_message());
	} catch (const std::exception& e) {
		wxLogError("%s", wxString::FromUTF8(e.what()));
	}
	return EXIT_FATAL_ERROR;
}

int app::OnExit() {
	config_mgr.shutdown();
	return wxAppConsole::OnExit();
}

int app::run_command(const wxCmdLineParser& parser) {
	const wxString command = parser.GetParam(0).Lower();
	const wxString deck_path = parser.GetParam(1);
	const wxString file_path = parser.GetParam(2);
	if (command == "export") {
		format_options options = config_mgr.get_format_options();
		wxString font_name;
		if (parser.Found("font", &font_name) && !font_name.IsEmpty()) {
			options.font_name = font_name;
		}
		long font_size{0};
		if (parser.Found("font-size", &font_size)) {
			if (font_size < 1 || font_size > 400) {
				wxLogError(_("Invalid font size: %ld"), font_size);
				return EXIT_USAGE_ERROR;
			}
			options.font_size = static_cast<int>(font_size);
		}
		run_export(deck_path, file_path, options);
		return 0;
	}
	if (command == "preview") {
		run_preview(deck_path, file_path);
		return 0;
	}
	if (command == "import") {
		std::optional<std::set<int>> allowed_slides;
		wxString slide_list;
		if (parser.Found("slides", &slide_list)) {
			allowed_slides = parse_slide_list(slide_list);
			if (!allowed_slides) {
				wxLogError(_("Invalid slide list '%s'; expected numbers like 2,5,7"), slide_list);
				return EXIT_USAGE_ERROR;
			}
		}
		run_import(deck_path, file_path, allowed_slides);
		return 0;
	}
	wxLogError(_("Unknown command: %s"), command);
	parser.Usage();
	return EXIT_USAGE_ERROR;
}

void app::run_export(const wxString& deck_path, const wxString& output_path, const format_options& options) {
	deck_session session(deck_path, config_mgr.get_retry_policy());
	session.open();
	export_notes(session.deck(), output_path, options);
	session.close();
	wxPrintf(_("\nCreated: %s\n"), output_path);
}

void app::run_preview(const wxString& deck_path, const wxString& edited_path) {
	deck_session session(deck_path, config_mgr.get_retry_policy());
	session.open();
	const auto changes = preview_notes(session.deck(), edited_path);
	session.close();
	if (changes.empty()) {
		wxPrintf(_("\nNo changes detected.\n"));
		return;
	}
	wxPrintf(_("\nFound %zu change(s):\n"), changes.size());
	for (const auto& change : changes) {
		if (change.slide_title.empty()) {
			wxPrintf("  Slide %d: %s\n", change.slide_number, change_type_name(change.type));
		} else {
			wxPrintf("  Slide %d (%s): %s\n", change.slide_number, wxString::FromUTF8(change.slide_title), change_type_name(change.type));
		}
	}
}

void app::run_import(const wxString& deck_path, const wxString& edited_path, const std::optional<std::set<int>>& allowed_slides) {
	deck_session session(deck_path, config_mgr.get_retry_policy());
	session.open();
	const import_result result = import_notes(session.deck(), edited_path, allowed_slides);
	session.close();
	wxPrintf(_("\nApplied to slides: %s\n"), join_slide_numbers(result.outcome.applied));
	if (!result.outcome.skipped.empty()) {
		wxPrintf(_("Skipped missing slides: %s\n"), join_slide_numbers(result.outcome.skipped));
	}
	if (result.outcome.has_errors()) {
		wxPrintf(_("Errors:\n"));
		for (const auto& error : result.outcome.errors) {
			wxPrintf("  Slide %d: %s\n", error.slide_number, error.message);
		}
	}
}

wxIMPLEMENT_APP_CONSOLE(app);
