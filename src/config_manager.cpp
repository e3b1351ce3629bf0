/* config_manager.cpp - manages reading from and writing to our INI-based config file.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "constants.hpp"
#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <wx/filefn.h>
#include <wx/filename.h>
#include <wx/log.h>
#include <wx/stdpaths.h>
#include <wx/string.h>

namespace {
inline bool read_config_value(wxFileConfig* cfg, const wxString& key, bool default_val) {
	return cfg->ReadBool(key, default_val);
}

inline int read_config_value(wxFileConfig* cfg, const wxString& key, int default_val) {
	return static_cast<int>(cfg->ReadLong(key, default_val));
}

inline wxString read_config_value(wxFileConfig* cfg, const wxString& key, const wxString& default_val) {
	return cfg->Read(key, default_val);
}
} // namespace

config_manager::~config_manager() {
	if (config) {
		shutdown();
	}
}

bool config_manager::initialize(const wxString& config_path) {
	const wxString path = config_path.IsEmpty() ? get_default_config_path() : config_path;
	config = std::make_unique<wxFileConfig>(APP_NAME, "", path, "", wxCONFIG_USE_LOCAL_FILE);
	if (!config) {
		return false;
	}
	if (wxConfigBase::Get(false) == nullptr) {
		wxConfigBase::Set(config.get());
		owns_global_config = true;
	}
	load_defaults();
	wxLogVerbose("Using configuration file %s", path);
	return true;
}

void config_manager::flush() {
	if (!config) {
		return;
	}
	config->Flush();
}

void config_manager::shutdown() {
	if (!config) {
		return;
	}
	config->Flush();
	if (owns_global_config) {
		wxConfigBase::Set(nullptr);
		owns_global_config = false;
	}
	config.reset();
}

template <typename T>
T config_manager::get_app_setting(const wxString& key, const T& default_value) const {
	T result = default_value;
	with_app_section([this, &key, &default_value, &result]() {
		result = read_config_value(config.get(), key, default_value);
	});
	return result;
}

template <typename T>
void config_manager::set_app_setting(const wxString& key, const T& value) {
	with_app_section([this, &key, &value]() {
		config->Write(key, value);
	});
}

retry_policy config_manager::get_retry_policy() const {
	retry_policy policy;
	policy.max_attempts = std::max(get(retry_attempts), 1);
	policy.delay = std::chrono::milliseconds(std::max(get(retry_delay_ms), 0));
	return policy;
}

format_options config_manager::get_format_options() const {
	format_options options;
	const wxString font_name = get(docx_font_name).Strip(wxString::both);
	if (!font_name.IsEmpty()) {
		options.font_name = font_name;
	}
	const int font_size = get(docx_font_size);
	if (font_size > 0) {
		options.font_size = font_size;
	}
	return options;
}

wxString config_manager::get_default_config_path() {
	const wxString exe_path = wxStandardPaths::Get().GetExecutablePath();
	const wxString exe_dir = wxFileName(exe_path).GetPath();
	if (is_directory_writable(exe_dir)) {
		return exe_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
	}
	const wxString appdata_dir = wxStandardPaths::Get().GetUserDataDir();
	if (!wxFileName::DirExists(appdata_dir)) {
		wxFileName::Mkdir(appdata_dir, wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL);
	}
	return appdata_dir + wxFileName::GetPathSeparator() + APP_NAME + ".ini";
}

bool config_manager::is_directory_writable(const wxString& dir) {
	const wxFileName fn(dir, wxEmptyString);
	return fn.IsDirWritable();
}

void config_manager::load_defaults() {
	auto set_default_if_missing = [this](const auto& setting) {
		config->SetPath("/app");
		if (!config->HasEntry(setting.key)) {
			config->Write(setting.key, setting.default_value);
		}
		config->SetPath("/");
	};
	set_default_if_missing(retry_attempts);
	set_default_if_missing(retry_delay_ms);
	set_default_if_missing(docx_font_name);
	set_default_if_missing(docx_font_size);
	set_default_if_missing(verbose_logging);
	if (get(config_version) != CONFIG_VERSION_CURRENT) {
		set(config_version, static_cast<int>(CONFIG_VERSION_CURRENT));
	}
}

void config_manager::with_app_section(const std::function<void()>& func) const {
	if (!config) {
		return;
	}
	config->SetPath("/app");
	func();
	config->SetPath("/");
}

template bool config_manager::get_app_setting<bool>(const wxString&, const bool&) const;
template int config_manager::get_app_setting<int>(const wxString&, const int&) const;
template wxString config_manager::get_app_setting<wxString>(const wxString&, const wxString&) const;
template void config_manager::set_app_setting<bool>(const wxString&, const bool&);
template void config_manager::set_app_setting<int>(const wxString&, const int&);
template void config_manager::set_app_setting<wxString>(const wxString&, const wxString&);
