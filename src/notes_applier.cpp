/* notes_applier.cpp - writing approved note changes back to a presentation.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_applier.hpp"
#include "sync_exception.hpp"
#include <optional>
#include <set>
#include <vector>
#include <wx/log.h>
#include <wx/translation.h>

apply_outcome apply_notes(deck_backend& deck, const std::vector<change_record>& changes, const std::optional<std::set<int>>& allowed_slides) {
	std::vector<const change_record*> pending;
	for (const auto& change : changes) {
		if (!allowed_slides || allowed_slides->contains(change.slide_number)) {
			pending.push_back(&change);
		}
	}
	apply_outcome outcome;
	if (pending.empty()) {
		wxLogMessage(_("No changes to apply"));
		return outcome;
	}
	wxLogMessage(_("Applying changes to %zu slide(s)..."), pending.size());
	const int slide_count = deck.slide_count();
	for (const auto* change : pending) {
		const int slide_number = change->slide_number;
		if (slide_number < 1 || slide_number > slide_count) {
			outcome.skipped.push_back(slide_number);
			wxLogWarning(_("Slide %d: not in the presentation, skipped"), slide_number);
			continue;
		}
		try {
			deck.set_notes(slide_number, change->edited_notes);
			outcome.applied.push_back(slide_number);
			wxLogVerbose("  Slide %d: updated", slide_number);
		} catch (const sync_exception& e) {
			outcome.errors.push_back({slide_number, e.get_message()});
			wxLogWarning(_("Slide %d: %s"), slide_number, e.get_message());
		}
	}
	deck.persist();
	wxLogMessage(_("Applied changes to %zu slide(s)"), outcome.applied.size());
	return outcome;
}
