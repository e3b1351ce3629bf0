/* test_notes_applier.cpp - tests for writing changes back through a deck backend.
 *
 * Slidenotes.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "notes_applier.hpp"
#include "sync_exception.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <set>
#include <vector>

namespace {
std::vector<change_record> three_changes() {
	return {
		{1, "", "a", "A", change_type::modified},
		{2, "", "b", "B", change_type::modified},
		{3, "", "", "C", change_type::added},
	};
}
} // namespace

TEST(ApplyNotes, WritesEveryChangeAndPersistsOnce) {
	fake_deck deck({{"", "a"}, {"", "b"}, {"", ""}});
	const auto outcome = apply_notes(deck, three_changes());
	EXPECT_EQ(outcome.applied, (std::vector<int>{1, 2, 3}));
	EXPECT_TRUE(outcome.skipped.empty());
	EXPECT_FALSE(outcome.has_errors());
	EXPECT_EQ(deck.slides[2].notes, "C");
	EXPECT_EQ(deck.persist_calls, 1);
}

TEST(ApplyNotes, OnlyAllowedSlidesAreAttempted) {
	fake_deck deck({{"", "a"}, {"", "b"}, {"", ""}});
	const auto outcome = apply_notes(deck, three_changes(), std::set<int>{2});
	EXPECT_EQ(deck.set_calls, std::vector<int>{2});
	EXPECT_EQ(outcome.applied, std::vector<int>{2});
	EXPECT_TRUE(outcome.skipped.empty());
	EXPECT_EQ(deck.slides[0].notes, "a");
}

TEST(ApplyNotes, NothingToApplyLeavesTheDeckUntouched) {
	fake_deck deck({{"", "a"}});
	const auto outcome = apply_notes(deck, three_changes(), std::set<int>{7});
	EXPECT_TRUE(outcome.applied.empty());
	EXPECT_TRUE(deck.set_calls.empty());
	EXPECT_EQ(deck.persist_calls, 0);
	EXPECT_EQ(apply_notes(deck, {}).applied.size(), 0U);
	EXPECT_EQ(deck.persist_calls, 0);
}

TEST(ApplyNotes, SlidesBeyondTheDeckAreSkipped) {
	fake_deck deck({{"", "a"}, {"", "b"}});
	const auto outcome = apply_notes(deck, three_changes());
	EXPECT_EQ(outcome.applied, (std::vector<int>{1, 2}));
	EXPECT_EQ(outcome.skipped, std::vector<int>{3});
	EXPECT_EQ(deck.persist_calls, 1);
}

TEST(ApplyNotes, PerSlideFailuresAreRecordedAndTheRestContinue) {
	fake_deck deck({{"", "a"}, {"", "b"}, {"", ""}});
	deck.failing_slides = {2};
	const auto outcome = apply_notes(deck, three_changes());
	EXPECT_EQ(outcome.applied, (std::vector<int>{1, 3}));
	ASSERT_EQ(outcome.errors.size(), 1U);
	EXPECT_EQ(outcome.errors[0].slide_number, 2);
	EXPECT_EQ(outcome.errors[0].message, "slide is locked");
	EXPECT_EQ(deck.persist_calls, 1);
}

TEST(ApplyNotes, PersistFailurePropagates) {
	fake_deck deck({{"", "a"}, {"", "b"}, {"", ""}});
	deck.fail_persist = true;
	try {
		static_cast<void>(apply_notes(deck, three_changes()));
		FAIL() << "expected a collaborator_failure error";
	} catch (const sync_exception& e) {
		EXPECT_EQ(e.get_error_code(), sync_error_code::collaborator_failure);
	}
}
