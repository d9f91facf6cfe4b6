// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Tasklog Contributors

#include "tasklog/document.hpp"

#include <gtest/gtest.h>

#include <string>

namespace tasklog {
namespace {

class DocumentTest : public ::testing::Test {
protected:
    LineClassifier classifier_{DateFormat(), 6};

    LogDocument build(std::string_view content, std::size_t window = 5000) const {
        return DocumentBuilder(classifier_, window).build(content);
    }

    void expect_round_trip(std::string_view content, std::size_t window = 5000) const {
        EXPECT_EQ(build(content, window).serialize(), content);
    }
};

constexpr std::string_view kSample =
    "# Work log\n"
    "\n"
    "### 18/10/2026\n"
    "- [x] infra-1 rotate production credentials\n"
    "      - blocked on access request\n"
    "      - unblocked\n"
    "random thought\n"
    "- [ ] dev-1 implement login flow\n"
    "\n"
    "### 19/10/2026\n"
    "- [ ] dev-2 write tests\n";

// ============================================================================
// Structure
// ============================================================================

TEST_F(DocumentTest, BuildsSectionsTasksAndNotes) {
    auto doc = build(kSample);

    ASSERT_EQ(doc.preamble.size(), 2u);
    EXPECT_EQ(doc.preamble[0].text, "# Work log");
    ASSERT_EQ(doc.sections.size(), 2u);
    EXPECT_EQ(doc.task_count(), 3u);

    const auto& first = doc.sections[0];
    EXPECT_EQ(first.header, "### 18/10/2026");
    ASSERT_EQ(first.blocks.size(), 4u);

    const auto& infra = std::get<Task>(first.blocks[0]);
    EXPECT_EQ(infra.id.to_string(), "infra-1");
    EXPECT_EQ(infra.status, TaskStatus::Done);
    ASSERT_EQ(infra.notes.size(), 2u);
    EXPECT_EQ(infra.notes[1].text, "unblocked");

    EXPECT_EQ(std::get<Verbatim>(first.blocks[1]).text, "random thought");
    EXPECT_EQ(std::get<Task>(first.blocks[2]).title, "implement login flow");
}

TEST_F(DocumentTest, FindTask) {
    auto doc = build(kSample);
    auto* task = doc.find_task(TaskId{"dev", 2});
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->title, "write tests");
    EXPECT_EQ(doc.find_task(TaskId{"dev", 9}), nullptr);
}

TEST_F(DocumentTest, FindTaskPrefersLastOccurrence) {
    auto doc = build(
        "### 18/10/2026\n"
        "- [ ] dev-1 first copy\n"
        "### 19/10/2026\n"
        "- [ ] dev-1 second copy\n");
    auto* task = doc.find_task(TaskId{"dev", 1});
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->title, "second copy");
}

TEST_F(DocumentTest, FindSection) {
    auto doc = build(kSample);
    using namespace std::chrono;
    auto* section = doc.find_section(year_month_day{year{2026}, month{10}, day{19}});
    ASSERT_NE(section, nullptr);
    EXPECT_EQ(section->header, "### 19/10/2026");
    EXPECT_EQ(doc.find_section(year_month_day{year{2026}, month{10}, day{20}}), nullptr);
}

TEST_F(DocumentTest, TaskBeforeFirstHeaderIsNotModeled) {
    auto doc = build(
        "- [ ] dev-1 stray task\n"
        "      - stray note\n"
        "### 19/10/2026\n");
    EXPECT_EQ(doc.find_task(TaskId{"dev", 1}), nullptr);
    EXPECT_EQ(doc.preamble.size(), 2u);
}

TEST_F(DocumentTest, OrphanNoteStaysVerbatim) {
    auto doc = build(
        "### 19/10/2026\n"
        "- [ ] dev-1 task\n"
        "\n"
        "      - not attached\n");
    auto* task = doc.find_task(TaskId{"dev", 1});
    ASSERT_NE(task, nullptr);
    EXPECT_TRUE(task->notes.empty());
    EXPECT_EQ(std::get<Verbatim>(doc.sections[0].blocks.back()).text, "      - not attached");
}

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(DocumentTest, RoundTripSample) {
    expect_round_trip(kSample);
}

TEST_F(DocumentTest, RoundTripEmpty) {
    expect_round_trip("");
}

TEST_F(DocumentTest, RoundTripCrLf) {
    expect_round_trip(
        "### 19/10/2026\r\n"
        "- [ ] dev-1 task\r\n"
        "      - note\r\n"
        "prose\r\n");
}

TEST_F(DocumentTest, RoundTripMixedLineEndings) {
    expect_round_trip(
        "### 19/10/2026\n"
        "- [ ] dev-1 task\r\n"
        "      - note\n"
        "prose\r\n");
}

TEST_F(DocumentTest, RoundTripMissingFinalNewline) {
    expect_round_trip(
        "### 19/10/2026\n"
        "- [ ] dev-1 task\n"
        "      - last note");
}

TEST_F(DocumentTest, RoundTripNearMisses) {
    expect_round_trip(
        "### 19/10/2026 \n"
        "- [X] dev-1 upper marker\n"
        "- [ ] dev-01 leading zero\n"
        "    - short indent\n"
        "\t\ttabs\n"
        "trailing spaces   \n"
        "\n\n\n");
}

TEST_F(DocumentTest, NewlineDetection) {
    EXPECT_EQ(build("### 19/10/2026\r\n- [ ] dev-1 t\r\n").newline, "\r\n");
    EXPECT_EQ(build("### 19/10/2026\n").newline, "\n");
    EXPECT_EQ(build("no newline at all").newline, "\n");
}

// ============================================================================
// Scan Window
// ============================================================================

TEST_F(DocumentTest, WindowKeepsHeadOpaque) {
    std::string content =
        "### 18/10/2026\n"
        "- [ ] dev-1 old task\n"
        "### 19/10/2026\n"
        "- [ ] dev-2 new task\n";
    auto doc = build(content, 2);

    EXPECT_EQ(doc.head, "### 18/10/2026\n- [ ] dev-1 old task\n");
    EXPECT_EQ(doc.find_task(TaskId{"dev", 1}), nullptr);
    EXPECT_NE(doc.find_task(TaskId{"dev", 2}), nullptr);
    EXPECT_EQ(doc.serialize(), content);
}

TEST_F(DocumentTest, WindowStartingInsideNoteBlock) {
    std::string content =
        "### 19/10/2026\n"
        "- [ ] dev-1 task\n"
        "      - note one\n"
        "      - note two\n";
    auto doc = build(content, 2);

    EXPECT_TRUE(doc.sections.empty());
    ASSERT_EQ(doc.preamble.size(), 2u);
    EXPECT_EQ(doc.preamble[0].text, "      - note one");
    EXPECT_EQ(doc.serialize(), content);
}

TEST_F(DocumentTest, WindowLargerThanFile) {
    auto doc = build(kSample, 1000000);
    EXPECT_TRUE(doc.head.empty());
    EXPECT_EQ(doc.task_count(), 3u);
}

// ============================================================================
// Rendering
// ============================================================================

TEST_F(DocumentTest, RenderLines) {
    Task task;
    task.id = TaskId{"infra", 1};
    task.title = "rotate production credentials";
    EXPECT_EQ(render_task_line(task), "- [ ] infra-1 rotate production credentials");

    task.status = TaskStatus::Done;
    EXPECT_EQ(render_task_line(task), "- [x] infra-1 rotate production credentials");

    EXPECT_EQ(render_note_line(Note{"blocked on access request", "\n"}, 6),
              "      - blocked on access request");
}

TEST_F(DocumentTest, LastEolAndBlankTail) {
    auto doc = build("### 19/10/2026\n- [ ] dev-1 task");
    auto* eol = doc.last_eol();
    ASSERT_NE(eol, nullptr);
    EXPECT_TRUE(eol->empty());
    EXPECT_FALSE(doc.ends_with_blank_line());

    EXPECT_TRUE(build("text\n\n").ends_with_blank_line());
    EXPECT_TRUE(build("").ends_with_blank_line());
    EXPECT_EQ(build("").last_eol(), nullptr);
}

} // namespace
} // namespace tasklog
