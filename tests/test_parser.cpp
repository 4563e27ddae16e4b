#include <gtest/gtest.h>
#include "../main/src/po_catalog.hpp"

TEST(ParserTest, ClassifyLines) {
    EXPECT_EQ(classify_line(""), LineKind::BLANK);
    EXPECT_EQ(classify_line("  \t\r"), LineKind::BLANK);
    EXPECT_EQ(classify_line("#: src/main.rs:12"), LineKind::COMMENT);
    EXPECT_EQ(classify_line("#~ msgid \"old\""), LineKind::COMMENT);
    EXPECT_EQ(classify_line("msgctxt \"menu\""), LineKind::MSGCTXT);
    EXPECT_EQ(classify_line("msgid \"Retry\""), LineKind::MSGID);
    EXPECT_EQ(classify_line("msgid_plural \"Retries\""), LineKind::MSGID_PLURAL);
    EXPECT_EQ(classify_line("msgstr \"\""), LineKind::MSGSTR);
    EXPECT_EQ(classify_line("msgstr[1] \"\""), LineKind::MSGSTR);
    EXPECT_EQ(classify_line("\"continued\""), LineKind::CONTINUATION);
    EXPECT_EQ(classify_line("garbage"), LineKind::OTHER);
    EXPECT_EQ(classify_line("msgid"), LineKind::OTHER);
}

TEST(ParserTest, TwoEntriesSeparatedByBlankLine) {
    auto catalog = parse_catalog(
        "msgid \"Warning\"\n"
        "msgstr \"\"\n"
        "\n"
        "msgid \"Info\"\n"
        "msgstr \"Information\"\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_EQ(catalog.entries[0].msgid(), "Warning");
    EXPECT_EQ(catalog.entries[0].msgstr(), "");
    EXPECT_EQ(catalog.entries[1].msgid(), "Info");
    EXPECT_EQ(catalog.entries[1].msgstr(), "Information");
    EXPECT_TRUE(catalog.trailing_lines.empty());
}

TEST(ParserTest, LeadingCommentsStayWithTheirEntry) {
    auto catalog = parse_catalog(
        "# Translator note\n"
        "#. Extracted note\n"
        "#: rustconn/src/window/ui.rs:42\n"
        "#, c-format\n"
        "msgid \"Retry\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    const auto& entry = catalog.entries[0];
    ASSERT_EQ(entry.comments.size(), 4u);
    EXPECT_EQ(entry.comments[0], "# Translator note");
    EXPECT_EQ(entry.comments[1], "#. Extracted note");
    EXPECT_EQ(entry.comments[2], "#: rustconn/src/window/ui.rs:42");
    EXPECT_EQ(entry.comments[3], "#, c-format");
}

TEST(ParserTest, MsgidAfterMsgstrWithoutBlankStartsNewEntry) {
    auto catalog = parse_catalog(
        "msgid \"A\"\n"
        "msgstr \"a\"\n"
        "msgid \"B\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_EQ(catalog.entries[0].msgid(), "A");
    EXPECT_EQ(catalog.entries[1].msgid(), "B");
}

TEST(ParserTest, CommentAfterMsgstrStartsNewEntry) {
    auto catalog = parse_catalog(
        "msgid \"A\"\n"
        "msgstr \"a\"\n"
        "#: file.rs:1\n"
        "msgid \"B\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_TRUE(catalog.entries[0].comments.empty());
    ASSERT_EQ(catalog.entries[1].comments.size(), 1u);
    EXPECT_EQ(catalog.entries[1].comments[0], "#: file.rs:1");
}

TEST(ParserTest, LastEntryWithoutTrailingNewlineIsKept) {
    auto catalog = parse_catalog("msgid \"A\"\nmsgstr \"a\"\n\nmsgid \"B\"\nmsgstr \"b\"");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_EQ(catalog.entries[1].msgstr(), "b");
}

TEST(ParserTest, ConsecutiveAndLeadingBlankLinesAreAbsorbed) {
    auto catalog = parse_catalog("\n\nmsgid \"A\"\nmsgstr \"a\"\n\n\n\nmsgid \"B\"\nmsgstr \"b\"\n\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_EQ(catalog.entries[0].msgid_lines.size(), 1u);
    EXPECT_EQ(catalog.entries[1].msgstr_lines.size(), 1u);
    EXPECT_TRUE(catalog.trailing_lines.empty());
}

TEST(ParserTest, ContinuationLinesAttachToActiveField) {
    auto catalog = parse_catalog(
        "msgid \"\"\n"
        "\"Part one \"\n"
        "\"part two\"\n"
        "msgstr \"\"\n"
        "\"Teil eins \"\n"
        "\"Teil zwei\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    const auto& entry = catalog.entries[0];
    EXPECT_EQ(entry.msgid_lines.size(), 3u);
    EXPECT_EQ(entry.msgstr_lines.size(), 3u);
    EXPECT_EQ(entry.msgid(), "Part one part two");
    EXPECT_EQ(entry.msgstr(), "Teil eins Teil zwei");
}

TEST(ParserTest, StrayContinuationOutsideFieldIsIgnored) {
    auto catalog = parse_catalog(
        "\"stray\"\n"
        "msgid \"A\"\n"
        "msgstr \"a\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    EXPECT_EQ(catalog.ignored_lines, 1u);
    EXPECT_EQ(catalog.entries[0].msgid(), "A");
}

TEST(ParserTest, CommentOnlyBlockIsNeverAStandaloneEntry) {
    auto catalog = parse_catalog(
        "# first block\n"
        "\n"
        "# second block\n"
        "msgid \"A\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    const auto& comments = catalog.entries[0].comments;
    ASSERT_EQ(comments.size(), 2u);
    EXPECT_EQ(comments[0], "# first block");
    EXPECT_EQ(comments[1], "# second block");
}

TEST(ParserTest, HeaderEntry) {
    auto catalog = parse_catalog(
        "msgid \"\"\n"
        "msgstr \"\"\n"
        "\"Project-Id-Version: rustconn 0.9.4\\n\"\n"
        "\"Content-Type: text/plain; charset=UTF-8\\n\"\n"
        "\n"
        "msgid \"Info\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    EXPECT_TRUE(catalog.entries[0].is_header());
    EXPECT_EQ(catalog.entries[0].msgstr_lines.size(), 3u);
    EXPECT_FALSE(catalog.entries[1].is_header());
}

TEST(ParserTest, PluralEntryKeepsAllLines) {
    auto catalog = parse_catalog(
        "msgid \"{} file\"\n"
        "msgid_plural \"{} files\"\n"
        "msgstr[0] \"\"\n"
        "msgstr[1] \"\"\n"
        "msgstr[2] \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    const auto& entry = catalog.entries[0];
    EXPECT_TRUE(entry.is_plural());
    EXPECT_EQ(entry.msgid(), "{} file");
    EXPECT_EQ(entry.msgid_plural_lines.size(), 1u);
    EXPECT_EQ(entry.msgstr_lines.size(), 3u);
}

TEST(ParserTest, MsgctxtBelongsToFollowingMsgid) {
    auto catalog = parse_catalog(
        "msgid \"A\"\n"
        "msgstr \"a\"\n"
        "msgctxt \"menu\"\n"
        "msgid \"Open\"\n"
        "msgstr \"\"\n");

    ASSERT_EQ(catalog.entries.size(), 2u);
    const auto& entry = catalog.entries[1];
    ASSERT_EQ(entry.msgctxt_lines.size(), 1u);
    EXPECT_EQ(entry.msgctxt_lines[0], "msgctxt \"menu\"");
    EXPECT_EQ(entry.msgid(), "Open");
}

TEST(ParserTest, TrailingObsoleteEntriesAreKept) {
    auto catalog = parse_catalog(
        "msgid \"A\"\n"
        "msgstr \"a\"\n"
        "\n"
        "#~ msgid \"Old\"\n"
        "#~ msgstr \"Alt\"\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    ASSERT_EQ(catalog.trailing_lines.size(), 2u);
    EXPECT_EQ(catalog.trailing_lines[0], "#~ msgid \"Old\"");
    EXPECT_EQ(catalog.trailing_lines[1], "#~ msgstr \"Alt\"");
}

TEST(ParserTest, CarriageReturnsStayInRawLines) {
    auto catalog = parse_catalog("msgid \"A\"\r\nmsgstr \"a\"\r\n");

    ASSERT_EQ(catalog.entries.size(), 1u);
    EXPECT_EQ(catalog.entries[0].msgid_lines[0], "msgid \"A\"\r");
    EXPECT_EQ(catalog.entries[0].msgid(), "A");
    EXPECT_EQ(catalog.entries[0].msgstr(), "a");
}

TEST(ParserTest, EmptyText) {
    auto catalog = parse_catalog("");
    EXPECT_TRUE(catalog.entries.empty());
    EXPECT_TRUE(catalog.trailing_lines.empty());
}
