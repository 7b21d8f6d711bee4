#include <gtest/gtest.h>

#include "booklayout.h"
#include "testprinters.h"

using namespace TextModel;
using BookLayout::TocEntry;

TEST(BookLayoutTest, ChaptersShareOneLineSpace) {
    const QStringList chapters = {
        QStringLiteral("<p>one</p>"),
        QStringLiteral("<h1>Two</h1><p id=\"s\">x</p>"),
    };
    const QList<TocEntry> toc = {
        TocEntry{QStringLiteral("First"), 0, QString()},
        TocEntry{QStringLiteral("Second"), 1, QString()},
        TocEntry{QStringLiteral("Section"), 1, QStringLiteral("s")},
    };

    const BookLayout::Result book = BookLayout::layoutChapters(chapters, 20, toc);
    ASSERT_TRUE(book.valid);

    EXPECT_EQ(book.linesPerContent, (QList<int>{4, 7}));
    EXPECT_EQ(book.structure.textLines.size(), 11);
    EXPECT_EQ(book.structure.textLines[7], QStringLiteral("x"));

    // Heading of the second chapter, shifted past the first one
    EXPECT_TRUE(book.structure.formatting.contains(InlineStyle{4, 0, 20, StyleAttr::Bold}));
    EXPECT_EQ(book.structure.sectionRows.value(QStringLiteral("s")), 7);
}

TEST(BookLayoutTest, TocIsRewrittenToSingleContent) {
    const QStringList chapters = {QStringLiteral("<p>one</p>"), QStringLiteral("<p>two</p>")};
    const QList<TocEntry> toc = {
        TocEntry{QStringLiteral("First"), 0, QString()},
        TocEntry{QStringLiteral("Second"), 1, QString()},
    };

    const BookLayout::Result book = BookLayout::layoutChapters(chapters, 20, toc);
    ASSERT_EQ(book.tocEntries.size(), 2);

    for (const TocEntry &entry : book.tocEntries) {
        EXPECT_EQ(entry.contentIndex, 0);
        EXPECT_FALSE(entry.section.isEmpty());
    }
    EXPECT_NE(book.tocEntries[0].section, book.tocEntries[1].section);
    EXPECT_EQ(book.tocEntries[1].label, QStringLiteral("Second"));

    // Generated anchors point at the first line of their chapter
    EXPECT_EQ(book.structure.sectionRows.value(book.tocEntries[0].section), 0);
    EXPECT_EQ(book.structure.sectionRows.value(book.tocEntries[1].section),
              book.linesPerContent[0]);
}

TEST(BookLayoutTest, ZeroWidthIsRejected) {
    const BookLayout::Result book =
        BookLayout::layoutChapters({QStringLiteral("<p>one</p>")}, 0, {});
    EXPECT_FALSE(book.valid);
    EXPECT_FALSE(book.errorMessage.isEmpty());
}
