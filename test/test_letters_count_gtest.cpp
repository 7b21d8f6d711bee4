#include <gtest/gtest.h>

#include "letterscount.h"
#include "testprinters.h"

TEST(LettersCountTest, WhitespaceIsNotCounted) {
    EXPECT_EQ(countLetters({QStringLiteral("a b"), QStringLiteral(" c\t"), QString()}), 3);
}

TEST(LettersCountTest, CumulativeCountsPerChapter) {
    const LettersCount counts = countBookLetters(
        {QStringLiteral("<p>abc def</p>"), QStringLiteral("<p>xy</p>"),
         QStringLiteral("<h1>z</h1>")});

    EXPECT_EQ(counts.all, 9);
    EXPECT_EQ(counts.cumulative, (QList<int>{0, 6, 8}));
}

TEST(LettersCountTest, HiddenContentDoesNotCount) {
    const LettersCount counts = countBookLetters(
        {QStringLiteral("<script>var hidden;</script><p>ab</p>")});
    EXPECT_EQ(counts.all, 2);
}

TEST(LettersCountTest, ReadingProgress) {
    LettersCount counts;
    counts.all = 10;
    counts.cumulative = {0, 6};

    const QStringList lines = {QStringLiteral("ab"), QStringLiteral("cd"), QString()};

    const std::optional<qreal> progress = readingProgress(counts, 1, lines, 1);
    ASSERT_TRUE(progress.has_value());
    EXPECT_DOUBLE_EQ(*progress, 0.8);

    // Past the end of the chapter counts the whole chapter
    EXPECT_DOUBLE_EQ(*readingProgress(counts, 1, lines, 50), 1.0);
}

TEST(LettersCountTest, NoProgressWithoutLetters) {
    EXPECT_FALSE(readingProgress(LettersCount{}, 0, {QStringLiteral("ab")}, 1).has_value());

    LettersCount counts;
    counts.all = 4;
    counts.cumulative = {0};
    EXPECT_FALSE(readingProgress(counts, 3, {QStringLiteral("ab")}, 1).has_value());
    EXPECT_FALSE(readingProgress(counts, -1, {QStringLiteral("ab")}, 1).has_value());
}
