#include <gtest/gtest.h>

#include "ansirenderer.h"
#include "testprinters.h"

using namespace TextModel;

TEST(AnsiRendererTest, PlainLineIsUnchanged) {
    EXPECT_EQ(AnsiRenderer::renderLine(QStringLiteral("plain"), {}), QStringLiteral("plain"));
}

TEST(AnsiRendererTest, OverlappingStylesAreCombined) {
    const QList<InlineStyle> styles = {
        InlineStyle{0, 0, 3, StyleAttr::Bold},
        InlineStyle{0, 2, 3, StyleAttr::Italic},
    };
    EXPECT_EQ(AnsiRenderer::renderLine(QStringLiteral("abc def"), styles),
              QStringLiteral("\x1b[1mab\x1b[0m\x1b[1;3mc\x1b[0m\x1b[3m d\x1b[0mef"));
}

TEST(AnsiRendererTest, StylesAreClippedToLine) {
    const QList<InlineStyle> styles = {InlineStyle{0, 1, 10, StyleAttr::Underline}};
    EXPECT_EQ(AnsiRenderer::renderLine(QStringLiteral("ab"), styles),
              QStringLiteral("a\x1b[4mb\x1b[0m"));
}

TEST(AnsiRendererTest, NormalAttributeAddsNothing) {
    const QList<InlineStyle> styles = {InlineStyle{0, 0, 2, StyleAttr::Normal}};
    EXPECT_EQ(AnsiRenderer::renderLine(QStringLiteral("ab"), styles), QStringLiteral("ab"));
}

TEST(AnsiRendererTest, RenderUsesRowNumbers) {
    TextStructure s;
    s.textLines = {QStringLiteral("first"), QStringLiteral("second")};
    s.formatting = {InlineStyle{11, 0, 3, StyleAttr::Bold}};

    const QStringList lines = AnsiRenderer::render(s, 10, 11, 1);
    EXPECT_EQ(lines, QStringList{QStringLiteral("\x1b[1msec\x1b[0mond")});

    const QStringList all = AnsiRenderer::render(s, 10);
    ASSERT_EQ(all.size(), 2);
    EXPECT_EQ(all[0], QStringLiteral("first"));
}
