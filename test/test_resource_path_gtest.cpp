#include <gtest/gtest.h>

#include "resourcepath.h"
#include "testprinters.h"

TEST(ResourcePathTest, ParentDirectory) {
    EXPECT_EQ(resolveResourcePath(QStringLiteral("/aaa/bbb/book.html"), QStringLiteral("../ccc.png")),
              QStringLiteral("/aaa/ccc.png"));
}

TEST(ResourcePathTest, RelativeBaseStaysRelative) {
    EXPECT_EQ(resolveResourcePath(QStringLiteral("OEBPS/Text/ch1.xhtml"),
                                  QStringLiteral("../Images/a.png")),
              QStringLiteral("OEBPS/Images/a.png"));
    EXPECT_EQ(resolveResourcePath(QStringLiteral("OEBPS/Text/ch1.xhtml"), QStringLiteral("b.png")),
              QStringLiteral("OEBPS/Text/b.png"));
    EXPECT_EQ(resolveResourcePath(QStringLiteral("ch1.html"), QStringLiteral("img/a.png")),
              QStringLiteral("img/a.png"));
}

TEST(ResourcePathTest, AbsoluteReferenceIsKept) {
    EXPECT_EQ(resolveResourcePath(QStringLiteral("/x/y.html"), QStringLiteral("/abs/./a.png")),
              QStringLiteral("/abs/a.png"));
}
