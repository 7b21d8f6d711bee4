#include <gtest/gtest.h>

#include <QTemporaryDir>

#include <KConfigGroup>

#include "readersettings.h"
#include "testprinters.h"

using TextModel::StyleAttr;

namespace {

KSharedConfigPtr configIn(const QTemporaryDir &dir)
{
    return KSharedConfig::openConfig(dir.filePath(QStringLiteral("termreaderrc")),
                                     KConfig::SimpleConfig);
}

} // namespace

TEST(ReaderSettingsTest, DefaultsWithoutConfig) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const ReaderSettings settings = ReaderSettings::load(configIn(dir));
    EXPECT_EQ(settings.textWidth, 80);
    EXPECT_EQ(settings.italicStyle, StyleAttr::Italic);
    EXPECT_FALSE(settings.seamless);
}

TEST(ReaderSettingsTest, SaveAndLoad) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    ReaderSettings settings;
    settings.textWidth = 60;
    settings.italicStyle = StyleAttr::Underline;
    settings.seamless = true;
    settings.save(configIn(dir));

    const ReaderSettings loaded = ReaderSettings::load(configIn(dir));
    EXPECT_EQ(loaded.textWidth, 60);
    EXPECT_EQ(loaded.italicStyle, StyleAttr::Underline);
    EXPECT_TRUE(loaded.seamless);
}

TEST(ReaderSettingsTest, InvalidValuesFallBack) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    const KSharedConfigPtr config = configIn(dir);
    KConfigGroup group(config, QStringLiteral("Layout"));
    group.writeEntry("TextWidth", -3);
    group.writeEntry("ItalicStyle", QStringLiteral("sparkly"));
    group.sync();

    const ReaderSettings loaded = ReaderSettings::load(config);
    EXPECT_EQ(loaded.textWidth, 80);
    EXPECT_EQ(loaded.italicStyle, StyleAttr::Italic);
}

TEST(ReaderSettingsTest, ItalicStyleNames) {
    bool ok = false;
    EXPECT_EQ(ReaderSettings::italicStyleFromName(QStringLiteral("Underline"), &ok),
              StyleAttr::Underline);
    EXPECT_TRUE(ok);
    EXPECT_EQ(ReaderSettings::italicStyleFromName(QStringLiteral("normal"), &ok), StyleAttr::Normal);
    EXPECT_TRUE(ok);
    ReaderSettings::italicStyleFromName(QStringLiteral("blink"), &ok);
    EXPECT_FALSE(ok);

    EXPECT_EQ(ReaderSettings::italicStyleName(StyleAttr::Normal), QStringLiteral("normal"));
}

TEST(ReaderSettingsTest, StyleAttributesFollowItalicStyle) {
    ReaderSettings settings;
    settings.italicStyle = StyleAttr::Underline;
    EXPECT_EQ(settings.styleAttributes().italic, StyleAttr::Underline);
    EXPECT_EQ(settings.styleAttributes().bold, StyleAttr::Bold);

    settings.italicStyle = StyleAttr::Normal;
    EXPECT_EQ(settings.styleAttributes().italic, StyleAttr::Normal);
}
