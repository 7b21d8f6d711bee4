/*
 * readersettings.cpp — Persistent layout defaults of the reader
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "readersettings.h"

#include <QDebug>

#include <KConfigGroup>

using TextModel::StyleAttr;

ReaderSettings ReaderSettings::load(const KSharedConfigPtr &config)
{
    KConfigGroup group(config, QStringLiteral("Layout"));

    ReaderSettings settings;
    settings.textWidth = group.readEntry("TextWidth", settings.textWidth);
    settings.seamless = group.readEntry("SeamlessBetweenChapters", settings.seamless);

    const QString style = group.readEntry("ItalicStyle", italicStyleName(settings.italicStyle));
    bool ok = false;
    const StyleAttr attr = italicStyleFromName(style, &ok);
    if (ok)
        settings.italicStyle = attr;
    else
        qWarning() << "ReaderSettings: unknown ItalicStyle" << style << "- using italic";

    if (settings.textWidth <= 0) {
        qWarning() << "ReaderSettings: invalid TextWidth" << settings.textWidth << "- using 80";
        settings.textWidth = 80;
    }

    return settings;
}

void ReaderSettings::save(const KSharedConfigPtr &config) const
{
    KConfigGroup group(config, QStringLiteral("Layout"));
    group.writeEntry("TextWidth", textWidth);
    group.writeEntry("ItalicStyle", italicStyleName(italicStyle));
    group.writeEntry("SeamlessBetweenChapters", seamless);
    group.sync();
}

StyleAttr ReaderSettings::italicStyleFromName(const QString &name, bool *ok)
{
    const QString key = name.trimmed().toLower();
    bool known = true;
    StyleAttr attr = StyleAttr::Italic;

    if (key == QLatin1String("underline"))
        attr = StyleAttr::Underline;
    else if (key == QLatin1String("normal"))
        attr = StyleAttr::Normal;
    else if (key != QLatin1String("italic"))
        known = false;

    if (ok)
        *ok = known;
    return attr;
}

QString ReaderSettings::italicStyleName(StyleAttr attr)
{
    switch (attr) {
    case StyleAttr::Underline:
        return QStringLiteral("underline");
    case StyleAttr::Normal:
        return QStringLiteral("normal");
    case StyleAttr::Italic:
    case StyleAttr::Bold:
        break;
    }
    return QStringLiteral("italic");
}

TextModel::StyleAttributes ReaderSettings::styleAttributes() const
{
    TextModel::StyleAttributes attributes;
    attributes.italic = TextModel::italicAttribute(italicStyle == StyleAttr::Italic,
                                                   italicStyle != StyleAttr::Normal);
    return attributes;
}
