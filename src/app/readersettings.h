/*
 * readersettings.h — Persistent layout defaults of the reader
 *
 * Stored in the "Layout" group of termreaderrc.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_READERSETTINGS_H
#define TERMREADER_READERSETTINGS_H

#include <QString>

#include <KSharedConfig>

#include "textmodel.h"

struct ReaderSettings {
    int textWidth = 80;
    TextModel::StyleAttr italicStyle = TextModel::StyleAttr::Italic;
    bool seamless = false;

    static ReaderSettings load(const KSharedConfigPtr &config = KSharedConfig::openConfig());
    void save(const KSharedConfigPtr &config = KSharedConfig::openConfig()) const;

    // "italic", "underline" or "normal"; ok is false for anything else
    static TextModel::StyleAttr italicStyleFromName(const QString &name, bool *ok = nullptr);
    static QString italicStyleName(TextModel::StyleAttr attr);

    // Attributes handed to the layout core
    TextModel::StyleAttributes styleAttributes() const;
};

#endif // TERMREADER_READERSETTINGS_H
