/*
 * ansirenderer.h — TextStructure → ANSI SGR terminal output
 *
 * Formatting instructions may overlap; every cell gets the union of the
 * attributes of all instructions covering it.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_ANSIRENDERER_H
#define TERMREADER_ANSIRENDERER_H

#include <QList>
#include <QString>
#include <QStringList>

#include "textmodel.h"

namespace AnsiRenderer {

// Render one line. `styles` are the instructions of that line's row;
// parts reaching past the end of the line are ignored.
QString renderLine(const QString &line, const QList<TextModel::InlineStyle> &styles);

// Render rows [firstRow, firstRow + count) of a structure whose first
// line has row number `startingLine`. A negative count renders to the end.
QStringList render(const TextModel::TextStructure &structure, int startingLine = 0,
                   int firstRow = 0, int count = -1);

} // namespace AnsiRenderer

#endif // TERMREADER_ANSIRENDERER_H
