/*
 * ansirenderer.cpp — TextStructure → ANSI SGR terminal output
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "ansirenderer.h"

#include <QHash>
#include <QtGlobal>

using TextModel::InlineStyle;
using TextModel::StyleAttr;

namespace AnsiRenderer {

enum CellFlag : quint8 {
    CellBold = 0x1,
    CellItalic = 0x2,
    CellUnderline = 0x4,
};

static quint8 flagFor(StyleAttr attr)
{
    switch (attr) {
    case StyleAttr::Bold:
        return CellBold;
    case StyleAttr::Italic:
        return CellItalic;
    case StyleAttr::Underline:
        return CellUnderline;
    case StyleAttr::Normal:
        break;
    }
    return 0;
}

static QString sgr(quint8 flags)
{
    if (flags == 0)
        return QStringLiteral("\x1b[0m");

    QStringList codes;
    if (flags & CellBold)
        codes << QStringLiteral("1");
    if (flags & CellItalic)
        codes << QStringLiteral("3");
    if (flags & CellUnderline)
        codes << QStringLiteral("4");
    return QStringLiteral("\x1b[") + codes.join(QLatin1Char(';')) + QLatin1Char('m');
}

QString renderLine(const QString &line, const QList<InlineStyle> &styles)
{
    const int length = static_cast<int>(line.size());
    QList<quint8> cells(length, 0);

    for (const InlineStyle &style : styles) {
        const quint8 flag = flagFor(style.attr);
        if (!flag)
            continue;
        const int from = qMax(style.col, 0);
        const int to = qMin(style.col + style.nLetters, length);
        for (int i = from; i < to; ++i)
            cells[i] |= flag;
    }

    QString out;
    quint8 active = 0;
    for (int i = 0; i < length; ++i) {
        if (cells[i] != active) {
            if (active != 0)
                out += sgr(0);
            if (cells[i] != 0)
                out += sgr(cells[i]);
            active = cells[i];
        }
        out += line[i];
    }
    if (active != 0)
        out += sgr(0);

    return out;
}

QStringList render(const TextModel::TextStructure &structure, int startingLine, int firstRow,
                   int count)
{
    QHash<int, QList<InlineStyle>> byRow;
    for (const InlineStyle &style : structure.formatting)
        byRow[style.row].append(style);

    const int total = static_cast<int>(structure.textLines.size());
    const int begin = qBound(0, firstRow - startingLine, total);
    const int end = count < 0 ? total : qMin(begin + count, total);

    QStringList lines;
    for (int i = begin; i < end; ++i)
        lines.append(renderLine(structure.textLines[i], byRow.value(startingLine + i)));
    return lines;
}

} // namespace AnsiRenderer
