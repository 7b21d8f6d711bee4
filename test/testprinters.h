/*
 * testprinters.h — GoogleTest printers for Qt and layout value types
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_TESTPRINTERS_H
#define TERMREADER_TESTPRINTERS_H

#include <QString>
#include <QStringList>

#include <ostream>

#include "textmodel.h"

inline void PrintTo(const QString &s, std::ostream *os)
{
    *os << '"' << s.toStdString() << '"';
}

inline void PrintTo(const QStringList &list, std::ostream *os)
{
    *os << '[';
    for (int i = 0; i < list.size(); ++i) {
        if (i > 0)
            *os << ", ";
        PrintTo(list[i], os);
    }
    *os << ']';
}

namespace TextModel {

inline void PrintTo(const CharPos &pos, std::ostream *os)
{
    *os << '(' << pos.row << ", " << pos.col << ')';
}

inline void PrintTo(const TextSpan &span, std::ostream *os)
{
    *os << "TextSpan(" << span.start.row << ", " << span.start.col << ", " << span.nLetters << ')';
}

inline void PrintTo(const InlineStyle &style, std::ostream *os)
{
    *os << "InlineStyle(" << style.row << ", " << style.col << ", " << style.nLetters << ", "
        << static_cast<int>(style.attr) << ')';
}

} // namespace TextModel

#endif // TERMREADER_TESTPRINTERS_H
