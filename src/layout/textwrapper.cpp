/*
 * textwrapper.cpp — Greedy monospace word wrapping
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textwrapper.h"

#include <QList>
#include <QRegularExpression>

namespace TextWrap {

static constexpr int kTabSize = 8;

static bool isWrapSpace(QChar c)
{
    switch (c.unicode()) {
    case ' ':
    case '\t':
    case '\n':
    case '\v':
    case '\f':
    case '\r':
        return true;
    default:
        return false;
    }
}

// Word characters that are not digits
static bool isLetter(const QString &s, int i)
{
    return i >= 0 && i < s.size() && (s[i].isLetter() || s[i] == QLatin1Char('_'));
}

static bool isHyphen(const QString &s, int i)
{
    return i >= 0 && i < s.size() && s[i] == QLatin1Char('-');
}

// "ab-|cd", "a-b-|cd", "ab-|c-d"; never "ab-|c"
static bool breaksAfterHyphen(const QString &s, int i)
{
    const bool before = (isLetter(s, i - 1) && isLetter(s, i - 2))
        || (isLetter(s, i - 1) && isHyphen(s, i - 2) && isLetter(s, i - 3));
    const bool after = isLetter(s, i + 1)
        && (isLetter(s, i + 2) || (isHyphen(s, i + 2) && isLetter(s, i + 3)));
    return before && after;
}

// UTF-16 length of the first `columns` code points of s
static int unitsFor(const QString &s, int columns)
{
    int i = 0;
    for (int n = 0; n < columns && i < s.size(); ++n) {
        if (s[i].isHighSurrogate() && i + 1 < s.size() && s[i + 1].isLowSurrogate())
            i += 2;
        else
            ++i;
    }
    return i;
}

int columnCount(const QString &text)
{
    int columns = static_cast<int>(text.size());
    for (int i = 1; i < text.size(); ++i) {
        if (text[i].isLowSurrogate() && text[i - 1].isHighSurrogate())
            --columns;
    }
    return columns;
}

// Tabs to spaces (column resets at line breaks), then every remaining
// whitespace character to a single space.
static QString normalizeWhitespace(const QString &text)
{
    QString result;
    result.reserve(text.size());
    int column = 0;
    for (const QChar c : text) {
        if (c == QLatin1Char('\t')) {
            const int pad = kTabSize - (column % kTabSize);
            result.append(QString(pad, QLatin1Char(' ')));
            column += pad;
        } else if (c == QLatin1Char('\n') || c == QLatin1Char('\r')) {
            result.append(QLatin1Char(' '));
            column = 0;
        } else {
            result.append(isWrapSpace(c) ? QLatin1Char(' ') : c);
            if (!c.isLowSurrogate())
                ++column;
        }
    }
    return result;
}

// Break a normalized text into whitespace runs and words; a word is
// further cut after each hyphen that sits between letters ("well-|known").
static QStringList chunksOf(const QString &text)
{
    QStringList chunks;
    int i = 0;
    const int len = text.size();

    while (i < len) {
        const int start = i;
        if (text[i] == QLatin1Char(' ')) {
            while (i < len && text[i] == QLatin1Char(' '))
                ++i;
            chunks.append(text.mid(start, i - start));
            continue;
        }

        int wordStart = start;
        while (i < len && text[i] != QLatin1Char(' ')) {
            if (text[i] == QLatin1Char('-') && breaksAfterHyphen(text, i)) {
                chunks.append(text.mid(wordStart, i + 1 - wordStart));
                wordStart = i + 1;
            }
            ++i;
        }
        chunks.append(text.mid(wordStart, i - wordStart));
    }

    return chunks;
}

static bool isBlank(const QString &chunk)
{
    return chunk.trimmed().isEmpty();
}

// The next chunk does not fit on any line: put as much of it as fits
// on the current one.
static void splitLongWord(QList<QString> &pending, QStringList &line, int lineLength, int width)
{
    const int spaceLeft = width < 1 ? 1 : width - lineLength;
    QString &chunk = pending.last();

    int end = unitsFor(chunk, spaceLeft);
    if (columnCount(chunk) > spaceLeft) {
        const int hyphen = end > 0 ? chunk.lastIndexOf(QLatin1Char('-'), end - 1) : -1;
        if (hyphen > 0) {
            const QString head = chunk.left(hyphen);
            bool onlyHyphens = true;
            for (const QChar c : head) {
                if (c != QLatin1Char('-')) {
                    onlyHyphens = false;
                    break;
                }
            }
            if (!onlyHyphens)
                end = hyphen + 1;
        }
    }

    line.append(chunk.left(end));
    chunk = chunk.mid(end);
}

QStringList wrap(const QString &text, int width)
{
    if (width < 1)
        width = 1;

    QStringList chunks = chunksOf(normalizeWhitespace(text));

    // Consumed from the back
    QList<QString> pending(chunks.crbegin(), chunks.crend());
    QStringList lines;

    while (!pending.isEmpty()) {
        QStringList line;
        int lineLength = 0;

        // Whitespace opening any line but the first is dropped
        if (isBlank(pending.last()) && !lines.isEmpty())
            pending.removeLast();

        while (!pending.isEmpty()) {
            const int l = columnCount(pending.last());
            if (lineLength + l > width)
                break;
            line.append(pending.takeLast());
            lineLength += l;
        }

        if (!pending.isEmpty() && columnCount(pending.last()) > width)
            splitLongWord(pending, line, lineLength, width);

        if (!line.isEmpty() && isBlank(line.last()))
            line.removeLast();

        if (!line.isEmpty())
            lines.append(line.join(QString()));
    }

    return lines;
}

QStringList splitLines(const QString &text)
{
    static const QRegularExpression breakRx(
        QStringLiteral("\\r\\n|[\\n\\r\\x{0b}\\x{0c}\\x{1c}\\x{1d}\\x{1e}\\x{85}\\x{2028}\\x{2029}]"));

    QStringList lines = text.split(breakRx);
    if (!lines.isEmpty() && lines.last().isEmpty())
        lines.removeLast();
    return lines;
}

} // namespace TextWrap
