/*
 * tagclassifier.h — Map HTML tag names to the handful of classes the
 * collector cares about
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef TERMREADER_TAGCLASSIFIER_H
#define TERMREADER_TAGCLASSIFIER_H

#include <QStringView>

namespace Markup {

enum class TagClass {
    Heading,      // h1-h6
    Paragraph,    // p, div
    Indent,       // q, dt, dd, blockquote
    Preformatted, // pre
    Bullet,       // li
    Hidden,       // script, style, head
    Superscript,  // sup
    Subscript,    // sub
    Image,        // img, image (SVG)
    Italic,       // i, em
    Bold,         // b, strong
    LineBreak,    // br
    Other,
};

// Case-insensitive; namespace prefixes ("svg:image") are ignored.
TagClass classifyTag(QStringView name);

} // namespace Markup

#endif // TERMREADER_TAGCLASSIFIER_H
