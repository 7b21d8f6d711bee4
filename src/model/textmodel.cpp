/*
 * textmodel.cpp — Position, mark and span value types for laid-out text
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "textmodel.h"

namespace TextModel {

StyleAttr italicAttribute(bool hasItalic, bool hasUnderline)
{
    if (hasItalic)
        return StyleAttr::Italic;
    if (hasUnderline)
        return StyleAttr::Underline;
    return StyleAttr::Normal;
}

TextStructure mergeTextStructures(const TextStructure &first,
                                  const TextStructure &second)
{
    TextStructure merged = first;
    merged.textLines += second.textLines;
    merged.formatting += second.formatting;

    for (auto it = second.imageMaps.cbegin(); it != second.imageMaps.cend(); ++it)
        merged.imageMaps.insert(it.key(), it.value());
    for (auto it = second.sectionRows.cbegin(); it != second.sectionRows.cend(); ++it)
        merged.sectionRows.insert(it.key(), it.value());

    return merged;
}

} // namespace TextModel
