#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include <algorithm>
#include <optional>
#include <utility>

#include "ansirenderer.h"
#include "booklayout.h"
#include "htmllayout.h"
#include "letterscount.h"
#include "readersettings.h"
#include "readingstate.h"
#include "resourcepath.h"

namespace {

struct Chapter {
    QString path;
    QString html;
};

bool readChapters(const QStringList &paths, QList<Chapter> *chapters)
{
    for (const QString &path : paths) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            qWarning() << "termreader: cannot open" << path << "-" << file.errorString();
            return false;
        }
        chapters->append(Chapter{path, QString::fromUtf8(file.readAll())});
    }
    return true;
}

bool parsePositive(const QString &value, int *out)
{
    bool ok = false;
    const int number = value.toInt(&ok);
    if (!ok || number <= 0)
        return false;
    *out = number;
    return true;
}

// Rows shown when a page height is given: `page` pages down from the top.
struct Window {
    int firstRow = 0;
    int count = -1;
};

Window pageWindow(int totalLines, int height, int page)
{
    if (height <= 0)
        return {};
    const int row = page > 0 ? Reading::pageDown(0, totalLines, height, page) : 0;
    return Window{row, height};
}

void printLines(QTextStream &out, const TextModel::TextStructure &structure, int startingLine,
                const Window &window, bool ansi)
{
    if (ansi) {
        const QStringList lines =
            AnsiRenderer::render(structure, startingLine, startingLine + window.firstRow, window.count);
        for (const QString &line : lines)
            out << line << '\n';
        return;
    }

    const int total = static_cast<int>(structure.textLines.size());
    const int end = window.count < 0 ? total : qMin(window.firstRow + window.count, total);
    for (int i = window.firstRow; i < end; ++i)
        out << structure.textLines[i] << '\n';
}

void printSections(QTextStream &err, const TextModel::TextStructure &structure,
                   const QStringList &sectionIds)
{
    for (const QString &id : sectionIds) {
        if (structure.sectionRows.contains(id))
            err << "section " << id << ": " << structure.sectionRows.value(id) << '\n';
        else
            err << "section " << id << ": not found" << '\n';
    }
}

void printImages(QTextStream &err, const TextModel::TextStructure &structure,
                 const QString &chapterPath)
{
    QList<int> rows = structure.imageMaps.keys();
    std::sort(rows.begin(), rows.end());
    for (int row : rows) {
        err << "image " << row << ": "
            << resolveResourcePath(chapterPath, structure.imageMaps.value(row)) << '\n';
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("termreader");

    KAboutData aboutData(
        QStringLiteral("termreader"),
        i18n("TermReader"),
        QStringLiteral("0.1.0"),
        i18n("Lays out HTML ebook chapters as styled terminal text"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2026")
    );
    aboutData.setOrganizationDomain("termreader.org");
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption widthOption(
        {QStringLiteral("w"), QStringLiteral("width")},
        i18n("Text width in columns."), QStringLiteral("columns"));
    const QCommandLineOption dumpOption(
        {QStringLiteral("d"), QStringLiteral("dump")},
        i18n("Print the raw paragraphs without layout."));
    const QCommandLineOption sectionOption(
        {QStringLiteral("s"), QStringLiteral("section")},
        i18n("Report the line of the element with this id (repeatable)."),
        QStringLiteral("id"));
    const QCommandLineOption seamlessOption(
        QStringLiteral("seamless"),
        i18n("Lay all files out as one continuous book."));
    const QCommandLineOption ansiOption(
        QStringLiteral("ansi"),
        i18n("Render bold and italic text with ANSI escape sequences."));
    const QCommandLineOption imagesOption(
        {QStringLiteral("i"), QStringLiteral("images")},
        i18n("List image placeholders with their resolved paths."));
    const QCommandLineOption heightOption(
        QStringLiteral("height"),
        i18n("Page height in rows; only one page is printed."), QStringLiteral("rows"));
    const QCommandLineOption pageOption(
        QStringLiteral("page"),
        i18n("Zero-based page to print when a height is given."), QStringLiteral("n"));
    const QCommandLineOption countOption(
        QStringLiteral("count-letters"),
        i18n("Print letter counts used for reading progress."));
    const QCommandLineOption saveOption(
        QStringLiteral("save-defaults"),
        i18n("Store width, italic style and seamless mode as defaults."));
    const QCommandLineOption italicOption(
        QStringLiteral("italic-style"),
        i18n("Attribute for italic text: italic, underline or normal."), QStringLiteral("style"));

    parser.addOptions({widthOption, dumpOption, sectionOption, seamlessOption, ansiOption,
                       imagesOption, heightOption, pageOption, countOption, saveOption,
                       italicOption});
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("HTML chapter files, in reading order"),
        QStringLiteral("file..."));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QTextStream out(stdout);
    QTextStream err(stderr);

    ReaderSettings settings = ReaderSettings::load();

    if (parser.isSet(widthOption) && !parsePositive(parser.value(widthOption), &settings.textWidth)) {
        qWarning() << "termreader: invalid width" << parser.value(widthOption);
        return 1;
    }
    if (parser.isSet(italicOption)) {
        bool ok = false;
        settings.italicStyle = ReaderSettings::italicStyleFromName(parser.value(italicOption), &ok);
        if (!ok) {
            qWarning() << "termreader: invalid italic style" << parser.value(italicOption);
            return 1;
        }
    }
    if (parser.isSet(seamlessOption))
        settings.seamless = true;

    int height = 0;
    if (parser.isSet(heightOption) && !parsePositive(parser.value(heightOption), &height)) {
        qWarning() << "termreader: invalid height" << parser.value(heightOption);
        return 1;
    }
    int page = 0;
    if (parser.isSet(pageOption)) {
        bool ok = false;
        page = parser.value(pageOption).toInt(&ok);
        if (!ok || page < 0) {
            qWarning() << "termreader: invalid page" << parser.value(pageOption);
            return 1;
        }
    }

    if (parser.isSet(saveOption))
        settings.save();

    const QStringList paths = parser.positionalArguments();
    if (paths.isEmpty()) {
        if (parser.isSet(saveOption))
            return 0;
        err << i18n("No input files.") << Qt::endl;
        parser.showHelp(1);
    }

    QList<Chapter> chapters;
    if (!readChapters(paths, &chapters))
        return 1;

    QStringList htmls;
    for (const Chapter &chapter : std::as_const(chapters))
        htmls << chapter.html;

    const QStringList sectionIds = parser.values(sectionOption);
    const TextModel::StyleAttributes attributes = settings.styleAttributes();

    if (parser.isSet(countOption)) {
        const LettersCount counts = countBookLetters(htmls);
        out << "letters: " << counts.all << '\n';
        for (int n = 0; n < counts.cumulative.size(); ++n)
            out << "  " << chapters[n].path << ": starts at " << counts.cumulative[n] << '\n';
        return 0;
    }

    if (parser.isSet(dumpOption)) {
        for (const QString &html : std::as_const(htmls)) {
            const QStringList paragraphs = HtmlLayout::parseParagraphs(html);
            for (const QString &paragraph : paragraphs)
                out << paragraph << "\n\n";
        }
        return 0;
    }

    const bool ansi = parser.isSet(ansiOption);

    if (settings.seamless) {
        QList<BookLayout::TocEntry> toc;
        for (int n = 0; n < chapters.size(); ++n)
            toc.append(BookLayout::TocEntry{QFileInfo(chapters[n].path).fileName(), n, QString()});
        for (const QString &id : sectionIds)
            toc.append(BookLayout::TocEntry{id, 0, id});

        const BookLayout::Result book =
            BookLayout::layoutChapters(htmls, settings.textWidth, toc, attributes);
        if (!book.valid) {
            err << book.errorMessage << '\n';
            return 1;
        }

        const int total = static_cast<int>(book.structure.textLines.size());
        const Window window = pageWindow(total, height, page);
        printLines(out, book.structure, 0, window, ansi);
        printSections(err, book.structure, sectionIds);
        if (parser.isSet(imagesOption))
            printImages(err, book.structure, chapters.first().path);

        if (height > 0) {
            Reading::ReadingState state;
            state.textWidth = settings.textWidth;
            state.row = window.firstRow;
            const Reading::ReadingState relative =
                Reading::toRelativeState(state, book.linesPerContent);
            const int tocIndex = Reading::findCurrentTocIndex(
                book.tocEntries, book.structure.sectionRows, 0, window.firstRow);
            err << "chapter " << relative.contentIndex + 1 << '/' << chapters.size()
                << ", row " << relative.row;
            if (tocIndex < book.tocEntries.size())
                err << ", " << book.tocEntries[tocIndex].label;
            err << '\n';
        }
        return 0;
    }

    const LettersCount counts = height > 0 ? countBookLetters(htmls) : LettersCount{};

    for (int n = 0; n < chapters.size(); ++n) {
        HtmlLayout::Options options;
        options.textWidth = settings.textWidth;
        options.sectionIds = QSet<QString>(sectionIds.cbegin(), sectionIds.cend());
        options.attributes = attributes;

        const HtmlLayout::Result result = HtmlLayout::parseHtml(chapters[n].html, options);
        if (!result.valid) {
            err << result.errorMessage << '\n';
            return 1;
        }

        const TextModel::TextStructure &structure = result.structure();
        const int total = static_cast<int>(structure.textLines.size());
        const Window window = pageWindow(total, height, page);
        printLines(out, structure, 0, window, ansi);
        printSections(err, structure, sectionIds);
        if (parser.isSet(imagesOption))
            printImages(err, structure, chapters[n].path);

        if (height > 0) {
            const std::optional<qreal> progress =
                readingProgress(counts, n, structure.textLines, window.firstRow + height);
            if (progress)
                err << chapters[n].path << ": " << qRound(*progress * 100) << "%\n";
        }
    }

    return 0;
}
