/*
 * main.cpp — html2vimdoc command line tool
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

#include "configloader.h"
#include "converter.h"
#include "markdownconverter.h"

#include <cstdio>

static int fail(const QString &message)
{
    QTextStream(stderr) << QCoreApplication::applicationName() << ": " << message << Qt::endl;
    return 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    KLocalizedString::setApplicationDomain("html2vimdoc");

    KAboutData aboutData(
        QStringLiteral("html2vimdoc"),
        i18n("html2vimdoc"),
        QStringLiteral("0.1.0"),
        i18n("Convert HTML and Markdown documents to Vim help files"),
        KAboutLicense::GPL_V2,
        i18n("(c) 2013-2026")
    );
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    aboutData.setupCommandLine(&parser);

    const QCommandLineOption fileOption({QStringLiteral("f"), QStringLiteral("file")},
        i18n("Name of the help file, embedded in its first line and used as tag prefix."),
        QStringLiteral("name"));
    const QCommandLineOption titleOption({QStringLiteral("t"), QStringLiteral("title")},
        i18n("Title of the help file (default: first <title> or <h1>)."),
        QStringLiteral("title"));
    const QCommandLineOption baseUrlOption({QStringLiteral("b"), QStringLiteral("base-url")},
        i18n("URL used to resolve relative links and images."),
        QStringLiteral("url"));
    const QCommandLineOption selectorOption({QStringLiteral("s"), QStringLiteral("selector")},
        i18n("Selector of the element holding the content (default: #content)."),
        QStringLiteral("css"));
    const QCommandLineOption ignoreOption({QStringLiteral("i"), QStringLiteral("ignore")},
        i18n("Leave out elements matching the selector; may be repeated."),
        QStringLiteral("css"));
    const QCommandLineOption configOption(QStringLiteral("config"),
        i18n("Read conversion options from an INI file ([Conversion] group)."),
        QStringLiteral("file"));
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
        i18n("Write the help file here instead of standard output."),
        QStringLiteral("file"));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"),
        i18n("Log the conversion steps to standard error."));

    parser.addOptions({fileOption, titleOption, baseUrlOption, selectorOption,
                       ignoreOption, configOption, outputOption, verboseOption});
    parser.addPositionalArgument(
        QStringLiteral("file"),
        i18n("HTML or Markdown file to convert (default: standard input)"),
        QStringLiteral("[file]"));
    parser.process(app);
    aboutData.processCommandLine(&parser);

    if (parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules(QStringLiteral("html2vimdoc.*.debug=true"));

    // Options: built-in defaults < configuration file < command line
    ConversionOptions options;
    if (parser.isSet(configOption)) {
        const Config::Result loaded = Config::load(parser.value(configOption), options);
        if (!loaded.valid)
            return fail(loaded.errorMessage);
        options = loaded.options;
    }
    if (parser.isSet(titleOption))
        options.title = parser.value(titleOption);
    if (parser.isSet(baseUrlOption))
        options.baseUrl = parser.value(baseUrlOption);
    if (parser.isSet(selectorOption))
        options.contentSelector = parser.value(selectorOption);
    if (parser.isSet(ignoreOption))
        options.selectorsToIgnore << parser.values(ignoreOption);

    // Input
    const QStringList args = parser.positionalArguments();
    if (args.size() > 1)
        return fail(i18n("Only one input file can be converted at a time"));

    QString path;
    QByteArray data;
    if (args.isEmpty()) {
        QFile in;
        if (!in.open(stdin, QIODevice::ReadOnly))
            return fail(i18n("Cannot read standard input"));
        data = in.readAll();
    } else {
        path = args.first();
        QFile in(path);
        if (!in.open(QIODevice::ReadOnly))
            return fail(i18n("Cannot open %1: %2", path, in.errorString()));
        data = in.readAll();
    }
    QString text = QString::fromUtf8(data);

    if (parser.isSet(fileOption))
        options.embeddedFilename = parser.value(fileOption);
    else if (options.embeddedFilename.isEmpty() && !path.isEmpty())
        options.embeddedFilename = QFileInfo(path).completeBaseName() + QStringLiteral(".txt");

    if (Markdown::looksLikeMarkdown(path, text)) {
        bool ok = false;
        text = Markdown::toHtml(text, &ok);
        if (!ok)
            return fail(i18n("Failed to convert Markdown input"));
    }

    const Convert::Result result = Convert::convertHtml(text, options);
    if (!result.valid)
        return fail(i18n("Conversion failed: %1", result.errorMessage));

    // Output
    const QByteArray output = result.text.toUtf8() + '\n';
    if (parser.isSet(outputOption)) {
        const QString outPath = parser.value(outputOption);
        QFile out(outPath);
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return fail(i18n("Cannot write %1: %2", outPath, out.errorString()));
        if (out.write(output) != output.size())
            return fail(i18n("Cannot write %1: %2", outPath, out.errorString()));
    } else {
        QFile out;
        if (!out.open(stdout, QIODevice::WriteOnly))
            return fail(i18n("Cannot write to standard output"));
        if (out.write(output) != output.size())
            return fail(i18n("Cannot write to standard output"));
    }
    return 0;
}
