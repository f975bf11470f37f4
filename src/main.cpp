#include <cstdio>
#include <string>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFile>
#include <QString>
#include <QStringList>

#include "app/HandBatchParser.hpp"
#include "app/HandExporter.hpp"
#include "infra/ParserSettingsRepository.hpp"
#include "infra/stars/StarsHandStreamScanner.hpp"

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("phh-dump"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser cli;
    cli.setApplicationDescription(QStringLiteral("Parse PokerStars hand histories and print them as JSON."));
    cli.addHelpOption();
    cli.addVersionOption();

    const QCommandLineOption configOpt(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                       QStringLiteral("Parser settings JSON file."), QStringLiteral("file"));
    const QCommandLineOption headerOnlyOpt(QStringLiteral("header-only"),
                                           QStringLiteral("Parse only the header line of each hand."));
    const QCommandLineOption outputOpt(QStringList{QStringLiteral("o"), QStringLiteral("output")},
                                       QStringLiteral("Write JSON to this file instead of stdout."),
                                       QStringLiteral("file"));
    cli.addOption(configOpt);
    cli.addOption(headerOnlyOpt);
    cli.addOption(outputOpt);
    cli.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Hand history files."),
                              QStringLiteral("files..."));
    cli.process(app);

    const QStringList files = cli.positionalArguments();
    if (files.isEmpty()) {
        cli.showHelp(1);
    }

    phh::infra::stars::ParserSettings settings;
    if (cli.isSet(configOpt)) {
        phh::infra::ParserSettingsRepository repo(cli.value(configOpt).toStdString());
        settings = repo.load();
    }

    phh::app::HandBatchParser parser(settings);
    parser.setHeaderOnly(cli.isSet(headerOnlyOpt));

    phh::app::BatchResult result;
    bool fileErrors = false;

    for (const auto& path : files) {
        std::size_t index = result.total();
        const auto scan = phh::infra::stars::scanHandFile(
            path.toStdString(),
            [&](const phh::infra::stars::HandChunk& chunk, std::uint64_t, std::string*) {
                parser.parseOne(chunk.text, index++, result);
                return true;
            });
        if (!scan.ok) {
            qWarning() << "Cannot read hands from" << path << ":" << QString::fromStdString(scan.error);
            fileErrors = true;
            continue;
        }
        qDebug() << "Read" << scan.hands << "hands from" << path;
    }

    const QByteArray json = phh::app::HandExporter::toJson(result.hands).toJson(QJsonDocument::Indented);

    if (cli.isSet(outputOpt)) {
        QFile out(cli.value(outputOpt));
        if (!out.open(QIODevice::WriteOnly | QIODevice::Text)) {
            qWarning() << "Failed to write output:" << cli.value(outputOpt);
            return 2;
        }
        out.write(json);
        out.close();
    } else {
        std::fwrite(json.constData(), 1, static_cast<std::size_t>(json.size()), stdout);
    }

    if (!result.failures.empty()) {
        qWarning() << result.failures.size() << "of" << result.total() << "hands failed to parse";
    }
    return (fileErrors || !result.failures.empty()) ? 1 : 0;
}
