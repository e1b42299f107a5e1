#include "engineconfig.h"
#include "logging.h"
#include "passwordservice.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSettings>
#include <QTextStream>
#include <QtConcurrent/QtConcurrent>

#include <cstdio>

namespace {

const int EXIT_FAILED_REQUEST = 1;
const int EXIT_USAGE = 2;

QStringList readPasswords() {
    QStringList passwords;
    QTextStream in(stdin);
    QString line;
    while (in.readLineInto(&line)) {
        if (!line.isEmpty()) passwords.append(line);
    }
    return passwords;
}

void printJson(const QJsonDocument& document, bool compact) {
    QTextStream out(stdout);
    out << document.toJson(compact ? QJsonDocument::Compact : QJsonDocument::Indented);
    if (compact) out << '\n';
}

bool succeeded(const QJsonObject& envelope) {
    return envelope.value("success").toBool();
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("passlab");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Password Security Lab: strength analysis, crack-time estimates and password generation.\n"
        "analyze and improve read passwords from stdin, one per line.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "One of: " + PasswordService::operations().join(", "));

    const QCommandLineOption lengthOption("length", "Generated password length.", "n",
                                          QString::number(EngineConfig::DEFAULT_GENERATED_LENGTH));
    const QCommandLineOption noLowerOption("no-lowercase", "Exclude lowercase letters from generation.");
    const QCommandLineOption noUpperOption("no-uppercase", "Exclude uppercase letters from generation.");
    const QCommandLineOption noDigitsOption("no-digits", "Exclude digits from generation.");
    const QCommandLineOption noSpecialOption("no-special", "Exclude special characters from generation.");
    const QCommandLineOption compactOption("compact", "Print compact JSON.");
    const QCommandLineOption configOption("config", "INI file with [attack_speeds] overrides.", "file");
    parser.addOptions({lengthOption, noLowerOption, noUpperOption, noDigitsOption, noSpecialOption,
                       compactOption, configOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.size() != 1 || !PasswordService::operations().contains(args.first())) {
        qCCritical(lcCli) << "Expected exactly one command:" << PasswordService::operations().join(", ");
        parser.showHelp(EXIT_USAGE);
    }
    const QString command = args.first();
    const bool compact = parser.isSet(compactOption);

    CrackTimeModel model;
    if (parser.isSet(configOption)) {
        const QString path = parser.value(configOption);
        if (!QFileInfo::exists(path)) {
            qCCritical(lcCli) << "Config file not found:" << path;
            return EXIT_USAGE;
        }
        QSettings settings(path, QSettings::IniFormat);
        if (!CrackTimeModel::fromSettings(settings, model))
            qCWarning(lcCli) << "Ignoring attack speed overrides from" << path;
    }
    const PasswordService service(model);

    if (command == "analyze" || command == "improve") {
        const QStringList passwords = readPasswords();
        if (passwords.isEmpty()) {
            qCCritical(lcCli) << "No password given on stdin";
            return EXIT_USAGE;
        }

        const QList<QJsonObject> envelopes = QtConcurrent::blockingMapped<QList<QJsonObject>>(
            passwords, [&service, &command](const QString& password) {
                QJsonObject request;
                request["password"] = password;
                return service.handle(command, request);
            });

        bool allSucceeded = true;
        QJsonArray results;
        for (const QJsonObject& envelope : envelopes) {
            allSucceeded = allSucceeded && succeeded(envelope);
            results.append(envelope);
        }
        if (envelopes.size() == 1) printJson(QJsonDocument(envelopes.first()), compact);
        else printJson(QJsonDocument(results), compact);
        return allSucceeded ? 0 : EXIT_FAILED_REQUEST;
    }

    QJsonObject request;
    if (command == "generate") {
        bool ok = false;
        const int length = parser.value(lengthOption).toInt(&ok);
        if (!ok) {
            qCCritical(lcCli) << "--length expects an integer";
            return EXIT_USAGE;
        }
        request["length"] = length;
        request["include_lowercase"] = !parser.isSet(noLowerOption);
        request["include_uppercase"] = !parser.isSet(noUpperOption);
        request["include_digits"] = !parser.isSet(noDigitsOption);
        request["include_special"] = !parser.isSet(noSpecialOption);
    }

    const QJsonObject envelope = service.handle(command, request);
    printJson(QJsonDocument(envelope), compact);
    return succeeded(envelope) ? 0 : EXIT_FAILED_REQUEST;
}
