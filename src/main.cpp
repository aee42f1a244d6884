#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>

#include <cstdio>

#include "gemrun/code_executor.hpp"
#include "gemrun/executor_config.hpp"
#include "gemrun/telemetry.hpp"

namespace {

constexpr int kExitUsage = 2;

int finish(int code) {
    const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
    gemrun::Telemetry::instance().exportToFile(path);
    return code;
}

int usageError(const QString& message) {
    QTextStream(stderr) << "gemrun: " << message << "\n";
    return finish(kExitUsage);
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("gemrun");
    QCoreApplication::setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Runs a Ruby snippet after installing the requested gems and prints "
        "{returncode, stdout, stderr} as JSON. Not a security sandbox.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        "config", "Executor config file (default: ./gemrun.json when present).", "file");
    const QCommandLineOption codeOption("code", "Ruby source to run.", "source");
    const QCommandLineOption fileOption("file", "Read the Ruby source from a file.", "path");
    const QCommandLineOption packageOption(
        {"p", "package"}, "Gem to install before running (repeatable).", "name");
    const QCommandLineOption isolatedOption(
        "isolated", "Install gems into a throwaway directory removed after the run.");
    const QCommandLineOption requestOption(
        "request",
        "Treat the input (--file or stdin) as a JSON request {code, packages, isolated}.");
    parser.addOption(configOption);
    parser.addOption(codeOption);
    parser.addOption(fileOption);
    parser.addOption(packageOption);
    parser.addOption(isolatedOption);
    parser.addOption(requestOption);

    if (!parser.parse(QCoreApplication::arguments())) {
        return usageError(parser.errorText());
    }
    if (parser.isSet("help")) {
        QTextStream(stdout) << parser.helpText();
        return finish(0);
    }
    if (parser.isSet("version")) {
        QTextStream(stdout) << QCoreApplication::applicationName() << " "
                            << QCoreApplication::applicationVersion() << "\n";
        return finish(0);
    }
    if (parser.isSet(codeOption) && parser.isSet(fileOption)) {
        return usageError("--code and --file are mutually exclusive.");
    }
    if (parser.isSet(codeOption) && parser.isSet(requestOption)) {
        return usageError("--request reads from --file or stdin, not --code.");
    }
    if (!parser.positionalArguments().isEmpty()) {
        return usageError("unexpected argument " + parser.positionalArguments().first());
    }

    gemrun::ExecutorConfig config;
    QString configPath = parser.value(configOption);
    if (configPath.isEmpty() && QFile::exists("gemrun.json")) {
        configPath = "gemrun.json";
    }
    if (!configPath.isEmpty()) {
        const QJsonObject loaded = config.loadFromFile(configPath);
        if (!loaded.value("success").toBool()) {
            return usageError(loaded.value("error").toString() + " (" + configPath + ")");
        }
    }

    QByteArray input;
    if (parser.isSet(codeOption)) {
        input = parser.value(codeOption).toUtf8();
    } else if (parser.isSet(fileOption)) {
        QFile file(parser.value(fileOption));
        if (!file.open(QIODevice::ReadOnly)) {
            return usageError("cannot read " + parser.value(fileOption) + ": " + file.errorString());
        }
        input = file.readAll();
    } else {
        QFile in;
        if (!in.open(stdin, QIODevice::ReadOnly)) {
            return usageError("cannot read source from stdin.");
        }
        input = in.readAll();
    }

    gemrun::ExecutionRequest request;
    if (parser.isSet(requestOption)) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(input, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            return usageError("request must be a JSON object.");
        }
        request = gemrun::ExecutionRequest::fromJson(doc.object());
    } else {
        request.code = QString::fromUtf8(input);
    }
    request.packages.append(parser.values(packageOption));
    request.isolated = request.isolated || parser.isSet(isolatedOption);
    if (request.code.trimmed().isEmpty()) {
        return usageError("no source given (use --code, --file or stdin).");
    }

    const gemrun::CodeExecutor executor(config);
    const gemrun::CommandResult result = executor.execute(request);

    QTextStream(stdout) << QJsonDocument(result.toJson()).toJson(QJsonDocument::Indented);
    return finish(result.status == 0 ? 0 : 1);
}
