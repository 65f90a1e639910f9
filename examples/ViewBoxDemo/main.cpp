#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>

#include "domDocumentAdapter.h"
#include "traceSink.h"
#include "viewBoxCalculator.h"

namespace {

bool readFile(const QString& path, QString* contents) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }
    *contents = QString::fromUtf8(file.readAll());
    return true;
}

bool writeFile(const QString& path, const QString& contents) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text | QIODevice::Truncate)) {
        return false;
    }
    return file.write(contents.toUtf8()) >= 0;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("ViewBoxDemo");

    QCommandLineParser parser;
    parser.setApplicationDescription("Computes a viewBox that fits every frame of an animated SVG.");
    parser.addHelpOption();
    parser.addPositionalArgument("input", "SVG file to analyze.");
    QCommandLineOption bufferOption(QStringList() << "b" << "buffer", "Padding around the content.", "units", "10");
    QCommandLineOption writeOption(QStringList() << "w" << "write", "Save the tightened SVG to <file>.", "file");
    QCommandLineOption parallelOption("parallel", "Analyze elements with QtConcurrent.");
    QCommandLineOption traceOption("trace", "Print per-stage diagnostics.");
    parser.addOption(bufferOption);
    parser.addOption(writeOption);
    parser.addOption(parallelOption);
    parser.addOption(traceOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.size() != 1) {
        parser.showHelp(1);
    }

    Core::AnalyzerConfig config;
    bool ok = false;
    config.buffer = parser.value(bufferOption).toDouble(&ok);
    if (!ok || config.buffer < 0.0) {
        err << "Invalid buffer: " << parser.value(bufferOption) << Qt::endl;
        return 1;
    }
    config.parallel = parser.isSet(parallelOption);

    QString svgText;
    if (!readFile(arguments.first(), &svgText)) {
        err << "Cannot read " << arguments.first() << Qt::endl;
        return 1;
    }

    Core::DomDocumentAdapter document(config);
    QString errorMessage;
    if (!document.load(svgText, &errorMessage)) {
        err << "Error: " << errorMessage << Qt::endl;
        return 1;
    }

    Core::DebugTraceSink debugSink;
    Core::ViewBoxCalculator calculator(config, parser.isSet(traceOption) ? &debugSink : nullptr);
    Core::ViewBoxResult result = calculator.calculate(document);
    if (!result.valid) {
        err << "Error: " << result.errorMessage << Qt::endl;
        return 1;
    }

    out << "Original viewBox: " << result.originalViewBoxText << Qt::endl;
    out << "New viewBox:      " << result.viewBoxText << Qt::endl;
    out << "Elements: " << result.elementCount << ", animations: " << result.animationCount
        << ", with effects: " << result.effectsCount << Qt::endl;
    out << "Area saved: " << QString::number(result.savingsPercent, 'f', 1) << "%" << Qt::endl;

    if (parser.isSet(writeOption)) {
        const QString target = parser.value(writeOption);
        if (!calculator.applyToDocument(document, result) || !writeFile(target, document.toString())) {
            err << "Cannot write " << target << Qt::endl;
            return 1;
        }
        out << "Written to " << target << Qt::endl;
    }
    return 0;
}
