#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QUrl>

#include "models/uploadqueue.h"
#include "services/backoffretrier.h"
#include "services/consolepresenter.h"
#include "services/errorhandler.h"
#include "services/httptransferclient.h"
#include "services/uploadscheduler.h"
#include "services/uploadservice.h"
#include "services/uploadsettings.h"
#include "utils/logging.h"
#include "version.h"

namespace {

constexpr int ExitSuccess = 0;
constexpr int ExitUploadFailed = 1;
constexpr int ExitUsage = 2;

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("courier");
    app.setApplicationVersion(COURIER_VERSION);
    app.setOrganizationName("courier");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Uploads files to a storage endpoint with bounded concurrency");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("files", "Files to upload.", "<file>...");

    QCommandLineOption endpointOption(
        QStringList() << "e" << "endpoint",
        "Base URL of the storage endpoint.", "url");
    QCommandLineOption tokenOption(
        QStringList() << "t" << "token",
        "Bearer token sent with every upload.", "token");
    QCommandLineOption concurrencyOption(
        QStringList() << "c" << "concurrency",
        "Maximum number of simultaneous uploads.", "n");
    QCommandLineOption destinationOption(
        QStringList() << "d" << "destination",
        "Destination path resolved against the endpoint.", "path");
    QCommandLineOption autoRetryOption(
        QStringList() << "r" << "auto-retry",
        "Retry transient failures automatically with a growing delay.");
    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    parser.addOption(endpointOption);
    parser.addOption(tokenOption);
    parser.addOption(concurrencyOption);
    parser.addOption(destinationOption);
    parser.addOption(autoRetryOption);
    parser.addOption(verboseOption);

    parser.process(app);

    // Set verbose logging flag
    courier::verboseLogging = parser.isSet(verboseOption);

    if (courier::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    // Stored settings first, command line overrides on top
    QSettings settings;
    UploadSettings config = UploadSettings::load(settings);

    if (parser.isSet(endpointOption)) {
        config.endpoint = parser.value(endpointOption);
    }
    if (parser.isSet(tokenOption)) {
        config.authToken = parser.value(tokenOption);
    }
    if (parser.isSet(destinationOption)) {
        config.destinationHint = parser.value(destinationOption);
    }
    if (parser.isSet(autoRetryOption)) {
        config.autoRetry = true;
    }
    if (parser.isSet(concurrencyOption)) {
        bool ok = false;
        int limit = parser.value(concurrencyOption).toInt(&ok);
        if (!ok || limit < 1) {
            qCritical().noquote() << "Invalid concurrency:" << parser.value(concurrencyOption);
            return ExitUsage;
        }
        config.activeLimit = limit;
    }

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty()) {
        qCritical().noquote() << "No files given, see --help";
        return ExitUsage;
    }

    // The presenter is declared first so it outlives the service, which
    // detaches it on destruction
    ConsolePresenter presenter;
    HttpTransferClient client;
    UploadQueue queue;
    UploadScheduler scheduler(&queue, &client);
    BackoffRetrier retrier(&queue);
    UploadService service(&queue);

    service.setPresenter(&presenter);

    QUrl endpoint = QUrl::fromUserInput(config.endpoint);
    if (config.endpoint.isEmpty() || !endpoint.isValid() || endpoint.host().isEmpty()) {
        service.errorHandler()->handleConfigurationError(
            QCoreApplication::translate("main", "No valid upload endpoint configured (use --endpoint)"));
        return ExitUsage;
    }

    client.setEndpoint(endpoint);
    client.setAuthToken(config.authToken);
    client.setTransferTimeout(config.transferTimeoutMs);
    service.applySettings(config);
    retrier.setEnabled(config.autoRetry);

    QObject::connect(&queue, &UploadQueue::allUploadsFinished, &app, [&]() {
        if (retrier.hasPendingRetries()) {
            LOG_VERBOSE() << "Waiting for" << retrier.pendingRetryCount() << "scheduled retries";
            return;
        }
        if (service.isBusy()) {
            // Queued while files were still being submitted; later ones are running
            return;
        }
        UploadSnapshot snapshot = queue.snapshot();
        qInfo().noquote() << QString("Finished: %1 uploaded, %2 failed")
            .arg(snapshot.counts.succeeded)
            .arg(snapshot.counts.failed);
        app.exit(snapshot.counts.failed > 0 ? ExitUploadFailed : ExitSuccess);
    }, Qt::QueuedConnection);  // May fire while files are still being queued, before exec()

    if (service.uploadFiles(files).isEmpty()) {
        qCritical().noquote() << "None of the given files could be queued";
        return ExitUploadFailed;
    }

    return app.exec();
}
