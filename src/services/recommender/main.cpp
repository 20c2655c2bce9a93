#include "recommender_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("hybridrec-recommender"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    hr::Settings settings = hr::SettingsManager::load().value_or(hr::Settings{});
    hr::SettingsManager::applyDefaultPaths(settings);
    QDir().mkpath(QFileInfo(settings.dbPath).absolutePath());

    hr::RecommenderService service(settings);
    QString error;
    if (!service.initialize(&error)) {
        LOG_ERROR(hrCore, "Recommender failed to initialize: %s", qUtf8Printable(error));
        return 1;
    }
    return service.run();
}
