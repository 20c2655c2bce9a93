#include "core/ipc/service_base.h"
#include "core/shared/logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>

namespace hr {

namespace {

QString directoryFromEnv(const char* name)
{
    const QString value = qEnvironmentVariable(name).trimmed();
    return value.isEmpty() ? QString() : QDir::cleanPath(value);
}

} // namespace

ServiceBase::ServiceBase(const QString& serviceName, QObject* parent)
    : QObject(parent)
    , m_serviceName(serviceName)
    , m_server(std::make_unique<SocketServer>())
{
    m_server->setRequestHandler([this](const QJsonObject& request) {
        return dispatch(request);
    });
    registerMethod(QStringLiteral("ping"), [this](uint64_t id, const QJsonObject&) {
        return ping(id);
    });
    registerMethod(QStringLiteral("shutdown"), [this](uint64_t id, const QJsonObject&) {
        return shutdown(id);
    });
}

ServiceBase::~ServiceBase() = default;

int ServiceBase::run()
{
    const QString path = socketPath(m_serviceName);
    const QString directory = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(directory)) {
        LOG_ERROR(hrIpc, "Cannot create socket directory %s", qUtf8Printable(directory));
        return 1;
    }
    if (!m_server->listen(path)) {
        LOG_ERROR(hrIpc, "Service '%s' failed to start", qUtf8Printable(m_serviceName));
        return 1;
    }

    LOG_INFO(hrIpc, "Service '%s' serving %d methods", qUtf8Printable(m_serviceName),
             static_cast<int>(m_methods.size()));
    std::fprintf(stdout, "ready\n");
    std::fflush(stdout);

    const int status = QCoreApplication::exec();
    m_server->close();
    return status;
}

QString ServiceBase::socketPath(const QString& serviceName)
{
    return QDir(socketDirectory()).filePath(serviceName + QStringLiteral(".sock"));
}

QString ServiceBase::runtimeDirectory()
{
    const QString configured = directoryFromEnv("HYBRIDREC_RUNTIME_DIR");
    return configured.isEmpty() ? QStringLiteral("/tmp/hybridrec-%1").arg(getuid()) : configured;
}

QString ServiceBase::socketDirectory()
{
    const QString configured = directoryFromEnv("HYBRIDREC_SOCKET_DIR");
    return configured.isEmpty() ? runtimeDirectory() : configured;
}

void ServiceBase::registerMethod(const QString& method, MethodHandler handler)
{
    m_methods.insert(method, std::move(handler));
}

QJsonObject ServiceBase::dispatch(const QJsonObject& request) const
{
    QString problem;
    const std::optional<IpcRequest> parsed = IpcRequest::fromJson(request, &problem);
    if (!parsed) {
        return IpcMessage::makeError(IpcMessage::requestId(request), IpcErrorCode::InvalidParams, problem);
    }

    const auto handler = m_methods.constFind(parsed->method);
    if (handler == m_methods.constEnd()) {
        LOG_WARN(hrIpc, "Unknown method '%s' in service '%s'",
                 qUtf8Printable(parsed->method), qUtf8Printable(m_serviceName));
        return IpcMessage::makeError(parsed->id, IpcErrorCode::NotFound,
                                     QStringLiteral("Unknown method: %1").arg(parsed->method));
    }

    LOG_DEBUG(hrIpc, "%s id=%llu", qUtf8Printable(parsed->method),
              static_cast<unsigned long long>(parsed->id));
    return handler.value()(parsed->id, parsed->params);
}

QJsonObject ServiceBase::ping(uint64_t id) const
{
    QJsonObject result;
    result[QStringLiteral("pong")] = true;
    result[QStringLiteral("service")] = m_serviceName;
    result[QStringLiteral("timestamp")] = QDateTime::currentMSecsSinceEpoch();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject ServiceBase::shutdown(uint64_t id) const
{
    LOG_INFO(hrIpc, "Shutdown requested for '%s'", qUtf8Printable(m_serviceName));
    // Queued so the response is written before the loop exits.
    QMetaObject::invokeMethod(QCoreApplication::instance(), &QCoreApplication::quit,
                              Qt::QueuedConnection);

    QJsonObject result;
    result[QStringLiteral("shutting_down")] = true;
    return IpcMessage::makeResponse(id, result);
}

} // namespace hr
