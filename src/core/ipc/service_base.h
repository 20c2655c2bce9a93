#pragma once

#include "core/ipc/socket_server.h"

#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>

#include <functional>
#include <memory>

namespace hr {

// Local-socket JSON service. Methods are registered by name; "ping" and
// "shutdown" are always present. run() binds <socketDirectory>/<name>.sock,
// prints "ready" on stdout and enters the Qt event loop.
class ServiceBase : public QObject {
    Q_OBJECT
public:
    using MethodHandler = std::function<QJsonObject(uint64_t id, const QJsonObject& params)>;

    explicit ServiceBase(const QString& serviceName, QObject* parent = nullptr);
    ~ServiceBase() override;

    int run();

    // Turns one request envelope into its response or error envelope.
    QJsonObject dispatch(const QJsonObject& request) const;
    bool hasMethod(const QString& method) const { return m_methods.contains(method); }

    const QString& serviceName() const { return m_serviceName; }

    static QString socketPath(const QString& serviceName);
    static QString runtimeDirectory();
    static QString socketDirectory();

protected:
    // Replaces any handler already registered under the same name.
    void registerMethod(const QString& method, MethodHandler handler);

private:
    QJsonObject ping(uint64_t id) const;
    QJsonObject shutdown(uint64_t id) const;

    QString m_serviceName;
    std::unique_ptr<SocketServer> m_server;
    QHash<QString, MethodHandler> m_methods;
};

} // namespace hr
