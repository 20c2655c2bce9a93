#include "core/ipc/socket_server.h"
#include "core/shared/logging.h"

namespace hr {

namespace {

// True when something still accepts connections on the path.
bool pathHasListener(const QString& socketPath)
{
    QLocalSocket peer;
    peer.connectToServer(socketPath);
    if (!peer.waitForConnected(150)) {
        return false;
    }
    peer.abort();
    return true;
}

} // namespace

SocketServer::SocketServer(QObject* parent)
    : QObject(parent)
    , m_server(std::make_unique<QLocalServer>())
{
    connect(m_server.get(), &QLocalServer::newConnection, this, &SocketServer::onNewConnection);
}

SocketServer::~SocketServer()
{
    close();
}

bool SocketServer::listen(const QString& socketPath)
{
    m_server->setSocketOptions(QLocalServer::UserAccessOption);
    if (!m_server->listen(socketPath)) {
        if (m_server->serverError() != QAbstractSocket::AddressInUseError) {
            return fail(QStringLiteral("cannot listen on %1: %2")
                            .arg(socketPath, m_server->errorString()));
        }
        if (pathHasListener(socketPath)) {
            return fail(QStringLiteral("%1 is owned by a running service").arg(socketPath));
        }
        LOG_WARN(hrIpc, "Replacing stale socket %s", qUtf8Printable(socketPath));
        QLocalServer::removeServer(socketPath);
        if (!m_server->listen(socketPath)) {
            return fail(QStringLiteral("cannot listen on %1: %2")
                            .arg(socketPath, m_server->errorString()));
        }
    }

    LOG_INFO(hrIpc, "Listening on %s", qUtf8Printable(socketPath));
    return true;
}

void SocketServer::close()
{
    const QList<QLocalSocket*> clients = m_codecs.keys();
    for (QLocalSocket* client : clients) {
        release(client, true);
    }
    if (m_server->isListening()) {
        LOG_INFO(hrIpc, "Closing %s", qUtf8Printable(m_server->fullServerName()));
        m_server->close();
    }
}

bool SocketServer::isListening() const
{
    return m_server->isListening();
}

void SocketServer::setRequestHandler(RequestHandler handler)
{
    m_handler = std::move(handler);
}

void SocketServer::onNewConnection()
{
    while (QLocalSocket* client = m_server->nextPendingConnection()) {
        client->setParent(this);
        m_codecs.insert(client, FrameCodec());
        connect(client, &QLocalSocket::readyRead, this, &SocketServer::onReadyRead);
        connect(client, &QLocalSocket::disconnected, this, &SocketServer::onDisconnected);
        LOG_DEBUG(hrIpc, "Client connected, %d open", clientCount());
        emit clientConnected();
    }
}

void SocketServer::onReadyRead()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && m_codecs.contains(client)) {
        serve(client);
    }
}

void SocketServer::onDisconnected()
{
    auto* client = qobject_cast<QLocalSocket*>(sender());
    if (client && m_codecs.contains(client)) {
        release(client, false);
    }
}

void SocketServer::serve(QLocalSocket* client)
{
    auto codec = m_codecs.find(client);
    codec->append(client->readAll());
    if (codec->buffered() > kMaxPendingBytes) {
        LOG_ERROR(hrIpc, "Client exceeded %d pending bytes, disconnecting", kMaxPendingBytes);
        release(client, true);
        return;
    }

    QJsonObject incoming;
    QString problem;
    for (;;) {
        // The handler may run a nested event loop; look the codec up again.
        codec = m_codecs.find(client);
        if (codec == m_codecs.end()) {
            return;
        }

        switch (codec->next(&incoming, &problem)) {
        case FrameCodec::Result::NeedMore:
            return;
        case FrameCodec::Result::BadLength:
            LOG_ERROR(hrIpc, "Dropping client: %s", qUtf8Printable(problem));
            release(client, true);
            return;
        case FrameCodec::Result::BadPayload:
            LOG_WARN(hrIpc, "Unreadable frame: %s", qUtf8Printable(problem));
            reply(client, IpcMessage::makeError(0, IpcErrorCode::InvalidParams,
                                                QStringLiteral("Malformed message: %1").arg(problem)));
            continue;
        case FrameCodec::Result::Frame:
            break;
        }

        const QString type = incoming.value(QStringLiteral("type")).toString();
        if (type != QLatin1String("request")) {
            LOG_DEBUG(hrIpc, "Ignoring '%s' message", qUtf8Printable(type));
            continue;
        }
        reply(client, m_handler
                          ? m_handler(incoming)
                          : IpcMessage::makeError(IpcMessage::requestId(incoming), IpcErrorCode::InternalError,
                                                  QStringLiteral("No request handler registered")));
    }
}

void SocketServer::reply(QLocalSocket* client, const QJsonObject& message)
{
    const QByteArray frame = FrameCodec::encode(message);
    if (frame.isEmpty()) {
        const QByteArray fallback = FrameCodec::encode(IpcMessage::makeError(
            IpcMessage::requestId(message), IpcErrorCode::InternalError,
            QStringLiteral("Response too large")));
        client->write(fallback);
    } else {
        client->write(frame);
    }
    client->flush();
}

void SocketServer::release(QLocalSocket* client, bool abortConnection)
{
    if (m_codecs.remove(client) == 0) {
        return;
    }
    client->disconnect(this);
    if (abortConnection) {
        client->abort();
    }
    client->deleteLater();
    LOG_DEBUG(hrIpc, "Client released, %d open", clientCount());
    emit clientDisconnected();
}

bool SocketServer::fail(const QString& message)
{
    LOG_ERROR(hrIpc, "%s", qUtf8Printable(message));
    emit errorOccurred(message);
    return false;
}

} // namespace hr
