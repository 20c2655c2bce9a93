#include "core/ipc/socket_client.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>

namespace hr {

SocketClient::~SocketClient()
{
    disconnect();
}

bool SocketClient::connectToServer(const QString& socketPath, int timeoutMs)
{
    const QString path = socketPath.trimmed();
    if (path.isEmpty() || timeoutMs <= 0) {
        LOG_ERROR(hrIpc, "Invalid connect arguments (path='%s', timeout=%dms)",
                  qUtf8Printable(path), timeoutMs);
        return false;
    }
    if (isConnected() && m_socket.serverName() == path) {
        return true;
    }

    m_socket.abort();
    m_codec.reset();
    m_socket.connectToServer(path);
    if (!m_socket.waitForConnected(timeoutMs)) {
        LOG_DEBUG(hrIpc, "Connect to %s failed: %s", qUtf8Printable(path),
                  qUtf8Printable(m_socket.errorString()));
        return false;
    }
    return true;
}

void SocketClient::disconnect()
{
    if (m_socket.state() != QLocalSocket::UnconnectedState) {
        m_socket.disconnectFromServer();
        if (m_socket.state() != QLocalSocket::UnconnectedState) {
            m_socket.waitForDisconnected(100);
        }
    }
    m_codec.reset();
}

bool SocketClient::isConnected() const
{
    return m_socket.state() == QLocalSocket::ConnectedState;
}

std::optional<QJsonObject> SocketClient::sendRequest(const QString& method,
                                                     const QJsonObject& params,
                                                     int timeoutMs)
{
    if (!isConnected()) {
        LOG_WARN(hrIpc, "Cannot send %s: not connected", qUtf8Printable(method));
        return std::nullopt;
    }

    const uint64_t id = m_nextRequestId++;
    const QByteArray frame = FrameCodec::encode(IpcMessage::makeRequest(id, method, params));
    if (frame.isEmpty()) {
        return std::nullopt;
    }
    m_socket.write(frame);
    m_socket.flush();

    QElapsedTimer timer;
    timer.start();
    QJsonObject message;
    QString problem;
    while (timer.elapsed() < timeoutMs) {
        const FrameCodec::Result result = m_codec.next(&message, &problem);
        if (result == FrameCodec::Result::Frame) {
            const QString type = message.value(QStringLiteral("type")).toString();
            if ((type == QLatin1String("response") || type == QLatin1String("error"))
                && IpcMessage::requestId(message) == id) {
                return message;
            }
            continue;
        }
        if (result == FrameCodec::Result::BadPayload) {
            LOG_WARN(hrIpc, "Skipping unreadable frame: %s", qUtf8Printable(problem));
            continue;
        }
        if (result == FrameCodec::Result::BadLength) {
            LOG_ERROR(hrIpc, "Server sent %s, disconnecting", qUtf8Printable(problem));
            disconnect();
            return std::nullopt;
        }

        if (!isConnected() && m_socket.bytesAvailable() == 0) {
            LOG_WARN(hrIpc, "Connection lost while waiting for %s", qUtf8Printable(method));
            return std::nullopt;
        }
        if (m_socket.bytesAvailable() == 0) {
            const int remaining = std::max(1, timeoutMs - static_cast<int>(timer.elapsed()));
            m_socket.waitForReadyRead(std::min(remaining, 50));
        }
        m_codec.append(m_socket.readAll());
    }

    LOG_WARN(hrIpc, "Request timed out: method=%s id=%llu timeout=%dms",
             qUtf8Printable(method), static_cast<unsigned long long>(id), timeoutMs);
    return std::nullopt;
}

} // namespace hr
