#pragma once

#include "core/ipc/message.h"

#include <QHash>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

#include <functional>
#include <memory>

namespace hr {

// Accepts local-socket clients and answers each framed request with the
// handler's reply, in arrival order per connection.
class SocketServer : public QObject {
    Q_OBJECT
public:
    explicit SocketServer(QObject* parent = nullptr);
    ~SocketServer() override;

    // Pending bytes allowed per client before it is cut off.
    static constexpr int kMaxPendingBytes = 4 * FrameCodec::kMaxFrameSize;

    using RequestHandler = std::function<QJsonObject(const QJsonObject& request)>;

    // A socket file left by a dead process is replaced; one with a live
    // listener is not.
    bool listen(const QString& socketPath);
    void close();
    bool isListening() const;
    int clientCount() const { return static_cast<int>(m_codecs.size()); }

    void setRequestHandler(RequestHandler handler);

signals:
    void clientConnected();
    void clientDisconnected();
    void errorOccurred(const QString& error);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    void serve(QLocalSocket* client);
    void reply(QLocalSocket* client, const QJsonObject& message);
    void release(QLocalSocket* client, bool abortConnection);
    bool fail(const QString& message);

    std::unique_ptr<QLocalServer> m_server;
    QHash<QLocalSocket*, FrameCodec> m_codecs;
    RequestHandler m_handler;
};

} // namespace hr
