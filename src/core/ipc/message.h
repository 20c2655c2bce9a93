#pragma once

#include "core/shared/errors.h"
#include "core/shared/ipc_messages.h"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>

namespace hr {

// Envelope builders for the request/response protocol.
class IpcMessage {
public:
    static QJsonObject makeRequest(uint64_t id, const QString& method, const QJsonObject& params = {});
    static QJsonObject makeResponse(uint64_t id, const QJsonObject& result);
    static QJsonObject makeError(uint64_t id, IpcErrorCode code, const QString& message);
    static QJsonObject makeError(uint64_t id, const Error& error);

    static uint64_t requestId(const QJsonObject& message);
};

// A request envelope that passed shape checks.
struct IpcRequest {
    uint64_t id = 0;
    QString method;
    QJsonObject params;

    static std::optional<IpcRequest> fromJson(const QJsonObject& json, QString* errorOut = nullptr);
};

// Stream framing: a 4-byte big-endian payload length, then compact UTF-8 JSON.
// One codec per connection accumulates bytes and yields whole frames.
class FrameCodec {
public:
    static constexpr int kHeaderSize = 4;
    static constexpr int kMaxFrameSize = 16 * 1024 * 1024;

    enum class Result {
        Frame,       // *out holds the next object
        NeedMore,
        BadPayload,  // frame dropped, later frames are still readable
        BadLength,   // length prefix out of range, the stream is unusable
    };

    // Empty when the payload exceeds kMaxFrameSize.
    static QByteArray encode(const QJsonObject& json);

    void append(const QByteArray& bytes) { m_buffer.append(bytes); }
    Result next(QJsonObject* out, QString* errorOut = nullptr);

    int buffered() const { return static_cast<int>(m_buffer.size()); }
    void reset() { m_buffer.clear(); }

private:
    QByteArray m_buffer;
};

} // namespace hr
