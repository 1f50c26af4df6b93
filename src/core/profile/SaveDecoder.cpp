#include "SaveDecoder.h"

#include <QDebug>
#include <QFile>
#include <QJsonParseError>
#include <QStringDecoder>

#include <openssl/evp.h>
#include <zlib.h>

#include <memory>

// ── SaveDecodeError ─────────────────────────────────────────────────
QString SaveDecodeError::stageName() const
{
    switch (stage) {
    case NoError:    return QStringLiteral("none");
    case Read:       return QStringLiteral("read");
    case Magic:      return QStringLiteral("magic");
    case Decrypt:    return QStringLiteral("decrypt");
    case Decompress: return QStringLiteral("decompress");
    case Json:       return QStringLiteral("json");
    }
    return QString();
}

QString SaveDecodeError::errorString() const
{
    return stageName() + QStringLiteral(": ") + message;
}

static void setError(SaveDecodeError* error, SaveDecodeError::Stage stage, const QString& message)
{
    qWarning() << "[SaveDecoder]" << message;
    if (error) {
        error->stage = stage;
        error->message = message;
    }
}

// ── Constants ───────────────────────────────────────────────────────
const QByteArray& SaveDecoder::magic()
{
    static const QByteArray s_magic = QByteArrayLiteral("EVAS");
    return s_magic;
}

const QByteArray& SaveDecoder::profileKey()
{
    static const QByteArray s_key = QByteArray::fromHex(
        "728B369E24ED0134768511021812AFC0A3C25D02065F166B4BCC58CD2644F29E");
    return s_key;
}

// ── Decrypt ─────────────────────────────────────────────────────────
// ECB: each 16-byte block is decrypted independently with the fixed key.
std::optional<QByteArray> SaveDecoder::decryptBlocks(const QByteArray& ciphertext, QString* error)
{
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
        EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        *error = QStringLiteral("cannot allocate cipher context");
        return std::nullopt;
    }

    const auto* key = reinterpret_cast<const unsigned char*>(profileKey().constData());
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_ecb(), nullptr, key, nullptr) != 1) {
        *error = QStringLiteral("cipher initialization failed");
        return std::nullopt;
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    QByteArray plain(ciphertext.size() + kBlockSize, Qt::Uninitialized);
    int outLen = 0;
    int finalLen = 0;
    auto* out = reinterpret_cast<unsigned char*>(plain.data());
    if (EVP_DecryptUpdate(ctx.get(), out, &outLen,
                          reinterpret_cast<const unsigned char*>(ciphertext.constData()),
                          static_cast<int>(ciphertext.size())) != 1
        || EVP_DecryptFinal_ex(ctx.get(), out + outLen, &finalLen) != 1) {
        *error = QStringLiteral("block decryption failed");
        return std::nullopt;
    }

    plain.truncate(outLen + finalLen);
    return plain;
}

// ── Decompress ──────────────────────────────────────────────────────
// zlib-wrapped deflate. Bytes after the end of the stream are ignored.
std::optional<QByteArray> SaveDecoder::inflateStream(const QByteArray& compressed, QString* error)
{
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        *error = QStringLiteral("inflateInit failed");
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.constData()));
    zs.avail_in = static_cast<uInt>(compressed.size());

    QByteArray out;
    char chunk[64 * 1024];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(chunk);
        zs.avail_out = sizeof(chunk);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            *error = QStringLiteral("inflate failed (%1)%2")
                         .arg(ret)
                         .arg(zs.msg ? QStringLiteral(": ") + QString::fromLatin1(zs.msg) : QString());
            inflateEnd(&zs);
            return std::nullopt;
        }
        out.append(chunk, static_cast<qsizetype>(sizeof(chunk) - zs.avail_out));

        if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
            *error = QStringLiteral("truncated zlib stream");
            inflateEnd(&zs);
            return std::nullopt;
        }
    }

    inflateEnd(&zs);
    return out;
}

// ── JSON ────────────────────────────────────────────────────────────
std::optional<QJsonDocument> SaveDecoder::parseLeadingJson(const QByteArray& utf8, QString* error)
{
    QStringDecoder toUtf16(QStringDecoder::Utf8);
    QString text = toUtf16(utf8);
    if (toUtf16.hasError()) {
        *error = QStringLiteral("payload is not valid UTF-8");
        return std::nullopt;
    }

    // Strip trailing NUL padding and whitespace
    qsizetype end = text.size();
    while (end > 0 && (text.at(end - 1) == QChar(0) || text.at(end - 1).isSpace()))
        --end;
    text.truncate(end);

    QByteArray bytes = text.toUtf8();
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);

    // Only the first complete value counts; anything after it is ignored
    if (err.error == QJsonParseError::GarbageAtEnd && err.offset > 0) {
        bytes.truncate(err.offset);
        doc = QJsonDocument::fromJson(bytes, &err);
    }

    if (err.error != QJsonParseError::NoError) {
        *error = QStringLiteral("malformed JSON at offset %1: %2")
                     .arg(err.offset).arg(err.errorString());
        return std::nullopt;
    }
    return doc;
}

// ── decode ──────────────────────────────────────────────────────────
std::optional<QJsonDocument> SaveDecoder::decodeBytes(const QByteArray& data, SaveDecodeError* error)
{
    if (data.left(kMagicSize) != magic()) {
        setError(error, SaveDecodeError::Magic,
                 QStringLiteral("unrecognized save format (magic=%1)")
                     .arg(QString::fromLatin1(data.left(kMagicSize).toHex())));
        return std::nullopt;
    }

    // Header is discarded; ciphertext is truncated to whole blocks
    QByteArray payload = data.mid(kHeaderSize);
    payload.truncate(payload.size() - payload.size() % kBlockSize);
    if (payload.isEmpty()) {
        setError(error, SaveDecodeError::Decrypt, QStringLiteral("no ciphertext after header"));
        return std::nullopt;
    }

    QString message;
    auto plain = decryptBlocks(payload, &message);
    if (!plain) {
        setError(error, SaveDecodeError::Decrypt, message);
        return std::nullopt;
    }

    auto inflated = inflateStream(*plain, &message);
    if (!inflated) {
        setError(error, SaveDecodeError::Decompress, message);
        return std::nullopt;
    }

    auto doc = parseLeadingJson(*inflated, &message);
    if (!doc) {
        setError(error, SaveDecodeError::Json, message);
        return std::nullopt;
    }

    if (error) *error = SaveDecodeError{};
    return doc;
}

std::optional<QJsonDocument> SaveDecoder::decode(const QString& path, SaveDecodeError* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, SaveDecodeError::Read,
                 QStringLiteral("cannot open %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    const QByteArray data = file.readAll();
    qDebug() << "[SaveDecoder] Read" << data.size() << "bytes from" << path;
    return decodeBytes(data, error);
}
