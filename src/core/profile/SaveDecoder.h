#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QString>
#include <optional>

struct SaveDecodeError {
    enum Stage {
        NoError,
        Read,         // file could not be read
        Magic,        // unrecognized save format
        Decrypt,
        Decompress,
        Json
    };

    Stage   stage = NoError;
    QString message;

    QString stageName() const;
    QString errorString() const;   // "<stage>: <message>"
};

// Decodes a *_PRFLDB player save:
//   [0:4)   magic "EVAS"
//   [4:20)  header, ignored
//   [20:]   AES-256 ciphertext, every 16-byte block on its own (no IV,
//           no chaining); the plaintext is a zlib stream holding UTF-8
//           JSON followed by NUL padding.
class SaveDecoder {
public:
    static std::optional<QJsonDocument> decode(const QString& path,
                                               SaveDecodeError* error = nullptr);
    static std::optional<QJsonDocument> decodeBytes(const QByteArray& data,
                                                    SaveDecodeError* error = nullptr);

    static const QByteArray& magic();
    static const QByteArray& profileKey();   // 32 bytes

    static constexpr int kMagicSize = 4;
    static constexpr int kHeaderSize = 20;   // magic included
    static constexpr int kBlockSize = 16;

private:
    static std::optional<QByteArray> decryptBlocks(const QByteArray& ciphertext, QString* error);
    static std::optional<QByteArray> inflateStream(const QByteArray& compressed, QString* error);
    static std::optional<QJsonDocument> parseLeadingJson(const QByteArray& utf8, QString* error);
};
