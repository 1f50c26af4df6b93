#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "profile/SaveDecoder.h"

#include <openssl/evp.h>
#include <zlib.h>

#include <memory>

// ── Fixture builders ────────────────────────────────────────────────
static QByteArray zeroPad(QByteArray data)
{
    const int rem = data.size() % SaveDecoder::kBlockSize;
    if (rem != 0)
        data.append(QByteArray(SaveDecoder::kBlockSize - rem, '\0'));
    return data;
}

static QByteArray deflate(const QByteArray& data)
{
    uLongf bound = compressBound(static_cast<uLong>(data.size()));
    QByteArray out(static_cast<qsizetype>(bound), Qt::Uninitialized);
    if (compress2(reinterpret_cast<Bytef*>(out.data()), &bound,
                  reinterpret_cast<const Bytef*>(data.constData()),
                  static_cast<uLong>(data.size()), Z_BEST_COMPRESSION) != Z_OK)
        return QByteArray();
    out.truncate(static_cast<qsizetype>(bound));
    return out;
}

// Input must already be a whole number of blocks
static QByteArray encryptBlocks(const QByteArray& plain)
{
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(
        EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    const auto* key = reinterpret_cast<const unsigned char*>(SaveDecoder::profileKey().constData());
    EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_ecb(), nullptr, key, nullptr);
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    QByteArray out(plain.size() + SaveDecoder::kBlockSize, Qt::Uninitialized);
    int len = 0;
    int finalLen = 0;
    auto* dst = reinterpret_cast<unsigned char*>(out.data());
    EVP_EncryptUpdate(ctx.get(), dst, &len,
                      reinterpret_cast<const unsigned char*>(plain.constData()),
                      static_cast<int>(plain.size()));
    EVP_EncryptFinal_ex(ctx.get(), dst + len, &finalLen);
    out.truncate(len + finalLen);
    return out;
}

// magic + 16 header bytes + ciphertext of the given plaintext
static QByteArray wrapPlaintext(const QByteArray& plain)
{
    QByteArray header(SaveDecoder::kHeaderSize - SaveDecoder::kMagicSize, '\x07');
    return SaveDecoder::magic() + header + encryptBlocks(zeroPad(plain));
}

static QByteArray makeSave(const QByteArray& json)
{
    return wrapPlaintext(deflate(json));
}

class tst_SaveDecoder : public QObject {
    Q_OBJECT

private slots:
    void profileKey_is32Bytes()
    {
        QCOMPARE(SaveDecoder::profileKey().size(), 32);
        QCOMPARE(SaveDecoder::magic(), QByteArray("EVAS"));
    }

    // ── Round trip ───────────────────────────────────────────────
    void decode_roundTrip()
    {
        const QByteArray json = R"({"Songs":{"abc":{"TimeStamp":1700000000,"DynamicDifficulty":{"Avg":0.42}}},)"
                                R"("SongsSA":{"ABC":{"PlayCount":3,"Badges":{"Hard":4}}},"Name":"Bassist é"})";

        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("1234_PRFLDB"));
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write(makeSave(json));
        f.close();

        SaveDecodeError error;
        auto doc = SaveDecoder::decode(path, &error);
        QVERIFY2(doc.has_value(), qPrintable(error.errorString()));
        QCOMPARE(error.stage, SaveDecodeError::NoError);
        QCOMPARE(*doc, QJsonDocument::fromJson(json));
    }

    void decode_ignoresTrailingBytesAfterJson()
    {
        const QByteArray json = R"({"Songs":{},"SongsSA":{"X":{"PlayCount":1}}})";

        SaveDecodeError error;
        auto doc = SaveDecoder::decodeBytes(makeSave(json + QByteArray("\0\0garbage{]", 11)), &error);
        QVERIFY2(doc.has_value(), qPrintable(error.errorString()));
        QCOMPARE(*doc, QJsonDocument::fromJson(json));
    }

    void decode_ignoresBytesAfterZlibStream()
    {
        const QByteArray json = R"({"Songs":{}})";
        QByteArray plain = deflate(json) + QByteArray("leftover-bytes");

        auto doc = SaveDecoder::decodeBytes(wrapPlaintext(plain));
        QVERIFY(doc.has_value());
        QCOMPARE(*doc, QJsonDocument::fromJson(json));
    }

    void decode_ignoresPartialTrailingBlock()
    {
        const QByteArray json = R"({"Songs":{}})";
        auto doc = SaveDecoder::decodeBytes(makeSave(json) + QByteArray("xyz"));
        QVERIFY(doc.has_value());
    }

    // ── Error stages ─────────────────────────────────────────────
    void decode_missingFileIsReadError()
    {
        SaveDecodeError error;
        auto doc = SaveDecoder::decode(QStringLiteral("/nonexistent/basstutor/none_PRFLDB"), &error);
        QVERIFY(!doc.has_value());
        QCOMPARE(error.stage, SaveDecodeError::Read);
        QCOMPARE(error.stageName(), QStringLiteral("read"));
    }

    void decode_badMagic()
    {
        QByteArray data = makeSave(R"({"a":1})");
        data.replace(0, 4, "SAVE");

        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(data, &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Magic);
        QVERIFY(error.message.contains(QStringLiteral("53415645")));   // hex of "SAVE"
        QVERIFY(error.errorString().startsWith(QStringLiteral("magic: ")));
    }

    void decode_emptyInputIsMagicError()
    {
        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(QByteArray(), &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Magic);
    }

    void decode_headerOnlyIsDecryptError()
    {
        QByteArray data = SaveDecoder::magic() + QByteArray(16, '\0') + QByteArray(5, 'x');

        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(data, &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Decrypt);
    }

    void decode_notZlibIsDecompressError()
    {
        SaveDecodeError error;
        auto doc = SaveDecoder::decodeBytes(wrapPlaintext(QByteArray(64, '\xff')), &error);
        QVERIFY(!doc.has_value());
        QCOMPARE(error.stage, SaveDecodeError::Decompress);
    }

    void decode_truncatedZlibIsDecompressError()
    {
        QByteArray compressed = deflate(QByteArray(4096, 'a') + QByteArray("{}"));
        compressed.truncate(compressed.size() / 2);

        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(wrapPlaintext(compressed), &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Decompress);
    }

    void decode_malformedJsonIsJsonError()
    {
        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(makeSave("{\"Songs\": [1, 2"), &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Json);
        QCOMPARE(error.stageName(), QStringLiteral("json"));
    }

    void decode_invalidUtf8IsJsonError()
    {
        SaveDecodeError error;
        QVERIFY(!SaveDecoder::decodeBytes(makeSave("{\"a\":\"\xc3\x28\"}"), &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::Json);
    }

    void decode_successResetsError()
    {
        SaveDecodeError error;
        error.stage = SaveDecodeError::Magic;
        error.message = QStringLiteral("stale");
        QVERIFY(SaveDecoder::decodeBytes(makeSave("{}"), &error).has_value());
        QCOMPARE(error.stage, SaveDecodeError::NoError);
        QVERIFY(error.message.isEmpty());
    }
};

QTEST_MAIN(tst_SaveDecoder)
#include "tst_SaveDecoder.moc"
