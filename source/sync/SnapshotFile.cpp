#include "SnapshotFile.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace SnapshotFile {

bool load(const QString& path, CanvasSnapshot& out)
{
    if (path.isEmpty()) {
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "SnapshotFile::load: Cannot open file for reading:" << path;
        return false;
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "SnapshotFile::load: JSON parse error in" << path
                   << "at offset" << parseError.offset << ":" << parseError.errorString();
        return false;
    }
    if (!jsonDoc.isObject()) {
        qWarning() << "SnapshotFile::load: Top-level value is not an object:" << path;
        return false;
    }

    out = CanvasSnapshot::fromJson(jsonDoc.object());
    return true;
}

bool save(const CanvasSnapshot& snapshot, const QString& path)
{
    if (path.isEmpty()) {
        return false;
    }

    const QJsonDocument jsonDoc(snapshot.toJson());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "SnapshotFile::save: Cannot open file for writing:" << path;
        return false;
    }

    const QByteArray data = jsonDoc.toJson(QJsonDocument::Indented);
    const qint64 bytesWritten = file.write(data);
    file.close();

    if (bytesWritten != data.size()) {
        qWarning() << "SnapshotFile::save: Write failed, expected" << data.size()
                   << "bytes, wrote" << bytesWritten;
        return false;
    }
    return true;
}

} // namespace SnapshotFile
