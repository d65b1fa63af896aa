#include "SurfaceRecord.h"

SurfaceRecord SurfaceRecord::create(const SurfaceKey& key, const QString& canvasData, qreal canvasHeight)
{
    SurfaceRecord record;
    record.id = key.toString();
    record.documentId = key.documentId;
    record.page = key.page;
    record.panelId = key.panelId;
    record.canvasData = canvasData;
    record.canvasHeight = qMax(0.0, canvasHeight);
    record.lastModified = QDateTime::currentDateTimeUtc();
    return record;
}

QJsonObject SurfaceRecord::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["documentId"] = documentId;
    obj["page"] = page;
    if (!panelId.isEmpty()) {
        obj["panelId"] = panelId;
    }
    obj["canvasData"] = canvasData;
    obj["canvasHeight"] = canvasHeight;
    obj["lastModified"] = lastModified.toString(Qt::ISODateWithMs);
    return obj;
}

SurfaceRecord SurfaceRecord::fromJson(const QJsonObject& obj, bool* ok)
{
    SurfaceRecord record;
    const bool valid = obj["id"].isString() && obj["canvasData"].isString()
                       && obj["canvasHeight"].toDouble(0.0) >= 0.0;
    if (ok) {
        *ok = valid;
    }
    if (!valid) {
        return record;
    }

    record.id = obj["id"].toString();
    record.canvasData = obj["canvasData"].toString();
    record.canvasHeight = obj["canvasHeight"].toDouble(0.0);
    record.lastModified = QDateTime::fromString(obj["lastModified"].toString(), Qt::ISODateWithMs);

    // Identity fields are derivable from the id for records that omit them
    if (obj.contains("documentId")) {
        record.documentId = obj["documentId"].toString();
        record.page = obj["page"].toInt();
        record.panelId = obj["panelId"].toString();
    } else {
        SurfaceKey key = SurfaceKey::fromString(record.id);
        record.documentId = key.documentId;
        record.page = key.page;
        record.panelId = key.panelId;
    }
    return record;
}
