#include "SurfaceKey.h"

#include <QStringList>

QString SurfaceKey::toString() const
{
    QString key = documentId + QLatin1Char(':') + QString::number(page);
    if (hasPanel()) {
        key += QLatin1Char(':') + panelId;
    }
    return key;
}

SurfaceKey SurfaceKey::fromString(const QString& key, bool* ok)
{
    SurfaceKey result;
    if (ok) *ok = false;

    const QStringList parts = key.split(QLatin1Char(':'));
    if (parts.size() < 2 || parts.size() > 3 || parts[0].isEmpty()) {
        return result;
    }
    if (parts.size() == 3 && parts[2].isEmpty()) {
        return result;
    }

    bool pageOk = false;
    const int page = parts[1].toInt(&pageOk);
    if (!pageOk) {
        return result;
    }

    result.documentId = parts[0];
    result.page = page;
    if (parts.size() == 3) {
        result.panelId = parts[2];
    }
    if (ok) *ok = true;
    return result;
}
