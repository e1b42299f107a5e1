#include "commonpasswords.h"
#include "logging.h"

#include <QFile>
#include <QList>

namespace {

const char* const BLOCKLIST_RESOURCE = ":/data/common-passwords.txt";

QSet<QString> loadBlocklist() {
    QFile file(BLOCKLIST_RESOURCE);
    if (!file.open(QIODevice::ReadOnly)) {
        qCCritical(lcEngine) << "Could not open blocklist resource" << BLOCKLIST_RESOURCE
                             << ":" << file.errorString() << "- common passwords will not be detected";
        return QSet<QString>();
    }
    QSet<QString> entries = CommonPasswords::parse(file.readAll());
    qCDebug(lcEngine) << "Loaded" << entries.size() << "common passwords";
    return entries;
}

} // namespace

QSet<QString> CommonPasswords::parse(const QByteArray& data) {
    QSet<QString> entries;
    const QList<QByteArray> lines = data.split('\n');
    for (const QByteArray& rawLine : lines) {
        const QString line = QString::fromUtf8(rawLine).trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;
        entries.insert(line.toLower());
    }
    return entries;
}

const QSet<QString>& CommonPasswords::blocklist() {
    static const QSet<QString> entries = loadBlocklist();
    return entries;
}

bool CommonPasswords::isLoaded() {
    return !blocklist().isEmpty();
}

bool CommonPasswords::contains(const QString& password) {
    if (password.isEmpty()) return false;
    return blocklist().contains(password.toLower());
}
