#ifndef COMMONPASSWORDS_H
#define COMMONPASSWORDS_H

#include <QSet>
#include <QString>

class CommonPasswords {
public:
    // Exact, case-insensitive blocklist lookup.
    static bool contains(const QString& password);

    // The blocklist itself. Loaded once from the bundled resource, never modified.
    static const QSet<QString>& blocklist();
    // False when the resource could not be read. health reports it.
    static bool isLoaded();

    static QSet<QString> parse(const QByteArray& data);
};

#endif // COMMONPASSWORDS_H
