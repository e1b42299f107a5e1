#ifndef PASSWORDSERVICE_H
#define PASSWORDSERVICE_H

#include "engineerror.h"
#include "passwordanalyzer.h"

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <QStringList>

// Maps the engine operations onto the uniform {success, data, error} envelope
// so that any transport can serve them unchanged.
class PasswordService {
public:
    explicit PasswordService(const CrackTimeModel& model = CrackTimeModel());

    static QStringList operations();

    QJsonObject handle(const QString& operation, const QJsonObject& request = QJsonObject()) const;

    QJsonObject analyze(const QJsonObject& request) const;
    QJsonObject generate(const QJsonObject& request) const;
    QJsonObject improve(const QJsonObject& request) const;
    QJsonObject algorithms() const;
    QJsonObject examples() const;
    QJsonObject health() const;

    static QJsonObject success(const QJsonValue& data);
    static QJsonObject failure(const EngineError& error);

private:
    static bool passwordFrom(const QJsonObject& request, QString& password, EngineError* error);

    PasswordAnalyzer m_analyzer;
};

#endif // PASSWORDSERVICE_H
