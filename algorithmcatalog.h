#ifndef ALGORITHMCATALOG_H
#define ALGORITHMCATALOG_H

#include "cracktimeestimator.h"

#include <QList>
#include <QString>

struct AlgorithmInfo {
    HashAlgorithm algorithm;
    QString name;
    QString year;
    QString status;
    QString speed;
    QString description;
    QString useCase;
};

struct ExamplePassword {
    QString password;
    QString description;
    int expectedScore;
};

// Read-only reference data, built once on first use.
class AlgorithmCatalog {
public:
    static const QList<AlgorithmInfo>& algorithms();
    static const QList<ExamplePassword>& examples();
};

#endif // ALGORITHMCATALOG_H
