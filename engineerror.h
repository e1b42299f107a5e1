#ifndef ENGINEERROR_H
#define ENGINEERROR_H

#include <QString>

struct EngineError {
    enum Kind {
        NoError,
        InvalidInput,
        InvalidSpec,
        BackendUnavailable
    };

    Kind kind = NoError;
    QString message;

    bool isError() const { return kind != NoError; }

    static QString kindToString(Kind kind);
    static int statusCodeFor(Kind kind);
};

// Fills *error when the caller asked for it. Always returns false so that
// failing paths can `return setError(...)`.
bool setError(EngineError* error, EngineError::Kind kind, const QString& message);
void clearError(EngineError* error);

#endif // ENGINEERROR_H
