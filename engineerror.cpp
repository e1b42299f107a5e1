#include "engineerror.h"

QString EngineError::kindToString(EngineError::Kind kind) {
    switch (kind) {
    case NoError: return "NoError";
    case InvalidInput: return "InvalidInput";
    case InvalidSpec: return "InvalidSpec";
    case BackendUnavailable: return "BackendUnavailable";
    default: return "Unknown";
    }
}

int EngineError::statusCodeFor(EngineError::Kind kind) {
    switch (kind) {
    case NoError: return 200;
    case InvalidInput:
    case InvalidSpec: return 400;
    case BackendUnavailable: return 503;
    default: return 500;
    }
}

bool setError(EngineError* error, EngineError::Kind kind, const QString& message) {
    if (error) {
        error->kind = kind;
        error->message = message;
    }
    return false;
}

void clearError(EngineError* error) {
    if (error) {
        error->kind = EngineError::NoError;
        error->message.clear();
    }
}
