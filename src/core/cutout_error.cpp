#include "core/cutout_error.h"

CutoutError::CutoutError(Kind kind, const QString &message)
    : std::runtime_error((kindName(kind) + ": " + message).toStdString())
    , m_kind(kind)
{
}

QString CutoutError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::InvalidInput:
        return QStringLiteral("InvalidInput");
    case Kind::CompositingFailed:
        return QStringLiteral("CompositingFailed");
    case Kind::InvalidGeometry:
        return QStringLiteral("InvalidGeometry");
    case Kind::NoSubjectDetected:
        return QStringLiteral("NoSubjectDetected");
    case Kind::MultipleSubjectsDetected:
        return QStringLiteral("MultipleSubjectsDetected");
    case Kind::Cancelled:
        return QStringLiteral("Cancelled");
    }
    return QStringLiteral("Unknown");
}
