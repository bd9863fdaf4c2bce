#ifndef CUTOUT_ERROR_H
#define CUTOUT_ERROR_H

#include <QString>
#include <stdexcept>

/**
 * @brief Error raised by the cutout pipeline
 *
 * Every failure that the pure stages (refiner, compositor, scaler, renderer)
 * report to their caller is a CutoutError. The kind tells the caller whether
 * the request can be retried with different input or should be dropped.
 */
class CutoutError : public std::runtime_error
{
public:
    enum class Kind {
        InvalidInput,             // Zero-area or malformed mask/image
        CompositingFailed,        // Resampling or blending produced no valid output
        InvalidGeometry,          // Degenerate canvas or subject size with no safe default
        NoSubjectDetected,        // Segmentation returned nothing usable
        MultipleSubjectsDetected, // More than one subject where only one is allowed
        Cancelled                 // Cancellation token fired between stages
    };

    CutoutError(Kind kind, const QString &message);

    Kind kind() const { return m_kind; }
    QString message() const { return QString::fromStdString(what()); }

    static QString kindName(Kind kind);

private:
    Kind m_kind;
};

#endif // CUTOUT_ERROR_H
