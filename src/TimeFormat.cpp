#include "TimeFormat.h"

#include <cmath>

namespace TimeFormat {

Hms splitHms(double seconds)
{
    Hms out;
    if (!std::isfinite(seconds) || seconds <= 0.0)
        return out;

    const qint64 total = static_cast<qint64>(std::floor(seconds));
    out.hours   = total / 3600;
    out.minutes = static_cast<int>((total % 3600) / 60);
    out.seconds = static_cast<int>(total % 60);
    return out;
}

QString formatHms(double seconds)
{
    const Hms t = splitHms(seconds);
    return QString("%1:%2:%3")
           .arg(t.hours,   2, 10, QChar('0'))
           .arg(t.minutes, 2, 10, QChar('0'))
           .arg(t.seconds, 2, 10, QChar('0'));
}

QString formatHoursMinutes(double seconds)
{
    const Hms t = splitHms(seconds);
    return QString("%1:%2").arg(t.hours).arg(t.minutes, 2, 10, QChar('0'));
}

QString formatHoursTenths(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0)
        seconds = 0.0;
    return QString::number(std::round(seconds / 360.0) / 10.0, 'f', 1);
}

}
