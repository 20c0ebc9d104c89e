#pragma once

#include <QString>

namespace TimeFormat {

struct Hms {
    qint64 hours   = 0;
    int    minutes = 0;
    int    seconds = 0;
};

// Whole hours / minutes / seconds. Fractions are truncated; negative or
// non-finite input yields zero.
Hms splitHms(double seconds);

// "HH:MM:SS", hours zero-padded to at least two digits.
QString formatHms(double seconds);

// "H:MM"
QString formatHoursMinutes(double seconds);

// Hours rounded to one decimal, e.g. 5400 -> "1.5".
QString formatHoursTenths(double seconds);

}
