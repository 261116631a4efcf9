#pragma once

#include <QString>





/** Functions for handling the phone numbers.
A phone number is a plain string of digits, optionally prefixed with a '+' (international form).
Users may write the numbers with whitespace, dashes or dots as separators; these are removed. */
namespace PhoneNumber
{

/** Returns the number with all the separators (whitespace, '-', '.') removed. */
QString stripSeparators(const QString & aNumber);

/** Returns true if the string, after removing the separators, is a valid phone number ("+?[0-9]+"). */
bool isValid(const QString & aNumber);

/** Returns the canonical form of the number (separators removed), or an empty string if the number is not valid. */
QString canonical(const QString & aNumber);

/** Converts an Irish number in international form ("+353..." or "00353...") into the national form ("0...").
Numbers in other forms are returned unchanged. */
QString irishToNational(const QString & aCanonicalNumber);

/** Returns true if the national-form number is an Irish mobile number (08x followed by 7 digits). */
bool isIrishMobile(const QString & aNationalNumber);

}  // namespace PhoneNumber
