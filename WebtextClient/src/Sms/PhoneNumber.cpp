#include "PhoneNumber.hpp"
#include <QRegularExpression>





QString PhoneNumber::stripSeparators(const QString & aNumber)
{
	static const QRegularExpression reSeparators("[\\s\\-\\.]");
	auto res = aNumber;
	res.remove(reSeparators);
	return res;
}





bool PhoneNumber::isValid(const QString & aNumber)
{
	return !canonical(aNumber).isEmpty();
}





QString PhoneNumber::canonical(const QString & aNumber)
{
	static const QRegularExpression reNumber("^\\+?[0-9]+$");
	auto stripped = stripSeparators(aNumber);
	if (!reNumber.match(stripped).hasMatch())
	{
		return QString();
	}
	return stripped;
}





QString PhoneNumber::irishToNational(const QString & aCanonicalNumber)
{
	if (aCanonicalNumber.startsWith("+353"))
	{
		return "0" + aCanonicalNumber.mid(4);
	}
	if (aCanonicalNumber.startsWith("00353"))
	{
		return "0" + aCanonicalNumber.mid(5);
	}
	return aCanonicalNumber;
}





bool PhoneNumber::isIrishMobile(const QString & aNationalNumber)
{
	static const QRegularExpression reIrishMobile("^08[0-9][0-9]{7}$");
	return reIrishMobile.match(aNationalNumber).hasMatch();
}
