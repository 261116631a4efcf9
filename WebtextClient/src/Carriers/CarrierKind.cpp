#include "CarrierKind.hpp"





const std::vector<CarrierKind> & allCarrierKinds()
{
	static const std::vector<CarrierKind> kinds =
	{
		crMeteor,
		crO2,
		crVodafone,
		crThree,
		crEmobile,
		crTesco,
	};
	return kinds;
}





QString carrierName(CarrierKind aKind)
{
	switch (aKind)
	{
		case crMeteor:   return QString::fromUtf8("meteor");
		case crO2:       return QString::fromUtf8("o2");
		case crVodafone: return QString::fromUtf8("vodafone");
		case crThree:    return QString::fromUtf8("three");
		case crEmobile:  return QString::fromUtf8("emobile");
		case crTesco:    return QString::fromUtf8("tesco");
	}
	throw LogicError("Unhandled carrier kind: %1", static_cast<int>(aKind));
}





QStringList allCarrierNames()
{
	QStringList res;
	for (const auto kind: allCarrierKinds())
	{
		res.append(carrierName(kind));
	}
	return res;
}





CarrierKind carrierKindFromName(const QString & aName)
{
	auto name = aName.trimmed().toLower();
	for (const auto kind: allCarrierKinds())
	{
		if (carrierName(kind) == name)
		{
			return kind;
		}
	}
	throw UnknownCarrierError("Invalid carrier \"%1\". Specify one of: %2", aName, allCarrierNames().join(", "));
}





QDebug operator << (QDebug aDebug, CarrierKind aKind)
{
	return (aDebug << carrierName(aKind));
}
