#pragma once

#include <vector>
#include <QDebug>
#include <QString>
#include <QStringList>
#include "../Exception.hpp"





/** The carriers whose webtext service is supported.
Adding a carrier means adding a value here and a new CarrierSession implementation. */
enum CarrierKind
{
	crMeteor,
	crO2,
	crVodafone,
	crThree,
	crEmobile,
	crTesco,
};





/** Thrown when a carrier name (from the command line or the config file) is not recognized. */
class UnknownCarrierError:
	public RuntimeError
{
public:
	using RuntimeError::RuntimeError;
};





/** Returns all the supported carriers, in the order in which they are presented to the user. */
const std::vector<CarrierKind> & allCarrierKinds();

/** Returns the lowercase name of the carrier, as used on the command line and in the config file. */
QString carrierName(CarrierKind aKind);

/** Returns the names of all supported carriers. */
QStringList allCarrierNames();

/** Returns the carrier of the specified name (case-insensitive, surrounding whitespace ignored).
Throws an UnknownCarrierError listing the valid names if there's no such carrier. */
CarrierKind carrierKindFromName(const QString & aName);

/** Allows logging the carrier kinds directly, by name. */
QDebug operator << (QDebug aDebug, CarrierKind aKind);
