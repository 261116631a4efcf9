#include "CarrierSession.hpp"
#include "../Sms/PhoneNumber.hpp"





////////////////////////////////////////////////////////////////////////////////
// SendError:

QString SendError::kindName(SendError::Kind aKind)
{
	switch (aKind)
	{
		case skTransport:          return QString::fromUtf8("transport");
		case skRejectedNumber:     return QString::fromUtf8("rejected-number");
		case skUnexpectedResponse: return QString::fromUtf8("unexpected-response");
		case skTimeout:            return QString::fromUtf8("timeout");
		case skSessionLost:        return QString::fromUtf8("session-lost");
		case skCancelled:          return QString::fromUtf8("cancelled");
	}
	throw LogicError("Unhandled SendError kind: %1", static_cast<int>(aKind));
}





////////////////////////////////////////////////////////////////////////////////
// CarrierSession:

const int CarrierSession::UNKNOWN_TEXTS_REMAINING;




QString CarrierSession::normalizeNumber(const QString & aNumber) const
{
	auto res = PhoneNumber::canonical(aNumber);
	if (res.isEmpty())
	{
		throw SendError(SendError::skRejectedNumber,
			"%1 is invalid; only a leading + and digits are allowed", aNumber
		);
	}
	return res;
}
