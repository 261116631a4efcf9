#include "SendRequest.hpp"





////////////////////////////////////////////////////////////////////////////////
// SendResult:

SendResult SendResult::success(const QString & aRecipient, const MessageChunk & aChunk)
{
	return SendResult{aRecipient, aChunk.mIndex, aChunk.mTotal, true, SendError::skTransport, QString()};
}





SendResult SendResult::failure(
	const QString & aRecipient,
	const MessageChunk & aChunk,
	SendError::Kind aKind,
	const QString & aReason
)
{
	return SendResult{aRecipient, aChunk.mIndex, aChunk.mTotal, false, aKind, aReason};
}





////////////////////////////////////////////////////////////////////////////////
// SendReport:

SendReport::Status SendReport::status() const
{
	if (mAbortReason != arNone)
	{
		return stAborted;
	}
	auto numOK = numSucceeded();
	if ((numOK == mResults.size()) && !mResults.empty())
	{
		return stAllSucceeded;
	}
	if (numOK == 0)
	{
		return stNoneSucceeded;
	}
	return stPartiallySucceeded;
}





size_t SendReport::numSucceeded() const
{
	size_t res = 0;
	for (const auto & r: mResults)
	{
		if (r.mIsSuccess)
		{
			res += 1;
		}
	}
	return res;
}





SendReport SendReport::aborted(AbortReason aReason, const QString & aMessage, int aTextsRemaining)
{
	SendReport res;
	res.mAbortReason = aReason;
	res.mAbortMessage = aMessage;
	res.mTextsRemaining = aTextsRemaining;
	return res;
}





QString SendReport::statusName(Status aStatus)
{
	switch (aStatus)
	{
		case stAllSucceeded:       return QString::fromUtf8("all succeeded");
		case stPartiallySucceeded: return QString::fromUtf8("partially succeeded");
		case stNoneSucceeded:      return QString::fromUtf8("none succeeded");
		case stAborted:            return QString::fromUtf8("aborted");
	}
	throw LogicError("Unhandled SendReport status: %1", static_cast<int>(aStatus));
}





QString SendReport::abortReasonName(AbortReason aReason)
{
	switch (aReason)
	{
		case arNone:             return QString::fromUtf8("none");
		case arUnknownRecipient: return QString::fromUtf8("unknown recipient");
		case arAuthFailed:       return QString::fromUtf8("authentication failed");
		case arMessageTooLong:   return QString::fromUtf8("message too long");
		case arNoTextsRemaining: return QString::fromUtf8("no texts remaining");
		case arNoRecipients:     return QString::fromUtf8("no recipients");
	}
	throw LogicError("Unhandled SendReport abort reason: %1", static_cast<int>(aReason));
}
