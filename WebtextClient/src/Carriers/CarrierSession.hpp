#pragma once

#include <memory>
#include <QByteArray>
#include <QString>
#include "../Exception.hpp"
#include "../Sms/MessageSplitter.hpp"
#include "CarrierKind.hpp"





/** Thrown when sending a single chunk to a single number fails.
The failure is recorded for that (number, chunk) pair only, other sends continue. */
class SendError:
	public RuntimeError
{
	using Super = RuntimeError;


public:

	/** The reason of the failure. */
	enum Kind
	{
		skTransport,           ///< The request couldn't be delivered to the carrier (network error, HTTP error status)
		skRejectedNumber,      ///< The carrier (or its number format check) rejected the recipient number
		skUnexpectedResponse,  ///< The carrier's response didn't match the expected success indicator
		skTimeout,             ///< The request to the carrier timed out
		skSessionLost,         ///< The carrier session expired and couldn't be re-established (recorded by the orchestrator)
		skCancelled,           ///< The send was cancelled by the user before it started (recorded by the orchestrator)
	};


	/** Creates a new exception of the specified kind, with the description formatted using StringFormatter. */
	template <typename... OtherTs>
	SendError(Kind aKind, const QString & aFormatString, const OtherTs &... aArgValues):
		Super(aFormatString, aArgValues...),
		mKind(aKind)
	{
	}

	/** Creates a new exception of the specified kind, with the description formatted using StringFormatter.
	Logs the description into aLogger. */
	template <typename... OtherTs>
	SendError(PrefixLogger & aLogger, Kind aKind, const QString & aFormatString, const OtherTs &... aArgValues):
		Super(aLogger, aFormatString, aArgValues...),
		mKind(aKind)
	{
	}

	Kind kind() const { return mKind; }

	/** Returns the short lowercase name of the kind, used in the reports. */
	static QString kindName(Kind aKind);


protected:

	Kind mKind;
};





/** The interface to a single carrier's webtext service, for the duration of one send request.
Each carrier has its own implementation, encapsulating the endpoint URLs, the form fields,
the success detection heuristics and the session expiry detection.
A session is stateful (cookies, scraped tokens) and is used by a single thread at a time.

State machine:
Unauthenticated -(authenticate)-> Authenticated -(sendChunk)*-> Authenticated | Expired
An expired session reports itself by throwing an AuthError from sendChunk(); the caller then calls
authenticate() again (which always logs in anew) and retries; a second consecutive failure is terminal. */
class CarrierSession
{
public:

	/** Thrown when the login is rejected, the session cannot be established (network error,
	unexpected page) or when the session has expired while sending. */
	class AuthError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** The value returned by textsRemaining() when the allowance cannot be determined. */
	static const int UNKNOWN_TEXTS_REMAINING = -1;


	virtual ~CarrierSession() {}

	/** Returns the carrier that this session talks to. */
	virtual CarrierKind kind() const = 0;

	/** Logs into the carrier's webtext service.
	The first call may reuse a cached session instead, if one is available and still valid;
	all subsequent calls always log in anew.
	Throws an AuthError if the login is rejected or the session cannot be established. */
	virtual void authenticate(const QString & aUsername, const QString & aPassword) = 0;

	/** Returns the maximum length of a single message that the carrier's form accepts. */
	virtual int maxMessageLength() const = 0;

	/** Returns the number in the form that the carrier's form expects.
	The default implementation accepts any valid phone number, in its canonical form.
	Throws a SendError(skRejectedNumber) if the number cannot be served by this carrier. No network I/O is done. */
	virtual QString normalizeNumber(const QString & aNumber) const;

	/** Returns the number of free webtexts remaining for the account, as reported by the carrier.
	Returns UNKNOWN_TEXTS_REMAINING if it cannot be determined. Needs to be authenticated. Doesn't throw. */
	virtual int textsRemaining() = 0;

	/** Sends the chunk to the specified number (already normalized by normalizeNumber()).
	Throws a SendError on failure, or an AuthError if the carrier session has expired. */
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) = 0;

	/** Returns true if the response body of the send request indicates success.
	This is the only place where the carrier's send response is interpreted. */
	virtual bool detectSuccess(const QByteArray & aResponseBody) const = 0;
};

using CarrierSessionPtr = std::unique_ptr<CarrierSession>;





/** The interface for creating carrier sessions.
The SendOrchestrator uses it to create the primary session and one session for each additional lane. */
class CarrierSessionFactory
{
public:

	virtual ~CarrierSessionFactory() {}

	/** Creates a new, unauthenticated session for the specified carrier.
	If aUseCookieCache is true, the session may reuse a cached login and stores its login in the cache.
	Only one session of a request (the primary one) uses the cache, so that concurrent sessions don't share
	one server-side session. */
	virtual CarrierSessionPtr createSession(CarrierKind aKind, bool aUseCookieCache) = 0;
};
