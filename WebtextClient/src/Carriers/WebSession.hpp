#pragma once

#include <memory>
#include <QRegularExpression>
#include "../Http/HttpClient.hpp"
#include "CarrierSession.hpp"





// fwd:
class CookieCache;





/** The HTTP plumbing shared by all the CarrierSession implementations.
Each carrier session owns one WebSession and performs all its requests through it.
The request helpers translate the HttpClient failures into the carrier-level exceptions:
the auth* ones into CarrierSession::AuthError (used while logging in), the send* ones into SendError
(used while sending).
Also handles the session cookies' persistence through the (optional) CookieCache. */
class WebSession
{
public:

	/** How long a cached login session is considered valid. */
	static const int SESSION_VALIDITY_SECONDS = 30 * 60;


	/** Creates a new instance that uses the specified HTTP client and logs into the specified logger.
	aCookieCache may be nullptr, in which case the logins aren't cached. */
	WebSession(
		CarrierKind aKind,
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	/** Starts an authentication attempt.
	On the first call, tries to restore a cached session for the user; returns true if the cache has an unexpired
	aSessionCookieName cookie, the caller should then skip the login.
	On any other call (or if there's no cached session), clears all the cookies, drops the user's cached session
	and returns false, the caller should log in. */
	bool startAuthentication(const QString & aUsername, const QByteArray & aSessionCookieName);

	/** Marks the login as successful and stores the session in the cookie cache (if any).
	The aSessionCookieName cookie's expiry is set to the expiry of the aExpiryCookieName cookie, if given and present,
	or SESSION_VALIDITY_SECONDS from now otherwise. */
	void finishAuthentication(
		const QString & aUsername,
		const QByteArray & aSessionCookieName,
		const QByteArray & aExpiryCookieName = QByteArray()
	);

	/** Performs a GET request as part of the login. Any failure, including a HTTP error status, is an AuthError. */
	HttpClient::Response authGet(const QUrl & aUrl, const HttpClient::Headers & aHeaders = HttpClient::Headers());

	/** Performs a POST request as part of the login. Any failure, including a HTTP error status, is an AuthError. */
	HttpClient::Response authPost(
		const QUrl & aUrl,
		const HttpClient::Form & aForm,
		const HttpClient::Headers & aHeaders = HttpClient::Headers()
	);

	/** Performs a GET request as part of sending a message.
	Transport failures are reported as SendError(skTransport), timeouts as SendError(skTimeout),
	HTTP 401 / 403 as AuthError (expired session), other HTTP error statuses as SendError(skTransport). */
	HttpClient::Response sendGet(const QUrl & aUrl, const HttpClient::Headers & aHeaders = HttpClient::Headers());

	/** Performs a POST request as part of sending a message. The failures are reported the same as in sendGet(). */
	HttpClient::Response sendPost(
		const QUrl & aUrl,
		const HttpClient::Form & aForm,
		const HttpClient::Headers & aHeaders = HttpClient::Headers()
	);

	/** Performs a GET request that may fail without consequences (such as scraping the texts remaining).
	Returns true and fills aResponse on success (2xx), returns false on any failure. Doesn't throw. */
	bool tryGet(const QUrl & aUrl, HttpClient::Response & aResponse, const HttpClient::Headers & aHeaders = HttpClient::Headers());

	/** Performs a POST request that may fail without consequences. Same semantics as tryGet(). */
	bool tryPost(
		const QUrl & aUrl,
		const HttpClient::Form & aForm,
		HttpClient::Response & aResponse,
		const HttpClient::Headers & aHeaders = HttpClient::Headers()
	);

	/** Returns true if the client currently holds a cookie of the specified name. */
	bool hasCookie(const QByteArray & aName) const;

	/** Logs the response that the carrier code didn't recognize, including its body, for later diagnosis. */
	void logUnrecognizedResponse(const HttpClient::Response & aResponse, const QString & aWhat);

	/** Returns the first capture group of the first match of aPattern in aBody (decoded as UTF-8),
	or an empty string if there's no match. Used for scraping the values out of the carriers' pages. */
	static QString scrape(const QByteArray & aBody, const QRegularExpression & aPattern);

	/** Returns the logger to be used by the carrier code, it prefixes each message with the carrier's name. */
	PrefixLogger & logger() { return mLogger; }

	/** Returns the number of startAuthentication() calls so far. */
	int numAuthentications() const { return mNumAuthentications; }


protected:

	/** The carrier, used as the cookie cache key and log prefix. */
	CarrierKind mKind;

	/** The client performing the actual requests. */
	std::unique_ptr<HttpClient> mHttpClient;

	/** The logger for the carrier-level events. */
	PrefixLogger mLogger;

	/** The cache for the login cookies, nullptr if not to be used. */
	std::shared_ptr<CookieCache> mCookieCache;

	/** Number of startAuthentication() calls so far.
	Only the first one may restore a cached session. */
	int mNumAuthentications;


	/** Maps an HTTP error status received while sending to an exception.
	Does nothing for a 2xx / 3xx status. */
	void checkSendStatus(const HttpClient::Response & aResponse, const QUrl & aUrl);
};
