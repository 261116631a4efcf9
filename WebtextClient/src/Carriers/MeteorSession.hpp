#pragma once

#include "CarrierSession.hpp"
#include "WebSession.hpp"





/** Sends webtexts through Meteor's "MyMeteor" portal.
The login is a plain form POST, the success is recognized by the redirect to the landing page.
Sending is done through the portal's AJAX API: first the recipient is added to the server-side recipient list,
then the message is sent to the list.
The same API family is used by eMobile, see EmobileSession. */
class MeteorSession:
	public CarrierSession
{
public:

	/** The portal-specific URLs and names. */
	struct Endpoints
	{
		/** The carrier served by the portal. */
		CarrierKind mKind;

		/** The URL where the login form is POSTed. */
		const char * mLoginUrl;

		/** The final URL after a successful login starts with this. */
		const char * mLoggedInUrl;

		/** The page showing the number of free texts remaining. */
		const char * mTextsRemainingUrl;

		/** The AJAX API endpoint. */
		const char * mApiUrl;

		/** The name of the cookie that holds the login session. */
		const char * mSessionCookieName;
	};


	/** The maximum length of a single message accepted by the portal's form. */
	static const int MAX_MESSAGE_LENGTH = 480;


	/** Creates a new session for Meteor. */
	MeteorSession(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	// CarrierSession overrides:
	virtual CarrierKind kind() const override { return mEndpoints.mKind; }
	virtual void authenticate(const QString & aUsername, const QString & aPassword) override;
	virtual int maxMessageLength() const override { return MAX_MESSAGE_LENGTH; }
	virtual QString normalizeNumber(const QString & aNumber) const override;
	virtual int textsRemaining() override;
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) override;
	virtual bool detectSuccess(const QByteArray & aResponseBody) const override;


protected:

	/** The portal to talk to. */
	const Endpoints & mEndpoints;

	/** The HTTP plumbing. */
	WebSession mWeb;


	/** Creates a new session for the portal with the specified endpoints. */
	MeteorSession(
		const Endpoints & aEndpoints,
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	/** Throws an AuthError if the response shows that the portal has logged us out
	(the request was redirected to the login page). */
	void checkSessionAlive(const HttpClient::Response & aResponse);
};





/** Sends webtexts through eMobile's account portal, which runs the same software as MyMeteor. */
class EmobileSession:
	public MeteorSession
{
public:

	EmobileSession(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);
};
