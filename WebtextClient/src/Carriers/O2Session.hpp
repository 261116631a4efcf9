#pragma once

#include "CarrierSession.hpp"
#include "WebSession.hpp"





/** Sends webtexts through O2 Ireland's messaging center.
The login goes through O2's single-sign-on server, then the messaging center's session ID (SID) is scraped
from the SSO manager's redirect page. The messaging center answers with JavaScript object literals
rather than proper JSON, these are parsed by LenientJson. */
class O2Session:
	public CarrierSession
{
public:

	static const int MAX_MESSAGE_LENGTH = 480;


	O2Session(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	// CarrierSession overrides:
	virtual CarrierKind kind() const override { return crO2; }
	virtual void authenticate(const QString & aUsername, const QString & aPassword) override;
	virtual int maxMessageLength() const override { return MAX_MESSAGE_LENGTH; }
	virtual int textsRemaining() override;
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) override;
	virtual bool detectSuccess(const QByteArray & aResponseBody) const override;

	/** Returns the messaging center's session ID, empty if not logged in. */
	const QString & sid() const { return mSid; }


protected:

	WebSession mWeb;

	/** The messaging center's session ID, scraped after the login. */
	QString mSid;


	/** Scrapes the messaging center's SID using the current SSO session.
	Returns true on success. */
	bool findSid();

	/** Logs into the SSO server. Throws an AuthError on failure. */
	void login(const QString & aUsername, const QString & aPassword);
};
