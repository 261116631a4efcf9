#pragma once

#include "CarrierSession.hpp"
#include "WebSession.hpp"





/** Sends webtexts through Vodafone Ireland's "My Vodafone" portal.
The webtext form is protected by a one-time Struts token, so the form page is loaded before each send
and the token is scraped from it (the same page also shows the free texts remaining). */
class VodafoneSession:
	public CarrierSession
{
public:

	static const int MAX_MESSAGE_LENGTH = 480;


	VodafoneSession(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	// CarrierSession overrides:
	virtual CarrierKind kind() const override { return crVodafone; }
	virtual void authenticate(const QString & aUsername, const QString & aPassword) override;
	virtual int maxMessageLength() const override { return MAX_MESSAGE_LENGTH; }
	virtual int textsRemaining() override;
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) override;
	virtual bool detectSuccess(const QByteArray & aResponseBody) const override;


protected:

	WebSession mWeb;


	/** Loads the webtext form page and returns the Struts token scraped from it.
	Throws an AuthError if the portal has logged us out, SendError if the token is not found. */
	QString fetchFormToken();

	/** Returns true if the response is the portal's login page. */
	static bool isLoginPage(const HttpClient::Response & aResponse);
};
