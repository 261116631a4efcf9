#pragma once

#include "CarrierSession.hpp"
#include "WebSession.hpp"





/** Sends webtexts through Tesco Mobile Ireland's account site.
Both the login form and the webtext form are CSRF-protected, the token is scraped from the respective page
before each POST. The send endpoint answers with a JSON status object.
Tesco limits the webtexts to a single SMS, 160 characters. */
class TescoSession:
	public CarrierSession
{
public:

	static const int MAX_MESSAGE_LENGTH = 160;


	TescoSession(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	// CarrierSession overrides:
	virtual CarrierKind kind() const override { return crTesco; }
	virtual void authenticate(const QString & aUsername, const QString & aPassword) override;
	virtual int maxMessageLength() const override { return MAX_MESSAGE_LENGTH; }
	virtual int textsRemaining() override;
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) override;
	virtual bool detectSuccess(const QByteArray & aResponseBody) const override;


protected:

	WebSession mWeb;


	/** Returns the CSRF token from the page, or an empty string if there's none. */
	static QString scrapeCsrf(const QByteArray & aPage);

	/** Returns true if the response is the site's login page. */
	static bool isLoginPage(const HttpClient::Response & aResponse);
};
