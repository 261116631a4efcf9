#pragma once

#include "CarrierSession.hpp"
#include "WebSession.hpp"





/** Sends webtexts through Three Ireland's webtext site.
Both the login and the send are plain form POSTs; the send page itself shows the remaining texts. */
class ThreeSession:
	public CarrierSession
{
public:

	static const int MAX_MESSAGE_LENGTH = 480;


	ThreeSession(
		std::unique_ptr<HttpClient> aHttpClient,
		Logger & aLogger,
		std::shared_ptr<CookieCache> aCookieCache
	);

	// CarrierSession overrides:
	virtual CarrierKind kind() const override { return crThree; }
	virtual void authenticate(const QString & aUsername, const QString & aPassword) override;
	virtual int maxMessageLength() const override { return MAX_MESSAGE_LENGTH; }
	virtual int textsRemaining() override;
	virtual void sendChunk(const QString & aNumber, const MessageChunk & aChunk) override;
	virtual bool detectSuccess(const QByteArray & aResponseBody) const override;


protected:

	WebSession mWeb;
};
