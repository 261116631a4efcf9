#include "ThreeSession.hpp"





static const char * LOGIN_URL = "https://webtexts.three.ie/webtext/users/login";
static const char * SEND_URL  = "https://webtexts.three.ie/webtext/messages/send";

/** The load balancer's cookie holding the session; it's a session cookie, so it gets the expiry of LOGIN_COOKIE. */
static const char * SESSION_COOKIE = "AWSELB";

/** The site's login cookie, which has a proper expiry. */
static const char * LOGIN_COOKIE = "CAKEPHP";





ThreeSession::ThreeSession(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mWeb(crThree, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





void ThreeSession::authenticate(const QString & aUsername, const QString & aPassword)
{
	if (mWeb.startAuthentication(aUsername, SESSION_COOKIE))
	{
		return;
	}

	auto resp = mWeb.authPost(QUrl(LOGIN_URL),
		{
			{"data[User][telephoneNo]", aUsername},
			{"data[User][pin]",         aPassword},
		}
	);
	if (!resp.mFinalUrl.toString().startsWith(SEND_URL))
	{
		throw AuthError(mWeb.logger(), "The login was rejected, ended up at %1", resp.mFinalUrl);
	}
	mWeb.finishAuthentication(aUsername, SESSION_COOKIE, LOGIN_COOKIE);
}





int ThreeSession::textsRemaining()
{
	static const QRegularExpression reRemaining("Remaining texts\\D*(\\d+) \\(of (\\d+)\\)");
	HttpClient::Response resp{};
	if (!mWeb.tryGet(QUrl(SEND_URL), resp))
	{
		return UNKNOWN_TEXTS_REMAINING;
	}
	auto remaining = WebSession::scrape(resp.mBody, reRemaining);
	if (remaining.isEmpty())
	{
		mWeb.logUnrecognizedResponse(resp, "the send page");
		return UNKNOWN_TEXTS_REMAINING;
	}
	return remaining.toInt();
}





void ThreeSession::sendChunk(const QString & aNumber, const MessageChunk & aChunk)
{
	auto resp = mWeb.sendPost(QUrl(SEND_URL),
		{
			{"data[Message][message]",               aChunk.renderedText()},
			{"data[Message][recipients_individual]", aNumber},
		}
	);
	if (resp.mFinalUrl.toString().startsWith(LOGIN_URL))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", resp.mFinalUrl);
	}
	if (!detectSuccess(resp.mBody))
	{
		mWeb.logUnrecognizedResponse(resp, "the send form");
		throw SendError(mWeb.logger(), SendError::skUnexpectedResponse,
			"Sending chunk %1/%2 to %3 not confirmed by the carrier", aChunk.mIndex, aChunk.mTotal, aNumber
		);
	}
	mWeb.logger().log("Sent chunk %1/%2 to %3", aChunk.mIndex, aChunk.mTotal, aNumber);
}





bool ThreeSession::detectSuccess(const QByteArray & aResponseBody) const
{
	return aResponseBody.contains("Message sent");
}
