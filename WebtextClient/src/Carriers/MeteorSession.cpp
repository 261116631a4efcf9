#include "MeteorSession.hpp"
#include "../Sms/PhoneNumber.hpp"





static const MeteorSession::Endpoints METEOR_ENDPOINTS =
{
	crMeteor,
	"https://www.mymeteor.ie/go/mymeteor-login-manager",
	"https://www.mymeteor.ie/postpaylanding",
	"https://www.mymeteor.ie/go/freewebtext",
	"https://www.mymeteor.ie/mymeteorapi/index.cfm",
	"JSESSIONID",
};

static const MeteorSession::Endpoints EMOBILE_ENDPOINTS =
{
	crEmobile,
	"https://myaccount.emobile.ie/go/myaccount-login-manager",
	"https://myaccount.emobile.ie/go/myaccount",
	"https://myaccount.emobile.ie/go/freewebtext",
	"https://myaccount.emobile.ie/myemobileapi/index.cfm",
	"JSESSIONID",
};





////////////////////////////////////////////////////////////////////////////////
// MeteorSession:

MeteorSession::MeteorSession(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	MeteorSession(METEOR_ENDPOINTS, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





MeteorSession::MeteorSession(
	const Endpoints & aEndpoints,
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mEndpoints(aEndpoints),
	mWeb(aEndpoints.mKind, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





void MeteorSession::authenticate(const QString & aUsername, const QString & aPassword)
{
	if (mWeb.startAuthentication(aUsername, mEndpoints.mSessionCookieName))
	{
		return;
	}

	auto resp = mWeb.authPost(QUrl(mEndpoints.mLoginUrl),
		{
			{"username", aUsername},
			{"userpass", aPassword},
			{"login",    ""},
			{"returnTo", "/"},
		}
	);
	if (!resp.mFinalUrl.toString().startsWith(mEndpoints.mLoggedInUrl))
	{
		throw AuthError(mWeb.logger(), "The login was rejected, ended up at %1", resp.mFinalUrl);
	}
	mWeb.finishAuthentication(aUsername, mEndpoints.mSessionCookieName);
}





QString MeteorSession::normalizeNumber(const QString & aNumber) const
{
	auto national = PhoneNumber::irishToNational(CarrierSession::normalizeNumber(aNumber));
	if (!PhoneNumber::isIrishMobile(national))
	{
		throw SendError(SendError::skRejectedNumber,
			"%1 is invalid; expected 10 digits beginning with 08", national
		);
	}
	return national;
}





int MeteorSession::textsRemaining()
{
	static const QRegularExpression reRemaining(
		"Free web texts left <input type=\"text\" id=\"numfreesmstext\" value=\"(\\d+)\" disabled size=2>"
	);
	HttpClient::Response resp{};
	if (!mWeb.tryGet(QUrl(mEndpoints.mTextsRemainingUrl), resp))
	{
		return UNKNOWN_TEXTS_REMAINING;
	}
	auto remaining = WebSession::scrape(resp.mBody, reRemaining);
	if (remaining.isEmpty())
	{
		mWeb.logUnrecognizedResponse(resp, "the free texts query");
		return UNKNOWN_TEXTS_REMAINING;
	}
	return remaining.toInt();
}





void MeteorSession::sendChunk(const QString & aNumber, const MessageChunk & aChunk)
{
	const QUrl apiUrl(mEndpoints.mApiUrl);

	// Add the recipient to the server-side list:
	auto resp = mWeb.sendGet(HttpClient::withQuery(apiUrl,
		{
			{"event",       "smsAjax"},
			{"func",        "addEnteredMsisdns"},
			{"ajaxRequest", "addEnteredMSISDNs"},
			{"remove",      "-"},
			{"add",         "0|" + aNumber},
		}
	));
	checkSessionAlive(resp);

	// Send the message to the list:
	resp = mWeb.sendGet(HttpClient::withQuery(apiUrl,
		{
			{"event",       "smsAjax"},
			{"func",        "sendSMS"},
			{"ajaxRequest", "sendSMS"},
			{"messageText", aChunk.renderedText()},
		}
	));
	checkSessionAlive(resp);
	if (!detectSuccess(resp.mBody))
	{
		mWeb.logUnrecognizedResponse(resp, "sendSMS");
		throw SendError(mWeb.logger(), SendError::skUnexpectedResponse,
			"Sending chunk %1/%2 to %3 not confirmed by the carrier", aChunk.mIndex, aChunk.mTotal, aNumber
		);
	}
	mWeb.logger().log("Sent chunk %1/%2 to %3", aChunk.mIndex, aChunk.mTotal, aNumber);
}





bool MeteorSession::detectSuccess(const QByteArray & aResponseBody) const
{
	static const QRegularExpression reSent("showEl\\(\"sentTrue\"\\)");
	return reSent.match(QString::fromUtf8(aResponseBody)).hasMatch();
}





void MeteorSession::checkSessionAlive(const HttpClient::Response & aResponse)
{
	if (aResponse.mFinalUrl.path().contains("login", Qt::CaseInsensitive))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", aResponse.mFinalUrl);
	}
}





////////////////////////////////////////////////////////////////////////////////
// EmobileSession:

EmobileSession::EmobileSession(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	MeteorSession(EMOBILE_ENDPOINTS, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}
