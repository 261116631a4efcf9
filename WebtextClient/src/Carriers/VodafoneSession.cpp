#include "VodafoneSession.hpp"





static const char * LOGIN_URL     = "https://www.vodafone.ie/myv/services/login/Login.shtml";
static const char * LOGGED_IN_URL = "https://www.vodafone.ie/myv/index.jsp";
static const char * FORM_URL      = "https://www.vodafone.ie/myv/messaging/webtext/index.jsp";
static const char * SEND_URL      = "https://www.vodafone.ie/myv/messaging/webtext/Process.shtml";
static const char * SESSION_COOKIE = "JSESSIONID";
static const char * TOKEN_FIELD   = "org.apache.struts.taglib.html.TOKEN";





VodafoneSession::VodafoneSession(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mWeb(crVodafone, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





void VodafoneSession::authenticate(const QString & aUsername, const QString & aPassword)
{
	if (mWeb.startAuthentication(aUsername, SESSION_COOKIE))
	{
		return;
	}

	auto resp = mWeb.authPost(QUrl(LOGIN_URL),
		{
			{"username", aUsername},
			{"password", aPassword},
		}
	);
	if (!resp.mFinalUrl.toString().startsWith(LOGGED_IN_URL))
	{
		throw AuthError(mWeb.logger(), "The login was rejected, ended up at %1", resp.mFinalUrl);
	}
	mWeb.finishAuthentication(aUsername, SESSION_COOKIE);
}





int VodafoneSession::textsRemaining()
{
	static const QRegularExpression reRemaining("(\\d+)\\s+free\\s+texts?\\s+remaining", QRegularExpression::CaseInsensitiveOption);
	HttpClient::Response resp{};
	if (!mWeb.tryGet(QUrl(FORM_URL), resp) || isLoginPage(resp))
	{
		return UNKNOWN_TEXTS_REMAINING;
	}
	auto remaining = WebSession::scrape(resp.mBody, reRemaining);
	if (remaining.isEmpty())
	{
		mWeb.logUnrecognizedResponse(resp, "the webtext form page");
		return UNKNOWN_TEXTS_REMAINING;
	}
	return remaining.toInt();
}





void VodafoneSession::sendChunk(const QString & aNumber, const MessageChunk & aChunk)
{
	auto token = fetchFormToken();
	auto resp = mWeb.sendPost(QUrl(SEND_URL),
		{
			{TOKEN_FIELD,     token},
			{"message",       aChunk.renderedText()},
			{"recipients[0]", aNumber},
			{"futuredate",    "false"},
			{"futuretime",    "false"},
		}
	);
	if (isLoginPage(resp))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", resp.mFinalUrl);
	}
	if (resp.mBody.contains("not a valid"))
	{
		throw SendError(mWeb.logger(), SendError::skRejectedNumber, "The carrier rejected the number %1", aNumber);
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





bool VodafoneSession::detectSuccess(const QByteArray & aResponseBody) const
{
	return aResponseBody.contains("Message sent!");
}





QString VodafoneSession::fetchFormToken()
{
	static const QRegularExpression reToken(
		"name=\"org\\.apache\\.struts\\.taglib\\.html\\.TOKEN\"\\s+value=\"(\\w+)\""
	);
	auto resp = mWeb.sendGet(QUrl(FORM_URL));
	if (isLoginPage(resp))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", resp.mFinalUrl);
	}
	auto token = WebSession::scrape(resp.mBody, reToken);
	if (token.isEmpty())
	{
		mWeb.logUnrecognizedResponse(resp, "the webtext form page");
		throw SendError(mWeb.logger(), SendError::skUnexpectedResponse, "The webtext form has no token");
	}
	return token;
}





bool VodafoneSession::isLoginPage(const HttpClient::Response & aResponse)
{
	return aResponse.mFinalUrl.path().contains("/login/", Qt::CaseInsensitive);
}
