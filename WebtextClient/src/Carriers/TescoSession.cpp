#include "TescoSession.hpp"
#include <QJsonDocument>
#include <QJsonObject>





static const char * LOGIN_URL     = "https://www.tescomobile.ie/login";
static const char * LOGGED_IN_URL = "https://www.tescomobile.ie/myaccount";
static const char * FORM_URL      = "https://www.tescomobile.ie/myaccount/webtext";
static const char * SEND_URL      = "https://www.tescomobile.ie/myaccount/webtext/send";
static const char * SESSION_COOKIE = "SESSION";





TescoSession::TescoSession(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mWeb(crTesco, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





void TescoSession::authenticate(const QString & aUsername, const QString & aPassword)
{
	if (mWeb.startAuthentication(aUsername, SESSION_COOKIE))
	{
		return;
	}

	auto page = mWeb.authGet(QUrl(LOGIN_URL));
	auto csrf = scrapeCsrf(page.mBody);
	if (csrf.isEmpty())
	{
		mWeb.logUnrecognizedResponse(page, "the login page");
		throw AuthError(mWeb.logger(), "The login page has no CSRF token");
	}
	auto resp = mWeb.authPost(QUrl(LOGIN_URL),
		{
			{"_csrf",    csrf},
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





int TescoSession::textsRemaining()
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
		mWeb.logUnrecognizedResponse(resp, "the webtext page");
		return UNKNOWN_TEXTS_REMAINING;
	}
	return remaining.toInt();
}





void TescoSession::sendChunk(const QString & aNumber, const MessageChunk & aChunk)
{
	auto page = mWeb.sendGet(QUrl(FORM_URL));
	if (isLoginPage(page))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", page.mFinalUrl);
	}
	auto csrf = scrapeCsrf(page.mBody);
	if (csrf.isEmpty())
	{
		mWeb.logUnrecognizedResponse(page, "the webtext page");
		throw SendError(mWeb.logger(), SendError::skUnexpectedResponse, "The webtext page has no CSRF token");
	}

	auto resp = mWeb.sendPost(QUrl(SEND_URL),
		{
			{"_csrf",     csrf},
			{"recipient", aNumber},
			{"message",   aChunk.renderedText()},
		},
		{{"X-Requested-With", "XMLHttpRequest"}}
	);
	if (isLoginPage(resp))
	{
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", resp.mFinalUrl);
	}
	if (resp.mBody.contains("INVALID_NUMBER"))
	{
		throw SendError(mWeb.logger(), SendError::skRejectedNumber, "The carrier rejected the number %1", aNumber);
	}
	if (!detectSuccess(resp.mBody))
	{
		mWeb.logUnrecognizedResponse(resp, "the send request");
		throw SendError(mWeb.logger(), SendError::skUnexpectedResponse,
			"Sending chunk %1/%2 to %3 not confirmed by the carrier", aChunk.mIndex, aChunk.mTotal, aNumber
		);
	}
	mWeb.logger().log("Sent chunk %1/%2 to %3", aChunk.mIndex, aChunk.mTotal, aNumber);
}





bool TescoSession::detectSuccess(const QByteArray & aResponseBody) const
{
	auto doc = QJsonDocument::fromJson(aResponseBody);
	if (!doc.isObject())
	{
		return false;
	}
	return (doc.object().value("status").toString() == "OK");
}





QString TescoSession::scrapeCsrf(const QByteArray & aPage)
{
	static const QRegularExpression reCsrf("name=\"_csrf\"\\s+value=\"([^\"]+)\"");
	return WebSession::scrape(aPage, reCsrf);
}





bool TescoSession::isLoginPage(const HttpClient::Response & aResponse)
{
	return aResponse.mFinalUrl.toString().startsWith(LOGIN_URL);
}
