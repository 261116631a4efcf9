#include "WebSession.hpp"
#include <QDateTime>
#include "../DB/CookieCache.hpp"





const int WebSession::SESSION_VALIDITY_SECONDS;





WebSession::WebSession(
	CarrierKind aKind,
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mKind(aKind),
	mHttpClient(std::move(aHttpClient)),
	mLogger(aLogger, carrierName(aKind) + ": "),
	mCookieCache(std::move(aCookieCache)),
	mNumAuthentications(0)
{
	if (mHttpClient == nullptr)
	{
		throw LogicError("WebSession needs a HttpClient");
	}
}





bool WebSession::startAuthentication(const QString & aUsername, const QByteArray & aSessionCookieName)
{
	mNumAuthentications += 1;
	const auto carrier = carrierName(mKind);
	if ((mNumAuthentications == 1) && (mCookieCache != nullptr))
	{
		auto cached = mCookieCache->cookies(carrier, aUsername);
		auto now = QDateTime::currentDateTimeUtc();
		for (const auto & cookie: cached)
		{
			if ((cookie.name() == aSessionCookieName) && (cookie.expirationDate() > now))
			{
				mLogger.log("Reusing the cached session of %1, valid until %2",
					aUsername, cookie.expirationDate().toString(Qt::ISODate)
				);
				mHttpClient->setCookies(cached);
				return true;
			}
		}
	}

	// Log in anew:
	mHttpClient->clearCookies();
	if ((mNumAuthentications > 1) && (mCookieCache != nullptr))
	{
		mCookieCache->remove(carrier, aUsername);
	}
	mLogger.log("Logging in as %1 (attempt %2)", aUsername, mNumAuthentications);
	return false;
}





void WebSession::finishAuthentication(
	const QString & aUsername,
	const QByteArray & aSessionCookieName,
	const QByteArray & aExpiryCookieName
)
{
	mLogger.log("Logged in as %1", aUsername);
	if (mCookieCache == nullptr)
	{
		return;
	}

	auto cookies = mHttpClient->cookies();
	auto expiry = QDateTime::currentDateTimeUtc().addSecs(SESSION_VALIDITY_SECONDS);
	if (!aExpiryCookieName.isEmpty())
	{
		for (const auto & cookie: cookies)
		{
			if ((cookie.name() == aExpiryCookieName) && !cookie.isSessionCookie())
			{
				expiry = cookie.expirationDate();
			}
		}
	}
	bool hasSessionCookie = false;
	for (auto & cookie: cookies)
	{
		if (cookie.name() == aSessionCookieName)
		{
			cookie.setExpirationDate(expiry);
			hasSessionCookie = true;
		}
	}
	if (!hasSessionCookie)
	{
		mLogger.log("The login didn't set the %1 cookie, not caching the session", aSessionCookieName);
		return;
	}
	mCookieCache->store(carrierName(mKind), aUsername, cookies);
}





HttpClient::Response WebSession::authGet(const QUrl & aUrl, const HttpClient::Headers & aHeaders)
{
	try
	{
		auto resp = mHttpClient->get(aUrl, aHeaders);
		if (resp.mStatusCode >= 400)
		{
			throw CarrierSession::AuthError(mLogger, "Login request to %1 failed with HTTP status %2",
				aUrl, resp.mStatusCode
			);
		}
		return resp;
	}
	catch (const HttpClient::Error & exc)
	{
		throw CarrierSession::AuthError(mLogger, "Cannot log in: %1", exc.message());
	}
}





HttpClient::Response WebSession::authPost(
	const QUrl & aUrl,
	const HttpClient::Form & aForm,
	const HttpClient::Headers & aHeaders
)
{
	try
	{
		auto resp = mHttpClient->post(aUrl, aForm, aHeaders);
		if (resp.mStatusCode >= 400)
		{
			throw CarrierSession::AuthError(mLogger, "Login request to %1 failed with HTTP status %2",
				aUrl, resp.mStatusCode
			);
		}
		return resp;
	}
	catch (const HttpClient::Error & exc)
	{
		throw CarrierSession::AuthError(mLogger, "Cannot log in: %1", exc.message());
	}
}





HttpClient::Response WebSession::sendGet(const QUrl & aUrl, const HttpClient::Headers & aHeaders)
{
	try
	{
		auto resp = mHttpClient->get(aUrl, aHeaders);
		checkSendStatus(resp, aUrl);
		return resp;
	}
	catch (const HttpClient::TimeoutError & exc)
	{
		throw SendError(mLogger, SendError::skTimeout, "%1", exc.message());
	}
	catch (const HttpClient::Error & exc)
	{
		throw SendError(mLogger, SendError::skTransport, "%1", exc.message());
	}
}





HttpClient::Response WebSession::sendPost(
	const QUrl & aUrl,
	const HttpClient::Form & aForm,
	const HttpClient::Headers & aHeaders
)
{
	try
	{
		auto resp = mHttpClient->post(aUrl, aForm, aHeaders);
		checkSendStatus(resp, aUrl);
		return resp;
	}
	catch (const HttpClient::TimeoutError & exc)
	{
		throw SendError(mLogger, SendError::skTimeout, "%1", exc.message());
	}
	catch (const HttpClient::Error & exc)
	{
		throw SendError(mLogger, SendError::skTransport, "%1", exc.message());
	}
}





bool WebSession::tryGet(const QUrl & aUrl, HttpClient::Response & aResponse, const HttpClient::Headers & aHeaders)
{
	try
	{
		aResponse = mHttpClient->get(aUrl, aHeaders);
	}
	catch (const HttpClient::Error & exc)
	{
		mLogger.log("GET %1 failed: %2", aUrl, exc.message());
		return false;
	}
	return aResponse.isSuccess();
}





bool WebSession::tryPost(
	const QUrl & aUrl,
	const HttpClient::Form & aForm,
	HttpClient::Response & aResponse,
	const HttpClient::Headers & aHeaders
)
{
	try
	{
		aResponse = mHttpClient->post(aUrl, aForm, aHeaders);
	}
	catch (const HttpClient::Error & exc)
	{
		mLogger.log("POST %1 failed: %2", aUrl, exc.message());
		return false;
	}
	return aResponse.isSuccess();
}





bool WebSession::hasCookie(const QByteArray & aName) const
{
	for (const auto & cookie: mHttpClient->cookies())
	{
		if (cookie.name() == aName)
		{
			return true;
		}
	}
	return false;
}





void WebSession::logUnrecognizedResponse(const HttpClient::Response & aResponse, const QString & aWhat)
{
	mLogger.logBlock(aResponse.mBody, "Unrecognized response to %1 (HTTP %2, final URL %3):",
		aWhat, aResponse.mStatusCode, aResponse.mFinalUrl
	);
}





QString WebSession::scrape(const QByteArray & aBody, const QRegularExpression & aPattern)
{
	auto match = aPattern.match(QString::fromUtf8(aBody));
	if (!match.hasMatch())
	{
		return QString();
	}
	return match.captured(1);
}





void WebSession::checkSendStatus(const HttpClient::Response & aResponse, const QUrl & aUrl)
{
	if ((aResponse.mStatusCode == 401) || (aResponse.mStatusCode == 403))
	{
		throw CarrierSession::AuthError(mLogger, "The session has expired (HTTP %1 from %2)",
			aResponse.mStatusCode, aUrl
		);
	}
	if (aResponse.mStatusCode >= 400)
	{
		throw SendError(mLogger, SendError::skTransport, "HTTP status %1 from %2",
			aResponse.mStatusCode, aUrl
		);
	}
}
