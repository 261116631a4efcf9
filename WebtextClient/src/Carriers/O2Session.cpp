#include "O2Session.hpp"
#include "LenientJson.hpp"





static const char * LOGIN_URL = "https://www.o2online.ie/amserver/UI/Login";
static const char * LOGGED_IN_URL = "http://www.o2online.ie/wps/wcm/connect/O2/Logged+in/LoginCheck";
static const char * SSO_MANAGER_URL =
	"http://messaging.o2online.ie/ssomanager.osp?APIID=AUTH-WEBSSO"
	"&TargetApp=o2om_smscenter_new.osp%3FMsgContentID%3D-1%26SID%3D_";
static const char * EVALUATE_URL = "http://messaging.o2online.ie/smscenter_evaluate.osp";
static const char * SEND_URL = "http://messaging.o2online.ie/smscenter_send.osp";
static const char * MESSAGING_REFERER = "http://messaging.o2online.ie/";
static const char * SESSION_COOKIE = "iPlanetDirectoryPro";





O2Session::O2Session(
	std::unique_ptr<HttpClient> aHttpClient,
	Logger & aLogger,
	std::shared_ptr<CookieCache> aCookieCache
):
	mWeb(crO2, std::move(aHttpClient), aLogger, std::move(aCookieCache))
{
}





void O2Session::authenticate(const QString & aUsername, const QString & aPassword)
{
	mSid.clear();
	if (mWeb.startAuthentication(aUsername, SESSION_COOKIE))
	{
		if (findSid())
		{
			return;
		}
		// The cached SSO session is no longer valid, log in anew:
		mWeb.logger().log("The cached session didn't provide a SID, logging in");
		if (mWeb.startAuthentication(aUsername, SESSION_COOKIE))
		{
			throw LogicError("A repeated authentication must not reuse the cached session");
		}
	}

	login(aUsername, aPassword);
	if (!findSid())
	{
		throw AuthError(mWeb.logger(), "Logged in, but the messaging center didn't provide a SID");
	}
	mWeb.finishAuthentication(aUsername, SESSION_COOKIE);
}





void O2Session::login(const QString & aUsername, const QString & aPassword)
{
	auto resp = mWeb.authPost(QUrl(LOGIN_URL),
		{
			{"org",            "o2ext"},
			{"IDButton",       "Go"},
			{"CONNECTFORMGET", "TRUE"},
			{"IDToken1",       aUsername},
			{"IDToken2",       aPassword},
		},
		{{"Referer", LOGGED_IN_URL}}
	);
	if (!resp.mFinalUrl.toString().contains("LoginCheck"))
	{
		throw AuthError(mWeb.logger(), "The login was rejected, ended up at %1", resp.mFinalUrl);
	}
}





bool O2Session::findSid()
{
	static const QRegularExpression reSid("o2om_smscenter_new\\.osp\\?MsgContentID=-1&SID=_&SID=(\\w+)");
	HttpClient::Response resp{};
	if (!mWeb.tryGet(QUrl::fromEncoded(SSO_MANAGER_URL), resp))
	{
		return false;
	}
	mSid = WebSession::scrape(resp.mBody, reSid);
	if (mSid.isEmpty())
	{
		mWeb.logUnrecognizedResponse(resp, "the SSO manager");
		return false;
	}
	return true;
}





int O2Session::textsRemaining()
{
	HttpClient::Response resp{};
	if (!mWeb.tryPost(QUrl(EVALUATE_URL),
		{
			{"SID",     mSid},
			{"SMSText", "text"},
			{"FID",     "6406"},
		},
		resp,
		{{"Referer", MESSAGING_REFERER}}
	))
	{
		return UNKNOWN_TEXTS_REMAINING;
	}
	try
	{
		auto obj = LenientJson::parseObject(resp.mBody);
		auto count = obj.value("freeMessageCount");
		if (count.isDouble())
		{
			return count.toInt();
		}
		if (count.isString())
		{
			bool isOK = false;
			auto res = count.toString().toInt(&isOK);
			if (isOK)
			{
				return res;
			}
		}
	}
	catch (const LenientJson::ParseError & exc)
	{
		mWeb.logger().log("Cannot parse the free texts response: %1", exc.message());
	}
	mWeb.logUnrecognizedResponse(resp, "the free texts query");
	return UNKNOWN_TEXTS_REMAINING;
}





void O2Session::sendChunk(const QString & aNumber, const MessageChunk & aChunk)
{
	auto resp = mWeb.sendPost(QUrl(SEND_URL),
		{
			{"SID",          mSid},
			{"MsgContentID", "-1"},
			{"SMSTo",        aNumber},
			{"SMSText",      aChunk.renderedText()},
		},
		{{"Referer", MESSAGING_REFERER}}
	);
	if (resp.mFinalUrl.host() != QUrl(SEND_URL).host())
	{
		// The messaging center redirects to the SSO login when the session is gone
		throw AuthError(mWeb.logger(), "The session has expired, redirected to %1", resp.mFinalUrl);
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





bool O2Session::detectSuccess(const QByteArray & aResponseBody) const
{
	try
	{
		return LenientJson::parseObject(aResponseBody).value("isSuccess").toBool();
	}
	catch (const LenientJson::ParseError &)
	{
		return false;
	}
}
