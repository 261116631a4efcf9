#include "QtHttpClient.hpp"
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkCookieJar>
#include <QNetworkReply>
#include <QTimer>





/** A cookie jar that makes the whole-jar accessors public, so that the cookies can be
moved in and out of the short-lived QNetworkAccessManager used for a single request. */
class ExposedCookieJar:
	public QNetworkCookieJar
{
public:
	using QNetworkCookieJar::allCookies;
	using QNetworkCookieJar::setAllCookies;
};





const char * QtHttpClient::USER_AGENT = "Mozilla/5.0 (X11; Linux x86_64; rv:102.0) Gecko/20100101 Firefox/102.0";





QtHttpClient::QtHttpClient(Logger & aLogger, int aTimeoutMsec):
	mLogger(aLogger),
	mTimeoutMsec(aTimeoutMsec)
{
}





HttpClient::Response QtHttpClient::get(const QUrl & aUrl, const Headers & aHeaders)
{
	QNetworkRequest request(aUrl);
	for (const auto & hdr: aHeaders)
	{
		request.setRawHeader(hdr.first, hdr.second);
	}
	mLogger.log("GET %1", aUrl.toString(QUrl::RemoveQuery));
	return perform(request, "GET", QByteArray());
}





HttpClient::Response QtHttpClient::post(const QUrl & aUrl, const Form & aForm, const Headers & aHeaders)
{
	QNetworkRequest request(aUrl);
	request.setHeader(QNetworkRequest::ContentTypeHeader, "application/x-www-form-urlencoded");
	for (const auto & hdr: aHeaders)
	{
		request.setRawHeader(hdr.first, hdr.second);
	}
	// Log the field names only, the values contain passwords and message texts:
	QStringList fieldNames;
	for (const auto & field: aForm)
	{
		fieldNames.append(field.first);
	}
	mLogger.log("POST %1, fields %2", aUrl.toString(QUrl::RemoveQuery), fieldNames.join(", "));
	return perform(request, "POST", encodeForm(aForm));
}





QList<QNetworkCookie> QtHttpClient::cookies() const
{
	QMutexLocker lock(&mMtxCookies);
	return mCookies;
}





void QtHttpClient::setCookies(const QList<QNetworkCookie> & aCookies)
{
	QMutexLocker lock(&mMtxCookies);
	mCookies = aCookies;
}





HttpClient::Response QtHttpClient::perform(QNetworkRequest & aRequest, const QByteArray & aVerb, const QByteArray & aBody)
{
	QNetworkAccessManager nam;
	auto jar = new ExposedCookieJar;  // Owned by nam
	jar->setAllCookies(cookies());
	nam.setCookieJar(jar);

	aRequest.setHeader(QNetworkRequest::UserAgentHeader, USER_AGENT);
	// The carriers redirect from https login pages to plain http ones, so the redirects need to be allowed manually:
	aRequest.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::UserVerifiedRedirectPolicy);

	QNetworkReply * reply = (aVerb == "POST") ? nam.post(aRequest, aBody) : nam.get(aRequest);
	QEventLoop loop;
	QTimer timer;
	timer.setSingleShot(true);
	bool hasTimedOut = false;
	QObject::connect(reply, &QNetworkReply::redirected, reply, &QNetworkReply::redirectAllowed);
	QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
	QObject::connect(&timer, &QTimer::timeout, &loop,
		[&hasTimedOut, reply]()
		{
			hasTimedOut = true;
			reply->abort();
		}
	);
	timer.start(mTimeoutMsec);
	if (!reply->isFinished())
	{
		loop.exec();
	}
	timer.stop();

	if (hasTimedOut)
	{
		throw TimeoutError(mLogger, "%1 %2 timed out after %3 msec",
			QString::fromUtf8(aVerb), aRequest.url().toString(QUrl::RemoveQuery), mTimeoutMsec
		);
	}
	auto statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
	if ((reply->error() != QNetworkReply::NoError) && (statusCode == 0))
	{
		// No HTTP response at all, this is a transport error:
		throw TransportError(mLogger, "%1 %2 failed: %3",
			QString::fromUtf8(aVerb), aRequest.url().toString(QUrl::RemoveQuery), reply->errorString()
		);
	}

	Response res;
	res.mStatusCode = statusCode;
	res.mFinalUrl = reply->url();
	res.mBody = reply->readAll();
	mLogger.log("  -> HTTP %1, %2 bytes, final URL %3",
		res.mStatusCode, res.mBody.size(), res.mFinalUrl.toString(QUrl::RemoveQuery)
	);

	// Keep the cookies for the next request:
	setCookies(jar->allCookies());
	return res;
}
