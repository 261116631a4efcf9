#pragma once

#include <QMutex>
#include <QNetworkRequest>
#include "HttpClient.hpp"





/** Implements the HttpClient interface using Qt's QNetworkAccessManager.
Each request is performed synchronously: a QNetworkAccessManager is created in the calling thread
and a local event loop is run until the reply finishes or the timeout expires, so that the client can be
used from any (single) thread, such as the SendOrchestrator's lanes.
The cookies are kept in the client between the requests and pre-loaded into each request's cookie jar. */
class QtHttpClient:
	public HttpClient
{
public:

	/** The User-Agent header sent with every request. The carriers' sites refuse unknown browsers. */
	static const char * USER_AGENT;


	/** Creates a new client that logs into the specified logger
	and aborts any request that takes longer than aTimeoutMsec. */
	QtHttpClient(Logger & aLogger, int aTimeoutMsec);

	// HttpClient overrides:
	virtual Response get(const QUrl & aUrl, const Headers & aHeaders = Headers()) override;
	virtual Response post(const QUrl & aUrl, const Form & aForm, const Headers & aHeaders = Headers()) override;
	virtual QList<QNetworkCookie> cookies() const override;
	virtual void setCookies(const QList<QNetworkCookie> & aCookies) override;


protected:

	/** The logger for the requests and their results. */
	Logger & mLogger;

	/** The maximum time a single request may take, including all its redirects. */
	int mTimeoutMsec;

	/** The cookies kept between the requests.
	Protected against multithreaded access by mMtxCookies. */
	QList<QNetworkCookie> mCookies;

	/** Protects mCookies against multithreaded access. */
	mutable QMutex mMtxCookies;


	/** Performs the request using the specified HTTP verb ("GET" / "POST") and body.
	Blocks until the response is received, or the timeout expires.
	Throws a TransportError or a TimeoutError on failure. */
	Response perform(QNetworkRequest & aRequest, const QByteArray & aVerb, const QByteArray & aBody);
};
