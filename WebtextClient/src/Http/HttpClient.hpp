#pragma once

#include <map>
#include <QByteArray>
#include <QList>
#include <QNetworkCookie>
#include <QUrl>
#include <QPair>
#include "../Exception.hpp"





/** The interface for performing blocking HTTP(S) requests on behalf of a single carrier session.
An instance keeps its own cookie jar, so that the cookies received in the login response are sent
with all the following requests (exactly like a browser session).
Redirects are followed; the Response reports the final URL after redirection.
The implementations must be usable from any single thread at a time (not concurrently). */
class HttpClient
{
public:

	/** Additional request headers, such as the Referer. */
	using Headers = std::map<QByteArray, QByteArray>;

	/** The form fields (name, value) of a POST body or a GET query, in the order in which they are sent.
	Values are kept verbatim (QUrlQuery would decode any "%xx" sequences in the message text). */
	using Form = QList<QPair<QString, QString>>;


	/** Base for all exceptions thrown by the client when the request cannot be completed. */
	class Error:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** The request failed on the transport level (DNS, connection refused, TLS, ...). */
	class TransportError:
		public Error
	{
	public:
		using Error::Error;
	};


	/** The request didn't finish within the configured timeout. */
	class TimeoutError:
		public Error
	{
	public:
		using Error::Error;
	};


	/** The received response. Non-2xx responses are reported as Responses, not exceptions. */
	struct Response
	{
		/** The HTTP status code of the final response. */
		int mStatusCode;

		/** The URL of the final response, after all redirects. */
		QUrl mFinalUrl;

		/** The response body. */
		QByteArray mBody;


		/** Returns true if the status code is a 2xx one. */
		bool isSuccess() const { return (mStatusCode >= 200) && (mStatusCode < 300); }
	};


	virtual ~HttpClient() {}

	/** Sends a GET request to the specified URL and returns the response.
	Throws a TransportError or TimeoutError if the request cannot be completed. */
	virtual Response get(const QUrl & aUrl, const Headers & aHeaders = Headers()) = 0;

	/** Sends a POST request with the specified form data (application/x-www-form-urlencoded) to the specified URL.
	Throws a TransportError or TimeoutError if the request cannot be completed. */
	virtual Response post(const QUrl & aUrl, const Form & aForm, const Headers & aHeaders = Headers()) = 0;

	/** Returns all the cookies currently in the client's jar. */
	virtual QList<QNetworkCookie> cookies() const = 0;

	/** Replaces the client's cookies with the specified ones. */
	virtual void setCookies(const QList<QNetworkCookie> & aCookies) = 0;

	/** Removes all cookies from the client's jar. */
	void clearCookies() { setCookies({}); }

	/** Encodes the form for a POST body or a query string (everything but the unreserved characters percent-encoded). */
	static QByteArray encodeForm(const Form & aForm);

	/** Returns aUrl with its query replaced by the encoded aQuery (see encodeForm()). */
	static QUrl withQuery(const QUrl & aUrl, const Form & aQuery);
};
