#include <gtest/gtest.h>
#include <map>
#include <set>
#include <QNetworkProxy>
#include <QNetworkProxyFactory>
#include <QTcpServer>
#include <QTcpSocket>
#include "../src/Http/QtHttpClient.hpp"
#include "TestHelpers.hpp"





/** A minimal HTTP server on the loopback interface, serving canned responses by path.
It runs in the test's thread; the client's local event loop drives it while the client waits for a reply. */
class LocalHttpServer
{
public:

	/** A single received request, split into its parts. */
	struct Request
	{
		QByteArray mVerb;
		QByteArray mTarget;  // The path and query, as sent
		QByteArray mHeaders;
		QByteArray mBody;
	};


	LocalHttpServer()
	{
		QObject::connect(&mServer, &QTcpServer::newConnection, &mServer,
			[this]()
			{
				newConnection();
			}
		);
	}


	/** Starts listening on a random loopback port. */
	bool listen()
	{
		return mServer.listen(QHostAddress::LocalHost);
	}


	/** Returns the URL of the specified path on this server. */
	QUrl url(const QByteArray & aPath) const
	{
		return QUrl(QString("http://127.0.0.1:%1%2").arg(mServer.serverPort()).arg(QString::fromUtf8(aPath)));
	}


	/** Sets the raw response sent for the requests to the specified path (query ignored). */
	void respond(const QByteArray & aPath, int aStatusCode, const QByteArray & aExtraHeaders, const QByteArray & aBody)
	{
		mResponses[aPath] =
			"HTTP/1.1 " + QByteArray::number(aStatusCode) + " Canned\r\n" +
			aExtraHeaders +
			"Content-Type: text/html\r\n"
			"Content-Length: " + QByteArray::number(aBody.size()) + "\r\n"
			"Connection: close\r\n"
			"\r\n" +
			aBody;
	}


	/** The requests to the specified path are received, but never answered. */
	void ignore(const QByteArray & aPath)
	{
		mIgnoredPaths.insert(aPath);
	}


	/** All the requests received so far, in order. */
	const std::vector<Request> & requests() const { return mRequests; }


protected:

	QTcpServer mServer;

	/** Path -> the complete raw response. Unknown paths get a 404. */
	std::map<QByteArray, QByteArray> mResponses;

	/** Paths whose requests are never answered. */
	std::set<QByteArray> mIgnoredPaths;

	/** The incoming data of each connection, until a complete request is received. */
	std::map<QTcpSocket *, QByteArray> mIncoming;

	std::vector<Request> mRequests;


	void newConnection()
	{
		while (mServer.hasPendingConnections())
		{
			auto sock = mServer.nextPendingConnection();
			QObject::connect(sock, &QTcpSocket::readyRead, &mServer,
				[this, sock]()
				{
					dataReceived(sock);
				}
			);
		}
	}


	void dataReceived(QTcpSocket * aSocket)
	{
		auto & data = mIncoming[aSocket];
		data.append(aSocket->readAll());
		auto headerEnd = data.indexOf("\r\n\r\n");
		if (headerEnd < 0)
		{
			return;
		}
		Request req;
		auto lines = data.left(headerEnd).split('\n');
		auto requestLine = lines.value(0).trimmed().split(' ');
		req.mVerb = requestLine.value(0);
		req.mTarget = requestLine.value(1);
		req.mHeaders = data.mid(lines.value(0).size() + 1, headerEnd - lines.value(0).size() - 1);
		int contentLength = 0;
		for (const auto & line: lines)
		{
			if (line.toLower().startsWith("content-length:"))
			{
				contentLength = line.mid(15).trimmed().toInt();
			}
		}
		if (data.size() < headerEnd + 4 + contentLength)
		{
			return;
		}
		req.mBody = data.mid(headerEnd + 4, contentLength);
		mIncoming.erase(aSocket);
		mRequests.push_back(req);

		auto path = req.mTarget;
		auto queryStart = path.indexOf('?');
		if (queryStart >= 0)
		{
			path = path.left(queryStart);
		}
		if (mIgnoredPaths.count(path) > 0)
		{
			return;
		}
		auto itr = mResponses.find(path);
		if (itr == mResponses.end())
		{
			aSocket->write("HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
		}
		else
		{
			aSocket->write(itr->second);
		}
		aSocket->disconnectFromHost();
	}
};





class QtHttpClientTest:
	public ::testing::Test
{
protected:

	LocalHttpServer mServer;
	TestLogger mLogger;


	virtual void SetUp() override
	{
		// The environment's proxy settings must not intercept the loopback requests:
		QNetworkProxyFactory::setUseSystemConfiguration(false);
		QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
		ASSERT_TRUE(mServer.listen());
	}
};





TEST_F(QtHttpClientTest, FollowsRedirects)
{
	mServer.respond("/login", 302, "Location: /home\r\n", "");
	mServer.respond("/home", 200, "", "Welcome back");
	QtHttpClient client(mLogger.logger(), 5000);
	auto resp = client.get(mServer.url("/login"));
	EXPECT_EQ(resp.mStatusCode, 200);
	EXPECT_EQ(resp.mFinalUrl, mServer.url("/home"));
	EXPECT_EQ(resp.mBody, "Welcome back");
	ASSERT_EQ(mServer.requests().size(), 2u);
	EXPECT_EQ(mServer.requests()[1].mTarget, "/home");
}





TEST_F(QtHttpClientTest, ErrorStatusIsAResponse)
{
	mServer.respond("/send", 503, "", "Try again later");
	QtHttpClient client(mLogger.logger(), 5000);
	auto resp = client.get(mServer.url("/send"));
	EXPECT_EQ(resp.mStatusCode, 503);
	EXPECT_FALSE(resp.isSuccess());
	EXPECT_EQ(resp.mBody, "Try again later");
}





TEST_F(QtHttpClientTest, CookiesAreKeptBetweenRequests)
{
	mServer.respond("/login", 200, "Set-Cookie: SESSION=abc123; Path=/\r\n", "Logged in");
	mServer.respond("/send", 200, "", "Message sent");
	QtHttpClient client(mLogger.logger(), 5000);
	client.post(mServer.url("/login"), {{"username", "0861234567"}, {"password", "secret"}});
	client.get(mServer.url("/send"));
	ASSERT_EQ(mServer.requests().size(), 2u);
	EXPECT_FALSE(mServer.requests()[0].mHeaders.contains("SESSION=abc123"));
	EXPECT_TRUE(mServer.requests()[1].mHeaders.contains("Cookie: SESSION=abc123"));

	// The cookies can be carried over into another client, such as when restored from the cache:
	auto cookies = client.cookies();
	ASSERT_EQ(cookies.size(), 1);
	EXPECT_EQ(cookies[0].name(), "SESSION");
	QtHttpClient other(mLogger.logger(), 5000);
	other.setCookies(cookies);
	other.get(mServer.url("/send"));
	ASSERT_EQ(mServer.requests().size(), 3u);
	EXPECT_TRUE(mServer.requests()[2].mHeaders.contains("Cookie: SESSION=abc123"));

	// Cleared cookies are not sent:
	other.clearCookies();
	other.get(mServer.url("/send"));
	ASSERT_EQ(mServer.requests().size(), 4u);
	EXPECT_FALSE(mServer.requests()[3].mHeaders.contains("SESSION"));
}





TEST_F(QtHttpClientTest, UnansweredRequestTimesOut)
{
	mServer.ignore("/slow");
	QtHttpClient client(mLogger.logger(), 200);
	EXPECT_THROW(client.get(mServer.url("/slow")), HttpClient::TimeoutError);
}





TEST_F(QtHttpClientTest, ClosedPortIsTransportError)
{
	// Find a port that nobody listens on:
	QTcpServer tmp;
	ASSERT_TRUE(tmp.listen(QHostAddress::LocalHost));
	auto port = tmp.serverPort();
	tmp.close();

	QtHttpClient client(mLogger.logger(), 5000);
	EXPECT_THROW(client.get(QUrl(QString("http://127.0.0.1:%1/").arg(port))), HttpClient::TransportError);
}





TEST_F(QtHttpClientTest, FormEncoding)
{
	const HttpClient::Form form =
	{
		{"a&b", QString::fromUtf8("c+d%e#f \xC3\xA1 ok")},
		{"to", "0861234567"},
	};
	const QByteArray expected("a%26b=c%2Bd%25e%23f%20%C3%A1%20ok&to=0861234567");
	EXPECT_EQ(HttpClient::encodeForm(form), expected);

	// The same encoding goes out in the query and in the POST body:
	mServer.respond("/sms", 200, "", "ok");
	QtHttpClient client(mLogger.logger(), 5000);
	client.get(HttpClient::withQuery(mServer.url("/sms"), form));
	client.post(mServer.url("/sms"), form);
	ASSERT_EQ(mServer.requests().size(), 2u);
	EXPECT_EQ(mServer.requests()[0].mTarget, "/sms?" + expected);
	EXPECT_EQ(mServer.requests()[1].mBody, expected);

	// And decodes back to the original values:
	auto firstValue = expected.mid(expected.indexOf('=') + 1);
	firstValue = firstValue.left(firstValue.indexOf('&'));
	EXPECT_EQ(QUrl::fromPercentEncoding(firstValue), form[0].second);
}
