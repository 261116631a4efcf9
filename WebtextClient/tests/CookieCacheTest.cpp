#include <gtest/gtest.h>
#include <QDateTime>
#include <QTemporaryDir>
#include "../src/Carriers/MeteorSession.hpp"
#include "../src/Carriers/ThreeSession.hpp"
#include "../src/DB/CookieCache.hpp"
#include "../src/DB/Database.hpp"
#include "../src/InstallConfiguration.hpp"
#include "../src/MultiLogger.hpp"
#include "FakeHttpClient.hpp"
#include "TestHelpers.hpp"





/** The components needed by the CookieCache, working in a single data folder.
Creating another instance over the same folder simulates the next run of the program. */
class CacheComponents
{
public:

	explicit CacheComponents(const QString & aDataFolder)
	{
		auto instConf = mComponents.addNew<InstallConfiguration>(aDataFolder);
		mComponents.addNew<MultiLogger>(instConf->logsFolder());
		mComponents.addNew<Database>();
		mCookieCache = mComponents.addNew<CookieCache>();
		mComponents.start();
	}

	ComponentCollection mComponents;
	std::shared_ptr<CookieCache> mCookieCache;
};





/** Returns a cookie that expired an hour ago. */
static QNetworkCookie expiredCookie(const QByteArray & aName, const QByteArray & aValue)
{
	QNetworkCookie res(aName, aValue);
	res.setExpirationDate(QDateTime::currentDateTimeUtc().addSecs(-3600));
	return res;
}





/** Returns the value of the named cookie in the list, or an empty value if not present. */
static QByteArray cookieValue(const QList<QNetworkCookie> & aCookies, const QByteArray & aName)
{
	for (const auto & c: aCookies)
	{
		if (c.name() == aName)
		{
			return c.value();
		}
	}
	return QByteArray();
}





class CookieCacheTest:
	public ::testing::Test
{
protected:

	QTemporaryDir mDataDir;
};





TEST_F(CookieCacheTest, StoreSaveReload)
{
	ASSERT_TRUE(mDataDir.isValid());
	{
		CacheComponents run1(mDataDir.path());
		EXPECT_TRUE(run1.mCookieCache->cookies("meteor", "0861234567").isEmpty());
		run1.mCookieCache->store("meteor", "0861234567",
			{
				FakeHttpScript::cookie("JSESSIONID", "abc"),
				FakeHttpScript::sessionCookie("TRACKING", "xyz"),
			}
		);
		run1.mCookieCache->store("three", "0831234567", {FakeHttpScript::cookie("AWSELB", "lb")});
		auto cached = run1.mCookieCache->cookies("meteor", "0861234567");
		ASSERT_EQ(cached.size(), 1);
		EXPECT_EQ(cached[0].name(), "JSESSIONID");
		run1.mCookieCache->save();
	}

	CacheComponents run2(mDataDir.path());
	auto cached = run2.mCookieCache->cookies("meteor", "0861234567");
	ASSERT_EQ(cached.size(), 1);
	EXPECT_EQ(cached[0].value(), "abc");
	EXPECT_EQ(cookieValue(run2.mCookieCache->cookies("three", "0831234567"), "AWSELB"), "lb");
	EXPECT_TRUE(run2.mCookieCache->cookies("meteor", "0831234567").isEmpty());
	EXPECT_TRUE(run2.mCookieCache->cookies("three", "0861234567").isEmpty());
}





TEST_F(CookieCacheTest, ExpiredCookiesDropped)
{
	ASSERT_TRUE(mDataDir.isValid());
	{
		CacheComponents run1(mDataDir.path());
		run1.mCookieCache->store("o2", "joe",
			{
				expiredCookie("iPlanetDirectoryPro", "old"),
				FakeHttpScript::cookie("Other", "new"),
			}
		);
		run1.mCookieCache->save();
	}
	{
		CacheComponents run2(mDataDir.path());
		auto cached = run2.mCookieCache->cookies("o2", "joe");
		ASSERT_EQ(cached.size(), 1);
		EXPECT_EQ(cached[0].name(), "Other");
		run2.mCookieCache->save();
	}
	CacheComponents run3(mDataDir.path());
	EXPECT_EQ(run3.mCookieCache->cookies("o2", "joe").size(), 1);
}





TEST_F(CookieCacheTest, Remove)
{
	ASSERT_TRUE(mDataDir.isValid());
	{
		CacheComponents run1(mDataDir.path());
		run1.mCookieCache->store("vodafone", "joe", {FakeHttpScript::cookie("JSESSIONID", "v")});
		run1.mCookieCache->save();
		run1.mCookieCache->remove("vodafone", "joe");
		EXPECT_TRUE(run1.mCookieCache->cookies("vodafone", "joe").isEmpty());
		run1.mCookieCache->save();
	}
	CacheComponents run2(mDataDir.path());
	EXPECT_TRUE(run2.mCookieCache->cookies("vodafone", "joe").isEmpty());
}





TEST_F(CookieCacheTest, SavedWhenStopped)
{
	ASSERT_TRUE(mDataDir.isValid());
	{
		CacheComponents run1(mDataDir.path());
		run1.mCookieCache->store("tesco", "joe", {FakeHttpScript::cookie("SESSION", "s")});
		run1.mComponents.stop();
	}
	CacheComponents run2(mDataDir.path());
	EXPECT_EQ(cookieValue(run2.mCookieCache->cookies("tesco", "joe"), "SESSION"), "s");
}





////////////////////////////////////////////////////////////////////////////////
// Session reuse through the carrier sessions:

static const char * METEOR_LOGIN = "https://www.mymeteor.ie/go/mymeteor-login-manager";
static const char * METEOR_LANDING = "https://www.mymeteor.ie/postpaylanding";

TEST_F(CookieCacheTest, LoginIsCachedWithSessionValidity)
{
	ASSERT_TRUE(mDataDir.isValid());
	CacheComponents run(mDataDir.path());
	TestLogger logger;
	auto script = std::make_shared<FakeHttpScript>();
	script->respond("POST", METEOR_LOGIN, "", METEOR_LANDING, 200,
		{FakeHttpScript::sessionCookie("JSESSIONID", "fresh")}
	);
	MeteorSession session(std::make_unique<FakeHttpClient>(script), logger.logger(), run.mCookieCache);
	auto before = QDateTime::currentDateTimeUtc();
	session.authenticate("0861234567", "1234");

	auto cached = run.mCookieCache->cookies("meteor", "0861234567");
	ASSERT_EQ(cached.size(), 1);
	EXPECT_EQ(cached[0].value(), "fresh");
	auto validity = before.secsTo(cached[0].expirationDate());
	EXPECT_GE(validity, WebSession::SESSION_VALIDITY_SECONDS - 5);
	EXPECT_LE(validity, WebSession::SESSION_VALIDITY_SECONDS + 5);
}





TEST_F(CookieCacheTest, CachedSessionReused)
{
	ASSERT_TRUE(mDataDir.isValid());
	CacheComponents run(mDataDir.path());
	run.mCookieCache->store("meteor", "0861234567", {FakeHttpScript::cookie("JSESSIONID", "cached")});
	TestLogger logger;
	auto script = std::make_shared<FakeHttpScript>();
	MeteorSession session(std::make_unique<FakeHttpClient>(script), logger.logger(), run.mCookieCache);

	// The first authentication reuses the cached session, without any request:
	session.authenticate("0861234567", "1234");
	EXPECT_TRUE(script->mRequests.empty());
	EXPECT_EQ(cookieValue(script->mCookies, "JSESSIONID"), "cached");

	// A re-authentication (after the session expired) always logs in anew:
	script->respond("POST", METEOR_LOGIN, "", METEOR_LANDING, 200,
		{FakeHttpScript::sessionCookie("JSESSIONID", "relogged")}
	);
	session.authenticate("0861234567", "1234");
	ASSERT_EQ(script->mRequests.size(), 1u);
	EXPECT_EQ(cookieValue(script->mCookies, "JSESSIONID"), "relogged");
	EXPECT_EQ(cookieValue(run.mCookieCache->cookies("meteor", "0861234567"), "JSESSIONID"), "relogged");
}





TEST_F(CookieCacheTest, ExpiredSessionNotReused)
{
	ASSERT_TRUE(mDataDir.isValid());
	CacheComponents run(mDataDir.path());
	run.mCookieCache->store("meteor", "0861234567", {expiredCookie("JSESSIONID", "stale")});
	TestLogger logger;
	auto script = std::make_shared<FakeHttpScript>();
	script->respond("POST", METEOR_LOGIN, "", METEOR_LANDING, 200,
		{FakeHttpScript::sessionCookie("JSESSIONID", "fresh")}
	);
	MeteorSession session(std::make_unique<FakeHttpClient>(script), logger.logger(), run.mCookieCache);
	session.authenticate("0861234567", "1234");
	EXPECT_EQ(script->mRequests.size(), 1u);
	EXPECT_EQ(cookieValue(run.mCookieCache->cookies("meteor", "0861234567"), "JSESSIONID"), "fresh");
}





TEST_F(CookieCacheTest, ThreeSessionTakesLoginCookieExpiry)
{
	ASSERT_TRUE(mDataDir.isValid());
	CacheComponents run(mDataDir.path());
	TestLogger logger;
	auto script = std::make_shared<FakeHttpScript>();
	auto loginCookie = FakeHttpScript::cookie("CAKEPHP", "cake");
	script->respond("POST", "https://webtexts.three.ie/webtext/users/login", "",
		"https://webtexts.three.ie/webtext/messages/send", 200,
		{FakeHttpScript::sessionCookie("AWSELB", "lb"), loginCookie}
	);
	ThreeSession session(std::make_unique<FakeHttpClient>(script), logger.logger(), run.mCookieCache);
	session.authenticate("0831234567", "9999");

	auto cached = run.mCookieCache->cookies("three", "0831234567");
	ASSERT_EQ(cached.size(), 2);
	for (const auto & c: cached)
	{
		EXPECT_EQ(c.expirationDate(), loginCookie.expirationDate()) << c.name().constData();
	}
}
