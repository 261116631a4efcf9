#include "CookieCache.hpp"
#include <QDateTime>
#include <QSqlError>
#include <QSqlRecord>
#include "Database.hpp"





CookieCache::CookieCache(ComponentCollection & aComponents):
	Super(aComponents),
	mLogger(aComponents.logger("CookieCache"))
{
	requireForStart(ComponentCollection::ckDatabase);
}





void CookieCache::start()
{
	mLogger.log("Starting...");
	{
		auto db = mComponents.get<Database>();
		auto conn = db->connection();
		auto query = conn.query("SELECT * FROM SessionCookies");
		if (!query.exec())
		{
			throw RuntimeError(mLogger, "Cannot exec start statement: %1.", query.lastError());
		}
		const auto & rec = query.record();
		static const QString fieldNames[] =
		{
			"Carrier",
			"Username",
			"RawCookie",
		};
		for (const auto & fieldName: fieldNames)
		{
			if (rec.indexOf(fieldName) == -1)
			{
				throw RuntimeError(mLogger, "SessionCookies database is broken, missing field %1.", fieldName);
			}
		}
	}
	load();
}





void CookieCache::stop()
{
	save();
}





QList<QNetworkCookie> CookieCache::cookies(const QString & aCarrier, const QString & aUsername) const
{
	QMutexLocker lock(&mMtx);
	auto itr = mCookies.find(Owner(aCarrier, aUsername));
	if (itr == mCookies.end())
	{
		return {};
	}
	return itr->second;
}





void CookieCache::store(const QString & aCarrier, const QString & aUsername, const QList<QNetworkCookie> & aCookies)
{
	QList<QNetworkCookie> persistent;
	for (const auto & cookie: aCookies)
	{
		if (!cookie.isSessionCookie())
		{
			persistent.append(cookie);
		}
	}

	QMutexLocker lock(&mMtx);
	Owner owner(aCarrier, aUsername);
	mCookies[owner] = persistent;
	mDirty.insert(owner);
}





void CookieCache::remove(const QString & aCarrier, const QString & aUsername)
{
	QMutexLocker lock(&mMtx);
	Owner owner(aCarrier, aUsername);
	mCookies.erase(owner);
	mDirty.insert(owner);
}





void CookieCache::save()
{
	// Take a snapshot of the changes, so that the DB isn't accessed while holding the lock:
	std::map<Owner, QList<QNetworkCookie>> changes;
	{
		QMutexLocker lock(&mMtx);
		for (const auto & owner: mDirty)
		{
			auto itr = mCookies.find(owner);
			changes[owner] = (itr == mCookies.end()) ? QList<QNetworkCookie>() : itr->second;
		}
	}
	if (changes.empty())
	{
		return;
	}

	auto db = mComponents.get<Database>();
	auto conn = db->connection();
	conn.beginTransaction();
	try
	{
		for (const auto & change: changes)
		{
			auto del = conn.query("DELETE FROM SessionCookies WHERE Carrier = ? AND Username = ?");
			del.addBindValue(change.first.first);
			del.addBindValue(change.first.second);
			if (!del.exec())
			{
				throw Database::DBQueryError(mLogger, "Cannot delete the old cookies: %1", del.lastError());
			}
			for (const auto & cookie: change.second)
			{
				auto ins = conn.query("INSERT INTO SessionCookies (Carrier, Username, RawCookie) VALUES (?, ?, ?)");
				ins.addBindValue(change.first.first);
				ins.addBindValue(change.first.second);
				ins.addBindValue(cookie.toRawForm(QNetworkCookie::Full));
				if (!ins.exec())
				{
					throw Database::DBQueryError(mLogger, "Cannot insert the cookie: %1", ins.lastError());
				}
			}
		}
		conn.commit();
	}
	catch (const Database::DBQueryError &)
	{
		conn.rollback();
		throw;
	}

	mLogger.log("Saved cookies for %1 owners", changes.size());
	QMutexLocker lock(&mMtx);
	for (const auto & change: changes)
	{
		mDirty.erase(change.first);
	}
}





void CookieCache::load()
{
	auto db = mComponents.get<Database>();
	auto conn = db->connection();
	auto query = conn.query("SELECT Carrier, Username, RawCookie FROM SessionCookies");
	if (!query.exec())
	{
		throw RuntimeError(mLogger, "Cannot load the cookies: %1", query.lastError());
	}
	auto now = QDateTime::currentDateTimeUtc();
	size_t numLoaded = 0, numExpired = 0;
	QMutexLocker lock(&mMtx);
	while (query.next())
	{
		Owner owner(query.value("Carrier").toString(), query.value("Username").toString());
		for (const auto & cookie: QNetworkCookie::parseCookies(query.value("RawCookie").toByteArray()))
		{
			if (cookie.isSessionCookie() || (cookie.expirationDate() < now))
			{
				numExpired += 1;
				mDirty.insert(owner);  // The expired cookie should be removed from the DB on the next save
				continue;
			}
			mCookies[owner].append(cookie);
			numLoaded += 1;
		}
	}
	mLogger.log("Loaded %1 cookies, dropped %2 expired ones", numLoaded, numExpired);
}
