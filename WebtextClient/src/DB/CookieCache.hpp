#pragma once

#include <map>
#include <set>
#include <utility>
#include <QList>
#include <QMutex>
#include <QNetworkCookie>
#include "../ComponentCollection.hpp"





/** Keeps the carriers' login cookies across runs, so that a run shortly after a previous one
can skip the login round-trip.
The cookies are loaded from the Database upon start and kept in memory, where they can be queried and updated
from any thread. The changes are written back to the DB by save() (also called when the component is stopped),
which must be called from the main thread
(QSqlDatabase is bound to the thread that opened it).
Only persistent (non-session) cookies are cached, the expired ones are dropped upon loading. */
class CookieCache:
	public ComponentCollection::Component<ComponentCollection::ckCookieCache>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckCookieCache>;


public:

	CookieCache(ComponentCollection & aComponents);

	/** Checks that the DB is in proper format and loads all the unexpired cookies.
	If the DB is unusable, throws a descriptive RuntimeError. */
	virtual void start() override;

	/** Saves the changes into the DB, see save(). */
	virtual void stop() override;

	/** Returns the cached cookies for the specified carrier and username. */
	QList<QNetworkCookie> cookies(const QString & aCarrier, const QString & aUsername) const;

	/** Replaces the cached cookies for the specified carrier and username.
	Session cookies (without an expiration date) are not cached. */
	void store(const QString & aCarrier, const QString & aUsername, const QList<QNetworkCookie> & aCookies);

	/** Removes all cached cookies for the specified carrier and username. */
	void remove(const QString & aCarrier, const QString & aUsername);

	/** Writes all the changes done since the last save() into the DB.
	Must be called from the main thread.
	Throws a Database::DBQueryError if the DB write fails (the DB is left unchanged). */
	void save();


protected:

	/** Identification of the cookies' owner: (Carrier, Username). */
	using Owner = std::pair<QString, QString>;


	/** The logger for the cache operations. */
	Logger & mLogger;

	/** The cached cookies, per owner.
	Protected against multithreaded access by mMtx. */
	std::map<Owner, QList<QNetworkCookie>> mCookies;

	/** The owners whose cookies have changed since the last save().
	Protected against multithreaded access by mMtx. */
	std::set<Owner> mDirty;

	/** Protects mCookies and mDirty against multithreaded access. */
	mutable QMutex mMtx;


	/** Loads all the unexpired cookies from the DB. */
	void load();
};
