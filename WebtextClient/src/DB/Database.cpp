#include "Database.hpp"
#include <atomic>
#include <QDebug>
#include <QSqlError>
#include <QSqlQuery>
#include "../InstallConfiguration.hpp"
#include "../Exception.hpp"
#include "DatabaseUpgrade.hpp"





////////////////////////////////////////////////////////////////////////////////
// Database:

Database::Database(ComponentCollection & aComponents):
	ComponentSuper(aComponents),
	mLogger(aComponents.logger("Database"))
{
	requireForStart(ComponentCollection::ckInstallConfiguration);
	requireForStart(ComponentCollection::ckMultiLogger);
}





Database::~Database()
{
	if (mDatabase.isOpen())
	{
		mDatabase.close();
	}
	mDatabase = QSqlDatabase();
	if (!mConnectionName.isEmpty())
	{
		QSqlDatabase::removeDatabase(mConnectionName);
	}
}





void Database::start()
{
	auto instConf = mComponents.get<InstallConfiguration>();
	open(instConf->dataLocation("Webtexter.sqlite"));
}





void Database::open(const QString & aDBFileName)
{
	if (mDatabase.isOpen())
	{
		throw LogicError(mLogger, "Opening another DB (%1) is not allowed", aDBFileName);
	}

	static std::atomic<int> counter(0);
	mConnectionName = QString::fromUtf8("DB%1").arg(counter.fetch_add(1));
	mDatabase = QSqlDatabase::addDatabase("QSQLITE", mConnectionName);
	mDatabase.setDatabaseName(aDBFileName);
	if (!mDatabase.open())
	{
		throw RuntimeError(mLogger, tr("Cannot open the DB file %1: %2"), aDBFileName, mDatabase.lastError());
	}
	mLogger.log("Opened DB file %1", aDBFileName);

	// Another webtexter run may be saving its cookies at the same time, wait for it instead of failing:
	auto query = mDatabase.exec("PRAGMA busy_timeout = 5000");
	if (query.lastError().type() != QSqlError::NoError)
	{
		throw RuntimeError(mLogger, tr("Cannot set the DB busy timeout: %1"), query.lastError());
	}

	// Upgrade the DB to the latest version:
	DatabaseUpgrade::upgrade(mDatabase, mLogger);
}





Database::DBConnection Database::connection()
{
	if (!mDatabase.isOpen())
	{
		throw LogicError(mLogger, "Requesting a connection to a DB that is not open");
	}
	return DBConnection(*this);
}





////////////////////////////////////////////////////////////////////////////////
// Database::DBConnection:

Database::DBConnection::DBConnection(Database & aParent):
	mParent(&aParent)
{
	mParent->mMtxConnection.lock();
}





Database::DBConnection::DBConnection(DBConnection && aOther):
	mParent(aOther.mParent)
{
	aOther.mParent = nullptr;
}





Database::DBConnection::~DBConnection()
{
	if (mParent != nullptr)
	{
		mParent->mMtxConnection.unlock();
	}
}





QSqlQuery Database::DBConnection::query(const QString & aQueryString)
{
	if (mParent == nullptr)
	{
		throw LogicError("Using a moved-out DB connection");
	}
	QSqlQuery res(mParent->mDatabase);
	if (!res.prepare(aQueryString))
	{
		throw DBQueryError(mParent->mLogger, "Cannot prepare query \"%1\": %2", aQueryString, res.lastError());
	}
	return res;
}





void Database::DBConnection::beginTransaction()
{
	if (mParent == nullptr)
	{
		throw LogicError("Using a moved-out DB connection");
	}
	if (!mParent->mDatabase.transaction())
	{
		throw DBQueryError(mParent->mLogger, "Cannot start a DB transaction: %1", mParent->mDatabase.lastError());
	}
}





void Database::DBConnection::commit()
{
	if (mParent == nullptr)
	{
		throw LogicError("Using a moved-out DB connection");
	}
	if (!mParent->mDatabase.commit())
	{
		throw DBQueryError(mParent->mLogger, "DB transaction commit failed: %1", mParent->mDatabase.lastError());
	}
}





void Database::DBConnection::rollback()
{
	if (mParent == nullptr)
	{
		return;
	}
	if (!mParent->mDatabase.rollback())
	{
		mParent->mLogger.log("DB transaction rollback failed: %1", mParent->mDatabase.lastError());
	}
}
