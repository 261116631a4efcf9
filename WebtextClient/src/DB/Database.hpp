#pragma once

#include <vector>
#include <memory>
#include <QObject>
#include <QSqlDatabase>
#include <QMutex>
#include <QSqlQuery>
#include "../ComponentCollection.hpp"





/** The storage for all data that is persisted across runs (the session cookie cache).
The database is a single SQLite file in the data folder, upgraded to the current schema version upon opening.
Clients of this class take the SQL connection and issue their own queries on the database.
Note that QSqlDatabase can only be used from the thread that opened it, which is the main thread. */
class Database:
	public QObject,
	public ComponentCollection::Component<ComponentCollection::ckDatabase>
{
	Q_OBJECT
	using Super = QObject;
	using ComponentSuper = ComponentCollection::Component<ComponentCollection::ckDatabase>;


public:

	/** An exception that is thrown when DB query fails. */
	class DBQueryError:
		public RuntimeError
	{
	public:
		using RuntimeError::RuntimeError;
	};


	/** Wrapper for the DB connection, used by the clients to query and modify data.
	Only one connection is ever active at a time, to prevent threading issues.
	Get an instance through Database::connection(), and destroy the object as soon as the DB is not needed. */
	class DBConnection
	{
		friend class ::Database;

		/** Creates a new instance and locks aParent's mMtxConnection. */
		DBConnection(Database & aParent);


	public:

		DBConnection(DBConnection && aOther);
		DBConnection(const DBConnection &) = delete;
		DBConnection & operator = (const DBConnection &) = delete;

		/** Destroys this instance and unlocks mParent's mMtxConnection. */
		~DBConnection();

		/** Creates a new query and prepares it using the specified query string.
		Throws a DBQueryError if query preparation fails. */
		QSqlQuery query(const QString & aQueryString);

		/** Starts a transaction on the DB.
		Throws a DBQueryError if the transaction cannot be started. */
		void beginTransaction();

		/** Commits the transaction started by beginTransaction().
		Throws a DBQueryError if the commit fails. */
		void commit();

		/** Rolls back the transaction started by beginTransaction().
		Failures are only logged. */
		void rollback();


	protected:

		/** The Database object that provided this connection.
		Nullptr if this connection has been moved out of. */
		Database * mParent;
	};


	/** Creates a new instance.
	The DB file is opened in start(). */
	Database(ComponentCollection & aComponents);

	virtual ~Database() override;

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Opens the specified SQLite file to provide the data backstore and upgrades it to the current version.
	Only one DB can ever be open.
	Throws a RuntimeError if the DB cannot be opened or upgraded. */
	void open(const QString & aDBFileName);

	/** Returns a connection to the DB that can be used to query and modify data.
	Only one connection is ever active at a time, to prevent threading issues,
	so the client needs to destroy the returned connection as soon as it's done working with the DB. */
	DBConnection connection();


protected:

	/** The DB connection. */
	QSqlDatabase mDatabase;

	/** The name under which the connection is registered in QSqlDatabase. */
	QString mConnectionName;

	/** The mutex that is used to sequentialize access to the database / DBConnection. */
	QMutex mMtxConnection;

	/** The logger for the DB operations. */
	Logger & mLogger;
};
