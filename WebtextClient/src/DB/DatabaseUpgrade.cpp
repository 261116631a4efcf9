#include "DatabaseUpgrade.hpp"
#include <vector>
#include <QSqlQuery>





namespace
{

/** The commands that take the schema from the previous version to the next one. */
struct SchemaStep
{
	/** What the step adds, for the log. */
	const char * mDescription;

	std::vector<const char *> mCommands;
};





/** All the schema steps; the N-th item upgrades from version N to version N + 1. */
const std::vector<SchemaStep> g_SchemaSteps =
{
	{
		"the Version table",
		{
			"CREATE TABLE IF NOT EXISTS Version (Version INTEGER)",
			"INSERT INTO Version (Version) VALUES (0)",
		}
	},

	{
		"the SessionCookies table",
		{
			"CREATE TABLE SessionCookies ("
				"Carrier   TEXT NOT NULL,"
				"Username  TEXT NOT NULL,"
				"RawCookie BLOB NOT NULL"
			")",
			"CREATE INDEX SessionCookiesOwner ON SessionCookies (Carrier, Username)",
		}
	},
};





/** Executes a single command of the upgrade, throws a SqlError if it fails. */
void exec(QSqlDatabase & aDB, const QString & aCommand, Logger & aLogger)
{
	auto query = aDB.exec(aCommand);
	if (query.lastError().type() != QSqlError::NoError)
	{
		throw DatabaseUpgrade::SqlError(aLogger, query.lastError(), aCommand);
	}
}





/** Applies the step and marks the DB as being at aNewVersion, all in a single transaction. */
void applyStep(QSqlDatabase & aDB, const SchemaStep & aStep, int aNewVersion, Logger & aLogger)
{
	aLogger.log("Upgrading the DB to version %1: adding %2", aNewVersion, aStep.mDescription);
	if (!aDB.transaction())
	{
		throw DatabaseUpgrade::SqlError(aLogger, aDB.lastError(), "BEGIN");
	}
	try
	{
		for (const auto cmd: aStep.mCommands)
		{
			exec(aDB, QString::fromUtf8(cmd), aLogger);
		}
		exec(aDB, QString("UPDATE Version SET Version = %1").arg(aNewVersion), aLogger);
		if (!aDB.commit())
		{
			throw DatabaseUpgrade::SqlError(aLogger, aDB.lastError(), "COMMIT");
		}
	}
	catch (const DatabaseUpgrade::SqlError &)
	{
		aDB.rollback();
		throw;
	}
}

}  // anonymous namespace





DatabaseUpgrade::SqlError::SqlError(Logger & aLogger, const QSqlError & aSqlError, const QString & aSqlCommand):
	Super(aLogger, "DB upgrade failed: %1 (command \"%2\")", aSqlError, aSqlCommand)
{
}





void DatabaseUpgrade::upgrade(QSqlDatabase & aDB, Logger & aLogger)
{
	const auto version = storedVersion(aDB);
	if (version > currentVersion())
	{
		throw NewerVersionError(aLogger,
			"The DB is at version %1, written by a newer program; this program only knows versions up to %2",
			version, currentVersion()
		);
	}
	if (version == currentVersion())
	{
		aLogger.log("The DB is at the current version %1", version);
		return;
	}
	for (auto v = version; v < currentVersion(); ++v)
	{
		applyStep(aDB, g_SchemaSteps[static_cast<size_t>(v)], v + 1, aLogger);
	}

	// Reclaim the space left over by the upgrade:
	exec(aDB, "VACUUM", aLogger);
}





int DatabaseUpgrade::currentVersion()
{
	return static_cast<int>(g_SchemaSteps.size());
}





int DatabaseUpgrade::storedVersion(QSqlDatabase & aDB)
{
	if (!aDB.tables().contains("Version"))
	{
		return 0;
	}
	QSqlQuery query("SELECT MAX(Version) FROM Version", aDB);
	if (!query.first())
	{
		return 0;
	}
	return query.value(0).toInt();
}
