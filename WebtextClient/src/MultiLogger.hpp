#pragma once

#include <map>
#include <memory>
#include <QMutex>
#include <QString>

#include "ComponentCollection.hpp"
#include "Logger.hpp"





/** Manages multiple loggers by-subsystem (main, Orchestrator, Http, one per carrier, ...).
Each logger appends into its own file in the logs folder. Since the program is run repeatedly,
a log file that has grown over MAX_LOG_FILE_SIZE is rotated away (to "<name>.log.1") before it is opened. */
class MultiLogger:
	public ComponentCollection::Component<ComponentCollection::ckMultiLogger>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckMultiLogger>;


public:

	/** The size above which a log file is rotated when opening it. */
	static const qint64 MAX_LOG_FILE_SIZE = 1024 * 1024;


	/** Creates the MultiLogger that stores its log files in the specified folder.
	The folder is created if it doesn't exist. */
	MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder);

	virtual ~MultiLogger() override;

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Returns the main logger. */
	Logger & mainLogger() { return logger("main"); }

	/** Returns the logger for the specified subsystem name.
	If there's no such logger yet, creates one and starts its logfile. */
	Logger & logger(const QString & aLoggerName);

	/** Flushes all the loggers' files. */
	void flushAllLogs();

	/** Returns the folder where the log files are stored. */
	const QString & logsFolder() const { return mLogsFolder; }


protected:

	/** The folder where to store the log files. */
	QString mLogsFolder;

	/** All the loggers currently known.
	Protected against multithreaded access by mMtxLoggers. */
	std::map<QString, std::unique_ptr<Logger>> mLoggers;

	/** Protects mLoggers against multithreaded access. */
	QMutex mMtxLoggers;


	/** Returns the name of the file to which the specified logger should write. */
	QString loggerFileName(QString aLoggerName);

	/** If the file is larger than MAX_LOG_FILE_SIZE, renames it to "<aFileName>.1", replacing the previous one.
	Failures are ignored, the logger keeps appending to the large file then. */
	static void rotateIfTooLarge(const QString & aFileName);
};
