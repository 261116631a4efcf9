#include "MultiLogger.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>





const qint64 MultiLogger::MAX_LOG_FILE_SIZE;





MultiLogger::MultiLogger(ComponentCollection & aComponents, const QString & aLogsFolder):
	Super(aComponents),
	mLogsFolder(aLogsFolder)
{
	QDir dir;
	if (!dir.mkpath(aLogsFolder))
	{
		throw RuntimeError("Cannot create the logs folder %1", aLogsFolder);
	}
}





MultiLogger::~MultiLogger()
{
	flushAllLogs();
}





void MultiLogger::start()
{
	mainLogger().log("Logging into folder %1", mLogsFolder);
}





Logger & MultiLogger::logger(const QString & aLoggerName)
{
	QMutexLocker locker(&mMtxLoggers);
	auto itr = mLoggers.find(aLoggerName);
	if (itr != mLoggers.end())
	{
		return *(itr->second.get());
	}
	auto fileName = loggerFileName(aLoggerName);
	rotateIfTooLarge(fileName);
	auto res = mLoggers.insert({aLoggerName, std::make_unique<Logger>(fileName)});
	return *(res.first->second.get());
}





void MultiLogger::flushAllLogs()
{
	QMutexLocker locker(&mMtxLoggers);
	for (auto & logger: mLoggers)
	{
		logger.second->flush();
	}
}





QString MultiLogger::loggerFileName(QString aLoggerName)
{
	// Sanitize the logger name, at least somewhat:
	static const QString illegal("/\\\"\':;&%*?|<>");
	for (auto & ch: aLoggerName)
	{
		if (ch.unicode() < 32)
		{
			ch = '_';
		}
		else if (illegal.contains(ch))
		{
			ch = '_';
		}
	}

	return mLogsFolder + "/" + aLoggerName + ".log";
}





void MultiLogger::rotateIfTooLarge(const QString & aFileName)
{
	QFileInfo fi(aFileName);
	if (!fi.exists() || (fi.size() <= MAX_LOG_FILE_SIZE))
	{
		return;
	}
	auto rotatedName = aFileName + ".1";
	QFile::remove(rotatedName);
	if (!QFile::rename(aFileName, rotatedName))
	{
		qWarning() << "Cannot rotate the log file" << aFileName;
	}
}
