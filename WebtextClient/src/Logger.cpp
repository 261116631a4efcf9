#include "Logger.hpp"

#include <stdexcept>
#include <QDateTime>





Logger::Logger(const QString & aFileName):
	mLogFile(aFileName),
	mNumMessagesUntilFlush(FLUSH_AFTER_N_MESSAGES)
{
	if (!mLogFile.open(QFile::WriteOnly | QFile::Append))
	{
		throw std::runtime_error("Cannot open log file " + aFileName.toStdString() + " for appending");
	}
	mLogFile.write(QString("\n\n%1\tLogfile opened\n").arg(currentTimestamp()).toUtf8());
}





Logger::~Logger()
{
	flush();
}





QString Logger::currentTimestamp()
{
	auto now = QDateTime::currentDateTimeUtc();
	return now.toString("yyyy-MM-dd hh:mm:ss.zzz");
}





void Logger::logInternal(const QByteArray & aLogData)
{
	QMutexLocker lock(&mMtxLogFile);
	mLogFile.write(currentTimestamp().toUtf8());
	mLogFile.write("\t", 1);
	mLogFile.write(aLogData);
	mLogFile.write("\n", 1);
	mNumMessagesUntilFlush -= 1;
	if (mNumMessagesUntilFlush <= 0)
	{
		mLogFile.flush();
		mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
	}
}





void Logger::logBlockInternal(const QByteArray & aBlock, const QByteArray & aLogData)
{
	QMutexLocker lock(&mMtxLogFile);
	mLogFile.write(currentTimestamp().toUtf8());
	mLogFile.write("\t", 1);
	mLogFile.write(aLogData);
	mLogFile.write("\n", 1);

	// Write the block line by line, each line indented:
	auto block = aBlock.left(MAX_BLOCK_SIZE);
	int start = 0;
	const int len = block.size();
	while (start < len)
	{
		auto end = block.indexOf('\n', start);
		if (end < 0)
		{
			end = len;
		}
		auto line = block.mid(start, end - start);
		if (line.endsWith('\r'))
		{
			line.chop(1);
		}
		mLogFile.write("\t\t", 2);
		mLogFile.write(line);
		mLogFile.write("\n", 1);
		start = end + 1;
	}
	if (aBlock.size() > MAX_BLOCK_SIZE)
	{
		mLogFile.write(QString("\t\t(%1 more bytes not logged)\n").arg(aBlock.size() - MAX_BLOCK_SIZE).toUtf8());
	}
	mLogFile.flush();
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}





void Logger::flush()
{
	QMutexLocker lock(&mMtxLogFile);
	mLogFile.flush();
	mNumMessagesUntilFlush = FLUSH_AFTER_N_MESSAGES;
}
