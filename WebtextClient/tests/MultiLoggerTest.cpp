#include <gtest/gtest.h>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include "../src/MultiLogger.hpp"
#include "TestHelpers.hpp"





TEST(MultiLoggerTest, SubsystemFiles)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	ComponentCollection cc;
	auto logs = cc.addNew<MultiLogger>(dir.path() + "/logs");
	cc.start();
	cc.logger("Orchestrator").log("Resolved into %1 numbers", 3);
	cc.logger("a/b:c").log("odd name");
	EXPECT_EQ(&cc.logger("Orchestrator"), &logs->logger("Orchestrator"));
	logs->flushAllLogs();

	QFile f(dir.path() + "/logs/Orchestrator.log");
	ASSERT_TRUE(f.open(QIODevice::ReadOnly));
	EXPECT_TRUE(f.readAll().contains("Resolved into 3 numbers"));
	EXPECT_TRUE(QFileInfo::exists(dir.path() + "/logs/a_b_c.log"));
	EXPECT_TRUE(QFileInfo::exists(dir.path() + "/logs/main.log"));
}





TEST(MultiLoggerTest, LargeLogIsRotated)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const qint64 maxSize = MultiLogger::MAX_LOG_FILE_SIZE;
	{
		QFile big(dir.path() + "/Http.log");
		ASSERT_TRUE(big.open(QIODevice::WriteOnly));
		big.write(QByteArray(static_cast<int>(maxSize) + 1, 'x'));
	}

	ComponentCollection cc;
	cc.addNew<MultiLogger>(dir.path());
	cc.logger("Http").log("GET %1", "https://www.mymeteor.ie/");

	QFileInfo rotated(dir.path() + "/Http.log.1");
	ASSERT_TRUE(rotated.exists());
	EXPECT_GT(rotated.size(), maxSize);
	EXPECT_LT(QFileInfo(dir.path() + "/Http.log").size(), maxSize);
}





/** Returns the current contents of the file, as seen by another reader. */
static QByteArray fileContents(const QString & aFileName)
{
	QFile f(aFileName);
	if (!f.open(QIODevice::ReadOnly))
	{
		return QByteArray();
	}
	return f.readAll();
}





TEST(LoggerTest, FlushesEveryFewMessagesAndBlocks)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	auto fileName = dir.path() + "/Orchestrator.log";
	Logger logger(fileName);

	// The messages are buffered until the fourth one:
	logger.log("first");
	logger.log("second");
	logger.log("third");
	EXPECT_FALSE(fileContents(fileName).contains("third"));
	logger.log("fourth");
	auto contents = fileContents(fileName);
	EXPECT_TRUE(contents.contains("first"));
	EXPECT_TRUE(contents.contains("fourth"));

	// A block is written out immediately:
	logger.log("fifth");
	logger.logBlock("line 1\nline 2", "Unrecognized response from %1", "https://www.mymeteor.ie/");
	contents = fileContents(fileName);
	EXPECT_TRUE(contents.contains("fifth"));
	EXPECT_TRUE(contents.contains("Unrecognized response from https://www.mymeteor.ie/"));
	EXPECT_TRUE(contents.contains("\tline 2"));
}
