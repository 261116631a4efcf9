#include "InstallConfiguration.hpp"
#include <QDir>
#include <QStandardPaths>





InstallConfiguration::InstallConfiguration(ComponentCollection & aComponents, const QString & aDataFolderOverride):
	Super(aComponents),
	mDataFolder(aDataFolderOverride)
{
	if (mDataFolder.isEmpty())
	{
		mDataFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	}
	if (mDataFolder.isEmpty())
	{
		// No standard location available (weird platform), fall back to a dotfolder in home:
		mDataFolder = QDir::homePath() + "/.webtexter";
	}
	if (!QDir().mkpath(mDataFolder))
	{
		throw RuntimeError("Cannot create the data folder %1", mDataFolder);
	}
}





void InstallConfiguration::start()
{
	// Nothing needed
}





QString InstallConfiguration::dataLocation(const QString & aFileName) const
{
	return mDataFolder + "/" + aFileName;
}





QString InstallConfiguration::logsFolder() const
{
	return mDataFolder + "/logs";
}





QString InstallConfiguration::defaultConfigFile()
{
	return QDir::homePath() + "/.webtexter.conf";
}
