#pragma once

#include <QString>
#include "ComponentCollection.hpp"





/** Provides the locations of the files that the program uses:
the default configuration file, the data folder (SQLite DB) and the logs folder.
The data folder defaults to the platform's app data location, but can be overridden (used by tests). */
class InstallConfiguration:
	public ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>
{
	using Super = ComponentCollection::Component<ComponentCollection::ckInstallConfiguration>;


public:

	/** Creates a new instance.
	If aDataFolderOverride is empty, the platform's app data location is used. */
	InstallConfiguration(ComponentCollection & aComponents, const QString & aDataFolderOverride = QString());

	// ComponentCollection::ComponentBase override:
	virtual void start() override;

	/** Returns the full path to the specified file within the data folder. */
	QString dataLocation(const QString & aFileName) const;

	/** Returns the folder where the log files are to be stored. */
	QString logsFolder() const;

	/** Returns the path to the default configuration file ($HOME/.webtexter.conf). */
	static QString defaultConfigFile();


protected:

	/** The folder where the data (DB, logs) is stored. */
	QString mDataFolder;
};
