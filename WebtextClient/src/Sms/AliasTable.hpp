#pragma once

#include <map>
#include <QString>
#include <QStringList>





/** The user-defined shortcuts for recipients.
An alias maps a name to exactly one number, a group maps a name to several numbers.
The table is filled once by the configuration loader and then only read, so a const reference
can be shared by any number of threads. */
class AliasTable
{
public:

	AliasTable() {}

	/** Adds a new alias / group.
	Throws a LogicError if the name is already defined or if aNumbers is empty. */
	void addAlias(const QString & aName, const QStringList & aNumbers);

	/** Returns the numbers for the specified alias, in the order in which they were defined.
	Returns nullptr if there's no such alias. */
	const QStringList * lookup(const QString & aName) const;

	/** Returns true if the alias of the specified name is defined. */
	bool contains(const QString & aName) const { return (mAliases.find(aName) != mAliases.end()); }

	/** Returns true if the specified number is a member of any alias / group. */
	bool containsNumber(const QString & aNumber) const;

	/** Returns the names of all aliases, sorted case-insensitively. */
	QStringList names() const;

	/** Returns the number of aliases in the table. */
	size_t size() const { return mAliases.size(); }


protected:

	/** The aliases, map of name -> numbers. */
	std::map<QString, QStringList> mAliases;
};
