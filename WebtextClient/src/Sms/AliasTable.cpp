#include "AliasTable.hpp"
#include <algorithm>
#include "../Exception.hpp"





void AliasTable::addAlias(const QString & aName, const QStringList & aNumbers)
{
	if (aNumbers.isEmpty())
	{
		throw LogicError("Alias %1 has no numbers", aName);
	}
	auto res = mAliases.insert({aName, aNumbers});
	if (!res.second)
	{
		throw LogicError("Alias %1 is already defined", aName);
	}
}





const QStringList * AliasTable::lookup(const QString & aName) const
{
	auto itr = mAliases.find(aName);
	if (itr == mAliases.end())
	{
		return nullptr;
	}
	return &(itr->second);
}





bool AliasTable::containsNumber(const QString & aNumber) const
{
	for (const auto & alias: mAliases)
	{
		if (alias.second.contains(aNumber))
		{
			return true;
		}
	}
	return false;
}





QStringList AliasTable::names() const
{
	QStringList res;
	for (const auto & alias: mAliases)
	{
		res.append(alias.first);
	}
	std::sort(res.begin(), res.end(),
		[](const QString & aLeft, const QString & aRight)
		{
			return (QString::compare(aLeft, aRight, Qt::CaseInsensitive) < 0);
		}
	);
	return res;
}
