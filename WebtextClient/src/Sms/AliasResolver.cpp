#include "AliasResolver.hpp"
#include "PhoneNumber.hpp"





////////////////////////////////////////////////////////////////////////////////
// UnknownRecipientError:

UnknownRecipientError::UnknownRecipientError(const QString & aToken, const QStringList & aKnownAliases):
	Super("Alias %1 unknown. Known aliases: %2",
		aToken,
		aKnownAliases.isEmpty() ? QString::fromUtf8("(none)") : aKnownAliases.join(", ")
	),
	mToken(aToken)
{
}





////////////////////////////////////////////////////////////////////////////////
// AliasResolver:

QStringList AliasResolver::resolve(const QString & aToken, const AliasTable & aAliases)
{
	auto number = PhoneNumber::canonical(aToken);
	if (!number.isEmpty())
	{
		return {number};
	}
	auto numbers = aAliases.lookup(aToken);
	if (numbers == nullptr)
	{
		throw UnknownRecipientError(aToken, aAliases.names());
	}
	return *numbers;
}





QStringList AliasResolver::resolveAll(const QStringList & aTokens, const AliasTable & aAliases)
{
	QStringList res;
	for (const auto & token: aTokens)
	{
		res.append(resolve(token, aAliases));
	}
	return res;
}
