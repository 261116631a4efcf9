#pragma once

#include <QString>
#include <QStringList>
#include "../Exception.hpp"
#include "AliasTable.hpp"





/** Thrown when a recipient token is neither a phone number nor a known alias. */
class UnknownRecipientError:
	public RuntimeError
{
	using Super = RuntimeError;


public:

	/** Creates the exception for the unknown aToken.
	The known alias names are listed in the message, to help the user spot typos. */
	UnknownRecipientError(const QString & aToken, const QStringList & aKnownAliases);

	/** Returns the token that couldn't be resolved. */
	const QString & token() const { return mToken; }


protected:

	/** The token that couldn't be resolved. */
	QString mToken;
};





/** Expands recipient tokens (phone numbers, aliases, group names) into phone numbers. */
namespace AliasResolver
{

/** Resolves a single token.
A token that is a valid phone number is returned (in canonical form) as the only item.
Otherwise the token is looked up in the alias table and its numbers are returned in their stored order.
Throws an UnknownRecipientError if the token is neither. */
QStringList resolve(const QString & aToken, const AliasTable & aAliases);

/** Resolves all the tokens independently and concatenates the results, in order.
Numbers reachable through multiple tokens are kept multiple times (no deduplication),
so that such a number receives the message once for each token.
Throws an UnknownRecipientError on the first token that cannot be resolved. */
QStringList resolveAll(const QStringList & aTokens, const AliasTable & aAliases);

}  // namespace AliasResolver
